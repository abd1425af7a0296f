/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <vector>

namespace hostnet {

struct command_result {
  std::string out;
  std::string err;
  int exit_code;
};

struct exec_opts {
  bool run_as_root = false;
  bool check_exit_code = true;
  std::vector<int> exit_codes = {0};
  bool has_input = false;
  std::string process_input;

  static exec_opts root() {
    exec_opts o;
    o.run_as_root = true;
    return o;
  }

  // run as root and hand back the result whatever the exit code is
  static exec_opts root_unchecked() {
    exec_opts o;
    o.run_as_root = true;
    o.check_exit_code = false;
    return o;
  }

  static exec_opts root_with_input(const std::string &input) {
    exec_opts o;
    o.run_as_root = true;
    o.has_input = true;
    o.process_input = input;
    return o;
  }
};

std::string join_cmd(const std::vector<std::string> &argv);

class command_runner {
public:
  command_runner() {}
  virtual ~command_runner() {}

  /**
   * @brief run argv[0] with the given arguments and wait for it
   *
   * @throws process_execution_error if checking is enabled and the exit code
   * is not one of opts.exit_codes
   */
  virtual command_result execute(const std::vector<std::string> &argv,
                                 const exec_opts &opts = exec_opts()) = 0;

protected:
  command_runner(const command_runner &other) = delete; // non copyable
  command_runner &operator=(const command_runner &) = delete;

  static void check_result(const std::vector<std::string> &argv,
                           const exec_opts &opts, const command_result &res);
};

/**
 * @brief runs commands as child processes, privileged ones through a root
 * helper
 */
class process_runner final : public command_runner {
public:
  explicit process_runner(const std::string &root_helper);
  ~process_runner() override {}

  command_result execute(const std::vector<std::string> &argv,
                         const exec_opts &opts = exec_opts()) override;

private:
  std::vector<std::string> root_helper;
};

/**
 * @brief logs every command and pretends it succeeded
 */
class fake_runner final : public command_runner {
public:
  fake_runner() {}
  ~fake_runner() override {}

  command_result execute(const std::vector<std::string> &argv,
                         const exec_opts &opts = exec_opts()) override;
};

} // namespace hostnet
