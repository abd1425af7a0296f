/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include <glog/logging.h>

#include "command_runner.h"
#include "errors.h"

namespace hostnet {

std::string join_cmd(const std::vector<std::string> &argv) {
  std::string cmd;
  for (auto const &arg : argv) {
    if (!cmd.empty())
      cmd += " ";
    cmd += arg;
  }
  return cmd;
}

void command_runner::check_result(const std::vector<std::string> &argv,
                                  const exec_opts &opts,
                                  const command_result &res) {
  if (!opts.check_exit_code)
    return;

  if (std::find(opts.exit_codes.begin(), opts.exit_codes.end(),
                res.exit_code) != opts.exit_codes.end())
    return;

  throw process_execution_error(join_cmd(argv), res.exit_code, res.out,
                                res.err);
}

process_runner::process_runner(const std::string &helper) {
  std::istringstream ss(helper);
  std::string word;
  while (ss >> word)
    root_helper.push_back(word);
}

namespace {

struct pipe_fds {
  int fds[2] = {-1, -1};

  ~pipe_fds() {
    close_end(0);
    close_end(1);
  }

  void close_end(int i) {
    if (fds[i] != -1) {
      ::close(fds[i]);
      fds[i] = -1;
    }
  }
};

void read_available(int &fd, std::string &buf) {
  char tmp[4096];
  ssize_t n = ::read(fd, tmp, sizeof(tmp));
  if (n > 0) {
    buf.append(tmp, n);
  } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

command_result process_runner::execute(const std::vector<std::string> &argv,
                                       const exec_opts &opts) {
  std::vector<std::string> full;

  if (argv.empty())
    throw hostnet_error("empty command");

  if (opts.run_as_root)
    full = root_helper;
  full.insert(full.end(), argv.begin(), argv.end());

  VLOG(1) << __FUNCTION__ << ": running cmd: " << join_cmd(full);

  // built before fork(), the child must not allocate
  std::vector<char *> vctargv;
  for (auto &arg : full)
    vctargv.push_back(const_cast<char *>(arg.c_str()));
  vctargv.push_back(nullptr);

  static const char exec_failed[] = "execvp failed\n";

  pipe_fds in, out, err;
  // close-on-exec, so concurrent children do not inherit each other's pipes
  if (::pipe2(in.fds, O_CLOEXEC) < 0 || ::pipe2(out.fds, O_CLOEXEC) < 0 ||
      ::pipe2(err.fds, O_CLOEXEC) < 0)
    throw hostnet_error(std::string("pipe2() failed: ") + strerror(errno));

  pid_t pid = fork();
  if (pid < 0)
    throw hostnet_error(std::string("fork() failed: ") + strerror(errno));

  if (pid == 0) {
    // child process
    ::dup2(in.fds[0], STDIN_FILENO);
    ::dup2(out.fds[1], STDOUT_FILENO);
    ::dup2(err.fds[1], STDERR_FILENO);
    for (int fd : {in.fds[0], in.fds[1], out.fds[0], out.fds[1], err.fds[0],
                   err.fds[1]})
      ::close(fd);

    execvp(vctargv[0], &vctargv[0]);

    // only async-signal-safe calls after fork()
    ssize_t ignored =
        ::write(STDERR_FILENO, exec_failed, sizeof(exec_failed) - 1);
    (void)ignored;
    _exit(127); // just in case execvp fails
  }

  // father process
  in.close_end(0);
  out.close_end(1);
  err.close_end(1);

  // a daemon exiting early must not kill us while we feed it input
  ::signal(SIGPIPE, SIG_IGN);

  command_result res;
  res.exit_code = -1;

  int in_fd = in.fds[1];
  in.fds[1] = -1;
  int out_fd = out.fds[0];
  out.fds[0] = -1;
  int err_fd = err.fds[0];
  err.fds[0] = -1;

  size_t written = 0;
  const std::string &input = opts.process_input;
  if (!opts.has_input || input.empty()) {
    ::close(in_fd);
    in_fd = -1;
  }

  while (in_fd != -1 || out_fd != -1 || err_fd != -1) {
    struct pollfd pfds[3];
    int n = 0;
    int in_idx = -1, out_idx = -1, err_idx = -1;

    if (in_fd != -1) {
      pfds[n] = {in_fd, POLLOUT, 0};
      in_idx = n++;
    }
    if (out_fd != -1) {
      pfds[n] = {out_fd, POLLIN, 0};
      out_idx = n++;
    }
    if (err_fd != -1) {
      pfds[n] = {err_fd, POLLIN, 0};
      err_idx = n++;
    }

    if (::poll(pfds, n, -1) < 0) {
      if (errno == EINTR)
        continue;
      LOG(ERROR) << __FUNCTION__ << ": poll failed: " << strerror(errno);
      break;
    }

    if (in_idx >= 0 && pfds[in_idx].revents) {
      ssize_t w =
          ::write(in_fd, input.data() + written, input.size() - written);
      if (w > 0)
        written += w;
      if (w < 0 && errno != EINTR && errno != EAGAIN) {
        LOG(WARNING) << __FUNCTION__ << ": failed to write stdin of "
                     << full[0] << ": " << strerror(errno);
        written = input.size();
      }
      if (written >= input.size()) {
        ::close(in_fd);
        in_fd = -1;
      }
    }
    if (out_idx >= 0 && pfds[out_idx].revents)
      read_available(out_fd, res.out);
    if (err_idx >= 0 && pfds[err_idx].revents)
      read_available(err_fd, res.err);
  }

  for (int fd : {in_fd, out_fd, err_fd})
    if (fd != -1)
      ::close(fd);

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw hostnet_error(std::string("waitpid() failed: ") + strerror(errno));
  }

  if (WIFEXITED(status))
    res.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    res.exit_code = -WTERMSIG(status);

  VLOG(2) << __FUNCTION__ << ": cmd " << full[0]
          << " exited with code=" << res.exit_code;
  VLOG(3) << __FUNCTION__ << ": stdout='" << res.out << "' stderr='"
          << res.err << "'";

  check_result(full, opts, res);
  return res;
}

command_result fake_runner::execute(const std::vector<std::string> &argv,
                                    const exec_opts &opts) {
  LOG(INFO) << "FAKE NET: " << join_cmd(argv);
  return command_result{"fake", "", 0};
}

} // namespace hostnet
