/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <stdexcept>
#include <string>

namespace hostnet {

class hostnet_error : public std::runtime_error {
public:
  explicit hostnet_error(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief a command exited with a code that was not accepted
 */
class process_execution_error : public hostnet_error {
public:
  process_execution_error(const std::string &cmd, int exit_code,
                          const std::string &out, const std::string &err)
      : hostnet_error("unexpected error while running command: " + cmd +
                      "; exit code: " + std::to_string(exit_code) +
                      "; stderr: '" + err + "'"),
        cmd(cmd), exit_code(exit_code), out(out), err(err) {}

  const std::string &get_cmd() const { return cmd; }
  int get_exit_code() const { return exit_code; }
  const std::string &get_stdout() const { return out; }
  const std::string &get_stderr() const { return err; }

private:
  std::string cmd;
  int exit_code;
  std::string out;
  std::string err;
};

/**
 * @brief a device, firewall or daemon could not be configured
 */
class configuration_error : public hostnet_error {
public:
  configuration_error(const std::string &device, const std::string &err)
      : hostnet_error("failed to configure " + device + ": " + err),
        device(device), err(err) {}

  const std::string &get_device() const { return device; }
  const std::string &get_stderr() const { return err; }

private:
  std::string device;
  std::string err;
};

class dhcp_release_error : public hostnet_error {
public:
  dhcp_release_error(const std::string &address, const std::string &mac)
      : hostnet_error("failed to release dhcp lease of " + address + " (" +
                      mac + ")"),
        address(address), mac(mac) {}

  const std::string &get_address() const { return address; }
  const std::string &get_mac() const { return mac; }

private:
  std::string address;
  std::string mac;
};

} // namespace hostnet
