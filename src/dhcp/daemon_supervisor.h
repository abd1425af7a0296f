/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <sys/types.h>

#include <memory>
#include <string>
#include <vector>

#include "lease_config.h"

namespace hostnet {

class command_runner;
class device_orchestrator;
class firewall_rule_store;
struct network_spec;

enum daemon_state {
  DS_ABSENT,  // no pid file
  DS_STALE,   // pid file names a process without our config file
  DS_RUNNING, // pid file names our daemon
};

/**
 * @brief keeps dnsmasq and radvd of a device running with fresh config
 *
 * Daemons are tracked through their pid files only, the state is checked again
 * on every call.
 */
class daemon_supervisor {
public:
  daemon_supervisor(std::shared_ptr<command_runner> runner,
                    std::shared_ptr<firewall_rule_store> firewall,
                    std::shared_ptr<device_orchestrator> devices,
                    const dhcp_params &params = dhcp_params::from_flags());
  virtual ~daemon_supervisor() {}

  // <networks_path>/nova-<dev>.<kind>, creates networks_path
  static std::string dhcp_file(const std::string &dev,
                               const std::string &kind);
  // <networks_path>/nova-ra-<dev>.<kind>, creates networks_path
  static std::string ra_file(const std::string &dev, const std::string &kind);

  /**
   * @brief check that pid runs a command line containing match
   *
   * pids are recycled, so a pid file alone is no proof of our daemon.
   */
  bool is_pid_cmdline_correct(pid_t pid, const std::string &match);

  daemon_state get_dnsmasq_state(const std::string &dev, pid_t *pid);
  daemon_state get_radvd_state(const std::string &dev, pid_t *pid);

  // write the hosts file and restart dnsmasq
  void update_dhcp(const std::string &dev, const network_spec &net,
                   const std::vector<fixed_ip> &ips);
  // write the dns hosts file and restart dnsmasq
  void update_dns(const std::string &dev, const network_spec &net,
                  const std::vector<fixed_ip> &ips);

  /**
   * @brief reload a running dnsmasq or spawn a new one
   *
   * A HUP only rereads the host and option files, anything on the command
   * line needs a new process.
   *
   * @throws configuration_error if dnsmasq cannot be spawned
   */
  void restart_dhcp(const std::string &dev, const network_spec &net,
                    const std::vector<fixed_ip> &ips);

  void kill_dhcp(const std::string &dev);

  // radvd is always restarted
  void update_ra(const std::string &dev, const network_spec &net);

  /**
   * @throws dhcp_release_error
   */
  void release_dhcp(const std::string &dev, const std::string &address,
                    const std::string &mac);

  std::vector<std::string> get_dnsmasq_cmd(const std::string &dev,
                                           const network_spec &net) const;

  const dhcp_params &get_params() const { return params; }

private:
  daemon_supervisor(const daemon_supervisor &other) = delete;
  daemon_supervisor &operator=(const daemon_supervisor &) = delete;

  // callers hold the dnsmasq_start lock
  void restart_dhcp_locked(const std::string &dev, const network_spec &net,
                           const std::vector<fixed_ip> &ips);

  daemon_state pid_file_state(const std::string &pid_file,
                              const std::string &match, pid_t *pid);

  std::shared_ptr<command_runner> runner;
  std::shared_ptr<firewall_rule_store> firewall;
  std::shared_ptr<device_orchestrator> devices;
  dhcp_params params;
};

} // namespace hostnet
