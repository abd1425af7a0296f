/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <ctime>
#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "daemon_supervisor.h"
#include "firewall/rule_store.h"
#include "netdev/device_orchestrator.h"
#include "network/network_spec.h"
#include "utils/command_runner.h"
#include "utils/errors.h"
#include "utils/fs_utils.h"
#include "utils/inet_utils.h"
#include "utils/named_lock.h"
#include "utils/utils.h"

DECLARE_string(networks_path);
DECLARE_string(dhcpbridge);
DECLARE_string(dhcpbridge_flagfile);
DECLARE_string(dnsmasq_config_file);
DECLARE_string(dns_server);
DECLARE_bool(use_network_dns_servers);

namespace hostnet {

static std::string basename_of(const std::string &path) {
  auto pos = path.rfind('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

daemon_supervisor::daemon_supervisor(
    std::shared_ptr<command_runner> runner,
    std::shared_ptr<firewall_rule_store> firewall,
    std::shared_ptr<device_orchestrator> devices, const dhcp_params &params)
    : runner(std::move(runner)), firewall(std::move(firewall)),
      devices(std::move(devices)), params(params) {}

std::string daemon_supervisor::dhcp_file(const std::string &dev,
                                         const std::string &kind) {
  ensure_tree(FLAGS_networks_path);
  return FLAGS_networks_path + "/nova-" + dev + "." + kind;
}

std::string daemon_supervisor::ra_file(const std::string &dev,
                                       const std::string &kind) {
  ensure_tree(FLAGS_networks_path);
  return FLAGS_networks_path + "/nova-ra-" + dev + "." + kind;
}

bool daemon_supervisor::is_pid_cmdline_correct(pid_t pid,
                                               const std::string &match) {
  command_result res =
      runner->execute({"ps", "-ww", "-o", "command=", "-p",
                       std::to_string(pid)},
                      exec_opts::root_unchecked());

  if (res.exit_code != 0)
    return false;

  return res.out.find(match) != std::string::npos;
}

daemon_state daemon_supervisor::pid_file_state(const std::string &pid_file,
                                               const std::string &match,
                                               pid_t *pid) {
  *pid = read_pid_file(pid_file);
  if (*pid == 0)
    return DS_ABSENT;

  if (is_pid_cmdline_correct(*pid, match))
    return DS_RUNNING;

  return DS_STALE;
}

daemon_state daemon_supervisor::get_dnsmasq_state(const std::string &dev,
                                                  pid_t *pid) {
  // the hosts file name identifies the dnsmasq of dev
  return pid_file_state(dhcp_file(dev, "pid"),
                        basename_of(dhcp_file(dev, "conf")), pid);
}

daemon_state daemon_supervisor::get_radvd_state(const std::string &dev,
                                                pid_t *pid) {
  return pid_file_state(ra_file(dev, "pid"), ra_file(dev, "conf"), pid);
}

void daemon_supervisor::update_dhcp(const std::string &dev,
                                    const network_spec &net,
                                    const std::vector<fixed_ip> &ips) {
  named_lock lock("dnsmasq_start");

  write_to_file(dhcp_file(dev, "conf"), get_dhcp_hosts(ips, params));
  write_to_file(dhcp_file(dev, "leases"),
                get_dhcp_leases(ips, params, std::time(nullptr)));
  restart_dhcp_locked(dev, net, ips);
}

void daemon_supervisor::update_dns(const std::string &dev,
                                   const network_spec &net,
                                   const std::vector<fixed_ip> &ips) {
  named_lock lock("dnsmasq_start");

  write_to_file(dhcp_file(dev, "hosts"), get_dns_hosts(ips, params));
  restart_dhcp_locked(dev, net, ips);
}

void daemon_supervisor::restart_dhcp(const std::string &dev,
                                     const network_spec &net,
                                     const std::vector<fixed_ip> &ips) {
  named_lock lock("dnsmasq_start");
  restart_dhcp_locked(dev, net, ips);
}

void daemon_supervisor::restart_dhcp_locked(const std::string &dev,
                                            const network_spec &net,
                                            const std::vector<fixed_ip> &ips) {
  std::string conffile = dhcp_file(dev, "conf");
  std::string optsfile = dhcp_file(dev, "opts");

  write_to_file(optsfile, get_dhcp_opts(net, ips, params));
  set_file_mode(optsfile, 0644);

  // dnsmasq drops privileges before reading its files
  if (!file_exists(conffile))
    write_to_file(conffile, "");
  set_file_mode(conffile, 0644);

  pid_t pid;
  daemon_state state = get_dnsmasq_state(dev, &pid);

  if (state == DS_RUNNING) {
    bool reloaded = false;
    try {
      runner->execute({"kill", "-HUP", std::to_string(pid)},
                      exec_opts::root());
      reloaded = true;
    } catch (process_execution_error &e) {
      LOG(ERROR) << __FUNCTION__ << ": kill -HUP dnsmasq " << pid
                 << " threw: " << e.what();
    }

    if (reloaded) {
      firewall->ensure_dnsmasq_accept_rules(dev);
      firewall->apply();
      LOG(INFO) << __FUNCTION__ << ": reloaded dnsmasq " << pid << " on "
                << dev;
      return;
    }
  } else if (state == DS_STALE) {
    LOG(WARNING) << __FUNCTION__ << ": pid " << pid
                 << " is stale, relaunching dnsmasq on " << dev;
  }

  std::vector<std::string> cmd = get_dnsmasq_cmd(dev, net);
  try {
    runner->execute(cmd, exec_opts::root());
  } catch (process_execution_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": failed to spawn dnsmasq on " << dev
               << ": " << e.get_stderr();
    throw configuration_error(dev, e.get_stderr());
  }
  LOG(INFO) << __FUNCTION__ << ": spawned dnsmasq on " << dev;

  firewall->ensure_dnsmasq_accept_rules(dev);
  firewall->apply();
}

std::vector<std::string>
daemon_supervisor::get_dnsmasq_cmd(const std::string &dev,
                                   const network_spec &net) const {
  std::vector<std::string> cmd = {"env"};

  if (!FLAGS_dhcpbridge_flagfile.empty())
    cmd.push_back("CONFIG_FILE=" + FLAGS_dhcpbridge_flagfile);
  cmd.push_back("NETWORK_ID=" + std::to_string(net.id));
  cmd.push_back("dnsmasq");
  cmd.push_back("--strict-order");
  cmd.push_back("--bind-interfaces");
  if (!FLAGS_dnsmasq_config_file.empty())
    cmd.push_back("--conf-file=" + FLAGS_dnsmasq_config_file);
  cmd.push_back("--pid-file=" + dhcp_file(dev, "pid"));
  cmd.push_back("--dhcp-optsfile=" + dhcp_file(dev, "opts"));
  cmd.push_back("--listen-address=" + net.dhcp_server);
  cmd.push_back("--except-interface=lo");
  cmd.push_back("--dhcp-range=set:" + net.label + "," + net.dhcp_start +
                ",static," + net.netmask + "," +
                std::to_string(params.lease_time) + "s");
  cmd.push_back("--dhcp-lease-max=" + std::to_string(cidr_size(net.cidr)));
  cmd.push_back("--dhcp-hostsfile=" + dhcp_file(dev, "conf"));
  cmd.push_back("--dhcp-script=" + FLAGS_dhcpbridge);
  cmd.push_back("--no-hosts");
  cmd.push_back("--leasefile-ro");

  // dnsmasq refuses an empty domain
  if (!params.domain.empty())
    cmd.push_back("--domain=" + params.domain);

  if (net.multi_host)
    cmd.push_back("--addn-hosts=" + dhcp_file(dev, "hosts"));

  std::vector<std::string> dns_servers = split_list(FLAGS_dns_server);
  if (FLAGS_use_network_dns_servers) {
    if (!net.dns1.empty())
      dns_servers.push_back(net.dns1);
    if (!net.dns2.empty())
      dns_servers.push_back(net.dns2);
  }

  if (!dns_servers.empty())
    cmd.push_back("--no-resolv");
  for (auto const &server : dns_servers)
    cmd.push_back("--server=" + server);

  return cmd;
}

void daemon_supervisor::kill_dhcp(const std::string &dev) {
  named_lock lock("dnsmasq_start");

  pid_t pid;
  daemon_state state = get_dnsmasq_state(dev, &pid);

  if (state == DS_RUNNING) {
    try {
      runner->execute({"kill", "-9", std::to_string(pid)}, exec_opts::root());
    } catch (process_execution_error &e) {
      LOG(ERROR) << __FUNCTION__ << ": kill -9 dnsmasq " << pid
                 << " failed: " << e.get_stderr();
      // the admission rules go even if the daemon could not be killed
      firewall->remove_dnsmasq_accept_rules(dev);
      firewall->apply();
      throw;
    }
    LOG(INFO) << __FUNCTION__ << ": killed dnsmasq " << pid << " on " << dev;
  } else if (state == DS_STALE) {
    LOG(WARNING) << __FUNCTION__ << ": pid " << pid
                 << " is stale, skip killing dnsmasq on " << dev;
  }

  firewall->remove_dnsmasq_accept_rules(dev);
  firewall->apply();
}

void daemon_supervisor::update_ra(const std::string &dev,
                                  const network_spec &net) {
  named_lock lock("radvd_start");

  std::string conffile = ra_file(dev, "conf");
  write_to_file(conffile, get_ra_config(dev, net.cidr_v6));

  // radvd drops privileges before reading it
  set_file_mode(conffile, 0644);

  pid_t pid;
  daemon_state state = get_radvd_state(dev, &pid);

  if (state == DS_RUNNING) {
    try {
      runner->execute({"kill", std::to_string(pid)}, exec_opts::root());
    } catch (process_execution_error &e) {
      LOG(ERROR) << __FUNCTION__ << ": killing radvd " << pid
                 << " threw: " << e.what();
    }
  } else if (state == DS_STALE) {
    LOG(WARNING) << __FUNCTION__ << ": pid " << pid
                 << " is stale, relaunching radvd on " << dev;
  }

  try {
    runner->execute({"radvd", "-C", conffile, "-p", ra_file(dev, "pid")},
                    exec_opts::root());
  } catch (process_execution_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": failed to spawn radvd on " << dev << ": "
               << e.get_stderr();
    throw configuration_error(dev, e.get_stderr());
  }
  LOG(INFO) << __FUNCTION__ << ": spawned radvd on " << dev;
}

void daemon_supervisor::release_dhcp(const std::string &dev,
                                     const std::string &address,
                                     const std::string &mac) {
  if (!devices->device_exists(dev))
    return;

  try {
    runner->execute({"dhcp_release", dev, address, mac}, exec_opts::root());
  } catch (process_execution_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": dhcp_release of " << address << " on "
               << dev << " failed: " << e.get_stderr();
    throw dhcp_release_error(address, mac);
  }
}

} // namespace hostnet
