/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <map>
#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "device_orchestrator.h"
#include "firewall/rule_store.h"
#include "network/network_spec.h"
#include "utils/errors.h"
#include "utils/inet_utils.h"
#include "utils/named_lock.h"
#include "utils/utils.h"

DECLARE_int32(ovs_vsctl_timeout);
DECLARE_bool(send_arp_for_ha);
DECLARE_int32(send_arp_for_ha_count);
DECLARE_bool(use_ipv6);

namespace hostnet {

static const char *metadata_ip = "169.254.169.254";
static const char *ovs_vhostuser_type = "vhostuser";

// error messages that only tell us the desired state is already there
static const std::map<command_kind, std::vector<std::string>> benign_errors = {
    {CK_CREATE, {"File exists", "already exists"}},
    {CK_ATTACH, {"File exists", "already a member"}},
    {CK_DESTROY, {"does not exist", "Device not configured"}},
};

device_orchestrator::device_orchestrator(
    std::shared_ptr<command_runner> runner,
    std::shared_ptr<firewall_rule_store> firewall)
    : runner(std::move(runner)), firewall(std::move(firewall)) {}

bool device_orchestrator::is_benign_error(command_kind kind,
                                          const std::string &err) {
  auto it = benign_errors.find(kind);
  if (it == benign_errors.end())
    return false;

  for (auto const &msg : it->second) {
    if (err.find(msg) != std::string::npos)
      return true;
  }
  return false;
}

std::vector<std::string>
device_orchestrator::ifconfig_tail_cmd(const std::string &netif,
                                       const std::vector<std::string> &params,
                                       const std::string &action) {
  std::vector<std::string> cmd = {"ifconfig", netif};
  cmd.insert(cmd.end(), params.begin(), params.end());
  cmd.push_back(action);
  return cmd;
}

command_result device_orchestrator::run(const std::vector<std::string> &argv,
                                        const std::string &dev) {
  try {
    return runner->execute(argv, exec_opts::root());
  } catch (process_execution_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": " << e.get_cmd()
               << " failed: " << e.get_stderr();
    throw configuration_error(dev, e.get_stderr());
  }
}

command_result
device_orchestrator::run_tolerant(const std::vector<std::string> &argv,
                                  command_kind kind, const std::string &dev) {
  command_result res = runner->execute(argv, exec_opts::root_unchecked());

  if (res.exit_code == 0)
    return res;

  if (is_benign_error(kind, res.err)) {
    VLOG(1) << __FUNCTION__ << ": ignoring '" << strip(res.err)
            << "' of: " << join_cmd(argv);
    return res;
  }

  LOG(ERROR) << __FUNCTION__ << ": " << join_cmd(argv)
             << " failed: " << res.err;
  throw configuration_error(dev, res.err);
}

bool device_orchestrator::device_exists(const std::string &dev) {
  exec_opts opts = exec_opts::root();
  opts.exit_codes = {0};

  try {
    runner->execute({"ifconfig", dev}, opts);
  } catch (process_execution_error &e) {
    VLOG(3) << __FUNCTION__ << ": " << dev << " not found";
    return false;
  }
  return true;
}

std::string device_orchestrator::get_mac(const std::string &interface) {
  command_result res = run({"ifconfig", interface}, interface);

  for (auto const &line : split_lines(res.out)) {
    auto fields = split_fields(line);
    if (fields.size() > 1 && fields[0] == "ether")
      return fields[1];
  }
  return std::string();
}

std::vector<std::vector<std::string>>
device_orchestrator::get_inet_params(const std::string &interface) {
  std::vector<std::vector<std::string>> params;
  command_result res = run({"ifconfig", interface}, interface);

  for (auto const &line : split_lines(res.out)) {
    auto fields = split_fields(line);
    if (!fields.empty() && fields[0] == "inet")
      params.push_back(fields);
  }
  return params;
}

std::vector<std::vector<std::string>>
device_orchestrator::get_gateway_routes(const std::string &interface) {
  std::vector<std::vector<std::string>> routes;
  command_result res = run({"netstat", "-nrW", "-f", "inet"}, interface);

  // Destination Gateway Flags Refs Use Mtu Netif Expire
  for (auto const &line : split_lines(res.out)) {
    auto fields = split_fields(line);
    if (fields.size() > 6 && fields[6] == interface &&
        fields[2].find('G') != std::string::npos)
      routes.push_back(fields);
  }
  return routes;
}

void device_orchestrator::delete_routes(
    const std::vector<std::vector<std::string>> &routes) {
  for (auto const &fields : routes) {
    run({"route", "-q", "delete", fields[0], fields[1]}, fields[0]);
    VLOG(1) << __FUNCTION__ << ": removed route " << fields[0] << " via "
            << fields[1];
  }
}

void device_orchestrator::add_routes(
    const std::vector<std::vector<std::string>> &routes) {
  for (auto const &fields : routes) {
    run({"route", "-q", "add", fields[0], fields[1]}, fields[0]);
    VLOG(1) << __FUNCTION__ << ": restored route " << fields[0] << " via "
            << fields[1];
  }
}

void device_orchestrator::migrate_addresses(const std::string &from,
                                            const std::string &to) {
  auto addresses = get_inet_params(from);
  auto routes = get_gateway_routes(from);

  if (addresses.empty() && routes.empty())
    return;

  delete_routes(routes);

  std::vector<std::string> moved;
  for (auto const &params : addresses) {
    try {
      run(ifconfig_tail_cmd(from, params, "delete"), from);
      run(ifconfig_tail_cmd(to, params, "add"), to);
    } catch (configuration_error &e) {
      LOG(ERROR) << __FUNCTION__ << ": moving " << params[1] << " from "
                 << from << " to " << to << " failed after moving ["
                 << join(moved, ", ") << "]";
      throw configuration_error(to, "moved [" + join(moved, ", ") +
                                        "] before failure: " +
                                        e.get_stderr());
    }
    moved.push_back(params.size() > 1 ? params[1] : params[0]);
    LOG(INFO) << __FUNCTION__ << ": moved " << moved.back() << " from "
              << from << " to " << to;
  }

  try {
    add_routes(routes);
  } catch (configuration_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": restoring routes on " << to
               << " failed after moving [" << join(moved, ", ") << "]";
    throw configuration_error(to, "moved [" + join(moved, ", ") +
                                      "] but restoring routes failed: " +
                                      e.get_stderr());
  }
}

void device_orchestrator::ensure_bridge(const std::string &bridge,
                                        const std::string &interface,
                                        const network_spec *net, bool gateway,
                                        bool filtering) {
  named_lock lock("bridge");

  if (!device_exists(bridge)) {
    LOG(INFO) << __FUNCTION__ << ": starting bridge " << bridge;
    run_tolerant({"ifconfig", "bridge", "create", "name", bridge}, CK_CREATE,
                 bridge);
    run({"ifconfig", bridge, "up"}, bridge);
  }

  if (!interface.empty()) {
    VLOG(1) << __FUNCTION__ << ": adding interface " << interface
            << " to bridge " << bridge;
    run_tolerant({"ifconfig", bridge, "addm", interface}, CK_ATTACH, bridge);

    // keep the bridge address stable while ports come and go
    std::string mac = get_mac(interface);
    if (!mac.empty())
      run({"ifconfig", bridge, "ether", mac}, bridge);

    run({"ifconfig", interface, "up"}, interface);

    migrate_addresses(interface, bridge);
  }

  if (net)
    set_device_mtu(bridge, net->mtu);

  if (filtering) {
    // no forwarding unless we act as a gateway
    if (gateway)
      firewall->ensure_gateway_rules(bridge);
    else
      firewall->ensure_bridge_rules(bridge);
  }
}

void device_orchestrator::delete_bridge_dev(const std::string &dev) {
  if (!device_exists(dev))
    return;

  try {
    run({"ifconfig", dev, "down"}, dev);
    run_tolerant({"ifconfig", dev, "destroy"}, CK_DESTROY, dev);
  } catch (configuration_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": failed removing bridge device " << dev;
    throw;
  }
  LOG(INFO) << __FUNCTION__ << ": removed bridge " << dev;
}

void device_orchestrator::remove_bridge(const std::string &bridge,
                                        bool gateway, bool filtering) {
  named_lock lock("bridge");

  if (!device_exists(bridge))
    return;

  if (filtering) {
    if (gateway)
      firewall->remove_gateway_rules(bridge);
    else
      firewall->remove_bridge_rules(bridge);
  }

  delete_bridge_dev(bridge);
}

std::string device_orchestrator::ensure_vlan(int vlan_id,
                                             const std::string &interface,
                                             const std::string &mac, int mtu,
                                             const std::string &name) {
  named_lock lock("vlan");
  std::string vlan_dev = name.empty() ? "vlan" + std::to_string(vlan_id) : name;

  if (!device_exists(vlan_dev)) {
    LOG(INFO) << __FUNCTION__ << ": starting vlan interface " << vlan_dev;
    run_tolerant({"ifconfig", "vlan", "create", "vlan", std::to_string(vlan_id),
                  "vlandev", interface, "name", vlan_dev},
                 CK_CREATE, vlan_dev);

    // the bridge inherits this address
    if (!mac.empty())
      run({"ifconfig", vlan_dev, "ether", mac}, vlan_dev);

    run({"ifconfig", vlan_dev, "up"}, vlan_dev);
  }

  // set on every call so that changes propagate
  set_device_mtu(vlan_dev, mtu);
  return vlan_dev;
}

void device_orchestrator::remove_vlan(int vlan_id) {
  named_lock lock("vlan");
  delete_net_dev("vlan" + std::to_string(vlan_id));
}

std::string device_orchestrator::ensure_vlan_bridge(
    int vlan_id, const std::string &bridge, const std::string &interface,
    const network_spec *net, const std::string &mac, int mtu) {
  std::string vlan_dev = ensure_vlan(vlan_id, interface, mac, mtu);
  ensure_bridge(bridge, vlan_dev, net);
  return vlan_dev;
}

void device_orchestrator::remove_vlan_bridge(int vlan_id,
                                             const std::string &bridge) {
  remove_bridge(bridge);
  remove_vlan(vlan_id);
}

void device_orchestrator::create_tap(const std::string &dev,
                                     const std::string &mac) {
  if (device_exists(dev))
    return;

  run_tolerant({"ifconfig", "tap", "create", "name", dev}, CK_CREATE, dev);
  if (!mac.empty())
    run({"ifconfig", dev, "ether", mac}, dev);
  run({"ifconfig", dev, "up"}, dev);
  LOG(INFO) << __FUNCTION__ << ": created tap " << dev;
}

void device_orchestrator::delete_net_dev(const std::string &dev) {
  if (!device_exists(dev))
    return;

  try {
    run_tolerant({"ifconfig", dev, "destroy"}, CK_DESTROY, dev);
  } catch (configuration_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": failed removing net device " << dev;
    throw;
  }
  VLOG(1) << __FUNCTION__ << ": net device removed: " << dev;
}

void device_orchestrator::set_device_mtu(const std::string &dev, int mtu) {
  if (mtu <= 0)
    return;
  run({"ifconfig", dev, "mtu", std::to_string(mtu)}, dev);
}

void device_orchestrator::set_device_mac(const std::string &dev,
                                         const std::string &mac) {
  run({"ifconfig", dev, "ether", mac}, dev);
}

void device_orchestrator::set_device_up(const std::string &dev) {
  run({"ifconfig", dev, "up"}, dev);
}

void device_orchestrator::add_address(const std::string &dev,
                                      const std::string &cidr) {
  run({"ifconfig", dev, cidr, "add"}, dev);
}

void device_orchestrator::enable_ipv4_forwarding() {
  const std::string key = "net.inet.ip.forwarding";
  command_result res = run({"sysctl", "-n", key}, key);

  if (strip(res.out) != "1") {
    run({"sysctl", key + "=1"}, key);
    LOG(INFO) << __FUNCTION__ << ": enabled ipv4 forwarding";
  }
}

void device_orchestrator::initialize_gateway_device(const std::string &dev,
                                                    const network_spec &net) {
  named_lock lock("gateway");

  enable_ipv4_forwarding();

  // dnsmasq only answers on the first address of the device
  std::string full_ip = net.dhcp_server + "/" + cidr_prefix(net.cidr);

  std::vector<std::vector<std::string>> new_params = {
      {"inet", full_ip, "broadcast", net.broadcast}};
  auto old_params = get_inet_params(dev);

  for (auto const &fields : old_params) {
    if (fields.size() < 4 || address_to_cidr(fields[1], fields[3]) != full_ip)
      new_params.push_back(fields);
  }

  bool is_first = !old_params.empty() && old_params[0].size() >= 4 &&
                  address_to_cidr(old_params[0][1], old_params[0][3]) ==
                      full_ip;

  if (!is_first) {
    auto routes = get_gateway_routes(dev);
    delete_routes(routes);

    std::vector<std::string> removed;
    try {
      for (auto const &params : old_params) {
        run(ifconfig_tail_cmd(dev, params, "delete"), dev);
        removed.push_back(params[1]);
      }
      for (auto const &params : new_params)
        run(ifconfig_tail_cmd(dev, params, "add"), dev);
    } catch (configuration_error &e) {
      LOG(ERROR) << __FUNCTION__ << ": readdressing " << dev
                 << " failed after removing [" << join(removed, ", ") << "]";
      throw configuration_error(dev, "removed [" + join(removed, ", ") +
                                         "] before failure: " +
                                         e.get_stderr());
    }

    add_routes(routes);
    LOG(INFO) << __FUNCTION__ << ": " << full_ip << " is the first address of "
              << dev;

    if (FLAGS_send_arp_for_ha && FLAGS_send_arp_for_ha_count > 0)
      send_arp_for_ip(net.dhcp_server, dev, FLAGS_send_arp_for_ha_count);
  }

  if (FLAGS_use_ipv6 && !net.cidr_v6.empty())
    run({"ifconfig", dev, "inet6", net.cidr_v6}, dev);
}

void device_orchestrator::send_arp_for_ip(const std::string &ip,
                                          const std::string &device,
                                          int count) {
  command_result res =
      runner->execute({"arping", "-U", "-i", device, "-c",
                       std::to_string(count), ip},
                      exec_opts::root_unchecked());

  if (!res.err.empty())
    VLOG(1) << __FUNCTION__ << ": arping error for " << ip << ": " << res.err;
}

void device_orchestrator::bind_floating_ip(const std::string &floating_ip,
                                           const std::string &device) {
  run({"ifconfig", device, floating_ip + "/32", "add"}, device);

  if (FLAGS_send_arp_for_ha && FLAGS_send_arp_for_ha_count > 0)
    send_arp_for_ip(floating_ip, device, FLAGS_send_arp_for_ha_count);
}

void device_orchestrator::unbind_floating_ip(const std::string &floating_ip,
                                             const std::string &device) {
  run({"ifconfig", device, floating_ip + "/32", "delete"}, device);
}

void device_orchestrator::ensure_metadata_ip() {
  run({"ifconfig", "lo0", "alias", std::string(metadata_ip) + "/32"}, "lo0");
}

command_result
device_orchestrator::ovs_vsctl(const std::vector<std::string> &args,
                               const std::string &dev) {
  std::vector<std::string> full_args = {
      "ovs-vsctl", "--timeout=" + std::to_string(FLAGS_ovs_vsctl_timeout)};
  full_args.insert(full_args.end(), args.begin(), args.end());

  try {
    return runner->execute(full_args, exec_opts::root());
  } catch (process_execution_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": unable to execute " << e.get_cmd()
               << ": " << e.get_stderr();
    throw configuration_error(dev, e.get_stderr());
  }
}

void device_orchestrator::ovs_add_flow(const std::string &bridge,
                                       const std::string &flow) {
  run({"ovs-ofctl", "add-flow", bridge, flow}, bridge);
}

void device_orchestrator::create_ovs_vif_port(
    const std::string &bridge, const std::string &dev,
    const std::string &iface_id, const std::string &mac,
    const std::string &instance_id, int mtu,
    const std::string &interface_type) {
  std::vector<std::string> args = {"--",
                                   "--if-exists",
                                   "del-port",
                                   dev,
                                   "--",
                                   "add-port",
                                   bridge,
                                   dev,
                                   "--",
                                   "set",
                                   "Interface",
                                   dev,
                                   "external-ids:iface-id=" + iface_id,
                                   "external-ids:iface-status=active",
                                   "external-ids:attached-mac=" + mac,
                                   "external-ids:vm-uuid=" + instance_id};
  if (!interface_type.empty())
    args.push_back("type=" + interface_type);

  ovs_vsctl(args, dev);

  // vhostuser ports have no kernel device to set the mtu on
  if (interface_type != ovs_vhostuser_type)
    set_device_mtu(dev, mtu);
  else
    VLOG(1) << __FUNCTION__ << ": mtu not set on " << dev << " of type "
            << interface_type;
}

void device_orchestrator::delete_ovs_vif_port(const std::string &bridge,
                                              const std::string &dev,
                                              bool delete_dev) {
  ovs_vsctl({"--", "--if-exists", "del-port", bridge, dev}, dev);
  if (delete_dev)
    delete_net_dev(dev);
}

} // namespace hostnet
