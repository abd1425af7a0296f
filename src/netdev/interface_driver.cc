/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "device_orchestrator.h"
#include "firewall/rule_store.h"
#include "interface_driver.h"
#include "network/network_spec.h"
#include "utils/errors.h"
#include "utils/inet_utils.h"

DECLARE_string(flat_interface);
DECLARE_string(vlan_interface);
DECLARE_string(ovs_integration_bridge);
DECLARE_bool(share_dhcp_address);

namespace hostnet {

static const char *gateway_interface_prefix = "gw-";
static const char *neutron_bridge_prefix = "brq";

static std::string short_uuid(const network_spec &net) {
  return net.uuid.substr(0, 11);
}

static bool shares_dhcp_address(const network_spec &net) {
  return net.share_address || FLAGS_share_dhcp_address;
}

std::string bridge_interface_driver::plug(const network_spec &net,
                                          const std::string &mac,
                                          bool gateway) {
  std::string iface;

  if (net.has_vlan()) {
    iface = FLAGS_vlan_interface.empty() ? net.bridge_interface
                                         : FLAGS_vlan_interface;
    iface = devices->ensure_vlan_bridge(net.vlan, net.bridge, iface, &net, mac,
                                        net.mtu);
  } else {
    iface = FLAGS_flat_interface.empty() ? net.bridge_interface
                                         : FLAGS_flat_interface;
    devices->ensure_bridge(net.bridge, iface, &net, gateway);
  }

  if (shares_dhcp_address(net))
    firewall->ensure_dhcp_isolation(iface, net.dhcp_server);

  // one commit for everything the bridge setup queued
  firewall->apply();

  LOG(INFO) << __FUNCTION__ << ": plugged network " << net.label << " into "
            << net.bridge;
  return net.bridge;
}

std::string bridge_interface_driver::unplug(const network_spec &net) {
  std::string iface;

  if (net.has_vlan()) {
    iface = "vlan" + std::to_string(net.vlan);
    devices->remove_vlan_bridge(net.vlan, net.bridge);
  } else {
    iface = FLAGS_flat_interface.empty() ? net.bridge_interface
                                         : FLAGS_flat_interface;
    devices->remove_bridge(net.bridge);
  }

  if (shares_dhcp_address(net))
    firewall->remove_dhcp_isolation(iface, net.dhcp_server);

  firewall->apply();

  LOG(INFO) << __FUNCTION__ << ": unplugged network " << net.label;
  return get_dev(net);
}

std::string bridge_interface_driver::get_dev(const network_spec &net) const {
  return net.bridge;
}

std::string ovs_interface_driver::plug(const network_spec &net,
                                       const std::string &mac, bool gateway) {
  std::string dev = get_dev(net);
  const std::string &bridge = FLAGS_ovs_integration_bridge;

  if (devices->device_exists(dev))
    return dev;

  devices->ovs_vsctl({"--", "--may-exist", "add-port", bridge, dev, "--",
                      "set", "Interface", dev, "type=internal", "--", "set",
                      "Interface", dev, "external-ids:iface-id=" + dev, "--",
                      "set", "Interface", dev,
                      "external-ids:iface-status=active", "--", "set",
                      "Interface", dev, "external-ids:attached-mac=" + mac},
                     dev);
  devices->set_device_mac(dev, mac);
  devices->set_device_mtu(dev, net.mtu);
  devices->set_device_up(dev);

  if (!gateway) {
    // drop everything but dhcp towards our port
    devices->ovs_add_flow(bridge, "priority=1,actions=drop");
    devices->ovs_add_flow(bridge, "udp,tp_dst=67,dl_dst=" + mac +
                                      ",priority=2,actions=normal");
    firewall->ensure_bridge_rules(bridge);
  } else {
    firewall->ensure_gateway_rules(bridge);
  }
  firewall->apply();

  LOG(INFO) << __FUNCTION__ << ": plugged " << dev << " into " << bridge;
  return dev;
}

std::string ovs_interface_driver::unplug(const network_spec &net) {
  std::string dev = get_dev(net);
  devices->ovs_vsctl(
      {"--", "--if-exists", "del-port", FLAGS_ovs_integration_bridge, dev},
      dev);
  return dev;
}

std::string ovs_interface_driver::get_dev(const network_spec &net) const {
  return gateway_interface_prefix + short_uuid(net);
}

std::string neutron_bridge_interface_driver::plug(const network_spec &net,
                                                  const std::string &mac,
                                                  bool gateway) {
  std::string dev = get_dev(net);
  std::string bridge = get_bridge(net);

  if (!gateway) {
    // no forwarding through a non-gateway bridge
    firewall->ensure_bridge_rules(bridge);
    firewall->apply();
    return bridge;
  }

  firewall->ensure_gateway_rules(bridge);
  firewall->apply();

  devices->create_tap(dev, mac);

  if (!devices->device_exists(bridge)) {
    devices->ensure_bridge(bridge, "", nullptr, gateway, false);
    devices->set_device_mac(bridge, mac);
    devices->add_address(bridge,
                         net.dhcp_server + "/" + cidr_prefix(net.cidr));
    LOG(INFO) << __FUNCTION__ << ": started bridge " << bridge;
  }

  return dev;
}

std::string neutron_bridge_interface_driver::unplug(const network_spec &net) {
  std::string dev = get_dev(net);

  if (!devices->device_exists(dev))
    return std::string();

  devices->delete_net_dev(dev);
  return dev;
}

std::string
neutron_bridge_interface_driver::get_dev(const network_spec &net) const {
  return gateway_interface_prefix + short_uuid(net);
}

std::string
neutron_bridge_interface_driver::get_bridge(const network_spec &net) const {
  return neutron_bridge_prefix + short_uuid(net);
}

std::unique_ptr<interface_driver>
create_interface_driver(const std::string &name,
                        std::shared_ptr<device_orchestrator> devices,
                        std::shared_ptr<firewall_rule_store> firewall) {
  std::unique_ptr<interface_driver> driver;

  if (name == "bridge")
    driver.reset(new bridge_interface_driver(devices, firewall));
  else if (name == "ovs")
    driver.reset(new ovs_interface_driver(devices, firewall));
  else if (name == "neutron_bridge")
    driver.reset(new neutron_bridge_interface_driver(devices, firewall));
  else
    throw hostnet_error("unknown interface driver '" + name + "'");

  VLOG(1) << __FUNCTION__ << ": using " << name << " interface driver";
  return driver;
}

} // namespace hostnet
