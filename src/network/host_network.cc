/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "dhcp/daemon_supervisor.h"
#include "firewall/rule_store.h"
#include "host_network.h"
#include "netdev/device_orchestrator.h"
#include "netdev/interface_driver.h"
#include "network_spec.h"
#include "utils/command_runner.h"
#include "utils/utils.h"

DECLARE_string(metadata_host);
DECLARE_int32(metadata_port);
DECLARE_string(force_snat_range);
DECLARE_string(dmz_cidr);

namespace hostnet {

static const char *metadata_ip = "169.254.169.254";

host_network::host_network(std::shared_ptr<command_runner> runner,
                           const std::string &anchor,
                           const std::string &driver_name)
    : firewall(new firewall_rule_store(runner, anchor)),
      devices(new device_orchestrator(runner, firewall)),
      daemons(new daemon_supervisor(runner, firewall, devices)),
      driver(create_interface_driver(driver_name, devices, firewall)) {}

host_network::~host_network() {}

void host_network::init_host(const std::string &ip_range, bool is_external) {
  firewall->add_snat_rule(ip_range, is_external);
  if (is_external) {
    for (auto const &snat_range : split_list(FLAGS_force_snat_range))
      firewall->add_rule("pass quick inet from " + ip_range + " to " +
                         snat_range);
  }
  firewall->add_rule("pass quick inet from " + ip_range + " to " +
                     FLAGS_metadata_host + "/32");
  for (auto const &dmz : split_list(FLAGS_dmz_cidr))
    firewall->add_rule("pass quick inet from " + ip_range + " to " + dmz);

  firewall->apply();
  LOG(INFO) << __FUNCTION__ << ": host set up for " << ip_range;
}

void host_network::metadata_forward() {
  firewall->add_rule("rdr proto tcp from any to " + std::string(metadata_ip) +
                     " port 80 -> " + FLAGS_metadata_host + " port " +
                     std::to_string(FLAGS_metadata_port));
  firewall->add_rule("pass out route-to (lo0 127.0.0.1) proto tcp from any "
                     "to " +
                     std::string(metadata_ip) + " port 80");
  firewall->apply();
}

void host_network::metadata_accept() {
  firewall->add_rule("pass in inet proto tcp from any to " +
                     std::string(metadata_ip) +
                     " port = http flags S/SA keep state");
  firewall->apply();
}

void host_network::ensure_vpn_forward(const std::string &public_ip, int port,
                                      const std::string &private_ip) {
  firewall->add_rule("pass in proto udp from any to " + private_ip +
                     " port 1194");
  firewall->add_rule("rdr proto udp from any to " + public_ip + " port " +
                     std::to_string(port) + " -> " + private_ip +
                     " port 1194");
  firewall->apply();
}

void host_network::ensure_floating_forward(const std::string &floating_ip,
                                           const std::string &fixed_ip,
                                           const std::string &device,
                                           const network_spec &net) {
  firewall->ensure_floating_rules(floating_ip, fixed_ip, device);
  if (device != net.bridge)
    firewall->ensure_in_network_traffic_rules(fixed_ip, net.cidr);
  firewall->apply();
}

void host_network::remove_floating_forward(const std::string &floating_ip,
                                           const std::string &fixed_ip,
                                           const std::string &device,
                                           const network_spec &net) {
  firewall->remove_floating_rules(floating_ip, fixed_ip, device);
  if (device != net.bridge)
    firewall->remove_in_network_traffic_rules(fixed_ip, net.cidr);
  firewall->apply();
}

std::string host_network::plug(const network_spec &net, const std::string &mac,
                               bool gateway) {
  return driver->plug(net, mac, gateway);
}

std::string host_network::unplug(const network_spec &net) {
  return driver->unplug(net);
}

std::string host_network::get_dev(const network_spec &net) const {
  return driver->get_dev(net);
}

void host_network::initialize_gateway_device(const std::string &dev,
                                             const network_spec &net) {
  devices->initialize_gateway_device(dev, net);
}

void host_network::update_dhcp(const std::string &dev,
                               const network_spec &net,
                               const std::vector<fixed_ip> &ips) {
  daemons->update_dhcp(dev, net, ips);
}

void host_network::update_dns(const std::string &dev, const network_spec &net,
                              const std::vector<fixed_ip> &ips) {
  daemons->update_dns(dev, net, ips);
}

void host_network::kill_dhcp(const std::string &dev) {
  daemons->kill_dhcp(dev);
}

void host_network::update_ra(const std::string &dev, const network_spec &net) {
  daemons->update_ra(dev, net);
}

void host_network::release_dhcp(const std::string &dev,
                                const std::string &address,
                                const std::string &mac) {
  daemons->release_dhcp(dev, address, mac);
}

} // namespace hostnet
