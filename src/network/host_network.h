/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "dhcp/lease_config.h"

namespace hostnet {

class command_runner;
class daemon_supervisor;
class device_orchestrator;
class firewall_rule_store;
class interface_driver;
struct network_spec;

/**
 * @brief network host setup of this node
 *
 * Owns the one rule store of the process and hands it to every component.
 */
class host_network final {
public:
  host_network(std::shared_ptr<command_runner> runner,
               const std::string &anchor, const std::string &driver_name);
  ~host_network();

  // snat of ip_range plus its exceptions
  void init_host(const std::string &ip_range, bool is_external = false);

  void metadata_forward();
  void metadata_accept();
  void ensure_vpn_forward(const std::string &public_ip, int port,
                          const std::string &private_ip);

  void ensure_floating_forward(const std::string &floating_ip,
                               const std::string &fixed_ip,
                               const std::string &device,
                               const network_spec &net);
  void remove_floating_forward(const std::string &floating_ip,
                               const std::string &fixed_ip,
                               const std::string &device,
                               const network_spec &net);

  std::string plug(const network_spec &net, const std::string &mac,
                   bool gateway = true);
  std::string unplug(const network_spec &net);
  std::string get_dev(const network_spec &net) const;

  void initialize_gateway_device(const std::string &dev,
                                 const network_spec &net);

  void update_dhcp(const std::string &dev, const network_spec &net,
                   const std::vector<fixed_ip> &ips);
  void update_dns(const std::string &dev, const network_spec &net,
                  const std::vector<fixed_ip> &ips);
  void kill_dhcp(const std::string &dev);
  void update_ra(const std::string &dev, const network_spec &net);
  void release_dhcp(const std::string &dev, const std::string &address,
                    const std::string &mac);

  std::shared_ptr<firewall_rule_store> get_firewall() const {
    return firewall;
  }
  std::shared_ptr<device_orchestrator> get_devices() const { return devices; }
  std::shared_ptr<daemon_supervisor> get_daemons() const { return daemons; }

private:
  host_network(const host_network &other) = delete;
  host_network &operator=(const host_network &) = delete;

  std::shared_ptr<firewall_rule_store> firewall;
  std::shared_ptr<device_orchestrator> devices;
  std::shared_ptr<daemon_supervisor> daemons;
  std::unique_ptr<interface_driver> driver;
};

} // namespace hostnet
