/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "utils/command_runner.h"

namespace hostnet {

class firewall_rule_store;
struct network_spec;

// command kinds with their own list of tolerated error messages
enum command_kind {
  CK_CREATE,
  CK_ATTACH,
  CK_DESTROY,
};

/**
 * @brief creates, tears down and rewires host network devices
 *
 * Nothing is cached, every check asks ifconfig again.
 */
class device_orchestrator {
public:
  device_orchestrator(std::shared_ptr<command_runner> runner,
                      std::shared_ptr<firewall_rule_store> firewall);
  virtual ~device_orchestrator() {}

  bool device_exists(const std::string &dev);

  /**
   * @brief create a bridge unless it exists and move interface onto it
   *
   * Addresses and gateway routes of interface are moved to the bridge. The
   * bridge takes the mtu of net if one is set. Gateway or bridge rules are
   * added to the rule store but not applied.
   *
   * @throws configuration_error
   */
  void ensure_bridge(const std::string &bridge, const std::string &interface,
                     const network_spec *net = nullptr, bool gateway = true,
                     bool filtering = true);

  void remove_bridge(const std::string &bridge, bool gateway = true,
                     bool filtering = true);

  // @return the vlan interface name
  std::string ensure_vlan(int vlan_id, const std::string &interface,
                          const std::string &mac = "", int mtu = 0,
                          const std::string &name = "");
  void remove_vlan(int vlan_id);

  std::string ensure_vlan_bridge(int vlan_id, const std::string &bridge,
                                 const std::string &interface,
                                 const network_spec *net = nullptr,
                                 const std::string &mac = "", int mtu = 0);
  void remove_vlan_bridge(int vlan_id, const std::string &bridge);

  void create_tap(const std::string &dev, const std::string &mac = "");
  void delete_net_dev(const std::string &dev);
  void set_device_mtu(const std::string &dev, int mtu);
  void set_device_mac(const std::string &dev, const std::string &mac);
  void set_device_up(const std::string &dev);
  void add_address(const std::string &dev, const std::string &cidr);

  // ether address reported by ifconfig, empty if there is none
  std::string get_mac(const std::string &interface);

  /**
   * @brief make dhcp_server/prefix the first address of dev
   *
   * Enables forwarding, moves the other addresses behind it and restores the
   * gateway routes of dev.
   */
  void initialize_gateway_device(const std::string &dev,
                                 const network_spec &net);

  void bind_floating_ip(const std::string &floating_ip,
                        const std::string &device);
  void unbind_floating_ip(const std::string &floating_ip,
                          const std::string &device);
  void ensure_metadata_ip();
  void send_arp_for_ip(const std::string &ip, const std::string &device,
                       int count);

  // ovs-vsctl --timeout=<n> args...
  command_result ovs_vsctl(const std::vector<std::string> &args,
                           const std::string &dev);
  void ovs_add_flow(const std::string &bridge, const std::string &flow);
  void create_ovs_vif_port(const std::string &bridge, const std::string &dev,
                           const std::string &iface_id, const std::string &mac,
                           const std::string &instance_id, int mtu = 0,
                           const std::string &interface_type = "");
  void delete_ovs_vif_port(const std::string &bridge, const std::string &dev,
                           bool delete_dev = true);

  static bool is_benign_error(command_kind kind, const std::string &err);

  static std::vector<std::string>
  ifconfig_tail_cmd(const std::string &netif,
                    const std::vector<std::string> &params,
                    const std::string &action);

private:
  device_orchestrator(const device_orchestrator &other) = delete;
  device_orchestrator &operator=(const device_orchestrator &) = delete;

  // failures are reported as configuration_error of dev
  command_result run(const std::vector<std::string> &argv,
                     const std::string &dev);
  // same, but errors listed for kind are tolerated
  command_result run_tolerant(const std::vector<std::string> &argv,
                              command_kind kind, const std::string &dev);

  std::vector<std::vector<std::string>>
  get_inet_params(const std::string &interface);
  std::vector<std::vector<std::string>>
  get_gateway_routes(const std::string &interface);
  void delete_routes(const std::vector<std::vector<std::string>> &routes);
  void add_routes(const std::vector<std::vector<std::string>> &routes);

  void migrate_addresses(const std::string &from, const std::string &to);
  void delete_bridge_dev(const std::string &dev);
  void enable_ipv4_forwarding();

  std::shared_ptr<command_runner> runner;
  std::shared_ptr<firewall_rule_store> firewall;
};

} // namespace hostnet
