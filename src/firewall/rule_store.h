/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace hostnet {

class command_runner;

enum rule_section {
  RS_TRANSLATION, // nat, rdr, binat
  RS_FILTERING,   // pass, block
  RS_MAX          /* must be last */
};

/**
 * @brief in-memory pf rule set of this agent
 *
 * One instance is created at process start and shared by everything that
 * touches the packet filter; it lives until the process exits.  Every commit
 * loads the whole rule set into the anchor, translation rules first.
 */
class firewall_rule_store final {
public:
  firewall_rule_store(std::shared_ptr<command_runner> runner,
                      const std::string &anchor);
  ~firewall_rule_store() {}

  /**
   * @brief classify a trimmed rule by its leading verb
   *
   * @return false for an unknown verb
   */
  static bool get_rule_section(const std::string &rule, rule_section *section);

  // both return true if the rule set changed
  bool add_rule(const std::string &rule);
  bool remove_rule(const std::string &rule);

  void defer_apply();
  void resume_apply();

  bool dirty() const;
  bool is_deferred() const;

  /**
   * @brief commit the rule set if it changed and apply is not deferred
   *
   * @throws configuration_error if pfctl rejects the rule set; the store stays
   * dirty in that case
   */
  void apply();

  std::vector<std::string> get_rules(rule_section section) const;
  std::string get_rule_text() const;
  const std::string &get_anchor() const { return anchor; }

  // traffic forwarded through a gateway bridge
  void ensure_gateway_rules(const std::string &bridge);
  void remove_gateway_rules(const std::string &bridge);

  // no forwarding for non-gateway bridges, dhcp stays reachable
  void ensure_bridge_rules(const std::string &bridge);
  void remove_bridge_rules(const std::string &bridge);

  void ensure_dhcp_isolation(const std::string &interface,
                             const std::string &address);
  void remove_dhcp_isolation(const std::string &interface,
                             const std::string &address);

  void ensure_in_network_traffic_rules(const std::string &fixed_ip,
                                       const std::string &cidr);
  void remove_in_network_traffic_rules(const std::string &fixed_ip,
                                       const std::string &cidr);

  void ensure_floating_rules(const std::string &floating_ip,
                             const std::string &fixed_ip,
                             const std::string &device);
  void remove_floating_rules(const std::string &floating_ip,
                             const std::string &fixed_ip,
                             const std::string &device);

  void add_snat_rule(const std::string &ip_range, bool is_external = false);

  // dhcp (67) and dns (53) towards dnsmasq
  void ensure_dnsmasq_accept_rules(const std::string &dev);
  void remove_dnsmasq_accept_rules(const std::string &dev);

  static std::vector<std::string> gateway_rules(const std::string &bridge);
  static std::vector<std::string> bridge_rules(const std::string &bridge);
  static std::vector<std::string>
  dhcp_isolation_rules(const std::string &interface);
  static std::vector<std::string>
  floating_forward_rules(const std::string &floating_ip,
                         const std::string &fixed_ip,
                         const std::string &device);
  static std::vector<std::string>
  dnsmasq_accept_rules(const std::string &dev);

private:
  firewall_rule_store(const firewall_rule_store &other) = delete;
  firewall_rule_store &operator=(const firewall_rule_store &) = delete;

  void add_rules(const std::vector<std::string> &rules);
  void remove_rules(const std::vector<std::string> &rules);

  std::string render() const;

  std::shared_ptr<command_runner> runner;
  std::string anchor;

  // protects the rule sequences and flags, not the commit itself
  mutable std::mutex rules_mutex;
  std::vector<std::string> rules[RS_MAX];
  bool is_dirty;
  bool apply_deferred;
  uint64_t generation; // bumped by every change
};

} // namespace hostnet
