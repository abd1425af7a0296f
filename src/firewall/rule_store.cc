/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <algorithm>
#include <utility>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "rule_store.h"
#include "utils/command_runner.h"
#include "utils/errors.h"
#include "utils/named_lock.h"
#include "utils/utils.h"

DECLARE_string(routing_source_ip);
DECLARE_string(force_snat_range);
DECLARE_string(public_interface);

namespace hostnet {

static const char *section_names[RS_MAX] = {"translation", "filtering"};

firewall_rule_store::firewall_rule_store(std::shared_ptr<command_runner> runner,
                                         const std::string &anchor)
    : runner(std::move(runner)), anchor(anchor), is_dirty(false),
      apply_deferred(false), generation(0) {}

bool firewall_rule_store::get_rule_section(const std::string &rule,
                                           rule_section *section) {
  auto fields = split_fields(rule);
  if (fields.empty())
    return false;

  std::string verb = fields[0];

  // "no nat ...", "no rdr ..."
  if (verb == "no" && fields.size() > 1)
    verb = fields[1];

  if (verb == "nat" || verb == "rdr" || verb == "binat") {
    *section = RS_TRANSLATION;
    return true;
  }

  if (verb == "pass" || verb == "block" || verb == "match" ||
      verb == "antispoof") {
    *section = RS_FILTERING;
    return true;
  }

  return false;
}

// "no nat ...", "no rdr ..."
static bool is_exemption(const std::string &rule) {
  return rule.compare(0, 3, "no ") == 0;
}

bool firewall_rule_store::add_rule(const std::string &rule) {
  std::string cleaned = strip(rule);
  rule_section section;

  if (!get_rule_section(cleaned, &section)) {
    LOG(WARNING) << __FUNCTION__ << ": dropping rule with unknown verb: '"
                 << cleaned << "'";
    return false;
  }

  std::lock_guard<std::mutex> lock(rules_mutex);
  auto &seq = rules[section];
  if (std::find(seq.begin(), seq.end(), cleaned) != seq.end())
    return false;

  // pf takes the first matching nat rule, exemptions have to precede it
  if (is_exemption(cleaned))
    seq.insert(std::find_if(seq.begin(), seq.end(),
                            [](const std::string &r) {
                              return !is_exemption(r);
                            }),
               cleaned);
  else
    seq.push_back(cleaned);
  is_dirty = true;
  generation++;

  VLOG(1) << __FUNCTION__ << ": added rule to " << section_names[section]
          << ": " << cleaned;
  return true;
}

bool firewall_rule_store::remove_rule(const std::string &rule) {
  std::string cleaned = strip(rule);
  rule_section section;

  if (!get_rule_section(cleaned, &section)) {
    LOG(WARNING) << __FUNCTION__ << ": ignoring rule with unknown verb: '"
                 << cleaned << "'";
    return false;
  }

  std::lock_guard<std::mutex> lock(rules_mutex);
  auto &seq = rules[section];
  auto it = std::find(seq.begin(), seq.end(), cleaned);
  if (it == seq.end())
    return false;

  seq.erase(it);
  is_dirty = true;
  generation++;

  VLOG(1) << __FUNCTION__ << ": removed rule from " << section_names[section]
          << ": " << cleaned;
  return true;
}

void firewall_rule_store::defer_apply() {
  std::lock_guard<std::mutex> lock(rules_mutex);
  apply_deferred = true;
}

void firewall_rule_store::resume_apply() {
  {
    std::lock_guard<std::mutex> lock(rules_mutex);
    apply_deferred = false;
  }
  apply();
}

bool firewall_rule_store::dirty() const {
  std::lock_guard<std::mutex> lock(rules_mutex);
  return is_dirty;
}

bool firewall_rule_store::is_deferred() const {
  std::lock_guard<std::mutex> lock(rules_mutex);
  return apply_deferred;
}

void firewall_rule_store::apply() {
  {
    std::lock_guard<std::mutex> lock(rules_mutex);
    if (apply_deferred) {
      VLOG(2) << __FUNCTION__ << ": apply deferred";
      return;
    }
    if (!is_dirty) {
      VLOG(2) << __FUNCTION__ << ": skipping apply due to lack of new rules";
      return;
    }
  }

  named_lock lock("firewall");

  std::string text;
  uint64_t committed;
  {
    std::lock_guard<std::mutex> rlock(rules_mutex);
    // another thread might have committed while we waited for the lock
    if (!is_dirty)
      return;
    text = render();
    committed = generation;
  }

  try {
    runner->execute({"pfctl", "-a", anchor, "-f", "-"},
                    exec_opts::root_with_input(text));
  } catch (process_execution_error &e) {
    LOG(ERROR) << __FUNCTION__ << ": failed to load rules into anchor "
               << anchor << ": " << e.get_stderr();
    throw configuration_error("pf anchor " + anchor, e.get_stderr());
  }

  {
    std::lock_guard<std::mutex> rlock(rules_mutex);
    if (generation == committed)
      is_dirty = false;
  }

  LOG(INFO) << __FUNCTION__ << ": loaded rules into anchor " << anchor;
}

std::vector<std::string>
firewall_rule_store::get_rules(rule_section section) const {
  std::lock_guard<std::mutex> lock(rules_mutex);
  return rules[section];
}

std::string firewall_rule_store::get_rule_text() const {
  std::lock_guard<std::mutex> lock(rules_mutex);
  return render();
}

// caller holds rules_mutex
std::string firewall_rule_store::render() const {
  std::string text;
  for (auto const &rule : rules[RS_TRANSLATION])
    text += rule + "\n";
  for (auto const &rule : rules[RS_FILTERING])
    text += rule + "\n";
  return text;
}

void firewall_rule_store::add_rules(const std::vector<std::string> &rules) {
  for (auto const &rule : rules)
    add_rule(rule);
}

void firewall_rule_store::remove_rules(const std::vector<std::string> &rules) {
  for (auto const &rule : rules)
    remove_rule(rule);
}

std::vector<std::string>
firewall_rule_store::gateway_rules(const std::string &bridge) {
  return {"pass in quick on " + bridge + " all",
          "pass out quick on " + bridge + " all"};
}

std::vector<std::string>
firewall_rule_store::bridge_rules(const std::string &bridge) {
  return {"pass in quick on " + bridge +
              " inet proto udp from any port 68 to any port 67",
          "block in quick on " + bridge + " inet from any to ! (" + bridge +
              ")"};
}

std::vector<std::string>
firewall_rule_store::dhcp_isolation_rules(const std::string &interface) {
  return {"block in quick on " + interface +
              " inet proto udp from any to any port 67:68",
          "block out quick on " + interface +
              " inet proto udp from any to any port 67:68"};
}

std::vector<std::string>
firewall_rule_store::floating_forward_rules(const std::string &floating_ip,
                                            const std::string &fixed_ip,
                                            const std::string &device) {
  std::vector<std::string> out;
  out.push_back("rdr inet from any to " + floating_ip + " -> " + fixed_ip);
  return out;
}

std::vector<std::string>
firewall_rule_store::dnsmasq_accept_rules(const std::string &dev) {
  std::vector<std::string> out;
  for (int port : {67, 53}) {
    for (const char *proto : {"udp", "tcp"}) {
      out.push_back("pass in on " + dev + " inet proto " + proto +
                    " from any to any port " + std::to_string(port));
    }
  }
  return out;
}

void firewall_rule_store::ensure_gateway_rules(const std::string &bridge) {
  add_rules(gateway_rules(bridge));
}

void firewall_rule_store::remove_gateway_rules(const std::string &bridge) {
  remove_rules(gateway_rules(bridge));
}

void firewall_rule_store::ensure_bridge_rules(const std::string &bridge) {
  add_rules(bridge_rules(bridge));
}

void firewall_rule_store::remove_bridge_rules(const std::string &bridge) {
  remove_rules(bridge_rules(bridge));
}

void firewall_rule_store::ensure_dhcp_isolation(const std::string &interface,
                                                const std::string &address) {
  // pf does not see arp, only the dhcp traffic of address is kept local
  VLOG(1) << __FUNCTION__ << ": isolating dhcp of " << address << " on "
          << interface;
  add_rules(dhcp_isolation_rules(interface));
}

void firewall_rule_store::remove_dhcp_isolation(const std::string &interface,
                                                const std::string &address) {
  VLOG(1) << __FUNCTION__ << ": removing dhcp isolation of " << address
          << " on " << interface;
  remove_rules(dhcp_isolation_rules(interface));
}

void firewall_rule_store::ensure_in_network_traffic_rules(
    const std::string &fixed_ip, const std::string &cidr) {
  add_rule("no nat inet from " + fixed_ip + " to " + cidr);
}

void firewall_rule_store::remove_in_network_traffic_rules(
    const std::string &fixed_ip, const std::string &cidr) {
  remove_rule("no nat inet from " + fixed_ip + " to " + cidr);
}

void firewall_rule_store::ensure_floating_rules(const std::string &floating_ip,
                                                const std::string &fixed_ip,
                                                const std::string &device) {
  add_rules(floating_forward_rules(floating_ip, fixed_ip, device));
}

void firewall_rule_store::remove_floating_rules(const std::string &floating_ip,
                                                const std::string &fixed_ip,
                                                const std::string &device) {
  remove_rules(floating_forward_rules(floating_ip, fixed_ip, device));
}

void firewall_rule_store::add_snat_rule(const std::string &ip_range,
                                        bool is_external) {
  if (FLAGS_routing_source_ip.empty())
    return;

  std::vector<std::string> snat_range;
  if (is_external)
    snat_range = split_list(FLAGS_force_snat_range);
  else
    snat_range.push_back("0.0.0.0/0");

  for (auto const &dest_range : snat_range) {
    if (!is_external && !FLAGS_public_interface.empty())
      add_rule("nat on " + FLAGS_public_interface + " inet from " + ip_range +
               " to " + dest_range + " -> " + FLAGS_routing_source_ip);
    else
      add_rule("nat inet from " + ip_range + " to " + dest_range + " -> " +
               FLAGS_routing_source_ip);
  }

  apply();
}

void firewall_rule_store::ensure_dnsmasq_accept_rules(const std::string &dev) {
  add_rules(dnsmasq_accept_rules(dev));
}

void firewall_rule_store::remove_dnsmasq_accept_rules(const std::string &dev) {
  remove_rules(dnsmasq_accept_rules(dev));
}

} // namespace hostnet
