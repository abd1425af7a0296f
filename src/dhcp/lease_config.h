/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <ctime>
#include <string>
#include <vector>

namespace hostnet {

struct network_spec;

/**
 * @brief lease record of one address of a network
 */
struct fixed_ip {
  std::string address;
  std::string mac; // of the virtual interface
  int vif_id = 0;
  std::string hostname;
  bool leased = false;
  bool allocated = false;
  bool default_route = false;
};

struct dhcp_params {
  std::string domain = "novalocal";
  int lease_time = 86400;
  bool use_single_default_gateway = false;
  bool share_dhcp_address = false;

  // values of the dhcp flags
  static dhcp_params from_flags();
};

// dnsmasq counts the dot, so a host label holds at most 63 characters
constexpr size_t max_hostname_len = 63;

std::string truncate_hostname(const std::string &hostname);

// "<expiry> <mac> <ip> <hostname|*> *"
std::string host_lease(const fixed_ip &ip, const dhcp_params &params,
                       time_t now);

// "<mac>,<hostname>.<domain>,<ip>[,net:NW-<vif_id>]"
std::string host_dhcp(const fixed_ip &ip, const dhcp_params &params);

// "<ip>\t<hostname>.<domain>"
std::string host_dns(const fixed_ip &ip, const dhcp_params &params);

/**
 * @brief dhcp option 3 (router) line
 *
 * @param vif_id tag the line with NW-<vif_id> if not negative
 * @param gateway leave the router empty if gateway is empty
 */
std::string host_dhcp_opts(int vif_id = -1, const std::string &gateway = "");

// leased entries only
std::string get_dhcp_leases(const std::vector<fixed_ip> &ips,
                            const dhcp_params &params, time_t now);

// allocated entries only, first entry of a mac wins
std::string get_dhcp_hosts(const std::vector<fixed_ip> &ips,
                           const dhcp_params &params);

std::string get_dns_hosts(const std::vector<fixed_ip> &ips,
                          const dhcp_params &params);

std::string get_dhcp_opts(const network_spec &net,
                          const std::vector<fixed_ip> &ips,
                          const dhcp_params &params);

std::string get_ra_config(const std::string &dev, const std::string &cidr_v6);

} // namespace hostnet
