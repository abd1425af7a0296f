/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <set>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "lease_config.h"
#include "network/network_spec.h"
#include "utils/utils.h"

DECLARE_string(dhcp_domain);
DECLARE_int32(dhcp_lease_time);
DECLARE_bool(use_single_default_gateway);
DECLARE_bool(share_dhcp_address);

namespace hostnet {

dhcp_params dhcp_params::from_flags() {
  dhcp_params p;
  p.domain = FLAGS_dhcp_domain;
  p.lease_time = FLAGS_dhcp_lease_time;
  p.use_single_default_gateway = FLAGS_use_single_default_gateway;
  p.share_dhcp_address = FLAGS_share_dhcp_address;
  return p;
}

static std::string host_dhcp_network(int vif_id) {
  return "NW-" + std::to_string(vif_id);
}

std::string truncate_hostname(const std::string &hostname) {
  if (hostname.size() <= max_hostname_len)
    return hostname;

  LOG(WARNING) << __FUNCTION__ << ": hostname " << hostname
               << " too long, truncating";
  return hostname.substr(0, 2) + "-" + hostname.substr(hostname.size() - 60);
}

std::string host_lease(const fixed_ip &ip, const dhcp_params &params,
                       time_t now) {
  return std::to_string(static_cast<long long>(now) + params.lease_time) + " " +
         ip.mac + " " + ip.address + " " +
         (ip.hostname.empty() ? "*" : ip.hostname) + " *";
}

std::string host_dhcp(const fixed_ip &ip, const dhcp_params &params) {
  std::string line = ip.mac + "," + truncate_hostname(ip.hostname) + "." +
                     params.domain + "," + ip.address;

  if (params.use_single_default_gateway)
    line += ",net:" + host_dhcp_network(ip.vif_id);
  return line;
}

std::string host_dns(const fixed_ip &ip, const dhcp_params &params) {
  return ip.address + "\t" + ip.hostname + "." + params.domain;
}

std::string host_dhcp_opts(int vif_id, const std::string &gateway) {
  std::vector<std::string> values;

  if (vif_id >= 0)
    values.push_back(host_dhcp_network(vif_id));
  values.push_back("3"); // router option
  if (!gateway.empty())
    values.push_back(gateway);
  return join(values, ",");
}

std::string get_dhcp_leases(const std::vector<fixed_ip> &ips,
                            const dhcp_params &params, time_t now) {
  std::vector<std::string> lines;

  // a lease line only for addresses that are really leased
  for (auto const &ip : ips) {
    if (ip.leased)
      lines.push_back(host_lease(ip, params, now));
  }
  return join(lines, "\n");
}

std::string get_dhcp_hosts(const std::vector<fixed_ip> &ips,
                           const dhcp_params &params) {
  std::vector<std::string> lines;
  std::set<std::string> macs;

  for (auto const &ip : ips) {
    if (!ip.allocated)
      continue;
    if (!macs.insert(ip.mac).second) {
      VLOG(2) << __FUNCTION__ << ": skipping " << ip.address << ", "
              << ip.mac << " is already listed";
      continue;
    }
    lines.push_back(host_dhcp(ip, params));
  }
  return join(lines, "\n");
}

std::string get_dns_hosts(const std::vector<fixed_ip> &ips,
                          const dhcp_params &params) {
  std::vector<std::string> lines;

  for (auto const &ip : ips) {
    if (ip.allocated)
      lines.push_back(host_dns(ip, params));
  }
  return join(lines, "\n");
}

std::string get_dhcp_opts(const network_spec &net,
                          const std::vector<fixed_ip> &ips,
                          const dhcp_params &params) {
  std::string gateway = net.gateway;

  // multi host without a shared address: this host is the gateway
  if (net.multi_host && !(net.share_address || params.share_dhcp_address))
    gateway = net.dhcp_server;

  std::vector<std::string> lines;
  if (params.use_single_default_gateway) {
    for (auto const &ip : ips) {
      if (!ip.allocated)
        continue;
      if (ip.default_route)
        lines.push_back(host_dhcp_opts(ip.vif_id, gateway));
      else
        lines.push_back(host_dhcp_opts(ip.vif_id));
    }
  } else {
    lines.push_back(host_dhcp_opts(-1, gateway));
  }
  return join(lines, "\n");
}

std::string get_ra_config(const std::string &dev, const std::string &cidr_v6) {
  return "\n"
         "interface " +
         dev +
         "\n"
         "{\n"
         "   AdvSendAdvert on;\n"
         "   MinRtrAdvInterval 3;\n"
         "   MaxRtrAdvInterval 10;\n"
         "   prefix " +
         cidr_v6 +
         "\n"
         "   {\n"
         "        AdvOnLink on;\n"
         "        AdvAutonomous on;\n"
         "   };\n"
         "};\n";
}

} // namespace hostnet
