/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <libconfig.h++>

#include <glog/logging.h>

#include "network_db_file.h"
#include "utils/errors.h"

namespace hostnet {

static const char *networks_list = "networks";

static void read_string(const libconfig::Setting &s, const char *name,
                        std::string *out) {
  if (s.exists(name))
    *out = (const char *)s[name];
}

static void read_int(const libconfig::Setting &s, const char *name, int *out) {
  if (s.exists(name))
    *out = (int)s[name];
}

static void read_bool(const libconfig::Setting &s, const char *name,
                      bool *out) {
  if (s.exists(name))
    *out = (bool)s[name];
}

void network_db_file::read_config() {
  libconfig::Config config;

  try {
    config.readFile(config_file.c_str());
  } catch (libconfig::FileIOException &e) {
    LOG(ERROR) << __FUNCTION__ << ": unable to read " << config_file;
    throw configuration_error(config_file, "unable to read file");
  } catch (libconfig::ParseException &e) {
    LOG(ERROR) << __FUNCTION__ << ": " << config_file << ":" << e.getLine()
               << ": " << e.getError();
    throw configuration_error(config_file, std::string(e.getError()) +
                                               " at line " +
                                               std::to_string(e.getLine()));
  }

  networks.clear();
  if (!config.exists(networks_list)) {
    LOG(WARNING) << __FUNCTION__ << ": no networks in " << config_file;
    return;
  }

  const libconfig::Setting &list = config.lookup(networks_list);
  try {
    for (int i = 0; i < list.getLength(); i++)
      parse_network(list[i]);
  } catch (libconfig::SettingException &e) {
    LOG(ERROR) << __FUNCTION__ << ": bad setting " << e.getPath() << " in "
               << config_file;
    throw configuration_error(config_file,
                              std::string("bad setting ") + e.getPath());
  }

  VLOG(1) << __FUNCTION__ << ": read " << networks.size() << " networks from "
          << config_file;
}

void network_db_file::parse_network(const libconfig::Setting &network) {
  network_entry entry;
  network_spec &net = entry.net;

  if (!network.exists("bridge")) {
    LOG(WARNING) << __FUNCTION__ << ": skipping network without bridge at "
                 << network.getPath();
    return;
  }

  read_int(network, "id", &net.id);
  read_string(network, "uuid", &net.uuid);
  read_string(network, "label", &net.label);
  read_string(network, "bridge", &net.bridge);
  read_string(network, "bridge_interface", &net.bridge_interface);
  read_int(network, "vlan", &net.vlan);
  read_string(network, "cidr", &net.cidr);
  read_string(network, "cidr_v6", &net.cidr_v6);
  read_string(network, "netmask", &net.netmask);
  read_string(network, "broadcast", &net.broadcast);
  read_string(network, "dhcp_server", &net.dhcp_server);
  read_string(network, "dhcp_start", &net.dhcp_start);
  read_string(network, "gateway", &net.gateway);
  read_string(network, "dns1", &net.dns1);
  read_string(network, "dns2", &net.dns2);
  read_int(network, "mtu", &net.mtu);
  read_bool(network, "multi_host", &net.multi_host);
  read_bool(network, "share_address", &net.share_address);
  read_string(network, "mac", &entry.mac);

  if (network.exists("fixed_ips")) {
    const libconfig::Setting &ips = network["fixed_ips"];
    for (int j = 0; j < ips.getLength(); ++j)
      entry.fixed_ips.push_back(parse_fixed_ip(ips[j]));
  }

  networks.push_back(entry);
}

fixed_ip network_db_file::parse_fixed_ip(const libconfig::Setting &setting) {
  fixed_ip ip;

  read_string(setting, "address", &ip.address);
  read_string(setting, "mac", &ip.mac);
  read_int(setting, "vif_id", &ip.vif_id);
  read_string(setting, "hostname", &ip.hostname);
  read_bool(setting, "leased", &ip.leased);
  read_bool(setting, "allocated", &ip.allocated);
  read_bool(setting, "default_route", &ip.default_route);
  return ip;
}

const network_entry *
network_db_file::find_network(const std::string &key) const {
  for (auto const &entry : networks) {
    if (entry.net.label == key || entry.net.bridge == key ||
        std::to_string(entry.net.id) == key)
      return &entry;
  }
  return nullptr;
}

} // namespace hostnet
