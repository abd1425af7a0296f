/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <string>
#include <vector>

#include "dhcp/lease_config.h"
#include "network_spec.h"

namespace libconfig {
class Setting;
}

namespace hostnet {

struct network_entry {
  network_spec net;
  std::string mac; // of the gateway device
  std::vector<fixed_ip> fixed_ips;
};

/**
 * @brief networks and their fixed ips from a libconfig file
 *
 * networks = (
 *   { id = 1; uuid = "..."; label = "private"; bridge = "br100";
 *     cidr = "10.0.0.0/24"; ...
 *     fixed_ips = ( { address = "10.0.0.3"; mac = "..."; ... } ); }
 * );
 */
class network_db_file {
public:
  explicit network_db_file(const std::string &config_file)
      : config_file(config_file) {}
  virtual ~network_db_file() {}

  /**
   * @throws configuration_error if the file cannot be read or parsed
   */
  void read_config();

  const std::vector<network_entry> &get_networks() const { return networks; }

  // by label, bridge or id; nullptr if unknown
  const network_entry *find_network(const std::string &key) const;

private:
  void parse_network(const libconfig::Setting &network);
  fixed_ip parse_fixed_ip(const libconfig::Setting &setting);

  std::string config_file;
  std::vector<network_entry> networks;
};

} // namespace hostnet
