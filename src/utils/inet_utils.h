/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <cstdint>
#include <string>

namespace hostnet {

/**
 * @brief parse a dotted quad into host byte order
 *
 * @return false if addr is not an IPv4 address
 */
bool parse_ipv4(const std::string &addr, uint32_t *out);

std::string format_ipv4(uint32_t addr);

/**
 * @brief prefix length of a netmask given as 0xffffff00 or 255.255.255.0
 *
 * @return -1 if the mask is invalid or not contiguous
 */
int netmask_to_prefixlen(const std::string &mask);

// "10.0.0.5" and "0xffffff00" -> "10.0.0.5/24"
std::string address_to_cidr(const std::string &address,
                            const std::string &mask);

// "10.0.0.0/24" -> "24"; an empty string if there is no prefix
std::string cidr_prefix(const std::string &cidr);

// number of addresses in an IPv4 CIDR, 0 if invalid
uint64_t cidr_size(const std::string &cidr);

} // namespace hostnet
