/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstdlib>

#include "inet_utils.h"

namespace hostnet {

bool parse_ipv4(const std::string &addr, uint32_t *out) {
  struct in_addr in;

  if (inet_pton(AF_INET, addr.c_str(), &in) != 1)
    return false;

  *out = ntohl(in.s_addr);
  return true;
}

std::string format_ipv4(uint32_t addr) {
  char buf[INET_ADDRSTRLEN];
  struct in_addr in;

  in.s_addr = htonl(addr);
  inet_ntop(AF_INET, &in, buf, sizeof(buf));
  return std::string(buf);
}

int netmask_to_prefixlen(const std::string &mask) {
  uint32_t m = 0;

  if (mask.compare(0, 2, "0x") == 0 || mask.compare(0, 2, "0X") == 0) {
    char *end = nullptr;
    unsigned long v = std::strtoul(mask.c_str() + 2, &end, 16);
    if (end == mask.c_str() + 2 || *end != '\0' || v > 0xffffffffUL)
      return -1;
    m = static_cast<uint32_t>(v);
  } else if (!parse_ipv4(mask, &m)) {
    return -1;
  }

  int plen = 0;
  while (plen < 32 && (m & (0x80000000u >> plen)))
    plen++;

  // the remaining bits must all be zero
  if (plen < 32 && (m << plen) != 0)
    return -1;

  return plen;
}

std::string address_to_cidr(const std::string &address,
                            const std::string &mask) {
  int plen = netmask_to_prefixlen(mask);
  if (plen < 0)
    return address;
  return address + "/" + std::to_string(plen);
}

std::string cidr_prefix(const std::string &cidr) {
  auto pos = cidr.rfind('/');
  if (pos == std::string::npos)
    return std::string();
  return cidr.substr(pos + 1);
}

uint64_t cidr_size(const std::string &cidr) {
  std::string prefix = cidr_prefix(cidr);
  uint32_t addr;

  if (prefix.empty() || !parse_ipv4(cidr.substr(0, cidr.rfind('/')), &addr))
    return 0;

  int plen = std::atoi(prefix.c_str());
  if (plen < 0 || plen > 32)
    return 0;

  return uint64_t(1) << (32 - plen);
}

} // namespace hostnet
