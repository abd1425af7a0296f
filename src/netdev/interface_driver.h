/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#pragma once

#include <memory>
#include <string>

namespace hostnet {

class device_orchestrator;
class firewall_rule_store;
struct network_spec;

/**
 * @brief creates the gateway/dhcp endpoint of a network on this host
 */
class interface_driver {
public:
  interface_driver(std::shared_ptr<device_orchestrator> devices,
                   std::shared_ptr<firewall_rule_store> firewall)
      : devices(devices), firewall(firewall) {}
  virtual ~interface_driver() {}

  // create the device, return its name
  virtual std::string plug(const network_spec &net, const std::string &mac,
                           bool gateway = true) = 0;

  // destroy the device, return its name or an empty string if it was absent
  virtual std::string unplug(const network_spec &net) = 0;

  virtual std::string get_dev(const network_spec &net) const = 0;

protected:
  interface_driver(const interface_driver &other) = delete;
  interface_driver &operator=(const interface_driver &) = delete;

  std::shared_ptr<device_orchestrator> devices;
  std::shared_ptr<firewall_rule_store> firewall;
};

// if_bridge(4) with optional vlan(4) underneath
class bridge_interface_driver final : public interface_driver {
public:
  bridge_interface_driver(std::shared_ptr<device_orchestrator> devices,
                          std::shared_ptr<firewall_rule_store> firewall)
      : interface_driver(devices, firewall) {}
  ~bridge_interface_driver() override {}

  std::string plug(const network_spec &net, const std::string &mac,
                   bool gateway = true) override;
  std::string unplug(const network_spec &net) override;
  std::string get_dev(const network_spec &net) const override;
};

// internal port on the Open vSwitch integration bridge
class ovs_interface_driver final : public interface_driver {
public:
  ovs_interface_driver(std::shared_ptr<device_orchestrator> devices,
                       std::shared_ptr<firewall_rule_store> firewall)
      : interface_driver(devices, firewall) {}
  ~ovs_interface_driver() override {}

  std::string plug(const network_spec &net, const std::string &mac,
                   bool gateway = true) override;
  std::string unplug(const network_spec &net) override;
  std::string get_dev(const network_spec &net) const override;
};

// tap plus brq<uuid> bridge as laid out by the neutron bridge agent
class neutron_bridge_interface_driver final : public interface_driver {
public:
  neutron_bridge_interface_driver(std::shared_ptr<device_orchestrator> devices,
                                  std::shared_ptr<firewall_rule_store> firewall)
      : interface_driver(devices, firewall) {}
  ~neutron_bridge_interface_driver() override {}

  std::string plug(const network_spec &net, const std::string &mac,
                   bool gateway = true) override;
  std::string unplug(const network_spec &net) override;
  std::string get_dev(const network_spec &net) const override;

  std::string get_bridge(const network_spec &net) const;
};

/**
 * @brief driver for the given name: bridge, ovs or neutron_bridge
 *
 * @throws hostnet_error for an unknown name
 */
std::unique_ptr<interface_driver>
create_interface_driver(const std::string &name,
                        std::shared_ptr<device_orchestrator> devices,
                        std::shared_ptr<firewall_rule_store> firewall);

} // namespace hostnet
