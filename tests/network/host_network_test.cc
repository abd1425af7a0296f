#include <algorithm>
#include <memory>

#include <gflags/gflags.h>

#include "firewall/rule_store.h"
#include "mock_runner.h"
#include "network/host_network.h"
#include "network/network_spec.h"
#include "utils/errors.h"

#include "gtest/gtest.h"

DECLARE_string(lock_path);
DECLARE_string(routing_source_ip);
DECLARE_string(force_snat_range);
DECLARE_string(dmz_cidr);
DECLARE_string(networks_path);

namespace hostnet {

static const char *pfctl = "pfctl -a test -f -";

static bool contains(const std::vector<std::string> &rules,
                     const std::string &rule) {
  return std::find(rules.begin(), rules.end(), rule) != rules.end();
}

static network_spec sample_net() {
  network_spec net;
  net.id = 1;
  net.label = "private";
  net.bridge = "br100";
  net.bridge_interface = "em0";
  net.cidr = "10.0.0.0/24";
  net.dhcp_server = "10.0.0.1";
  return net;
}

TEST(host_network, unknown_driver) {
  auto runner = std::make_shared<mock_runner>();
  EXPECT_THROW(host_network(runner, "test", "linux"), hostnet_error);
}

TEST(host_network, init_host) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");

  FLAGS_routing_source_ip = "192.0.2.1";
  FLAGS_force_snat_range = "198.51.100.0/24";
  FLAGS_dmz_cidr = "203.0.113.0/24";
  host.init_host("10.0.0.0/24", true);
  FLAGS_routing_source_ip = "";
  FLAGS_force_snat_range = "";
  FLAGS_dmz_cidr = "";

  auto fw = host.get_firewall();
  auto nat = fw->get_rules(RS_TRANSLATION);
  EXPECT_TRUE(contains(
      nat, "nat inet from 10.0.0.0/24 to 198.51.100.0/24 -> 192.0.2.1"));

  auto filter = fw->get_rules(RS_FILTERING);
  EXPECT_TRUE(
      contains(filter, "pass quick inet from 10.0.0.0/24 to 198.51.100.0/24"));
  EXPECT_TRUE(
      contains(filter, "pass quick inet from 10.0.0.0/24 to 127.0.0.1/32"));
  EXPECT_TRUE(
      contains(filter, "pass quick inet from 10.0.0.0/24 to 203.0.113.0/24"));
  EXPECT_FALSE(fw->dirty());
}

TEST(host_network, init_host_inside_deferred_batch) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");

  host.get_firewall()->defer_apply();
  host.init_host("10.0.0.0/24");
  host.init_host("10.1.0.0/24");
  EXPECT_EQ(0u, runner->count("pfctl"));

  host.get_firewall()->resume_apply();
  EXPECT_EQ(1u, runner->count(pfctl));
}

TEST(host_network, metadata_rules) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");

  host.metadata_forward();
  host.metadata_accept();

  auto fw = host.get_firewall();
  EXPECT_EQ(std::vector<std::string>{"rdr proto tcp from any to "
                                     "169.254.169.254 port 80 -> 127.0.0.1 "
                                     "port 8775"},
            fw->get_rules(RS_TRANSLATION));
  EXPECT_EQ(2u, fw->get_rules(RS_FILTERING).size());
  EXPECT_EQ(2u, runner->count(pfctl));
}

TEST(host_network, vpn_forward) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");

  host.ensure_vpn_forward("192.0.2.1", 1000, "10.0.0.2");

  auto fw = host.get_firewall();
  EXPECT_TRUE(contains(fw->get_rules(RS_TRANSLATION),
                       "rdr proto udp from any to 192.0.2.1 port 1000 -> "
                       "10.0.0.2 port 1194"));
  EXPECT_TRUE(contains(fw->get_rules(RS_FILTERING),
                       "pass in proto udp from any to 10.0.0.2 port 1194"));
}

TEST(host_network, floating_forward) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");
  auto fw = host.get_firewall();
  auto net = sample_net();

  // traffic from inside the network needs no exception on its own bridge
  host.ensure_floating_forward("192.0.2.10", "10.0.0.3", "br100", net);
  EXPECT_EQ(1u, fw->get_rules(RS_TRANSLATION).size());
  host.remove_floating_forward("192.0.2.10", "10.0.0.3", "br100", net);
  EXPECT_TRUE(fw->get_rules(RS_TRANSLATION).empty());

  host.ensure_floating_forward("192.0.2.10", "10.0.0.3", "em1", net);
  EXPECT_TRUE(contains(fw->get_rules(RS_TRANSLATION),
                       "no nat inet from 10.0.0.3 to 10.0.0.0/24"));
  host.remove_floating_forward("192.0.2.10", "10.0.0.3", "em1", net);
  EXPECT_TRUE(fw->get_rules(RS_TRANSLATION).empty());
}

TEST(host_network, floating_exemption_after_snat) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");
  auto net = sample_net();

  FLAGS_routing_source_ip = "192.0.2.1";
  host.init_host("10.0.0.0/24");
  FLAGS_routing_source_ip = "";
  host.ensure_floating_forward("192.0.2.10", "10.0.0.3", "em1", net);

  // the exemption must be the first nat rule pf sees
  std::string text = runner->inputs.back();
  size_t exemption = text.find("no nat inet from 10.0.0.3 to 10.0.0.0/24");
  size_t snat = text.find("nat inet from 10.0.0.0/24 to 0.0.0.0/0");
  ASSERT_NE(std::string::npos, exemption);
  ASSERT_NE(std::string::npos, snat);
  EXPECT_LT(exemption, snat);
  EXPECT_EQ(0u, exemption);
}

TEST(host_network, gateway_setup_shares_one_rule_store) {
  auto runner = std::make_shared<mock_runner>();
  host_network host(runner, "test", "bridge");
  auto net = sample_net();

  host.get_firewall()->defer_apply();
  std::string dev = host.plug(net, "fa:16:3e:00:00:01");
  host.update_dhcp(dev, net, std::vector<fixed_ip>());
  host.get_firewall()->resume_apply();

  EXPECT_EQ("br100", dev);
  EXPECT_EQ("br100", host.get_dev(net));
  ASSERT_EQ(1u, runner->count(pfctl));
  EXPECT_NE(std::string::npos,
            runner->inputs.back().find("pass in quick on br100 all"));
  EXPECT_NE(std::string::npos,
            runner->inputs.back().find(
                "pass in on br100 inet proto udp from any to any port 67"));
}

} // namespace hostnet

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  FLAGS_lock_path = hostnet::make_temp_dir();
  FLAGS_networks_path = hostnet::make_temp_dir();
  return RUN_ALL_TESTS();
}
