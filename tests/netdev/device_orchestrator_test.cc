#include <memory>

#include <gflags/gflags.h>

#include "firewall/rule_store.h"
#include "mock_runner.h"
#include "netdev/device_orchestrator.h"
#include "network/network_spec.h"
#include "utils/errors.h"

#include "gtest/gtest.h"

DECLARE_string(lock_path);

namespace hostnet {

static const char *em0_with_addresses =
    "em0: flags=8843<UP,BROADCAST,RUNNING,SIMPLEX,MULTICAST> metric 0 mtu "
    "1500\n"
    "\toptions=81249b<RXCSUM,TXCSUM,VLAN_MTU,VLAN_HWTAGGING>\n"
    "\tether 52:54:00:12:34:56\n"
    "\tinet 192.0.2.10 netmask 0xffffff00 broadcast 192.0.2.255\n"
    "\tinet 192.0.2.11 netmask 0xffffffff broadcast 192.0.2.11\n"
    "\tmedia: Ethernet autoselect (1000baseT <full-duplex>)\n"
    "\tstatus: active\n";

static const char *em0_bare =
    "em0: flags=8843<UP,BROADCAST,RUNNING,SIMPLEX,MULTICAST> metric 0 mtu "
    "1500\n"
    "\tether 52:54:00:12:34:56\n"
    "\tstatus: active\n";

static const char *routes_via_em0 =
    "Routing tables\n"
    "\n"
    "Internet:\n"
    "Destination        Gateway            Flags     Refs      Use  Mtu    "
    "Netif Expire\n"
    "default            192.0.2.1          UGS          0     1024 1500    "
    "em0\n"
    "127.0.0.1          link#2             UH           0        8 16384   "
    "lo0\n"
    "192.0.2.0/24       link#1             U            0       17 1500    "
    "em0\n";

static const char *routes_via_br100 =
    "Routing tables\n"
    "\n"
    "Internet:\n"
    "Destination        Gateway            Flags     Refs      Use  Mtu    "
    "Netif Expire\n"
    "default            192.0.2.1          UGS          0     1024 1500    "
    "br100\n";

struct orchestrator_fixture {
  orchestrator_fixture()
      : runner(std::make_shared<mock_runner>()),
        firewall(std::make_shared<firewall_rule_store>(runner, "test")),
        devices(runner, firewall) {}

  std::shared_ptr<mock_runner> runner;
  std::shared_ptr<firewall_rule_store> firewall;
  device_orchestrator devices;
};

TEST(device_orchestrator, device_exists) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig br100", "ifconfig: interface br100 does "
                                         "not exist");
  EXPECT_FALSE(f.devices.device_exists("br100"));
  EXPECT_TRUE(f.devices.device_exists("em0"));
}

TEST(device_orchestrator, benign_error_table) {
  EXPECT_TRUE(device_orchestrator::is_benign_error(
      CK_CREATE, "ifconfig: SIOCIFCREATE2: File exists"));
  EXPECT_TRUE(device_orchestrator::is_benign_error(
      CK_ATTACH, "ifconfig: BRDGADD em0: already a member"));
  EXPECT_TRUE(device_orchestrator::is_benign_error(
      CK_DESTROY, "ifconfig: interface vlan5 does not exist"));
  EXPECT_FALSE(device_orchestrator::is_benign_error(
      CK_DESTROY, "ifconfig: SIOCIFCREATE2: File exists"));
  EXPECT_FALSE(device_orchestrator::is_benign_error(
      CK_CREATE, "ifconfig: Operation not permitted"));
}

TEST(device_orchestrator, ensure_bridge_moves_addresses_and_routes) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig br100", "does not exist");
  f.runner->on_exact("ifconfig em0", command_result{em0_with_addresses, "", 0});
  f.runner->on("netstat -nrW -f inet",
               command_result{routes_via_em0, "", 0});

  f.devices.ensure_bridge("br100", "em0");

  auto &r = *f.runner;
  int create = r.index_of("ifconfig bridge create name br100");
  int up = r.index_of("ifconfig br100 up");
  int addm = r.index_of("ifconfig br100 addm em0");
  int ether = r.index_of("ifconfig br100 ether 52:54:00:12:34:56");
  int route_del = r.index_of("route -q delete default 192.0.2.1");
  int del1 = r.index_of("ifconfig em0 inet 192.0.2.10 netmask 0xffffff00 "
                        "broadcast 192.0.2.255 delete");
  int add1 = r.index_of("ifconfig br100 inet 192.0.2.10 netmask 0xffffff00 "
                        "broadcast 192.0.2.255 add");
  int del2 = r.index_of("ifconfig em0 inet 192.0.2.11 netmask 0xffffffff "
                        "broadcast 192.0.2.11 delete");
  int add2 = r.index_of("ifconfig br100 inet 192.0.2.11 netmask 0xffffffff "
                        "broadcast 192.0.2.11 add");
  int route_add = r.index_of("route -q add default 192.0.2.1");

  ASSERT_GE(create, 0);
  EXPECT_LT(create, up);
  EXPECT_LT(up, addm);
  EXPECT_LT(addm, ether);
  EXPECT_LT(ether, route_del);
  EXPECT_LT(route_del, del1);
  EXPECT_LT(del1, add1);
  EXPECT_LT(add1, del2);
  EXPECT_LT(del2, add2);
  EXPECT_LT(add2, route_add);

  // the connected route has no G flag
  EXPECT_EQ(1u, r.count("route -q delete"));

  // rules are queued, not committed
  EXPECT_EQ(0u, r.count("pfctl"));
  EXPECT_EQ(firewall_rule_store::gateway_rules("br100"),
            f.firewall->get_rules(RS_FILTERING));
}

TEST(device_orchestrator, only_gateway_routes_of_the_interface_move) {
  orchestrator_fixture f;
  const char *routes =
      "Routing tables\n"
      "\n"
      "Internet:\n"
      "Destination        Gateway            Flags     Refs      Use  Mtu    "
      "Netif Expire\n"
      "default            203.0.113.1        UGS          0       12 1500    "
      "em1\n"
      "198.51.100.0/24    192.0.2.254        UGS          2       40 1500    "
      "em0\n"
      "192.0.2.77         52:54:00:aa:bb:cc  UHLW         1        3 1500    "
      "em0   1190\n";

  f.runner->fail_exact("ifconfig br100", "does not exist");
  f.runner->on_exact("ifconfig em0", command_result{em0_with_addresses, "", 0});
  f.runner->on("netstat -nrW -f inet", command_result{routes, "", 0});

  f.devices.ensure_bridge("br100", "em0");

  auto &r = *f.runner;
  EXPECT_TRUE(r.ran("route -q delete 198.51.100.0/24 192.0.2.254"));
  EXPECT_TRUE(r.ran("route -q add 198.51.100.0/24 192.0.2.254"));
  EXPECT_EQ(1u, r.count("route -q delete"));
  EXPECT_EQ(1u, r.count("route -q add"));
}

TEST(device_orchestrator, second_ensure_bridge_is_not_destructive) {
  orchestrator_fixture f;

  f.runner->on_exact("ifconfig em0", command_result{em0_bare, "", 0});
  f.runner->on("netstat -nrW -f inet",
               command_result{routes_via_br100, "", 0});
  f.runner->fail("ifconfig br100 addm em0",
                 "ifconfig: BRDGADD em0: File exists");

  f.devices.ensure_bridge("br100", "em0");

  EXPECT_EQ(0u, f.runner->count("ifconfig bridge create"));
  EXPECT_EQ(0u, f.runner->count_containing("delete"));
  EXPECT_EQ(0u, f.runner->count_containing("destroy"));
  EXPECT_EQ(0u, f.runner->count("route"));
}

TEST(device_orchestrator, ensure_bridge_without_mac_skips_ether) {
  orchestrator_fixture f;

  f.runner->on_exact("ifconfig em0", command_result{"fake", "", 0});
  f.devices.ensure_bridge("br100", "em0", nullptr, false);

  EXPECT_EQ(0u, f.runner->count("ifconfig br100 ether"));
  EXPECT_EQ(firewall_rule_store::bridge_rules("br100"),
            f.firewall->get_rules(RS_FILTERING));
}

TEST(device_orchestrator, ensure_bridge_without_filtering) {
  orchestrator_fixture f;

  f.devices.ensure_bridge("br100", "", nullptr, true, false);
  EXPECT_FALSE(f.firewall->dirty());
}

TEST(device_orchestrator, ensure_bridge_sets_network_mtu) {
  orchestrator_fixture f;
  network_spec net;
  net.mtu = 9000;

  f.devices.ensure_bridge("br100", "", &net);
  EXPECT_TRUE(f.runner->ran("ifconfig br100 mtu 9000"));
}

TEST(device_orchestrator, benign_create_error_is_swallowed) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig br100", "does not exist");
  f.runner->fail("ifconfig bridge create",
                 "ifconfig: SIOCIFCREATE2: File exists");

  EXPECT_NO_THROW(f.devices.ensure_bridge("br100", ""));
  EXPECT_TRUE(f.runner->ran("ifconfig br100 up"));
}

TEST(device_orchestrator, fatal_create_error_is_raised) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig br100", "does not exist");
  f.runner->fail("ifconfig bridge create",
                 "ifconfig: SIOCIFCREATE2: Operation not permitted");

  try {
    f.devices.ensure_bridge("br100", "");
    FAIL() << "ensure_bridge did not throw";
  } catch (configuration_error &e) {
    EXPECT_EQ("br100", e.get_device());
    EXPECT_EQ("ifconfig: SIOCIFCREATE2: Operation not permitted",
              e.get_stderr());
  }
  EXPECT_FALSE(f.runner->ran("ifconfig br100 up"));
}

TEST(device_orchestrator, partial_migration_is_reported) {
  orchestrator_fixture f;

  f.runner->on_exact("ifconfig em0", command_result{em0_with_addresses, "", 0});
  f.runner->fail_exact("ifconfig br100 inet 192.0.2.11 netmask 0xffffffff "
                       "broadcast 192.0.2.11 add",
                       "ifconfig: ioctl (SIOCAIFADDR): File exists");

  try {
    f.devices.ensure_bridge("br100", "em0");
    FAIL() << "ensure_bridge did not throw";
  } catch (configuration_error &e) {
    EXPECT_EQ("br100", e.get_device());
    EXPECT_NE(std::string::npos, e.get_stderr().find("[192.0.2.10]"));
  }

  // nothing is rolled back
  EXPECT_TRUE(f.runner->ran("ifconfig br100 inet 192.0.2.10"));
}

TEST(device_orchestrator, ensure_vlan) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig vlan100", "does not exist");
  EXPECT_EQ("vlan100",
            f.devices.ensure_vlan(100, "em0", "52:54:00:aa:bb:cc", 9000));

  auto &r = *f.runner;
  int create = r.index_of("ifconfig vlan create vlan 100 vlandev em0 name "
                          "vlan100");
  int ether = r.index_of("ifconfig vlan100 ether 52:54:00:aa:bb:cc");
  int up = r.index_of("ifconfig vlan100 up");
  int mtu = r.index_of("ifconfig vlan100 mtu 9000");
  ASSERT_GE(create, 0);
  EXPECT_LT(create, ether);
  EXPECT_LT(ether, up);
  EXPECT_LT(up, mtu);
}

TEST(device_orchestrator, ensure_vlan_twice_only_sets_mtu) {
  orchestrator_fixture f;

  f.devices.ensure_vlan(100, "em0", "", 1400);
  f.devices.ensure_vlan(100, "em0", "", 1500);

  EXPECT_EQ(0u, f.runner->count("ifconfig vlan create"));
  EXPECT_TRUE(f.runner->ran("ifconfig vlan100 mtu 1400"));
  EXPECT_TRUE(f.runner->ran("ifconfig vlan100 mtu 1500"));
}

TEST(device_orchestrator, ensure_vlan_with_name_and_no_mtu) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig tenant7", "does not exist");
  EXPECT_EQ("tenant7", f.devices.ensure_vlan(7, "em1", "", 0, "tenant7"));
  EXPECT_TRUE(
      f.runner->ran("ifconfig vlan create vlan 7 vlandev em1 name tenant7"));
  EXPECT_EQ(0u, f.runner->count("ifconfig tenant7 mtu"));
}

TEST(device_orchestrator, ensure_vlan_bridge) {
  orchestrator_fixture f;

  // both show up once created
  f.runner->fail_exact("ifconfig vlan100", "does not exist", 1, 1);
  f.runner->fail_exact("ifconfig br100", "does not exist", 1, 1);

  EXPECT_EQ("vlan100", f.devices.ensure_vlan_bridge(100, "br100", "em0"));
  EXPECT_LT(f.runner->index_of("ifconfig vlan create"),
            f.runner->index_of("ifconfig bridge create name br100"));
  EXPECT_TRUE(f.runner->ran("ifconfig br100 addm vlan100"));
}

TEST(device_orchestrator, remove_absent_bridge_is_noop) {
  orchestrator_fixture f;

  f.firewall->ensure_gateway_rules("br100");
  f.runner->fail_exact("ifconfig br100", "does not exist");

  f.devices.remove_bridge("br100");

  EXPECT_EQ(1u, f.runner->commands.size());
  EXPECT_EQ(2u, f.firewall->get_rules(RS_FILTERING).size());
}

TEST(device_orchestrator, remove_bridge) {
  orchestrator_fixture f;

  f.firewall->ensure_gateway_rules("br100");
  f.devices.remove_bridge("br100");

  EXPECT_TRUE(f.firewall->get_rules(RS_FILTERING).empty());
  EXPECT_LT(f.runner->index_of("ifconfig br100 down"),
            f.runner->index_of("ifconfig br100 destroy"));
}

TEST(device_orchestrator, remove_vlan_bridge) {
  orchestrator_fixture f;

  f.devices.remove_vlan_bridge(100, "br100");
  EXPECT_LT(f.runner->index_of("ifconfig br100 destroy"),
            f.runner->index_of("ifconfig vlan100 destroy"));
}

TEST(device_orchestrator, destroy_of_vanished_device_is_benign) {
  orchestrator_fixture f;

  f.runner->fail("ifconfig vlan5 destroy",
                 "ifconfig: interface vlan5 does not exist");
  EXPECT_NO_THROW(f.devices.remove_vlan(5));
}

TEST(device_orchestrator, delete_net_dev_failure_is_raised) {
  orchestrator_fixture f;

  f.runner->fail("ifconfig tap0 destroy", "ifconfig: Device busy");
  EXPECT_THROW(f.devices.delete_net_dev("tap0"), configuration_error);
}

TEST(device_orchestrator, create_tap) {
  orchestrator_fixture f;

  f.runner->fail_exact("ifconfig gw-1234", "does not exist");
  f.devices.create_tap("gw-1234", "fa:16:3e:00:00:01");

  EXPECT_TRUE(f.runner->ran("ifconfig tap create name gw-1234"));
  EXPECT_TRUE(f.runner->ran("ifconfig gw-1234 ether fa:16:3e:00:00:01"));
  EXPECT_TRUE(f.runner->ran("ifconfig gw-1234 up"));

  // present taps are left alone
  f.runner->clear();
  f.devices.create_tap("tap1");
  EXPECT_EQ(1u, f.runner->commands.size());
}

TEST(device_orchestrator, initialize_gateway_device) {
  orchestrator_fixture f;
  network_spec net;
  net.cidr = "10.0.0.0/24";
  net.dhcp_server = "10.0.0.1";
  net.broadcast = "10.0.0.255";

  f.runner->on("sysctl -n net.inet.ip.forwarding",
               command_result{"0\n", "", 0});
  f.runner->on_exact(
      "ifconfig br100",
      command_result{"br100: flags=8843<UP> mtu 1500\n"
                     "\tinet 10.0.0.5 netmask 0xffffff00 broadcast "
                     "10.0.0.255\n",
                     "", 0});

  f.devices.initialize_gateway_device("br100", net);

  auto &r = *f.runner;
  EXPECT_TRUE(r.ran("sysctl net.inet.ip.forwarding=1"));
  int del = r.index_of("ifconfig br100 inet 10.0.0.5 netmask 0xffffff00 "
                       "broadcast 10.0.0.255 delete");
  int add_dhcp = r.index_of("ifconfig br100 inet 10.0.0.1/24 broadcast "
                            "10.0.0.255 add");
  int add_old = r.index_of("ifconfig br100 inet 10.0.0.5 netmask 0xffffff00 "
                           "broadcast 10.0.0.255 add");
  ASSERT_GE(del, 0);
  EXPECT_LT(del, add_dhcp);
  EXPECT_LT(add_dhcp, add_old);
}

TEST(device_orchestrator, initialized_gateway_device_is_left_alone) {
  orchestrator_fixture f;
  network_spec net;
  net.cidr = "10.0.0.0/24";
  net.dhcp_server = "10.0.0.1";
  net.broadcast = "10.0.0.255";

  f.runner->on("sysctl -n net.inet.ip.forwarding",
               command_result{"1\n", "", 0});
  f.runner->on_exact(
      "ifconfig br100",
      command_result{"br100: flags=8843<UP> mtu 1500\n"
                     "\tinet 10.0.0.1 netmask 0xffffff00 broadcast "
                     "10.0.0.255\n",
                     "", 0});

  f.devices.initialize_gateway_device("br100", net);

  EXPECT_FALSE(f.runner->ran("sysctl net.inet.ip.forwarding=1"));
  EXPECT_EQ(0u, f.runner->count_containing("delete"));
  EXPECT_EQ(0u, f.runner->count_containing(" add"));
}

TEST(device_orchestrator, floating_ip_binding) {
  orchestrator_fixture f;

  f.devices.bind_floating_ip("192.0.2.50", "em0");
  f.devices.unbind_floating_ip("192.0.2.50", "em0");
  f.devices.ensure_metadata_ip();

  EXPECT_TRUE(f.runner->ran("ifconfig em0 192.0.2.50/32 add"));
  EXPECT_TRUE(f.runner->ran("ifconfig em0 192.0.2.50/32 delete"));
  EXPECT_TRUE(f.runner->ran("ifconfig lo0 alias 169.254.169.254/32"));
}

TEST(device_orchestrator, ovs_failure_names_device) {
  orchestrator_fixture f;

  f.runner->fail("ovs-vsctl", "database connection failed");
  try {
    f.devices.create_ovs_vif_port("br-int", "tap7", "port-id",
                                  "fa:16:3e:00:00:07", "vm-id", 1450);
    FAIL() << "create_ovs_vif_port did not throw";
  } catch (configuration_error &e) {
    EXPECT_EQ("tap7", e.get_device());
  }
}

TEST(device_orchestrator, ovs_vif_port) {
  orchestrator_fixture f;

  f.devices.create_ovs_vif_port("br-int", "tap7", "port-id",
                                "fa:16:3e:00:00:07", "vm-id", 1450);
  EXPECT_TRUE(f.runner->ran("ovs-vsctl --timeout=120 -- --if-exists "
                            "del-port tap7 -- add-port br-int tap7"));
  EXPECT_TRUE(f.runner->ran("ifconfig tap7 mtu 1450"));

  f.runner->clear();
  f.devices.create_ovs_vif_port("br-int", "vhu7", "port-id",
                                "fa:16:3e:00:00:07", "vm-id", 1450,
                                "vhostuser");
  EXPECT_EQ(1u, f.runner->count_containing("type=vhostuser"));
  EXPECT_EQ(0u, f.runner->count("ifconfig vhu7 mtu"));

  f.runner->clear();
  f.devices.delete_ovs_vif_port("br-int", "tap7");
  EXPECT_TRUE(f.runner->ran("ovs-vsctl --timeout=120 -- --if-exists "
                            "del-port br-int tap7"));
  EXPECT_TRUE(f.runner->ran("ifconfig tap7 destroy"));
}

} // namespace hostnet

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  FLAGS_lock_path = hostnet::make_temp_dir();
  return RUN_ALL_TESTS();
}
