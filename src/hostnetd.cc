/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <gflags/gflags.h>
#include <glog/logging.h>

#include "firewall/rule_store.h"
#include "netdev/device_orchestrator.h"
#include "network/host_network.h"
#include "network/network_db_file.h"
#include "utils/command_runner.h"
#include "utils/errors.h"
#include "version.h"

DECLARE_string(tryfromenv); // from gflags
DECLARE_string(network_db);
DECLARE_string(root_helper);
DECLARE_bool(fake_network);
DECLARE_string(interface_driver);
DECLARE_string(pf_anchor);
DECLARE_int32(ovs_vsctl_timeout);
DECLARE_int32(metadata_port);
DECLARE_bool(use_ipv6);

static const char *usage =
    "<command> [args]\n\n"
    "commands:\n"
    "  apply                          set up every network in one commit\n"
    "  plug <network> [nogateway]     create the network device\n"
    "  unplug <network>               remove the network device\n"
    "  init-gateway <network>         address the gateway device\n"
    "  update-dhcp <network>          rewrite hosts and restart dnsmasq\n"
    "  update-dns <network>           rewrite dns hosts and restart dnsmasq\n"
    "  kill-dhcp <network>            stop dnsmasq\n"
    "  update-ra <network>            rewrite config and restart radvd\n"
    "  release-dhcp <network> <address> <mac>\n"
    "  init-host <network> [external] snat and its exceptions\n"
    "  metadata                       metadata address and forwarding\n"
    "\n<network> is a label, bridge or id from --network_db";

static bool validate_port(const char *flagname, gflags::int32 value) {
  VLOG(3) << __FUNCTION__ << ": flagname=" << flagname << ", value=" << value;
  if (value > 0 && value <= UINT16_MAX) // value is ok
    return true;
  return false;
}

static bool validate_timeout(const char *flagname, gflags::int32 value) {
  VLOG(3) << __FUNCTION__ << ": flagname=" << flagname << ", value=" << value;
  return value > 0;
}

namespace hostnet {

static const network_entry &lookup(const network_db_file &db,
                                   const std::vector<std::string> &args,
                                   size_t nargs) {
  if (args.size() < nargs + 1)
    throw hostnet_error("missing arguments for " + args[0]);

  const network_entry *entry = db.find_network(args[1]);
  if (entry == nullptr)
    throw hostnet_error("unknown network '" + args[1] + "'");
  return *entry;
}

static void setup_network(host_network &host, const network_entry &entry) {
  std::string dev = host.plug(entry.net, entry.mac);

  host.initialize_gateway_device(dev, entry.net);
  host.update_dhcp(dev, entry.net, entry.fixed_ips);
  if (FLAGS_use_ipv6 && !entry.net.cidr_v6.empty())
    host.update_ra(dev, entry.net);
}

static int run_command(host_network &host, const network_db_file &db,
                       const std::vector<std::string> &args) {
  const std::string &cmd = args[0];

  if (cmd == "apply") {
    auto firewall = host.get_firewall();

    // every network, but one pf commit
    firewall->defer_apply();
    for (auto const &entry : db.get_networks()) {
      setup_network(host, entry);
      host.init_host(entry.net.cidr);
    }
    firewall->resume_apply();
  } else if (cmd == "plug") {
    auto &e = lookup(db, args, 1);
    bool gateway = !(args.size() > 2 && args[2] == "nogateway");
    std::cout << host.plug(e.net, e.mac, gateway) << std::endl;
  } else if (cmd == "unplug") {
    auto &e = lookup(db, args, 1);
    std::cout << host.unplug(e.net) << std::endl;
  } else if (cmd == "init-gateway") {
    auto &e = lookup(db, args, 1);
    host.initialize_gateway_device(host.get_dev(e.net), e.net);
  } else if (cmd == "update-dhcp") {
    auto &e = lookup(db, args, 1);
    host.update_dhcp(host.get_dev(e.net), e.net, e.fixed_ips);
  } else if (cmd == "update-dns") {
    auto &e = lookup(db, args, 1);
    host.update_dns(host.get_dev(e.net), e.net, e.fixed_ips);
  } else if (cmd == "kill-dhcp") {
    auto &e = lookup(db, args, 1);
    host.kill_dhcp(host.get_dev(e.net));
  } else if (cmd == "update-ra") {
    auto &e = lookup(db, args, 1);
    host.update_ra(host.get_dev(e.net), e.net);
  } else if (cmd == "release-dhcp") {
    auto &e = lookup(db, args, 3);
    host.release_dhcp(host.get_dev(e.net), args[2], args[3]);
  } else if (cmd == "init-host") {
    auto &e = lookup(db, args, 1);
    host.init_host(e.net.cidr, args.size() > 2 && args[2] == "external");
  } else if (cmd == "metadata") {
    host.get_devices()->ensure_metadata_ip();
    host.metadata_forward();
    host.metadata_accept();
  } else {
    LOG(ERROR) << __FUNCTION__ << ": unknown command " << cmd;
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}

} // namespace hostnet

int main(int argc, char **argv) {
  using hostnet::command_runner;
  using hostnet::fake_runner;
  using hostnet::host_network;
  using hostnet::network_db_file;
  using hostnet::process_runner;

  if (!gflags::RegisterFlagValidator(&FLAGS_metadata_port, &validate_port)) {
    std::cerr << "Failed to register port validator" << std::endl;
    exit(1);
  }

  if (!gflags::RegisterFlagValidator(&FLAGS_ovs_vsctl_timeout,
                                     &validate_timeout)) {
    std::cerr << "Failed to register timeout validator" << std::endl;
    exit(1);
  }

  // the deployment relevant variables can be set from env
  FLAGS_tryfromenv = std::string(
      "network_db,root_helper,fake_network,interface_driver,pf_anchor");
  gflags::SetUsageMessage(usage);
  gflags::SetVersionString(PROJECT_VERSION);

  // init
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  if (argc < 2) {
    gflags::ShowUsageWithFlagsRestrict(argv[0], "flags.cc");
    return EXIT_FAILURE;
  }

  std::vector<std::string> args(argv + 1, argv + argc);

  try {
    std::shared_ptr<command_runner> runner(nullptr);

    if (FLAGS_fake_network)
      runner.reset(new fake_runner());
    else
      runner.reset(new process_runner(FLAGS_root_helper));

    network_db_file db(FLAGS_network_db);
    if (args[0] != "metadata")
      db.read_config();

    host_network host(runner, FLAGS_pf_anchor, FLAGS_interface_driver);
    return hostnet::run_command(host, db, args);
  } catch (std::exception &e) {
    LOG(ERROR) << __FUNCTION__ << ": " << args[0] << " failed: " << e.what();
    return EXIT_FAILURE;
  }
}
