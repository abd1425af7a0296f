/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include <gflags/gflags.h>

// paths
DEFINE_string(networks_path, "/var/lib/hostnet/networks",
              "Location to keep network config files");
DEFINE_string(lock_path, "/var/lock/hostnet",
              "Directory for external lock files");
DEFINE_string(network_db, "/usr/local/etc/hostnet.conf",
              "Network database file");

// command execution
DEFINE_string(root_helper, "sudo", "Command prefix for privileged commands");
DEFINE_bool(fake_network, false,
            "Log network commands instead of running them");

// interfaces
DEFINE_string(interface_driver, "bridge",
              "Gateway interface driver: bridge, ovs or neutron_bridge");
DEFINE_string(flat_interface, "", "Physical interface for flat networks");
DEFINE_string(vlan_interface, "", "Physical interface for vlan networks");
DEFINE_string(public_interface, "", "Interface carrying public addresses");
DEFINE_string(ovs_integration_bridge, "br-int",
              "Open vSwitch bridge used by the ovs driver");
DEFINE_int32(ovs_vsctl_timeout, 120, "Timeout in seconds for ovs-vsctl");
DEFINE_bool(use_ipv6, false, "Configure IPv6 on gateway devices");
DEFINE_bool(send_arp_for_ha, false,
            "Send gratuitous ARPs when binding addresses");
DEFINE_int32(send_arp_for_ha_count, 3, "Number of gratuitous ARPs to send");

// firewall
DEFINE_string(pf_anchor, "org.hostnet/hostnetd", "pf anchor for our rules");
DEFINE_string(routing_source_ip, "", "Source address for outbound SNAT");
DEFINE_string(force_snat_range, "",
              "Comma separated destination ranges to always SNAT");
DEFINE_string(dmz_cidr, "", "Comma separated ranges excluded from SNAT");
DEFINE_string(metadata_host, "127.0.0.1", "Metadata service address");
DEFINE_int32(metadata_port, 8775, "Metadata service port");

// dhcp and dns
DEFINE_string(dhcp_domain, "novalocal", "Domain handed out by dnsmasq");
DEFINE_int32(dhcp_lease_time, 86400, "DHCP lease time in seconds");
DEFINE_string(dhcpbridge, "/usr/local/bin/hostnet-dhcpbridge",
              "dnsmasq lease change script");
DEFINE_string(dhcpbridge_flagfile, "",
              "Flag file handed to the lease change script");
DEFINE_string(dnsmasq_config_file, "", "Extra dnsmasq configuration file");
DEFINE_string(dns_server, "", "Comma separated upstream DNS servers");
DEFINE_bool(use_network_dns_servers, false,
            "Use the DNS servers of the network as upstream");
DEFINE_bool(use_single_default_gateway, false,
            "Only hand out a default gateway to the default-route port");
DEFINE_bool(share_dhcp_address, false,
            "All network hosts share the same DHCP address");
