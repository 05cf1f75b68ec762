#pragma once
// relay_config.h — Command line parsing and interface resolution.
//
//   udp_relay -p 5353 -r eth0,eth1 -t eth2 -b 10.0.0.0/8 -a 10.1.0.0/16 -vv

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

#include "interface_resolver.h"
#include "logger.h"
#include "net_address.h"
#include "relay_plan.h"

namespace relay {

struct RelayConfig {
  uint16_t port = 0;
  std::vector<std::string> receive;   // interface names or IPv4 literals
  std::vector<std::string> transmit;  // interface names
  std::vector<SocketAddressV4> destinations;
  std::vector<Ipv4Network> block_nets;
  std::vector<Ipv4Network> allow_nets;
  Severity log_level = Severity::Warn;
  size_t bus_capacity = PacketBus::kDefaultCapacity;
  size_t buffer_size = Receiver::kDefaultBufferSize;
};

void print_usage(std::FILE* out, const char* argv0);

// Throws relay::ConfigError on invalid or missing options. Returns
// std::nullopt when --help was requested (usage already printed).
std::optional<RelayConfig> parse_command_line(int argc, char** argv);

// Turns interface names into concrete endpoints:
//   listen:  every address of each receive interface, at the receive port
//   targets: every address of each transmit interface bound at the receive
//            port, sending to the interface broadcast address (or the
//            address itself when the link has none); explicit destinations
//            are sent from an ephemeral port.
// Duplicates are removed. Throws relay::ConfigError when nothing resolves.
RelayPlan resolve_plan(const RelayConfig& cfg, const InterfaceMap& interfaces);

}  // namespace relay
