#pragma once
// interface_resolver.h — Maps network interface names to their IPv4 addresses.

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "net_address.h"

namespace relay {

struct InterfaceAddress {
  Ipv4Address address;
  Ipv4Address netmask;
  std::optional<Ipv4Address> broadcast;  // absent on loopback / point-to-point links
};

using InterfaceMap = std::map<std::string, std::vector<InterfaceAddress>>;

// Snapshot of every IPv4 address on an interface that is up (getifaddrs).
// Throws std::runtime_error if the interface list cannot be read.
InterfaceMap enumerate_interfaces();

// Addresses of `name`; throws relay::ConfigError naming the known
// interfaces when `name` is absent or has no IPv4 address.
const std::vector<InterfaceAddress>& lookup_interface(const InterfaceMap& interfaces,
                                                      const std::string& name);

}  // namespace relay
