// interface_resolver.cpp

#include "interface_resolver.h"

#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <memory>

#include "relay_error.h"

namespace relay {

static Ipv4Address to_ipv4(const sockaddr* sa) {
  return Ipv4Address::from_in_addr(reinterpret_cast<const sockaddr_in*>(sa)->sin_addr);
}

InterfaceMap enumerate_interfaces() {
  ifaddrs* ifaddr = nullptr;
  if (::getifaddrs(&ifaddr) < 0) throw sys_error("getifaddrs()");
  std::unique_ptr<ifaddrs, decltype(&::freeifaddrs)> guard(ifaddr, &::freeifaddrs);

  InterfaceMap out;
  for (ifaddrs* ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    if (!(ifa->ifa_flags & IFF_UP)) continue;

    InterfaceAddress a;
    a.address = to_ipv4(ifa->ifa_addr);
    if (ifa->ifa_netmask) a.netmask = to_ipv4(ifa->ifa_netmask);
    // ifa_broadaddr aliases ifa_dstaddr; only meaningful with IFF_BROADCAST.
    if ((ifa->ifa_flags & IFF_BROADCAST) && ifa->ifa_broadaddr) {
      a.broadcast = to_ipv4(ifa->ifa_broadaddr);
    }
    out[ifa->ifa_name].push_back(a);
  }

  return out;
}

const std::vector<InterfaceAddress>& lookup_interface(const InterfaceMap& interfaces,
                                                      const std::string& name) {
  auto it = interfaces.find(name);
  if (it != interfaces.end() && !it->second.empty()) return it->second;

  std::string known;
  for (const auto& [n, addrs] : interfaces) {
    if (!known.empty()) known += ", ";
    known += n;
  }
  throw ConfigError("interface '" + name + "' has no IPv4 address (available: " +
                    (known.empty() ? std::string("none") : known) + ")");
}

}  // namespace relay
