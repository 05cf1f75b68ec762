// relay_config.cpp

#include "relay_config.h"

#include <getopt.h>

#include <algorithm>
#include <charconv>
#include <string_view>

#include "relay_error.h"

namespace relay {

namespace {

// Splits "a,b,,c" into {"a", "b", "c"}.
std::vector<std::string> split_list(std::string_view text) {
  std::vector<std::string> out;
  while (!text.empty()) {
    auto comma = text.find(',');
    auto item = text.substr(0, comma);
    if (!item.empty()) out.emplace_back(item);
    if (comma == std::string_view::npos) break;
    text.remove_prefix(comma + 1);
  }
  return out;
}

unsigned long parse_number(std::string_view text, const char* what, unsigned long lo,
                           unsigned long hi) {
  unsigned long v = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size() || v < lo || v > hi) {
    throw ConfigError(std::string("invalid ") + what + " '" + std::string(text) +
                      "' (expected " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
  }
  return v;
}

Severity lower(Severity s) {
  return s == Severity::Trace ? s : static_cast<Severity>(static_cast<uint8_t>(s) - 1);
}

template <typename T>
void push_unique(std::vector<T>& v, const T& item) {
  if (std::find(v.begin(), v.end(), item) == v.end()) v.push_back(item);
}

constexpr option kLongOptions[] = {
    {"port", required_argument, nullptr, 'p'},
    {"receive", required_argument, nullptr, 'r'},
    {"transmit", required_argument, nullptr, 't'},
    {"destination", required_argument, nullptr, 'd'},
    {"block", required_argument, nullptr, 'b'},
    {"allow", required_argument, nullptr, 'a'},
    {"bus-capacity", required_argument, nullptr, 'c'},
    {"buffer-size", required_argument, nullptr, 'B'},
    {"verbose", no_argument, nullptr, 'v'},
    {"quiet", no_argument, nullptr, 'q'},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0},
};

}  // namespace

void print_usage(std::FILE* out, const char* argv0) {
  std::fprintf(out,
               "Usage: %s -p PORT -r IFACE[,IFACE..] (-t IFACE[,..] | -d ADDR:PORT[,..]) [OPT..]\n"
               "\n"
               "Relays UDP datagrams received on the receive interfaces to every destination,\n"
               "dropping packets that originate from our own transmit addresses.\n"
               "\n"
               "Options:\n"
               "  -p, --port PORT           UDP port to listen on (and to send to on transmit\n"
               "                            interfaces)\n"
               "  -r, --receive LIST        receive interface names or IPv4 addresses\n"
               "  -t, --transmit LIST       transmit interface names (broadcast on PORT)\n"
               "  -d, --destination LIST    explicit destinations a.b.c.d:port\n"
               "  -b, --block LIST          drop packets from these networks (CIDR)\n"
               "  -a, --allow LIST          relay these networks even if blocked (CIDR)\n"
               "  -c, --bus-capacity N      packets buffered per transmitter (default %zu)\n"
               "  -B, --buffer-size N       receive buffer in bytes, %zu..%zu (default %zu)\n"
               "  -v, --verbose             more logging, repeatable (-v info, -vv debug,\n"
               "                            -vvv trace)\n"
               "  -q, --quiet               errors only\n"
               "  -h, --help                this text\n"
               "\n"
               "LIST arguments are comma separated and options may be repeated.\n",
               argv0, PacketBus::kDefaultCapacity, Receiver::kMinBufferSize,
               Receiver::kDefaultBufferSize, Receiver::kDefaultBufferSize);
}

std::optional<RelayConfig> parse_command_line(int argc, char** argv) {
  RelayConfig cfg;
  bool port_set = false;
  int verbosity = 0;
  bool quiet = false;

  // Reset getopt so the parser can run more than once per process.
  optind = 0;
  opterr = 0;

  int c = 0;
  while ((c = ::getopt_long(argc, argv, ":p:r:t:d:b:a:c:B:vqh", kLongOptions, nullptr)) != -1) {
    switch (c) {
      case 'p':
        cfg.port = static_cast<uint16_t>(parse_number(optarg, "port", 1, 65535));
        port_set = true;
        break;
      case 'r':
        for (auto& s : split_list(optarg)) push_unique(cfg.receive, s);
        break;
      case 't':
        for (auto& s : split_list(optarg)) push_unique(cfg.transmit, s);
        break;
      case 'd':
        for (auto& s : split_list(optarg)) {
          auto dest = SocketAddressV4::parse(s);
          if (dest.port() == 0) {
            throw ConfigError("destination port must not be 0: '" + s + "'");
          }
          push_unique(cfg.destinations, dest);
        }
        break;
      case 'b':
        for (auto& s : split_list(optarg)) cfg.block_nets.push_back(Ipv4Network::parse(s));
        break;
      case 'a':
        for (auto& s : split_list(optarg)) cfg.allow_nets.push_back(Ipv4Network::parse(s));
        break;
      case 'c':
        cfg.bus_capacity = parse_number(optarg, "bus capacity", 1, 1u << 20);
        break;
      case 'B':
        cfg.buffer_size = parse_number(optarg, "buffer size", Receiver::kMinBufferSize,
                                       Receiver::kDefaultBufferSize);
        break;
      case 'v':
        ++verbosity;
        break;
      case 'q':
        quiet = true;
        break;
      case 'h':
        print_usage(stdout, argv[0]);
        return std::nullopt;
      case ':':
        throw ConfigError(std::string("option requires an argument: ") + argv[optind - 1]);
      default:
        if (optopt != 0) throw ConfigError(std::string("unknown option: -") + char(optopt));
        throw ConfigError(std::string("unknown option: ") + argv[optind - 1]);
    }
  }
  if (optind < argc) {
    throw ConfigError(std::string("unexpected positional argument: ") + argv[optind]);
  }

  if (!port_set) throw ConfigError("missing required option --port");
  if (cfg.receive.empty()) throw ConfigError("missing required option --receive");
  if (cfg.transmit.empty() && cfg.destinations.empty()) {
    throw ConfigError("at least one --transmit interface or --destination is required");
  }

  if (quiet) {
    cfg.log_level = Severity::Error;
  } else {
    for (int i = 0; i < verbosity; ++i) cfg.log_level = lower(cfg.log_level);
  }
  return cfg;
}

RelayPlan resolve_plan(const RelayConfig& cfg, const InterfaceMap& interfaces) {
  RelayPlan plan;
  plan.block_nets = cfg.block_nets;
  plan.allow_nets = cfg.allow_nets;
  plan.bus_capacity = cfg.bus_capacity;
  plan.buffer_size = cfg.buffer_size;

  for (const auto& name : cfg.receive) {
    // An IPv4 literal is taken as-is; anything else must be an interface.
    if (name.find_first_not_of("0123456789.") == std::string::npos) {
      push_unique(plan.listen, SocketAddressV4(Ipv4Address::parse(name), cfg.port));
      continue;
    }
    for (const auto& a : lookup_interface(interfaces, name)) {
      push_unique(plan.listen, SocketAddressV4(a.address, cfg.port));
    }
  }

  for (const auto& name : cfg.transmit) {
    for (const auto& a : lookup_interface(interfaces, name)) {
      TransmitTarget t{SocketAddressV4(a.address, cfg.port),
                       SocketAddressV4(a.broadcast.value_or(a.address), cfg.port)};
      push_unique(plan.targets, t);
    }
  }
  for (const auto& d : cfg.destinations) {
    push_unique(plan.targets, TransmitTarget{SocketAddressV4{}, d});
  }

  if (plan.listen.empty()) throw ConfigError("no listening addresses could be resolved");
  if (plan.targets.empty()) throw ConfigError("no destination addresses could be resolved");
  return plan;
}

}  // namespace relay
