// udp_relay entry point.
//
// Threads:
//   main         — waits on g_running (futex); zero CPU until signal
//   receiver     — one per listening address: UDP recv → filter → bus
//   transmitter  — one per destination: bus → UDP send
//   log sink     — prints every LogRecord

#include <atomic>
#include <csignal>
#include <cstdio>
#include <exception>
#include <optional>

#include "component_logger.h"
#include "interface_resolver.h"
#include "logger.h"
#include "relay_config.h"
#include "relay_coordinator.h"
#include "relay_error.h"

static std::atomic<bool> g_running{true};

static void on_signal(int) {
  g_running.store(false, std::memory_order_release);
  g_running.notify_all();
}

static constexpr int kExitStartupFailure = 1;
static constexpr int kExitUsage = 2;

int main(int argc, char** argv) {
  // ── Configuration ─────────────────────────────────────────────────────────
  std::optional<relay::RelayConfig> cfg;
  try {
    cfg = relay::parse_command_line(argc, argv);
  } catch (const relay::ConfigError& e) {
    std::fprintf(stderr, "%s: %s\n", argv[0], e.what());
    std::fprintf(stderr, "Try '%s --help' for more information.\n", argv[0]);
    return kExitUsage;
  }
  if (!cfg) return 0;

  std::signal(SIGTERM, on_signal);
  std::signal(SIGINT, on_signal);

  // ── Logger thread ─────────────────────────────────────────────────────────
  auto sink = relay::create_log_sink(cfg->log_level);
  relay::ComponentLogger::init(sink.get());
  relay::ComponentLogger log("main");

  int rc = 0;
  try {
    relay::RelayPlan plan = relay::resolve_plan(*cfg, relay::enumerate_interfaces());
    relay::RelayCoordinator coordinator(plan);
    coordinator.start();

    log.info("started (port %u, %zu listening, %zu destinations)", cfg->port, plan.listen.size(),
             plan.targets.size());

    // ── Main thread: block on g_running (futex, zero CPU) ──────────────────
    g_running.wait(true);

    log.info("shutting down");
  } catch (const std::exception& e) {
    std::fprintf(stderr, "%s: %s\n", argv[0], e.what());
    rc = kExitStartupFailure;
  }

  // ── Cleanup ───────────────────────────────────────────────────────────────
  relay::ComponentLogger::init(nullptr);
  sink.reset();
  return rc;
}
