// osc-mqtt-bridge entry point.
//
// Threads:
//   main   : loads the config, starts every relay, then waits on g_running
//             (futex) until SIGINT/SIGTERM
//   logger : dedicated: prints every LogRecord
//   relays : see relay.h

#include <getopt.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

#include "component_logger.h"
#include "config_loader.h"
#include "config_validator.h"
#include "logger.h"
#include "paho_broker_client.h"
#include "relay.h"
#include "udp_transport.h"

static constexpr char kServiceName[] = "osc-mqtt-bridge";
static constexpr char kVersion[] = "0.1";

static std::atomic<bool> g_running{true};

static void shutdown(int) {
  g_running.store(false, std::memory_order_release);
  g_running.notify_all();
}

static void usage(std::FILE* out) {
  std::fprintf(out,
               "Usage: %s [options]\n"
               "  -c, --config FILE  configuration file (JSON)\n"
               "  -v, --version      print version and exit\n"
               "  -h, --help         print this help and exit\n"
               "\nWithout --config the first of these is used:\n",
               kServiceName);
  for (const auto& path : oscbridge::default_config_paths()) {
    std::fprintf(out, "  %s\n", path.c_str());
  }
}

int main(int argc, char** argv) {
  using namespace oscbridge;

  static const option kOptions[] = {
      {"config", required_argument, nullptr, 'c'},
      {"version", no_argument, nullptr, 'v'},
      {"help", no_argument, nullptr, 'h'},
      {nullptr, 0, nullptr, 0},
  };

  std::string config_path;
  int opt;
  while ((opt = getopt_long(argc, argv, "c:vh", kOptions, nullptr)) != -1) {
    switch (opt) {
      case 'c':
        config_path = optarg;
        break;
      case 'v':
        std::printf("%s %s\n", kServiceName, kVersion);
        return 0;
      case 'h':
        usage(stdout);
        return 0;
      default:
        usage(stderr);
        return 2;
    }
  }

  std::signal(SIGTERM, shutdown);
  std::signal(SIGINT, shutdown);

  // ── Logger thread ─────────────────────────────────────────────────────────
  Logger logger;
  ComponentLogger log(logger, "main", LogLevel::Debug);

  // ── Configuration ─────────────────────────────────────────────────────────
  std::vector<RelayConfig> configs;
  try {
    const std::string path = find_config_file(config_path);
    log.debug("Loading configuration from %s", path.c_str());
    configs = validate_relays(load_config_file(path));
  } catch (const ConfigError& e) {
    log.error("Configuration: %s", e.what());
    logger.drain();
    return 1;
  }

  // ── Relays ────────────────────────────────────────────────────────────────
  std::vector<std::unique_ptr<Relay>> relays;
  try {
    for (auto& config : configs) {
      ComponentLogger relay_log(logger, config.mqtt_topic, config.log_level);

      BrokerOptions broker{config.mqtt_host, config.mqtt_port, config.mqtt_client_id,
                           config.mqtt_user, config.mqtt_password};
      UdpEndpoint endpoint{config.osc_host, config.osc_port, config.osc_bind_addr,
                           config.osc_bind_port};

      auto relay = std::make_unique<Relay>(
          std::move(config), std::make_unique<PahoBrokerClient>(std::move(broker), relay_log),
          std::make_unique<UdpTransport>(std::move(endpoint), relay_log), logger);
      relay->start();
      relays.push_back(std::move(relay));
    }
  } catch (const BrokerError& e) {
    log.error("Relay start: %s", e.what());
    relays.clear();
    logger.drain();
    return 1;
  } catch (const TransportError& e) {
    log.error("Relay start: %s", e.what());
    relays.clear();
    logger.drain();
    return 1;
  }

  log.debug("%s %s started with %zu relay(s)", kServiceName, kVersion, relays.size());

  // ── Main thread: block on g_running (futex, zero CPU) ────────────────────
  g_running.wait(true);

  log.debug("Shutting down");
  relays.clear();
  logger.drain();
  return 0;
}
