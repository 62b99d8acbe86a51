#include <ifaddrs.h>
#include <arpa/inet.h>
#include <netinet/in.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "server/hub.hpp"
#include "server/server.hpp"

using quizsync::server::HubConfig;
using quizsync::server::Server;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

std::chrono::milliseconds env_millis(const char* name, std::chrono::milliseconds fallback) {
  const char* value = std::getenv(name);
  if (!value || !*value) return fallback;
  auto period = quizsync::server::parse_period(value);
  if (!period) {
    spdlog::warn("[hub] ignoring invalid {}={}", name, value);
    return fallback;
  }
  return *period;
}

// First non-loopback IPv4 address, the one students type into their client.
std::string local_ip() {
  ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) return "localhost";
  std::string found = "localhost";
  for (ifaddrs* it = list; it; it = it->ifa_next) {
    if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
    auto* addr = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
    if (ntohl(addr->sin_addr.s_addr) == INADDR_LOOPBACK) continue;
    char buf[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &addr->sin_addr, buf, sizeof(buf))) {
      found = buf;
      break;
    }
  }
  ::freeifaddrs(list);
  return found;
}

}  // namespace

int main(int argc, char** argv) {
  HubConfig config;
  if (const char* env_port = std::getenv("PORT")) {
    auto port = quizsync::server::parse_port(env_port);
    if (!port) {
      std::cerr << "[hub] invalid PORT: " << env_port << "\n";
      return 1;
    }
    config.port = *port;
  }
  if (argc > 1) {
    auto port = quizsync::server::parse_port(argv[1]);
    if (!port) {
      std::cerr << "Usage: " << argv[0] << " [port 1-65535]\n";
      return 1;
    }
    config.port = *port;
  }

  // Ensure logs dir exists and set up rotating logger.
  std::filesystem::create_directories("logs");
  auto logger = spdlog::rotating_logger_mt("hub", "logs/hub.log", 1024 * 1024 * 5, 3);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);
  if (const char* level = std::getenv("QUIZSYNC_LOG_LEVEL")) {
    spdlog::set_level(spdlog::level::from_str(level));
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_every(std::chrono::seconds(2));

  config.heartbeat_interval = env_millis("HUB_HEARTBEAT_MS", config.heartbeat_interval);
  config.cleanup_interval = env_millis("HUB_CLEANUP_MS", config.cleanup_interval);
  config.retention_window = env_millis("HUB_RETENTION_MS", config.retention_window);

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  Server server(config);
  std::string error;
  if (!server.start(&error)) {
    std::cerr << "[hub] failed to start: " << error << "\n";
    spdlog::error("[hub] failed to start: {}", error);
    return 1;
  }

  const std::string address = local_ip() + ":" + std::to_string(server.port());
  std::cout << "===========================================\n"
            << "Classroom Local Hub started\n"
            << "Share this address with students:\n"
            << "   " << address << "\n"
            << "===========================================\n"
            << "Press Ctrl+C to stop the hub\n";

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  std::cout << "\n[hub] shutting down...\n";
  server.stop();
  spdlog::shutdown();
  std::cout << "[hub] stopped.\n";
  return 0;
}
