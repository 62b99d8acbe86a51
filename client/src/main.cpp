#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include "client/local_store.hpp"
#include "client/mode_controller.hpp"
#include "client/remote_store.hpp"
#include "client/state.hpp"
#include "client/ui.hpp"

int main(int argc, char** argv) {
  using namespace quizsync::client;

  const std::string cache_db = argc > 1 ? argv[1] : "client_cache.db";
  const std::string remote_db = argc > 2 ? argv[2] : "cloud.db";

  std::filesystem::create_directories("logs");
  auto logger = spdlog::rotating_logger_mt("client", "logs/client.log", 1024 * 1024 * 5, 3);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);
  if (const char* level = std::getenv("QUIZSYNC_LOG_LEVEL")) {
    spdlog::set_level(spdlog::level::from_str(level));
  }
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_every(std::chrono::seconds(2));

  LocalStore store(cache_db);
  if (!store.is_open()) {
    std::cerr << "[client] cannot open cache database " << cache_db << "\n";
    return 1;
  }
  SqliteRemoteStore remote(remote_db);
  LocalIdentity identity;

  ClientState state;
  {
    ConnectionModeController controller(remote, identity, &store);
    if (auto last = controller.last_relay_address()) state.relay_address = *last;
    controller.on_notice([&state](const Notice& notice) { state.inbox.push(notice); });
    controller.on_mode_changed([](ConnectionMode from, ConnectionMode to) {
      spdlog::info("[client] mode {} -> {}", to_string(from), to_string(to));
    });

    while (render_ui(state, controller, identity)) {
      // loop until the window is closed
    }
    if (state.pending_connect.valid()) state.pending_connect.wait();
  }
  shutdown_ui();
  spdlog::shutdown();
  return 0;
}
