#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "client/mode_controller.hpp"
#include "client/remote_store.hpp"
#include "server/server.hpp"

using quizsync::Response;
using quizsync::server::HubConfig;
using quizsync::server::Server;
using namespace quizsync::client;

namespace {

struct TestRunner {
  int failures{0};

  void expect(bool condition, const std::string& msg) {
    if (!condition) {
      ++failures;
      std::cerr << "[FAIL] " << msg << "\n";
    }
  }

  int exit_code() const {
    if (failures == 0) {
      std::cout << "[PASS] all relay integration tests\n";
      return 0;
    }
    std::cerr << "[FAILURES] total: " << failures << "\n";
    return 1;
  }
};

bool wait_until(const std::function<bool()>& condition,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

// The cloud is never reached in these tests.
class UnusedRemoteStore : public RemoteStore {
 public:
  bool write_response(const Response&, std::string* error) override {
    if (error) *error = "cloud unavailable";
    return false;
  }
  std::vector<Response> query_responses(const std::string&) override { return {}; }
  Unsubscribe subscribe(const std::string&, Listener) override {
    return [] {};
  }
};

class NoticeLog {
 public:
  void attach(ConnectionModeController& controller) {
    controller.on_notice([this](const Notice& n) {
      std::lock_guard<std::mutex> lock(mtx_);
      notices_.push_back(n);
    });
  }

  bool has(Notice::Kind kind, const std::string& prefix = "") const {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& n : notices_) {
      if (n.kind == kind && n.text.compare(0, prefix.size(), prefix) == 0) return true;
    }
    return false;
  }

 private:
  mutable std::mutex mtx_;
  std::vector<Notice> notices_;
};

HubConfig test_config(std::uint16_t port = 0) {
  HubConfig config;
  config.host = "127.0.0.1";
  config.port = port;
  return config;
}

ControllerOptions relay_options(std::chrono::milliseconds base_delay) {
  ControllerOptions options;
  options.reconnect.base_delay = base_delay;
  options.connect_timeout = std::chrono::milliseconds(1000);
  return options;
}

}  // namespace

int main() {
  TestRunner tr;

  // Peers see each other's answers through the hub; late joiners catch up.
  {
    Server server(test_config());
    std::string error;
    tr.expect(server.start(&error), "hub starts: " + error);
    const std::string address = "127.0.0.1:" + std::to_string(server.port());

    UnusedRemoteStore remote;
    LocalIdentity ada(Identity{"u1", "Ada"});
    LocalIdentity bob(Identity{"u2", "Bob"});
    ConnectionModeController a(remote, ada, nullptr, relay_options(std::chrono::milliseconds(50)));
    ConnectionModeController b(remote, bob, nullptr, relay_options(std::chrono::milliseconds(50)));

    tr.expect(a.connect_to_relay(address, &error), "first client connects");
    tr.expect(a.mode() == ConnectionMode::LocalRelay, "first client in local mode");
    tr.expect(a.last_relay_address() && *a.last_relay_address() == address, "address remembered");
    tr.expect(b.connect_to_relay(address), "second client connects");
    tr.expect(a.connect_to_relay(address), "reconnecting to the open hub is a no-op");

    tr.expect(wait_until([&] { return a.relay_active_users() == 2; }), "presence reaches first client");

    std::atomic<int> b_updates{0};
    std::atomic<std::size_t> b_rows{0};
    b.subscribe("Q1", [&](const std::vector<Response>& rows) {
      b_rows.store(rows.size());
      ++b_updates;
    });
    tr.expect(b_updates.load() == 1 && b_rows.load() == 0, "local subscribe starts from cache");

    tr.expect(a.submit_response("Q1", "B", "because"), "relay submit delivered");
    tr.expect(a.cache().own_response("Q1", "u1").has_value(), "own copy cached");
    tr.expect(wait_until([&] { return b.cache().peer_response("Q1", "u1").has_value(); }),
              "peer answer reaches second client");
    auto seen = b.cache().peer_response("Q1", "u1");
    tr.expect(seen && seen->answer == "B" && seen->reason == "because" && seen->display_name == "Ada",
              "peer answer intact");
    tr.expect(wait_until([&] { return b_rows.load() == 1; }), "subscriber notified");
    tr.expect(b.get_peer_responses("Q1").size() == 1, "local read from cache");

    tr.expect(a.submit_response("Q1", "C"), "resubmission delivered");
    tr.expect(wait_until([&] {
                auto r = b.cache().peer_response("Q1", "u1");
                return r && r->answer == "C";
              }),
              "resubmission replaces peer entry");

    LocalIdentity cy(Identity{"u3", "Cy"});
    ConnectionModeController c(remote, cy, nullptr, relay_options(std::chrono::milliseconds(50)));
    tr.expect(c.connect_to_relay(address), "late joiner connects");
    tr.expect(wait_until([&] {
                auto r = c.cache().peer_response("Q1", "u1");
                return r && r->answer == "C";
              }),
              "late joiner receives stored answers");
    tr.expect(wait_until([&] { return c.relay_active_users() == 3; }), "late joiner sees all users");

    b.sign_out();
    tr.expect(b.mode() == ConnectionMode::Offline, "sign out leaves the relay");
    tr.expect(wait_until([&] { return a.relay_active_users() == 2; }), "departure observed");

    a.network_lost();
    tr.expect(a.mode() == ConnectionMode::Offline, "network loss goes offline");
    tr.expect(!a.submit_response("Q2", "A"), "offline submit not delivered");
    tr.expect(a.cache().own_response("Q2", "u1").has_value(), "offline submit cached");
  }

  // A hub restart inside the backoff window is recovered from.
  {
    auto server = std::make_unique<Server>(test_config());
    std::string error;
    tr.expect(server->start(&error), "hub starts: " + error);
    const std::uint16_t port = server->port();
    const std::string address = "127.0.0.1:" + std::to_string(port);

    UnusedRemoteStore remote;
    LocalIdentity ada(Identity{"u1", "Ada"});
    NoticeLog log;
    ConnectionModeController a(remote, ada, nullptr, relay_options(std::chrono::milliseconds(300)));
    log.attach(a);
    tr.expect(a.connect_to_relay(address), "client connects");
    tr.expect(a.submit_response("Q1", "A"), "answer stored on hub");

    server->stop();
    server = std::make_unique<Server>(test_config(port));
    tr.expect(server->start(&error), "hub restarts on the same port: " + error);

    tr.expect(wait_until([&] { return log.has(Notice::Kind::RelayConnected, "Reconnected"); }),
              "client reconnects");
    tr.expect(a.mode() == ConnectionMode::LocalRelay, "still in local mode");
    tr.expect(a.reconnect_attempts() == 0, "attempts reset after reconnect");
    tr.expect(a.submit_response("Q2", "B"), "submit after reconnect");
  }

  // Exhausted reconnects end offline; a user connect starts over.
  {
    Server server(test_config());
    std::string error;
    tr.expect(server.start(&error), "hub starts: " + error);
    const std::string address = "127.0.0.1:" + std::to_string(server.port());

    UnusedRemoteStore remote;
    LocalIdentity ada(Identity{"u1", "Ada"});
    NoticeLog log;
    ConnectionModeController a(remote, ada, nullptr, relay_options(std::chrono::milliseconds(20)));
    log.attach(a);
    tr.expect(a.connect_to_relay(address), "client connects");

    server.stop();
    tr.expect(wait_until([&] { return a.mode() == ConnectionMode::Offline; },
                         std::chrono::milliseconds(10000)),
              "offline after reconnects exhausted");
    tr.expect(a.reconnect_attempts() == ReconnectPolicy::kMaxAttempts, "five attempts made");
    tr.expect(wait_until([&] { return log.has(Notice::Kind::ReconnectFailed); }),
              "terminal failure surfaced");

    Server replacement(test_config());
    tr.expect(replacement.start(&error), "replacement hub starts: " + error);
    const std::string new_address = "127.0.0.1:" + std::to_string(replacement.port());
    tr.expect(a.connect_to_relay(new_address), "user connect succeeds");
    tr.expect(a.reconnect_attempts() == 0, "user connect resets attempts");
    tr.expect(a.mode() == ConnectionMode::LocalRelay, "back in local mode");
  }

  // Switching hubs: a failed switch keeps the current hub, a good one replaces it.
  {
    Server hub_a(test_config());
    Server hub_b(test_config());
    std::string error;
    tr.expect(hub_a.start(&error) && hub_b.start(&error), "both hubs start: " + error);
    const std::string address_a = "127.0.0.1:" + std::to_string(hub_a.port());
    const std::string address_b = "127.0.0.1:" + std::to_string(hub_b.port());

    UnusedRemoteStore remote;
    LocalIdentity ada(Identity{"u1", "Ada"});
    LocalIdentity bob(Identity{"u2", "Bob"});
    NoticeLog log;
    ConnectionModeController a(remote, ada, nullptr, relay_options(std::chrono::milliseconds(50)));
    ConnectionModeController b(remote, bob, nullptr, relay_options(std::chrono::milliseconds(50)));
    log.attach(a);
    tr.expect(a.connect_to_relay(address_a), "client joins hub A");
    tr.expect(b.connect_to_relay(address_a), "observer joins hub A");

    tr.expect(!a.connect_to_relay("127.0.0.1:1", &error), "switch to a dead port fails");
    tr.expect(!error.empty(), "switch failure reported");
    tr.expect(log.has(Notice::Kind::RelayError), "switch failure surfaced");
    tr.expect(a.mode() == ConnectionMode::LocalRelay, "still in local mode after failed switch");
    tr.expect(a.last_relay_address() && *a.last_relay_address() == address_a,
              "hub A still remembered");
    tr.expect(a.submit_response("Q1", "A"), "submit still goes through hub A");
    tr.expect(wait_until([&] { return b.cache().peer_response("Q1", "u1").has_value(); }),
              "hub A still relays the client");
    tr.expect(a.reconnect_attempts() == 0, "no reconnect after failed switch");

    tr.expect(wait_until([&] { return b.relay_active_users() == 2; }), "both users on hub A");
    tr.expect(a.connect_to_relay(address_b), "switch to hub B");
    tr.expect(a.mode() == ConnectionMode::LocalRelay, "local mode on hub B");
    tr.expect(a.last_relay_address() && *a.last_relay_address() == address_b, "hub B remembered");
    tr.expect(wait_until([&] { return b.relay_active_users() == 1; }), "hub A link released");
    tr.expect(a.submit_response("Q2", "B"), "submit goes through hub B");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    tr.expect(!b.cache().peer_response("Q2", "u1").has_value(), "hub A no longer hears the client");
    tr.expect(a.reconnect_attempts() == 0, "replacing a link is not a drop");
  }

  // A hub with a zero sweep period refuses to start.
  {
    HubConfig config = test_config();
    config.heartbeat_interval = std::chrono::milliseconds(0);
    Server server(config);
    std::string error;
    tr.expect(!server.start(&error) && !error.empty(), "zero heartbeat rejected");
  }

  return tr.exit_code();
}
