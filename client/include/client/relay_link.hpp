#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "client/local_cache.hpp"
#include "client/remote_store.hpp"
#include "common/message.hpp"
#include "common/protocol.hpp"

namespace quizsync::client {

constexpr std::uint16_t kDefaultHubPort = 8080;

// Split "host:port" into its parts; the port defaults to kDefaultHubPort.
// Returns false (error filled) for an empty host or a non-numeric port.
bool parse_relay_address(const std::string& address, std::string& host, std::uint16_t& port,
                         std::string& error);

// One framed duplex connection to a Hub. Inbound peer data is folded into the
// shared LocalCache; the listener hears about it on the link's reader thread.
class RelayLink {
 public:
  enum class State { Connecting, Open, Closed };

  class Listener {
   public:
    virtual ~Listener() = default;
    // New peer responses for `question_id` are in the cache.
    virtual void on_peer_data(const std::string& question_id) = 0;
    // The Hub closed the link or the socket failed after the link was Open.
    // Not called for close().
    virtual void on_link_closed(RelayLink& link) = 0;
  };

  static constexpr std::chrono::milliseconds kDefaultConnectTimeout{5000};

  RelayLink(LocalCache& cache, Listener* listener = nullptr);
  ~RelayLink();

  RelayLink(const RelayLink&) = delete;
  RelayLink& operator=(const RelayLink&) = delete;

  // Resolves true once the socket is connected and `identify` (when an identity
  // is given) and `request_sync` have been written, in that order. Resolves
  // false on timeout or transport error; a connect that misses the deadline is
  // abandoned and can never complete later. Only valid while Closed.
  std::future<bool> connect(const std::string& address, std::optional<Identity> identity,
                            std::chrono::milliseconds timeout = kDefaultConnectTimeout);

  bool send(const Message& msg, std::string* error = nullptr);
  bool submit_response(const quizsync::Response& r, std::string* error = nullptr);

  // Intentional close: no on_link_closed notification follows.
  void close();

  // Fold one inbound message into link state and the cache.
  void handle_message(const Message& msg);

  State state() const { return state_.load(); }
  std::string address() const;
  std::string client_id() const;
  std::string last_error() const;
  std::size_t active_user_count() const { return active_users_.load(); }

 private:
  void run(std::string address, std::optional<Identity> identity,
           std::chrono::milliseconds timeout, std::shared_ptr<std::promise<bool>> ready);
  int open_socket(const std::string& host, std::uint16_t port,
                  std::chrono::steady_clock::time_point deadline, std::string& error);
  void read_loop();
  void fold_responses(const std::vector<quizsync::Response>& responses);
  bool write_locked(const std::vector<std::uint8_t>& frame, std::string* error);
  void set_error(const std::string& error);
  void join_io();

  LocalCache& cache_;
  Listener* listener_;

  std::atomic<State> state_{State::Closed};
  std::atomic<bool> closing_{false};
  std::atomic<int> fd_{-1};
  std::atomic<std::size_t> active_users_{0};
  std::thread io_thread_;
  std::mutex write_mtx_;

  mutable std::mutex info_mtx_;
  std::string address_;
  std::string client_id_;
  std::string last_error_;
};

const char* to_string(RelayLink::State state);

}  // namespace quizsync::client
