#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "client/local_cache.hpp"
#include "client/local_store.hpp"
#include "client/reconnect_policy.hpp"
#include "client/relay_link.hpp"
#include "client/remote_store.hpp"
#include "common/thread_pool.hpp"

namespace quizsync::client {

enum class ConnectionMode { Cloud, LocalRelay, Offline };

const char* to_string(ConnectionMode mode);

struct ReconcileReport {
  std::size_t successful{0};
  std::size_t failed{0};
};

// User-facing message raised by the controller; the app renders these as toasts.
struct Notice {
  enum class Kind { Offline, RelayConnected, RelayError, ReconnectFailed, SyncComplete };
  Kind kind;
  std::string text;
};

struct ControllerOptions {
  ReconnectPolicy reconnect;
  std::chrono::milliseconds connect_timeout{RelayLink::kDefaultConnectTimeout};
};

// Owns the client's transport choice. Exactly one of Cloud (remote store),
// LocalRelay (a Hub over RelayLink) or Offline is active; every mode change
// goes through transition_locked().
//
// Thread-safety: public calls may come from any thread. Listeners run without
// the controller lock held, on whichever thread caused the event (the caller,
// a relay reader thread, or the reconnect worker).
class ConnectionModeController : private RelayLink::Listener {
 public:
  using ModeListener = std::function<void(ConnectionMode from, ConnectionMode to)>;
  using NoticeListener = std::function<void(const Notice&)>;
  using PeerCallback = RemoteStore::Listener;

  ConnectionModeController(RemoteStore& remote, IdentityProvider& identity,
                           LocalStore* store = nullptr, ControllerOptions options = {});
  ~ConnectionModeController() override;

  ConnectionModeController(const ConnectionModeController&) = delete;
  ConnectionModeController& operator=(const ConnectionModeController&) = delete;

  // -- host signals ---------------------------------------------------------
  void network_restored();
  void network_lost();
  void auth_state_changed(bool signed_in);
  void sign_out();

  // Blocks until the link is ready or has failed. On failure the mode is left
  // unchanged, a RelayError notice is raised and `error` is filled.
  bool connect_to_relay(const std::string& address, std::string* error = nullptr);

  // -- data -----------------------------------------------------------------
  // Caches the response as this device's own, then writes it through the
  // active transport. Returns whether that transport write succeeded.
  bool submit_response(const std::string& question_id, const std::string& answer,
                       const std::string& reason = "");
  std::vector<quizsync::Response> get_peer_responses(const std::string& question_id);
  void subscribe(const std::string& question_id, PeerCallback callback);
  void unsubscribe(const std::string& question_id);

  // Replays this user's own responses to the remote store. Only runs in Cloud.
  ReconcileReport reconcile();

  void on_mode_changed(ModeListener listener);
  void on_notice(NoticeListener listener);

  ConnectionMode mode() const;
  bool network_online() const;
  int reconnect_attempts() const;
  std::optional<std::string> last_relay_address() const;
  std::optional<ReconcileReport> last_reconcile() const;
  std::size_t relay_active_users() const;
  LocalCache& cache() { return cache_; }

 private:
  struct Subscription {
    PeerCallback callback;
    RemoteStore::Unsubscribe remote_unsubscribe;
  };

  // Mode changes and notices collected under the lock, delivered after it.
  struct Events {
    std::vector<std::pair<ConnectionMode, ConnectionMode>> changes;
    std::vector<Notice> notices;
  };

  void on_peer_data(const std::string& question_id) override;
  void on_link_closed(RelayLink& link) override;

  bool transition_locked(ConnectionMode to, const char* reason, Events& events);
  void enter_cloud();
  void relay_lost_locked(Events& events);
  void reconnect_attempt(std::uint64_t generation, int attempt, std::chrono::milliseconds delay);
  void emit(const Events& events);
  void rebind_subscriptions(ConnectionMode mode);
  RemoteStore::Unsubscribe attach_remote(const std::string& question_id,
                                         const PeerCallback& callback);
  void bind_remote(const std::string& question_id, const PeerCallback& callback);
  bool write_remote(const quizsync::Response& r, std::string& error);
  void persist_relay_address(const std::string& address);

  RemoteStore& remote_;
  IdentityProvider& identity_;
  LocalStore* store_;
  ControllerOptions options_;
  LocalCache cache_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  ConnectionMode mode_{ConnectionMode::Offline};
  bool online_{false};
  bool stopping_{false};
  int reconnect_attempts_{0};
  // Bumped whenever a pending reconnect must be abandoned.
  std::uint64_t generation_{0};
  std::optional<std::string> last_relay_address_;
  std::optional<ReconcileReport> last_reconcile_;
  std::shared_ptr<RelayLink> link_;

  std::mutex subs_mtx_;
  std::map<std::string, Subscription> subscriptions_;

  std::mutex listeners_mtx_;
  std::vector<ModeListener> mode_listeners_;
  std::vector<NoticeListener> notice_listeners_;

  quizsync::ThreadPool reconnect_pool_{1};
};

}  // namespace quizsync::client
