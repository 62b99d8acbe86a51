#include "client/mode_controller.hpp"

#include <exception>

#include <spdlog/spdlog.h>

#include "common/message.hpp"

namespace quizsync::client {

namespace {

constexpr const char* kRelayAddressKey = "last_relay_address";

}  // namespace

const char* to_string(ConnectionMode mode) {
  switch (mode) {
    case ConnectionMode::Cloud:
      return "cloud";
    case ConnectionMode::LocalRelay:
      return "local";
    case ConnectionMode::Offline:
      return "offline";
  }
  return "unknown";
}

ConnectionModeController::ConnectionModeController(RemoteStore& remote,
                                                   IdentityProvider& identity, LocalStore* store,
                                                   ControllerOptions options)
    : remote_(remote), identity_(identity), store_(store), options_(options), cache_(store) {
  if (store_ && store_->is_open()) {
    std::string error;
    auto saved = store_->get_setting(kRelayAddressKey, &error);
    if (saved) {
      last_relay_address_ = *saved;
      spdlog::info("[mode] last relay address {}", *saved);
    } else if (!error.empty()) {
      spdlog::warn("[mode] failed to read last relay address: {}", error);
    }
  }
}

ConnectionModeController::~ConnectionModeController() {
  std::shared_ptr<RelayLink> link;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    stopping_ = true;
    ++generation_;
    link = std::move(link_);
  }
  cv_.notify_all();
  reconnect_pool_.shutdown();
  if (link) link->close();
  link.reset();

  std::vector<RemoteStore::Unsubscribe> unsubscribes;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    for (auto& [question_id, sub] : subscriptions_) {
      if (sub.remote_unsubscribe) unsubscribes.push_back(std::move(sub.remote_unsubscribe));
    }
    subscriptions_.clear();
  }
  for (auto& fn : unsubscribes) fn();
}

// -- host signals -------------------------------------------------------------

void ConnectionModeController::network_restored() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    online_ = true;
  }
  spdlog::info("[mode] network restored");
  if (!identity_.current_identity()) {
    spdlog::info("[mode] not signed in, staying in current mode");
    return;
  }
  enter_cloud();
}

void ConnectionModeController::network_lost() {
  Events events;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    online_ = false;
    ++generation_;
    if (transition_locked(ConnectionMode::Offline, "network lost", events)) {
      events.notices.push_back(
          {Notice::Kind::Offline, "You are offline. Responses are saved on this device."});
    }
  }
  cv_.notify_all();
  emit(events);
}

void ConnectionModeController::auth_state_changed(bool signed_in) {
  if (!signed_in) {
    sign_out();
    return;
  }
  bool online = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    online = online_;
  }
  if (online) enter_cloud();
}

void ConnectionModeController::sign_out() {
  Events events;
  std::shared_ptr<RelayLink> old;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    ++generation_;
    reconnect_attempts_ = 0;
    transition_locked(ConnectionMode::Offline, "signed out", events);
    old = std::move(link_);
  }
  cv_.notify_all();
  if (old) old->close();
  old.reset();

  std::vector<RemoteStore::Unsubscribe> unsubscribes;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    for (auto& [question_id, sub] : subscriptions_) {
      if (sub.remote_unsubscribe) unsubscribes.push_back(std::move(sub.remote_unsubscribe));
    }
    spdlog::info("[mode] dropping {} subscriptions", subscriptions_.size());
    subscriptions_.clear();
  }
  for (auto& fn : unsubscribes) fn();
  emit(events);
}

bool ConnectionModeController::connect_to_relay(const std::string& address, std::string* error) {
  Events events;
  std::shared_ptr<RelayLink> stale;
  std::uint64_t generation = 0;
  bool already_open = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    reconnect_attempts_ = 0;
    ++generation_;
    generation = generation_;
    if (link_ && link_->state() == RelayLink::State::Open && link_->address() == address) {
      already_open = true;
      last_relay_address_ = address;
      transition_locked(ConnectionMode::LocalRelay, "relay already connected", events);
    } else if (link_ && link_->state() != RelayLink::State::Open) {
      stale = std::move(link_);
    }
    // An open link to another hub stays current until the new one is ready.
  }
  cv_.notify_all();
  if (already_open) {
    emit(events);
    return true;
  }
  if (stale) stale->close();
  stale.reset();

  spdlog::info("[mode] connecting to relay {}", address);
  auto link = std::make_shared<RelayLink>(cache_, static_cast<RelayLink::Listener*>(this));
  bool ok = link->connect(address, identity_.current_identity(), options_.connect_timeout).get();
  std::string reason = ok ? std::string() : link->last_error();
  std::shared_ptr<RelayLink> replaced;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (ok && (stopping_ || generation != generation_)) {
      ok = false;
      reason = "connect superseded";
    } else if (ok && link->state() != RelayLink::State::Open) {
      ok = false;
      reason = "relay closed during handshake";
    } else if (ok) {
      // Cancels any reconnect queued for the link being replaced.
      ++generation_;
      replaced = std::move(link_);
      link_ = link;
      last_relay_address_ = address;
      if (!transition_locked(ConnectionMode::LocalRelay, "relay connected", events)) {
        spdlog::info("[mode] switched relay to {}", address);
      }
      events.notices.push_back(
          {Notice::Kind::RelayConnected, "Connected to local hub at " + address});
    }

    // Local mode must keep a live transport: if the previous link is gone,
    // recover the way a dropped link would.
    if (!ok && !stopping_ && mode_ == ConnectionMode::LocalRelay &&
        (!link_ || link_->state() != RelayLink::State::Open)) {
      relay_lost_locked(events);
    }
  }
  cv_.notify_all();
  if (replaced) replaced->close();
  replaced.reset();

  if (!ok) {
    link->close();
    if (error) *error = reason;
    events.notices.push_back({Notice::Kind::RelayError,
                              "Could not connect to local hub at " + address + ": " + reason});
    emit(events);
    return false;
  }
  persist_relay_address(address);
  emit(events);
  return true;
}

// -- data ---------------------------------------------------------------------

bool ConnectionModeController::submit_response(const std::string& question_id,
                                               const std::string& answer,
                                               const std::string& reason) {
  auto identity = identity_.current_identity();
  if (!identity) {
    spdlog::warn("[mode] cannot submit {} without a signed-in user", question_id);
    return false;
  }

  Response r;
  r.question_id = question_id;
  r.answer = answer;
  r.reason = reason;
  r.user_id = identity->user_id;
  r.display_name = identity->display_name;
  r.timestamp = now_ms();
  cache_.put_own(r);

  ConnectionMode mode;
  std::shared_ptr<RelayLink> link;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    mode = mode_;
    link = link_;
  }

  std::string error;
  bool ok = false;
  switch (mode) {
    case ConnectionMode::Cloud:
      ok = write_remote(r, error);
      break;
    case ConnectionMode::LocalRelay:
      ok = link && link->submit_response(r, &error);
      if (!link) error = "no relay link";
      break;
    case ConnectionMode::Offline:
      spdlog::info("[mode] saved {} locally (offline)", question_id);
      return false;
  }
  if (!ok) {
    spdlog::warn("[mode] {} write for {} failed, kept for replay: {}", to_string(mode),
                 question_id, error);
  }
  return ok;
}

std::vector<Response> ConnectionModeController::get_peer_responses(const std::string& question_id) {
  if (mode() == ConnectionMode::Cloud) {
    try {
      return remote_.query_responses(question_id);
    } catch (const std::exception& ex) {
      spdlog::warn("[mode] remote query for {} failed, using cache: {}", question_id, ex.what());
    }
  }
  return cache_.peer_responses(question_id);
}

void ConnectionModeController::subscribe(const std::string& question_id, PeerCallback callback) {
  RemoteStore::Unsubscribe previous;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    auto& sub = subscriptions_[question_id];
    previous = std::move(sub.remote_unsubscribe);
    sub.callback = callback;
    sub.remote_unsubscribe = nullptr;
  }
  if (previous) previous();

  if (mode() == ConnectionMode::Cloud) {
    bind_remote(question_id, callback);
  } else {
    callback(cache_.peer_responses(question_id));
  }
}

void ConnectionModeController::unsubscribe(const std::string& question_id) {
  RemoteStore::Unsubscribe unsubscribe_fn;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    auto it = subscriptions_.find(question_id);
    if (it == subscriptions_.end()) return;
    unsubscribe_fn = std::move(it->second.remote_unsubscribe);
    subscriptions_.erase(it);
  }
  if (unsubscribe_fn) unsubscribe_fn();
}

ReconcileReport ConnectionModeController::reconcile() {
  if (mode() != ConnectionMode::Cloud) {
    spdlog::info("[mode] reconcile skipped outside cloud mode");
    return {};
  }
  auto identity = identity_.current_identity();
  if (!identity) return {};

  ReconcileReport report;
  for (const auto& r : cache_.own_responses_for(identity->user_id)) {
    std::string error;
    if (write_remote(r, error)) {
      ++report.successful;
    } else {
      ++report.failed;
      spdlog::warn("[mode] reconcile of {} failed: {}", r.question_id, error);
    }
  }
  spdlog::info("[mode] reconcile: {} successful, {} failed", report.successful, report.failed);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    last_reconcile_ = report;
  }
  return report;
}

void ConnectionModeController::on_mode_changed(ModeListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mtx_);
  mode_listeners_.push_back(std::move(listener));
}

void ConnectionModeController::on_notice(NoticeListener listener) {
  std::lock_guard<std::mutex> lock(listeners_mtx_);
  notice_listeners_.push_back(std::move(listener));
}

ConnectionMode ConnectionModeController::mode() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return mode_;
}

bool ConnectionModeController::network_online() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return online_;
}

int ConnectionModeController::reconnect_attempts() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return reconnect_attempts_;
}

std::optional<std::string> ConnectionModeController::last_relay_address() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return last_relay_address_;
}

std::optional<ReconcileReport> ConnectionModeController::last_reconcile() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return last_reconcile_;
}

std::size_t ConnectionModeController::relay_active_users() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return link_ ? link_->active_user_count() : 0;
}

// -- relay callbacks (reader thread) -------------------------------------------

void ConnectionModeController::on_peer_data(const std::string& question_id) {
  if (mode() == ConnectionMode::Cloud) return;
  PeerCallback callback;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    auto it = subscriptions_.find(question_id);
    if (it == subscriptions_.end()) return;
    callback = it->second.callback;
  }
  if (callback) callback(cache_.peer_responses(question_id));
}

void ConnectionModeController::on_link_closed(RelayLink& link) {
  Events events;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_ || link_.get() != &link) return;
    if (mode_ != ConnectionMode::LocalRelay) return;
    relay_lost_locked(events);
  }
  emit(events);
}

// -- internals ----------------------------------------------------------------

bool ConnectionModeController::transition_locked(ConnectionMode to, const char* reason,
                                                 Events& events) {
  if (to == mode_) return false;
  switch (to) {
    case ConnectionMode::Cloud:
      if (!online_) {
        spdlog::warn("[mode] refusing cloud mode: network offline");
        return false;
      }
      if (!identity_.current_identity()) {
        spdlog::warn("[mode] refusing cloud mode: not signed in");
        return false;
      }
      break;
    case ConnectionMode::LocalRelay:
      if (!link_ || link_->state() != RelayLink::State::Open) {
        spdlog::warn("[mode] refusing local mode: no open relay link");
        return false;
      }
      break;
    case ConnectionMode::Offline:
      break;
  }
  spdlog::info("[mode] {} -> {} ({})", to_string(mode_), to_string(to), reason);
  events.changes.emplace_back(mode_, to);
  mode_ = to;
  return true;
}

void ConnectionModeController::enter_cloud() {
  Events events;
  std::shared_ptr<RelayLink> old;
  bool entered = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    entered = transition_locked(ConnectionMode::Cloud, "network available", events);
    if (entered) {
      ++generation_;
      reconnect_attempts_ = 0;
      old = std::move(link_);
    }
  }
  cv_.notify_all();
  if (old) old->close();
  old.reset();
  emit(events);
  if (!entered) return;

  auto report = reconcile();
  if (report.successful > 0) {
    Events synced;
    std::string text = "Synced " + std::to_string(report.successful) + " responses to the cloud";
    if (report.failed > 0) text += " (" + std::to_string(report.failed) + " failed)";
    synced.notices.push_back({Notice::Kind::SyncComplete, text});
    emit(synced);
  }
}

void ConnectionModeController::relay_lost_locked(Events& events) {
  if (!last_relay_address_ || !options_.reconnect.should_retry(reconnect_attempts_)) {
    spdlog::warn("[mode] giving up on relay after {} reconnect attempts", reconnect_attempts_);
    ++generation_;
    if (transition_locked(ConnectionMode::Offline, "reconnect attempts exhausted", events)) {
      events.notices.push_back({Notice::Kind::ReconnectFailed,
                                "Failed to reconnect to local hub. Working offline."});
    }
    return;
  }

  int attempt = ++reconnect_attempts_;
  auto delay = options_.reconnect.delay_for(attempt);
  std::uint64_t generation = generation_;
  spdlog::info("[mode] reconnect attempt {}/{} in {} ms", attempt,
               options_.reconnect.max_attempts, delay.count());
  bool queued = reconnect_pool_.enqueue(
      [this, generation, attempt, delay] { reconnect_attempt(generation, attempt, delay); });
  if (!queued) spdlog::warn("[mode] reconnect worker stopped, attempt {} dropped", attempt);
}

void ConnectionModeController::reconnect_attempt(std::uint64_t generation, int attempt,
                                                 std::chrono::milliseconds delay) {
  std::shared_ptr<RelayLink> old;
  std::string address;
  {
    std::unique_lock<std::mutex> lock(mtx_);
    bool cancelled = cv_.wait_for(lock, delay, [this, generation] {
      return stopping_ || generation_ != generation;
    });
    if (cancelled) {
      spdlog::info("[mode] reconnect attempt {} cancelled", attempt);
      return;
    }
    address = last_relay_address_.value_or(std::string());
    old = std::move(link_);
  }
  old.reset();

  auto link = std::make_shared<RelayLink>(cache_, static_cast<RelayLink::Listener*>(this));
  bool ok = link->connect(address, identity_.current_identity(), options_.connect_timeout).get();

  Events events;
  bool superseded = false;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_ || generation_ != generation) {
      superseded = true;
    } else if (ok && link->state() == RelayLink::State::Open) {
      link_ = link;
      reconnect_attempts_ = 0;
      spdlog::info("[mode] reconnected to {} on attempt {}", address, attempt);
      events.notices.push_back(
          {Notice::Kind::RelayConnected, "Reconnected to local hub at " + address});
    } else {
      spdlog::warn("[mode] reconnect attempt {} failed: {}", attempt, link->last_error());
      relay_lost_locked(events);
    }
  }
  if (superseded) link->close();
  emit(events);
}

void ConnectionModeController::emit(const Events& events) {
  for (const auto& [from, to] : events.changes) {
    if (from == ConnectionMode::Cloud || to == ConnectionMode::Cloud) rebind_subscriptions(to);
  }

  std::vector<ModeListener> mode_listeners;
  std::vector<NoticeListener> notice_listeners;
  {
    std::lock_guard<std::mutex> lock(listeners_mtx_);
    mode_listeners = mode_listeners_;
    notice_listeners = notice_listeners_;
  }
  for (const auto& [from, to] : events.changes) {
    for (const auto& fn : mode_listeners) fn(from, to);
  }
  for (const auto& notice : events.notices) {
    spdlog::info("[mode] notice: {}", notice.text);
    for (const auto& fn : notice_listeners) fn(notice);
  }
}

void ConnectionModeController::rebind_subscriptions(ConnectionMode mode) {
  std::vector<RemoteStore::Unsubscribe> stale;
  std::vector<std::pair<std::string, PeerCallback>> targets;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    for (auto& [question_id, sub] : subscriptions_) {
      if (sub.remote_unsubscribe) stale.push_back(std::move(sub.remote_unsubscribe));
      sub.remote_unsubscribe = nullptr;
      targets.emplace_back(question_id, sub.callback);
    }
  }
  for (auto& fn : stale) fn();
  for (const auto& [question_id, callback] : targets) {
    if (mode == ConnectionMode::Cloud) {
      bind_remote(question_id, callback);
    } else {
      callback(cache_.peer_responses(question_id));
    }
  }
}

RemoteStore::Unsubscribe ConnectionModeController::attach_remote(const std::string& question_id,
                                                                 const PeerCallback& callback) {
  try {
    return remote_.subscribe(question_id, callback);
  } catch (const std::exception& ex) {
    spdlog::warn("[mode] remote subscribe for {} failed: {}", question_id, ex.what());
    return nullptr;
  }
}

void ConnectionModeController::bind_remote(const std::string& question_id,
                                           const PeerCallback& callback) {
  auto unsubscribe_fn = attach_remote(question_id, callback);
  if (!unsubscribe_fn) return;
  {
    std::lock_guard<std::mutex> lock(subs_mtx_);
    auto it = subscriptions_.find(question_id);
    if (it != subscriptions_.end() && !it->second.remote_unsubscribe) {
      it->second.remote_unsubscribe = std::move(unsubscribe_fn);
      return;
    }
  }
  // Unsubscribed or rebound while attaching.
  unsubscribe_fn();
}

bool ConnectionModeController::write_remote(const Response& r, std::string& error) {
  try {
    return remote_.write_response(r, &error);
  } catch (const std::exception& ex) {
    error = ex.what();
    return false;
  }
}

void ConnectionModeController::persist_relay_address(const std::string& address) {
  if (!store_) return;
  std::string error;
  if (!store_->set_setting(kRelayAddressKey, address, &error)) {
    spdlog::warn("[mode] failed to persist relay address: {}", error);
  }
}

}  // namespace quizsync::client
