#include "client/local_cache.hpp"

#include <spdlog/spdlog.h>

namespace quizsync::client {

namespace {

using ResponseMap = std::map<std::string, std::map<std::string, Response>>;

std::optional<Response> lookup(const ResponseMap& map, const std::string& question_id,
                               const std::string& user_id) {
  auto q = map.find(question_id);
  if (q == map.end()) return std::nullopt;
  auto u = q->second.find(user_id);
  if (u == q->second.end()) return std::nullopt;
  return u->second;
}

std::size_t count(const ResponseMap& map) {
  std::size_t total = 0;
  for (const auto& [question_id, by_user] : map) total += by_user.size();
  return total;
}

}  // namespace

LocalCache::LocalCache(LocalStore* store) : store_(store) {
  if (!store_ || !store_->is_open()) return;
  std::string error;
  for (auto& r : store_->load_responses(CacheScope::Own, &error)) {
    own_[r.question_id][r.user_id] = r;
  }
  for (auto& r : store_->load_responses(CacheScope::Peer, &error)) {
    peer_[r.question_id][r.user_id] = r;
  }
  if (!error.empty()) {
    spdlog::warn("[cache] failed to load persisted responses: {}", error);
  }
  spdlog::info("[cache] restored {} own and {} peer responses", count(own_), count(peer_));
}

void LocalCache::put_own(const Response& r) {
  std::lock_guard<std::mutex> lock(mtx_);
  own_[r.question_id][r.user_id] = r;
  persist(CacheScope::Own, r);
}

void LocalCache::put_peer(const Response& r) {
  std::lock_guard<std::mutex> lock(mtx_);
  peer_[r.question_id][r.user_id] = r;
  persist(CacheScope::Peer, r);
}

std::vector<Response> LocalCache::own_responses_for(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Response> out;
  for (const auto& [question_id, by_user] : own_) {
    auto it = by_user.find(user_id);
    if (it != by_user.end()) out.push_back(it->second);
  }
  return out;
}

std::optional<Response> LocalCache::own_response(const std::string& question_id,
                                                 const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lookup(own_, question_id, user_id);
}

std::vector<Response> LocalCache::peer_responses(const std::string& question_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Response> out;
  auto q = peer_.find(question_id);
  if (q == peer_.end()) return out;
  for (const auto& [user_id, r] : q->second) out.push_back(r);
  return out;
}

std::optional<Response> LocalCache::peer_response(const std::string& question_id,
                                                  const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return lookup(peer_, question_id, user_id);
}

std::size_t LocalCache::own_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return count(own_);
}

std::size_t LocalCache::peer_count() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return count(peer_);
}

void LocalCache::persist(CacheScope scope, const Response& r) {
  if (!store_) return;
  std::string error;
  if (!store_->save_response(scope, r, &error)) {
    spdlog::warn("[cache] failed to persist response {}/{}: {}", r.question_id, r.user_id, error);
  }
}

}  // namespace quizsync::client
