#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "client/local_store.hpp"
#include "common/protocol.hpp"

namespace quizsync::client {

// This device's own submissions (replayed to the cloud on reconcile) and the
// peer submissions observed through a relay (used for display). Entries are
// keyed by (question_id, user_id) and never pruned. Thread-safe.
class LocalCache {
 public:
  // With a store, previously persisted entries are loaded and every write is
  // mirrored to it; a failed mirror write is logged and the in-memory write kept.
  explicit LocalCache(LocalStore* store = nullptr);

  LocalCache(const LocalCache&) = delete;
  LocalCache& operator=(const LocalCache&) = delete;

  void put_own(const quizsync::Response& r);
  // Overwrites any previous entry for the key without comparing timestamps.
  void put_peer(const quizsync::Response& r);

  std::vector<quizsync::Response> own_responses_for(const std::string& user_id) const;
  std::optional<quizsync::Response> own_response(const std::string& question_id,
                                                 const std::string& user_id) const;

  std::vector<quizsync::Response> peer_responses(const std::string& question_id) const;
  std::optional<quizsync::Response> peer_response(const std::string& question_id,
                                                  const std::string& user_id) const;

  std::size_t own_count() const;
  std::size_t peer_count() const;

 private:
  // question_id -> user_id -> Response
  using ResponseMap = std::map<std::string, std::map<std::string, quizsync::Response>>;

  // Called with mtx_ held so memory and disk agree on the last write per key.
  void persist(CacheScope scope, const quizsync::Response& r);

  LocalStore* store_;
  mutable std::mutex mtx_;
  ResponseMap own_;
  ResponseMap peer_;
};

}  // namespace quizsync::client
