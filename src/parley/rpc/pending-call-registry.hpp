#pragma once

#include "status.hpp"

#include "parley/utils.hpp"

namespace parley::rpc {

/**
 * @brief Invoked exactly once with the outcome of a call; `result` is null unless
 *        `status.ok()`.
 */
using Continuation = std::function<void(const Status& status, const nlohmann::json& result)>;

// ----------------------------------------------------------------------------- PendingCallRegistry

/**
 * @brief The calls that are awaiting a response, keyed by call id.
 *
 * Not thread-safe: owned and driven by a single dispatch context.
 *
 * A continuation is detached from the registry before it is invoked, so a
 * continuation may register new calls (including under its own id). Exceptions
 * escaping a continuation are logged and do not interrupt `resolve_all`.
 */
class PendingCallRegistry {
private:
  struct PendingEntry {
    uint64_t sequence{0};
    Continuation continuation{};
  };

  unordered_map<int64_t, PendingEntry> entries_{};
  uint64_t next_sequence_{0};

  static void invoke_(int64_t id, const Continuation& continuation, const Status& status,
                      const nlohmann::json& result);

public:
  /**
   * @brief Register a pending call.
   * @return `ecode::duplicate_id` if `id` is already pending; the registry is unchanged.
   *         `ecode::argument_error` for a negative id or an empty continuation.
   */
  error_code insert(int64_t id, Continuation continuation);

  /**
   * @brief Remove the entry for `id`, and invoke its continuation.
   * @return false iff no call with `id` was pending.
   */
  bool resolve(int64_t id, const Status& status, const nlohmann::json& result = {});

  /**
   * @brief Remove every entry, then invoke each continuation with `status`, in
   *        registration order.
   * @return the number of continuations invoked.
   */
  std::size_t resolve_all(const Status& status);

  bool contains(int64_t id) const { return entries_.count(id) > 0; }
  std::size_t size() const { return entries_.size(); }
  bool empty() const { return entries_.empty(); }
};

} // namespace parley::rpc
