#include "pending-call-registry.hpp"

namespace parley::rpc {

void PendingCallRegistry::invoke_(int64_t id, const Continuation& continuation,
                                  const Status& status, const nlohmann::json& result) {
  try {
    continuation(status, result);
  } catch (std::exception& e) {
    LOG_ERR("continuation for call id={} threw: {}", id, e.what());
  }
}

// ------------------------------------------------------------------------------------------ insert

error_code PendingCallRegistry::insert(int64_t id, Continuation continuation) {
  if (id < 0 || !continuation)
    return make_error_code(ecode::argument_error);

  const auto [ii, inserted] = entries_.try_emplace(id, PendingEntry{});
  if (!inserted)
    return make_error_code(ecode::duplicate_id);

  ii->second.sequence = next_sequence_++;
  ii->second.continuation = std::move(continuation);
  return {};
}

// ----------------------------------------------------------------------------------------- resolve

bool PendingCallRegistry::resolve(int64_t id, const Status& status, const nlohmann::json& result) {
  auto ii = entries_.find(id);
  if (ii == entries_.end())
    return false;

  auto continuation = std::move(ii->second.continuation);
  entries_.erase(ii);
  invoke_(id, continuation, status, result);
  return true;
}

// ------------------------------------------------------------------------------------- resolve_all

std::size_t PendingCallRegistry::resolve_all(const Status& status) {
  vector<std::pair<int64_t, PendingEntry>> drained;
  drained.reserve(entries_.size());
  for (auto& [id, entry] : entries_)
    drained.emplace_back(id, std::move(entry));
  entries_.clear();

  std::sort(begin(drained), end(drained),
            [](const auto& a, const auto& b) { return a.second.sequence < b.second.sequence; });

  const nlohmann::json no_result{};
  for (const auto& [id, entry] : drained)
    invoke_(id, entry.continuation, status, no_result);
  return drained.size();
}

} // namespace parley::rpc
