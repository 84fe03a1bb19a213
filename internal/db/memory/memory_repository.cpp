#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace actions::db::memory {

namespace {

bool SoonerThan(const model::ActionRecord& a, const model::ActionRecord& b) {
  if (a.trigger_at_ms != b.trigger_at_ms) return a.trigger_at_ms < b.trigger_at_ms;
  return a.id < b.id;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertAction(Transaction& t, model::ActionRecord& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_action_id++;
  s.actions[r.id] = r;
  return Result::Ok();
}

std::optional<model::ActionRecord> MemoryRepository::GetAction(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.actions.find(id);
  if (it == s.actions.end()) return std::nullopt;
  return it->second;
}

std::optional<model::ActionRecord> MemoryRepository::GetSoonestAction(Transaction& t, int64_t before_ms) {
  const model::ActionRecord* best = nullptr;
  for (const auto& [_, record] : TX(t).View().actions) {
    if (record.trigger_at_ms >= before_ms) continue;
    if (!best || SoonerThan(record, *best)) best = &record;
  }
  if (!best) return std::nullopt;
  return *best;
}

std::vector<model::ActionRecord> MemoryRepository::ListActions(Transaction& t) {
  const auto&                      s = TX(t).View();
  std::vector<model::ActionRecord> records;
  records.reserve(s.actions.size());
  for (const auto& [_, record] : s.actions) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), SoonerThan);
  return records;
}

Result MemoryRepository::DeleteAction(Transaction& t, int64_t id) {
  TX(t).Mutable().actions.erase(id);
  return Result::Ok();
}

} // namespace actions::db::memory
