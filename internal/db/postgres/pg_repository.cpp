#include "pg_repository.hpp"

namespace actions::db::postgres {

namespace {

// BIGINT is signed; snowflakes round-trip through the same 64 bits.
int64_t ToSigned(uint64_t v) {
  return static_cast<int64_t>(v);
}

model::ActionRecord ReadAction(const pqxx::row& row) {
  model::ActionRecord r;
  r.id         = row[0].as<int64_t>();
  r.kind       = row[1].c_str();
  r.author_id  = static_cast<uint64_t>(row[2].as<int64_t>());
  if (!row[3].is_null()) {
    r.guild_id = static_cast<uint64_t>(row[3].as<int64_t>());
  }
  r.channel_id    = static_cast<uint64_t>(row[4].as<int64_t>());
  r.message_id    = static_cast<uint64_t>(row[5].as<int64_t>());
  r.created_at_ms = row[6].as<int64_t>();
  r.trigger_at_ms = row[7].as<int64_t>();
  r.extra         = row[8].c_str();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertAction(Transaction& t, model::ActionRecord& r) {
  try {
    std::optional<int64_t> guild_id;
    if (r.guild_id) guild_id = ToSigned(*r.guild_id);

    auto res = TX(t).Work().exec_prepared("insert_action", r.kind, ToSigned(r.author_id), guild_id, ToSigned(r.channel_id),
                                          ToSigned(r.message_id), r.created_at_ms, r.trigger_at_ms, r.extra);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ActionRecord> PgRepository::GetAction(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_prepared("get_action", id);
  if (res.empty()) return std::nullopt;
  return ReadAction(res[0]);
}

std::optional<model::ActionRecord> PgRepository::GetSoonestAction(Transaction& t, int64_t before_ms) {
  auto res = TX(t).Work().exec_prepared("soonest_action", before_ms);
  if (res.empty()) return std::nullopt;
  return ReadAction(res[0]);
}

std::vector<model::ActionRecord> PgRepository::ListActions(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_actions");

  std::vector<model::ActionRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadAction(row));
  }
  return records;
}

Result PgRepository::DeleteAction(Transaction& t, int64_t id) {
  try {
    TX(t).Work().exec_prepared("delete_action", id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace actions::db::postgres
