#include "repository_action_store.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/db/model/action_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace actions::store {

using observability::IntField;
using observability::StringField;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(message);
    default:
      throw util::StoreUnavailable(message);
  }
}

// Runs `fn` inside a transaction; backend exceptions become StoreUnavailable.
template <typename Fn>
auto InTransaction(db::Repository& repository, const char* context, Fn&& fn) {
  try {
    auto tx = repository.Begin();
    if constexpr (std::is_void_v<decltype(fn(*tx))>) {
      fn(*tx);
      tx->Commit();
    } else {
      auto out = fn(*tx);
      tx->Commit();
      return out;
    }
  } catch (const util::NotFound&) {
    throw;
  } catch (const util::InvalidArgument&) {
    throw;
  } catch (const util::InvalidState&) {
    throw;
  } catch (const util::StoreUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::StoreUnavailable(std::string(context) + ": " + e.what());
  }
}

} // namespace

RepositoryActionStore::RepositoryActionStore(std::shared_ptr<db::Repository> repository, std::chrono::milliseconds fetch_horizon)
    : repository_(std::move(repository)), fetch_horizon_(fetch_horizon) {
  if (!repository_) {
    throw std::invalid_argument("RepositoryActionStore requires a repository");
  }
}

std::optional<model::Action> RepositoryActionStore::FetchSoonest() {
  const auto before_ms = util::ToUnixMillis(util::Now() + fetch_horizon_);

  return InTransaction(*repository_, "fetch soonest action", [&](db::Transaction& tx) -> std::optional<model::Action> {
    for (;;) {
      auto record = repository_->GetSoonestAction(tx, before_ms);
      if (!record) {
        return std::nullopt;
      }

      try {
        return model::Action::FromRecord(*record);
      } catch (const util::InvalidArgument& e) {
        // an undecodable row would otherwise stay the soonest candidate forever
        ACTIONS_LOG_ERROR("Discarding undecodable action row",
                          {IntField("action_id", record->id), StringField("kind", record->kind), StringField("extra", record->extra),
                           IntField("trigger_at_ms", record->trigger_at_ms), StringField("error", e.what())});
        ThrowIfDbError(repository_->DeleteAction(tx, record->id), "discard action");
      }
    }
  });
}

model::Action RepositoryActionStore::Insert(const model::Action& action) {
  if (action.Id()) {
    throw util::InvalidArgument("action " + std::to_string(*action.Id()) + " is already persisted");
  }

  auto record = action.ToRecord();
  InTransaction(*repository_, "insert action",
                [&](db::Transaction& tx) { ThrowIfDbError(repository_->InsertAction(tx, record), "insert action"); });

  model::Action stored = action;
  stored.AssignId(record.id);
  return stored;
}

void RepositoryActionStore::Delete(model::ActionId id) {
  InTransaction(*repository_, "delete action",
                [&](db::Transaction& tx) { ThrowIfDbError(repository_->DeleteAction(tx, id), "delete action"); });
}

std::vector<model::Action> RepositoryActionStore::List() {
  auto records = InTransaction(*repository_, "list actions", [&](db::Transaction& tx) { return repository_->ListActions(tx); });

  std::vector<model::Action> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    try {
      out.push_back(model::Action::FromRecord(record));
    } catch (const util::InvalidArgument& e) {
      // read-only: skipped here, discarded by FetchSoonest
      ACTIONS_LOG_WARN("Skipping undecodable action row",
                       {IntField("action_id", record.id), StringField("kind", record.kind),
                        IntField("trigger_at_ms", record.trigger_at_ms), StringField("error", e.what())});
    }
  }
  return out;
}

} // namespace actions::store
