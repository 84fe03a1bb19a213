#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/util/time.hpp"

namespace actions::db::model {
struct ActionRecord;
}

namespace actions::model {

using ActionId  = int64_t;
using Snowflake = uint64_t;

enum class ActionKind : std::uint8_t {
  kReminder         = 1,
  kInfractionExpiry = 2,
};

// Symbolic name as stored and transmitted ("REMINDER", "INFRACTION_EXPIRY").
std::string_view ActionKindName(ActionKind kind);

// Both throw util::InvalidArgument for values outside the enumeration.
ActionKind ToActionKind(int raw);
ActionKind ParseActionKind(std::string_view name);

struct ReminderExtra {
  std::string content;

  bool operator==(const ReminderExtra&) const = default;
};

struct InfractionExtra {
  Snowflake   target_id = 0;
  std::string reason;

  bool operator==(const InfractionExtra&) const = default;
};

// Kind-dependent payload. The alternative always matches Action::Kind().
using ActionExtra = std::variant<ReminderExtra, InfractionExtra>;

// The kind whose payload shape `extra` holds.
ActionKind ExtraKind(const ActionExtra& extra);

std::string EncodeExtra(const ActionExtra& extra);

// Throws util::InvalidArgument on malformed JSON or a shape that does not fit `kind`.
ActionExtra DecodeExtra(ActionKind kind, std::string_view json);

/*
  Construction input for Action.

  created_at defaults to the moment the fields are built.
*/
struct ActionFields {
  std::optional<ActionId>  id;
  ActionKind               kind = ActionKind::kReminder;
  Snowflake                author_id  = 0;
  Snowflake                channel_id = 0;
  Snowflake                message_id = 0;
  std::optional<Snowflake> guild_id;
  util::TimePoint          created_at = util::Now();
  util::TimePoint          trigger_at{};
  ActionExtra              extra;
};

/*
  One scheduled event.

  Immutable once created, except for the store-assigned id which may be
  set exactly once.
*/
class Action {
 public:
  explicit Action(ActionFields fields);

  // Row form: symbolic kind name, JSON extra, millisecond timestamps.
  static Action            FromRecord(const db::model::ActionRecord& record);
  db::model::ActionRecord  ToRecord() const;

  const std::optional<ActionId>&  Id() const { return id_; }
  ActionKind                      Kind() const { return kind_; }
  Snowflake                       AuthorId() const { return author_id_; }
  Snowflake                       ChannelId() const { return channel_id_; }
  Snowflake                       MessageId() const { return message_id_; }
  const std::optional<Snowflake>& GuildId() const { return guild_id_; }
  util::TimePoint                 CreatedAt() const { return created_at_; }
  util::TimePoint                 TriggerAt() const { return trigger_at_; }
  const ActionExtra&              Extra() const { return extra_; }

  std::string_view KindName() const { return ActionKindName(kind_); }
  std::string      SerializedExtra() const { return EncodeExtra(extra_); }

  // Throws util::InvalidState if an id was already assigned.
  void AssignId(ActionId id);

  bool operator==(const Action&) const = default;

 private:
  std::optional<ActionId>  id_;
  ActionKind               kind_;
  Snowflake                author_id_;
  Snowflake                channel_id_;
  Snowflake                message_id_;
  std::optional<Snowflake> guild_id_;
  util::TimePoint          created_at_;
  util::TimePoint          trigger_at_;
  ActionExtra              extra_;
};

} // namespace actions::model
