#include "action.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <charconv>
#include <cmath>
#include <string>

#include "internal/db/model/action_record.hpp"
#include "internal/util/errors.hpp"

namespace actions::model {

namespace {

constexpr std::string_view kReminderName         = "REMINDER";
constexpr std::string_view kInfractionExpiryName = "INFRACTION_EXPIRY";

// Largest integer a JSON number (double) holds exactly.
constexpr double kMaxExactDouble = 9007199254740992.0;

using google::protobuf::Struct;
using google::protobuf::Value;

const Value& RequireField(const Struct& doc, const std::string& key, ActionKind kind) {
  auto it = doc.fields().find(key);
  if (it == doc.fields().end()) {
    throw util::InvalidArgument("extra for " + std::string(ActionKindName(kind)) + " is missing '" + key + "'");
  }
  return it->second;
}

std::string RequireString(const Struct& doc, const std::string& key, ActionKind kind) {
  const auto& value = RequireField(doc, key, kind);
  if (value.kind_case() != Value::kStringValue) {
    throw util::InvalidArgument("extra field '" + key + "' must be a string");
  }
  return value.string_value();
}

Snowflake RequireSnowflake(const Struct& doc, const std::string& key, ActionKind kind) {
  const auto& value = RequireField(doc, key, kind);

  if (value.kind_case() == Value::kStringValue) {
    const auto& text   = value.string_value();
    Snowflake   parsed = 0;
    auto [ptr, ec]     = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc() || ptr != text.data() + text.size() || text.empty()) {
      throw util::InvalidArgument("extra field '" + key + "' is not a valid identifier: " + text);
    }
    return parsed;
  }

  if (value.kind_case() == Value::kNumberValue) {
    const double number = value.number_value();
    if (number < 0 || number > kMaxExactDouble || std::floor(number) != number) {
      throw util::InvalidArgument("extra field '" + key + "' is not a valid identifier");
    }
    return static_cast<Snowflake>(number);
  }

  throw util::InvalidArgument("extra field '" + key + "' must be a string or integer");
}

} // namespace

std::string_view ActionKindName(ActionKind kind) {
  switch (kind) {
    case ActionKind::kReminder:
      return kReminderName;
    case ActionKind::kInfractionExpiry:
      return kInfractionExpiryName;
  }
  return "UNKNOWN";
}

ActionKind ToActionKind(int raw) {
  switch (raw) {
    case static_cast<int>(ActionKind::kReminder):
      return ActionKind::kReminder;
    case static_cast<int>(ActionKind::kInfractionExpiry):
      return ActionKind::kInfractionExpiry;
    default:
      throw util::InvalidArgument("unknown action kind value: " + std::to_string(raw));
  }
}

ActionKind ParseActionKind(std::string_view name) {
  if (name == kReminderName) return ActionKind::kReminder;
  if (name == kInfractionExpiryName) return ActionKind::kInfractionExpiry;
  throw util::InvalidArgument("unknown action kind: " + std::string(name));
}

ActionKind ExtraKind(const ActionExtra& extra) {
  return std::holds_alternative<ReminderExtra>(extra) ? ActionKind::kReminder : ActionKind::kInfractionExpiry;
}

std::string EncodeExtra(const ActionExtra& extra) {
  Struct doc;
  auto&  fields = *doc.mutable_fields();

  if (const auto* reminder = std::get_if<ReminderExtra>(&extra)) {
    fields["content"].set_string_value(reminder->content);
  } else {
    const auto& infraction = std::get<InfractionExtra>(extra);
    // 64-bit ids do not survive a JSON double, keep them textual
    fields["target_id"].set_string_value(std::to_string(infraction.target_id));
    fields["reason"].set_string_value(infraction.reason);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(doc, &json);
  if (!status.ok()) {
    throw std::runtime_error("failed to encode action extra: " + std::string(status.message()));
  }
  return json;
}

ActionExtra DecodeExtra(ActionKind kind, std::string_view json) {
  Struct doc;
  auto   status = google::protobuf::util::JsonStringToMessage(std::string(json), &doc);
  if (!status.ok()) {
    throw util::InvalidArgument("malformed extra payload: " + std::string(status.message()));
  }

  switch (kind) {
    case ActionKind::kReminder:
      return ReminderExtra{RequireString(doc, "content", kind)};
    case ActionKind::kInfractionExpiry:
      return InfractionExtra{RequireSnowflake(doc, "target_id", kind), RequireString(doc, "reason", kind)};
  }
  throw util::InvalidArgument("unknown action kind");
}

Action::Action(ActionFields fields)
    : id_(fields.id),
      kind_(fields.kind),
      author_id_(fields.author_id),
      channel_id_(fields.channel_id),
      message_id_(fields.message_id),
      guild_id_(fields.guild_id),
      created_at_(util::TruncateToMillis(fields.created_at)),
      trigger_at_(util::TruncateToMillis(fields.trigger_at)),
      extra_(std::move(fields.extra)) {
  // rejects values smuggled in through static_cast
  ToActionKind(static_cast<int>(kind_));

  if (ExtraKind(extra_) != kind_) {
    throw util::InvalidArgument("extra payload shape does not match kind " + std::string(ActionKindName(kind_)));
  }
  if (author_id_ == 0 || channel_id_ == 0 || message_id_ == 0) {
    throw util::InvalidArgument("author, channel and message ids are required");
  }
  if (trigger_at_ < created_at_) {
    throw util::InvalidArgument("trigger_at precedes created_at");
  }
  if (id_ && *id_ <= 0) {
    throw util::InvalidArgument("action id must be positive");
  }
}

Action Action::FromRecord(const db::model::ActionRecord& record) {
  ActionFields fields;
  if (record.id != 0) {
    fields.id = record.id;
  }
  fields.kind       = ParseActionKind(record.kind);
  fields.author_id  = record.author_id;
  fields.channel_id = record.channel_id;
  fields.message_id = record.message_id;
  fields.guild_id   = record.guild_id;
  fields.created_at = util::FromUnixMillis(record.created_at_ms);
  fields.trigger_at = util::FromUnixMillis(record.trigger_at_ms);
  fields.extra      = DecodeExtra(fields.kind, record.extra);
  return Action(std::move(fields));
}

db::model::ActionRecord Action::ToRecord() const {
  db::model::ActionRecord record;
  record.id            = id_.value_or(0);
  record.kind          = std::string(KindName());
  record.author_id     = author_id_;
  record.guild_id      = guild_id_;
  record.channel_id    = channel_id_;
  record.message_id    = message_id_;
  record.created_at_ms = util::ToUnixMillis(created_at_);
  record.trigger_at_ms = util::ToUnixMillis(trigger_at_);
  record.extra         = SerializedExtra();
  return record;
}

void Action::AssignId(ActionId id) {
  if (id_) {
    throw util::InvalidState("action already has id " + std::to_string(*id_));
  }
  if (id <= 0) {
    throw util::InvalidArgument("action id must be positive");
  }
  id_ = id;
}

} // namespace actions::model
