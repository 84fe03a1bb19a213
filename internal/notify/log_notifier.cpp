#include "log_notifier.hpp"

#include "internal/observability/logging.hpp"

namespace actions::notify {

using observability::IntField;
using observability::StringField;

void LogNotifier::Notify(const model::Action& action) {
  const auto guild = action.GuildId() ? std::to_string(*action.GuildId()) : std::string("none");

  ACTIONS_LOG_INFO("Action triggered",
                   {IntField("action_id", action.Id().value_or(0)), StringField("kind", action.KindName()),
                    StringField("author_id", std::to_string(action.AuthorId())), StringField("guild_id", guild),
                    StringField("channel_id", std::to_string(action.ChannelId())),
                    StringField("message_id", std::to_string(action.MessageId())),
                    IntField("trigger_at_ms", util::ToUnixMillis(action.TriggerAt())), StringField("extra", action.SerializedExtra())});
}

} // namespace actions::notify
