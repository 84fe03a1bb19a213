#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace actions::db::model {

/*
  Persistent action row.

  extra is stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text
    memory   -> string
*/

struct ActionRecord {
  int64_t id = 0; // 0 until inserted; backends assign on insert

  // symbolic kind name (REMINDER, INFRACTION_EXPIRY)
  std::string kind;

  uint64_t                author_id  = 0;
  std::optional<uint64_t> guild_id;
  uint64_t                channel_id = 0;
  uint64_t                message_id = 0;

  // epoch ms
  int64_t created_at_ms = 0;
  int64_t trigger_at_ms = 0;

  std::string extra;
};

} // namespace actions::db::model
