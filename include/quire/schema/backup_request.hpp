#pragma once
#include <quire/schema/primitives.hpp>
#include <string>

namespace quire::schema {

/// Legacy payload a client falls back to when a workspace has no
/// `notes.json` in the archive; clears stale client side notes.
inline constexpr auto kEmptyLegacyPayload = std::string_view{"{\"notes\":[]}"};

/// One workspace to include in a backup.
///
/// `legacy_payload` is opaque client state (pre-structured notes) written
/// verbatim to `notes.json`.
struct backup_request final {
  id_t workspace_id;
  std::string legacy_payload;
};

/// Legacy payload handed back to the caller after a workspace is restored.
struct restored_payload final {
  id_t workspace_id;
  std::string payload;

  bool operator==(const restored_payload&) const = default;
};

using backup_request_t = backup_request;
using restored_payload_t = restored_payload;

}  // namespace quire::schema
