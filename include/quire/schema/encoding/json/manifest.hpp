#pragma once
#include <quire/schema/manifest.hpp>
#include <json/json.h>
#include <string>

namespace quire::schema::encoding::json {

Json::Value to_json(const manifest<1>& o);
bool from_json(const Json::Value& value, manifest<1>& o, std::string& error);

/// Decode the `backup_manifest.json` written by the first generation of the
/// notebook backup feature (`backupVersion`, `notebooks`).
bool from_legacy_json(const Json::Value& value,
                      manifest<1>& o,
                      std::string& error);

}  // namespace quire::schema::encoding::json
