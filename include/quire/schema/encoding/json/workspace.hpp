#pragma once
#include <quire/schema/workspace.hpp>
#include <json/json.h>
#include <string>

namespace quire::schema::encoding::json {

Json::Value to_json(const workspace<1>& o);
bool from_json(const Json::Value& value, workspace<1>& o, std::string& error);

}  // namespace quire::schema::encoding::json
