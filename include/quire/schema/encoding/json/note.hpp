#pragma once
#include <quire/schema/note.hpp>
#include <json/json.h>
#include <string>

namespace quire::schema::encoding::json {

Json::Value to_json(const note<1>& o);
bool from_json(const Json::Value& value, note<1>& o, std::string& error);

}  // namespace quire::schema::encoding::json
