#pragma once
#include <quire/schema/folder.hpp>
#include <json/json.h>
#include <string>

namespace quire::schema::encoding::json {

Json::Value to_json(const folder<1>& o);
bool from_json(const Json::Value& value, folder<1>& o, std::string& error);

}  // namespace quire::schema::encoding::json
