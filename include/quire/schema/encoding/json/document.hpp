#pragma once
#include <quire/schema/document.hpp>
#include <json/json.h>
#include <string>

namespace quire::schema::encoding::json {

Json::Value to_json(const document<1>& o);
bool from_json(const Json::Value& value, document<1>& o, std::string& error);

}  // namespace quire::schema::encoding::json
