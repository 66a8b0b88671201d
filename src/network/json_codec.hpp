/**
 * @file json_codec.hpp
 * @brief jsoncpp helpers shared by the runtime and cluster clients.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"

#include <string>
#include <string_view>

#include <json/json.h>

namespace spawner {

/// Parse a JSON document; ErrorCode::Parse on malformed input.
Result<Json::Value> parse_json(std::string_view text);

/// Serialize without indentation.
std::string to_json_string(const Json::Value& value);

}  // namespace spawner
