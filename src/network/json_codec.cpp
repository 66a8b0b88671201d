/**
 * @file json_codec.cpp
 * @brief jsoncpp reader/writer wrappers.
 * @author Dimitris Kafetzis
 */

#include "network/json_codec.hpp"

#include <memory>

namespace spawner {

Result<Json::Value> parse_json(std::string_view text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Error{ErrorCode::Parse, "Invalid JSON: " + errors};
    }
    return root;
}

std::string to_json_string(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

}  // namespace spawner
