#pragma once

/**
 * @file json_utils.h
 * @brief Compact JSON serialization helpers
 *
 * jsoncpp keeps object members in a std::map, so compact output has keys in
 * lexicographic order. That makes toCompactJson() a stable canonical form
 * for signing and hashing.
 */

#include <json/json.h>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace common {

inline std::string toCompactJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

/**
 * @brief Parse JSON text
 * @return Parsed value, or std::nullopt if the text is not valid JSON
 */
inline std::optional<Json::Value> parseJson(const std::string& text) {
    Json::CharReaderBuilder reader;
    std::istringstream stream(text);
    Json::Value parsed;
    std::string errs;
    if (!Json::parseFromStream(reader, stream, &parsed, &errs)) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace common
