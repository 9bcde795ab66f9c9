#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace statusboard::json {

using Value = nlohmann::json;

inline Value Parse(std::string_view text) {
    return Value::parse(text);
}

inline Value Object() {
    return Value::object();
}

inline Value Array() {
    return Value::array();
}

// Invalid UTF-8 in string values is written as U+FFFD instead of throwing.
inline std::string Dump(const Value& value, int indent = -1) {
    return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace statusboard::json
