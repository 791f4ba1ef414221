#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::model::detail {

// Absent optionals are written as null so every record has the same shape
inline void put_optional(nlohmann::json& j, const char* key, const std::optional<std::string>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

inline std::optional<std::string> get_optional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // Numbers and booleans from other producers keep their JSON spelling
    return it->dump();
}

inline std::string get_string(const nlohmann::json& j, const char* key, const std::string& fallback = "") {
    auto value = get_optional(j, key);
    return value ? *value : fallback;
}

inline std::vector<std::string> get_string_list(const nlohmann::json& j, const char* key) {
    std::vector<std::string> values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto& item : *it) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

inline bool get_bool(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_boolean() && it->get<bool>();
}

} // namespace polygraph::model::detail
