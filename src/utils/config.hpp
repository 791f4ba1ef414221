#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace polygraph::utils {

using json = nlohmann::json;

/**
 * Configuration management system
 * Loads JSON documents; keys may be dotted paths ("network.listen_port")
 */
class Config {
public:
    Config() = default;

    /**
     * Load configuration from JSON file
     */
    static Config load_from_file(const std::string& path);

    /**
     * Load configuration from JSON string
     */
    static Config load_from_json(const std::string& json_str);

    /**
     * Save configuration to file
     */
    void save_to_file(const std::string& path) const;

    /**
     * Get a value from config; nullopt when missing or of another type
     */
    template<typename T>
    std::optional<T> get(const std::string& key) const {
        const json* node = find(key);
        if (node == nullptr) {
            return std::nullopt;
        }
        try {
            return node->get<T>();
        } catch (const json::type_error&) {
            return std::nullopt;
        }
    }

    /**
     * Get a value with default
     */
    template<typename T>
    T get_or(const std::string& key, const T& default_value) const {
        auto value = get<T>(key);
        return value.value_or(default_value);
    }

    /**
     * Set a value, creating intermediate objects for dotted keys
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        data_[json::json_pointer(to_pointer(key))] = value;
    }

    /**
     * Check if key exists
     */
    bool has(const std::string& key) const {
        return find(key) != nullptr;
    }

    /**
     * Get underlying JSON object
     */
    const json& data() const { return data_; }

private:
    json data_ = json::object();

    const json* find(const std::string& key) const;
    static std::string to_pointer(const std::string& key);
};

} // namespace polygraph::utils
