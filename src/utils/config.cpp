#include "config.hpp"
#include <fstream>
#include <stdexcept>

namespace polygraph::utils {

Config Config::load_from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    Config config;
    try {
        file >> config.data_;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse config file: " + std::string(e.what()));
    }

    if (!config.data_.is_object()) {
        throw std::runtime_error("Config file must contain a JSON object: " + path);
    }
    return config;
}

Config Config::load_from_json(const std::string& json_str) {
    Config config;
    try {
        config.data_ = json::parse(json_str);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Failed to parse JSON: " + std::string(e.what()));
    }
    if (!config.data_.is_object()) {
        throw std::runtime_error("Config JSON must be an object");
    }
    return config;
}

void Config::save_to_file(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + path);
    }

    file << data_.dump(2); // Pretty print with 2-space indent
}

std::string Config::to_pointer(const std::string& key) {
    std::string pointer = "/";
    for (char c : key) {
        pointer += (c == '.') ? '/' : c;
    }
    return pointer;
}

const json* Config::find(const std::string& key) const {
    const json* node = &data_;
    size_t start = 0;
    while (start <= key.size()) {
        size_t dot = key.find('.', start);
        std::string part = key.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!node->is_object()) {
            return nullptr;
        }
        auto it = node->find(part);
        if (it == node->end()) {
            return nullptr;
        }
        node = &(*it);
        if (dot == std::string::npos) {
            break;
        }
        start = dot + 1;
    }
    return node;
}

} // namespace polygraph::utils
