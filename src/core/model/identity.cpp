#include "identity.hpp"
#include "crypto/blake3.hpp"
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cctype>

namespace polygraph::model {

namespace {
    bool is_space(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    std::string trim(const std::string& text) {
        auto begin = std::find_if_not(text.begin(), text.end(), is_space);
        auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
        return begin < end ? std::string(begin, end) : std::string();
    }
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(), is_space);
}

std::string underscore_whitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    bool in_space = false;
    for (char c : text) {
        if (is_space(c)) {
            if (!in_space) {
                result += '_';
            }
            in_space = true;
        } else {
            result += c;
            in_space = false;
        }
    }
    return result;
}

std::string normalize_id(const std::string& label) {
    std::string id = underscore_whitespace(trim(label));
    std::transform(id.begin(), id.end(), id.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return id;
}

std::string derive_morph_id(const std::string& node_id, uint64_t seq) {
    return node_id + "_morph_" + std::to_string(seq);
}

std::string derive_relation_id(const std::string& source_id,
                               const std::string& name,
                               const std::string& target_id) {
    return "rel_" + source_id + "_" + underscore_whitespace(name) + "_" + target_id;
}

std::string derive_attribute_id(const std::string& source_id,
                                const std::string& name,
                                const std::string& value) {
    return "attr_" + source_id + "_" + underscore_whitespace(name) + "_" +
           crypto::Blake3::short_hex(value, constants::ATTRIBUTE_VALUE_HASH_CHARS);
}

std::string format_value(double value) {
    // Shortest representation that round-trips
    return fmt::format("{}", value);
}

} // namespace polygraph::model
