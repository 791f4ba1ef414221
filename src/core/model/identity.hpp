#pragma once

#include "polygraph/common.hpp"
#include <string>

namespace polygraph::model {

/**
 * Deterministic identifier derivation for graph entities.
 *
 * Every id is a pure function of the entity's defining fields, so that
 * re-ingesting the same content (e.g. a repeated markdown parse) resolves to
 * the same keys instead of creating duplicates.
 */

// "  Heavy   Water " -> "heavy_water"
std::string normalize_id(const std::string& label);

// Collapse whitespace runs to '_' without changing case ("part of" -> "part_of")
std::string underscore_whitespace(const std::string& text);

// "<node_id>_morph_<seq>"
std::string derive_morph_id(const std::string& node_id, uint64_t seq);

// "rel_<source>_<name>_<target>"
std::string derive_relation_id(const std::string& source_id,
                               const std::string& name,
                               const std::string& target_id);

// "attr_<source>_<name>_<16 hex chars of BLAKE3(value)>"
std::string derive_attribute_id(const std::string& source_id,
                                const std::string& name,
                                const std::string& value);

// Canonical string form of a computed numeric value ("18.015", "4", "1e+21")
std::string format_value(double value);

// True when the string is empty or only whitespace
bool is_blank(const std::string& text);

} // namespace polygraph::model
