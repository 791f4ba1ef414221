#pragma once

#include "polygraph/common.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::model {

/**
 * Morph - One contextual version of a node.
 *
 * A morph only references relations and attributes by id; the entities
 * themselves live under their own keys in the store.
 */
struct Morph {
    std::string morph_id;
    std::string node_id;
    std::string name;
    std::vector<std::string> relation_ids;
    std::vector<std::string> attribute_ids;

    // Append if absent; returns true when the list changed
    bool add_relation(const std::string& relation_id);
    bool add_attribute(const std::string& attribute_id);

    // Remove if present; returns true when the list changed
    bool remove_relation(const std::string& relation_id);
    bool remove_attribute(const std::string& attribute_id);

    bool has_relation(const std::string& relation_id) const;
    bool has_attribute(const std::string& attribute_id) const;

    bool operator==(const Morph& other) const;
    bool operator!=(const Morph& other) const { return !(*this == other); }
};

struct NodeOptions {
    std::optional<std::string> id;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::optional<std::string> role;
    std::optional<std::string> description;
    std::vector<std::string> parent_types;
};

/**
 * Node - A polymorphic graph node (PolyNode).
 *
 * Invariant: `morphs` is non-empty and `nbh` is the id of one of them.
 * `morph_seq` is the counter the next morph id is derived from; it only
 * ever grows, so morph ids are never reused within a node.
 */
struct Node {
    std::string id;
    std::string base_name;
    std::string name;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::string role;
    std::optional<std::string> description;
    std::vector<std::string> parent_types;
    bool deleted = false;
    std::vector<Morph> morphs;
    std::string nbh;
    uint64_t morph_seq = 0;

    Morph& active_morph();
    const Morph& active_morph() const;

    Morph* find_morph(const std::string& morph_id);
    const Morph* find_morph(const std::string& morph_id) const;
    Morph* find_morph_by_name(const std::string& morph_name);
    const Morph* find_morph_by_name(const std::string& morph_name) const;

    // Adds a morph with the next counter-derived id; does not switch nbh
    Morph& add_morph(const std::string& morph_name);

    // Checks the morph invariant; fills `reason` when it does not hold
    bool validate(std::string* reason = nullptr) const;

    bool operator==(const Node& other) const;
    bool operator!=(const Node& other) const { return !(*this == other); }
};

/**
 * Build a node with a single "basic" morph that is also the active one.
 * @throws InvalidNameError if base_name is blank or normalizes to an empty id
 */
Node create_node(const std::string& base_name, const NodeOptions& options = {});

// "<adjective> <base_name>" or just base_name
std::string display_name(const std::string& base_name, const std::optional<std::string>& adjective);

void to_json(nlohmann::json& j, const Morph& morph);
void from_json(const nlohmann::json& j, Morph& morph);
void to_json(nlohmann::json& j, const Node& node);
void from_json(const nlohmann::json& j, Node& node);

} // namespace polygraph::model
