#pragma once

#include "polygraph/common.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::model {

struct RelationOptions {
    std::optional<std::string> id;
    std::optional<std::string> adverb;
    std::optional<std::string> modality;
};

/**
 * Relation - Directed, named edge between two nodes.
 *
 * The id is derived from (source_id, name, target_id), so creating the same
 * triple twice addresses the same record.
 */
struct Relation {
    std::string id;
    std::string source_id;
    std::string target_id;
    std::string name;
    std::optional<std::string> adverb;
    std::optional<std::string> modality;
    std::vector<std::string> morph_ids;
    bool deleted = false;

    bool add_morph(const std::string& morph_id);

    bool operator==(const Relation& other) const;
    bool operator!=(const Relation& other) const { return !(*this == other); }
};

/**
 * Build a relation; endpoint existence is not checked here.
 * @throws InvalidNameError if the relation name is blank
 */
Relation create_relation(const std::string& source_id,
                         const std::string& target_id,
                         const std::string& name,
                         const RelationOptions& options = {});

void to_json(nlohmann::json& j, const Relation& relation);
void from_json(const nlohmann::json& j, Relation& relation);

} // namespace polygraph::model
