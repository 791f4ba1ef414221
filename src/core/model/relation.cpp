#include "relation.hpp"
#include "identity.hpp"
#include "json_fields.hpp"
#include "polygraph/error.hpp"
#include <algorithm>

namespace polygraph::model {

bool Relation::add_morph(const std::string& morph_id) {
    if (std::find(morph_ids.begin(), morph_ids.end(), morph_id) != morph_ids.end()) {
        return false;
    }
    morph_ids.push_back(morph_id);
    return true;
}

bool Relation::operator==(const Relation& other) const {
    return id == other.id &&
           source_id == other.source_id &&
           target_id == other.target_id &&
           name == other.name &&
           adverb == other.adverb &&
           modality == other.modality &&
           morph_ids == other.morph_ids &&
           deleted == other.deleted;
}

Relation create_relation(const std::string& source_id,
                         const std::string& target_id,
                         const std::string& name,
                         const RelationOptions& options) {
    if (is_blank(name)) {
        throw InvalidNameError("Relation name must not be empty");
    }

    Relation relation;
    relation.id = options.id && !options.id->empty()
        ? *options.id
        : derive_relation_id(source_id, name, target_id);
    relation.source_id = source_id;
    relation.target_id = target_id;
    relation.name = name;
    relation.adverb = options.adverb;
    relation.modality = options.modality;
    return relation;
}

void to_json(nlohmann::json& j, const Relation& relation) {
    j = nlohmann::json::object();
    j["id"] = relation.id;
    j["source_id"] = relation.source_id;
    j["target_id"] = relation.target_id;
    j["name"] = relation.name;
    detail::put_optional(j, "adverb", relation.adverb);
    detail::put_optional(j, "modality", relation.modality);
    j["morph_ids"] = relation.morph_ids;
    j["deleted"] = relation.deleted;
}

void from_json(const nlohmann::json& j, Relation& relation) {
    if (!j.is_object()) {
        throw PolygraphException(ErrorCode::DeserializationFailed, "Relation record is not an object");
    }
    relation.id = detail::get_string(j, "id");
    relation.source_id = detail::get_string(j, "source_id");
    relation.target_id = detail::get_string(j, "target_id");
    relation.name = detail::get_string(j, "name");
    relation.adverb = detail::get_optional(j, "adverb");
    relation.modality = detail::get_optional(j, "modality");
    relation.morph_ids = detail::get_string_list(j, "morph_ids");
    relation.deleted = detail::get_bool(j, "deleted");
}

} // namespace polygraph::model
