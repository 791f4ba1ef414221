#include "node.hpp"
#include "identity.hpp"
#include "json_fields.hpp"
#include "polygraph/error.hpp"
#include <algorithm>

namespace polygraph::model {

namespace {
    bool append_unique(std::vector<std::string>& ids, const std::string& id) {
        if (std::find(ids.begin(), ids.end(), id) != ids.end()) {
            return false;
        }
        ids.push_back(id);
        return true;
    }

    bool erase_value(std::vector<std::string>& ids, const std::string& id) {
        auto it = std::remove(ids.begin(), ids.end(), id);
        if (it == ids.end()) {
            return false;
        }
        ids.erase(it, ids.end());
        return true;
    }
}

// Morph

bool Morph::add_relation(const std::string& relation_id) {
    return append_unique(relation_ids, relation_id);
}

bool Morph::add_attribute(const std::string& attribute_id) {
    return append_unique(attribute_ids, attribute_id);
}

bool Morph::remove_relation(const std::string& relation_id) {
    return erase_value(relation_ids, relation_id);
}

bool Morph::remove_attribute(const std::string& attribute_id) {
    return erase_value(attribute_ids, attribute_id);
}

bool Morph::has_relation(const std::string& relation_id) const {
    return std::find(relation_ids.begin(), relation_ids.end(), relation_id) != relation_ids.end();
}

bool Morph::has_attribute(const std::string& attribute_id) const {
    return std::find(attribute_ids.begin(), attribute_ids.end(), attribute_id) != attribute_ids.end();
}

bool Morph::operator==(const Morph& other) const {
    return morph_id == other.morph_id &&
           node_id == other.node_id &&
           name == other.name &&
           relation_ids == other.relation_ids &&
           attribute_ids == other.attribute_ids;
}

// Node

Morph& Node::active_morph() {
    Morph* morph = find_morph(nbh);
    if (morph == nullptr) {
        throw GraphException(ErrorCode::MorphNotFound,
            "Active morph " + nbh + " missing from node " + id);
    }
    return *morph;
}

const Morph& Node::active_morph() const {
    const Morph* morph = find_morph(nbh);
    if (morph == nullptr) {
        throw GraphException(ErrorCode::MorphNotFound,
            "Active morph " + nbh + " missing from node " + id);
    }
    return *morph;
}

Morph* Node::find_morph(const std::string& morph_id) {
    for (auto& morph : morphs) {
        if (morph.morph_id == morph_id) return &morph;
    }
    return nullptr;
}

const Morph* Node::find_morph(const std::string& morph_id) const {
    for (const auto& morph : morphs) {
        if (morph.morph_id == morph_id) return &morph;
    }
    return nullptr;
}

Morph* Node::find_morph_by_name(const std::string& morph_name) {
    for (auto& morph : morphs) {
        if (morph.name == morph_name) return &morph;
    }
    return nullptr;
}

const Morph* Node::find_morph_by_name(const std::string& morph_name) const {
    for (const auto& morph : morphs) {
        if (morph.name == morph_name) return &morph;
    }
    return nullptr;
}

Morph& Node::add_morph(const std::string& morph_name) {
    Morph morph;
    do {
        morph.morph_id = derive_morph_id(id, morph_seq++);
    } while (find_morph(morph.morph_id) != nullptr);
    morph.node_id = id;
    morph.name = morph_name;
    morphs.push_back(std::move(morph));
    return morphs.back();
}

bool Node::validate(std::string* reason) const {
    auto fail = [reason](const std::string& message) {
        if (reason) *reason = message;
        return false;
    };

    if (id.empty()) {
        return fail("node id is empty");
    }
    if (morphs.empty()) {
        return fail("node " + id + " has no morphs");
    }
    if (find_morph(nbh) == nullptr) {
        return fail("active morph '" + nbh + "' is not a morph of node " + id);
    }
    for (size_t i = 0; i < morphs.size(); ++i) {
        for (size_t k = i + 1; k < morphs.size(); ++k) {
            if (morphs[i].morph_id == morphs[k].morph_id) {
                return fail("duplicate morph id " + morphs[i].morph_id);
            }
        }
    }
    return true;
}

bool Node::operator==(const Node& other) const {
    return id == other.id &&
           base_name == other.base_name &&
           name == other.name &&
           adjective == other.adjective &&
           quantifier == other.quantifier &&
           role == other.role &&
           description == other.description &&
           parent_types == other.parent_types &&
           deleted == other.deleted &&
           morphs == other.morphs &&
           nbh == other.nbh &&
           morph_seq == other.morph_seq;
}

std::string display_name(const std::string& base_name, const std::optional<std::string>& adjective) {
    if (adjective && !adjective->empty()) {
        return *adjective + " " + base_name;
    }
    return base_name;
}

Node create_node(const std::string& base_name, const NodeOptions& options) {
    if (is_blank(base_name)) {
        throw InvalidNameError("Node base name must not be empty");
    }

    Node node;
    node.id = options.id && !options.id->empty() ? *options.id : normalize_id(base_name);
    if (node.id.empty()) {
        throw InvalidNameError("Node base name '" + base_name + "' yields an empty id");
    }

    node.base_name = base_name;
    node.adjective = options.adjective;
    node.name = display_name(base_name, options.adjective);
    node.quantifier = options.quantifier;
    node.role = options.role ? *options.role : constants::DEFAULT_ROLE;
    node.description = options.description;
    node.parent_types = options.parent_types;

    const Morph& basic = node.add_morph(constants::BASIC_MORPH_NAME);
    node.nbh = basic.morph_id;
    return node;
}

// JSON

void to_json(nlohmann::json& j, const Morph& morph) {
    j = nlohmann::json{
        {"morph_id", morph.morph_id},
        {"node_id", morph.node_id},
        {"name", morph.name},
        {"relation_ids", morph.relation_ids},
        {"attribute_ids", morph.attribute_ids}
    };
}

void from_json(const nlohmann::json& j, Morph& morph) {
    morph.morph_id = detail::get_string(j, "morph_id");
    morph.node_id = detail::get_string(j, "node_id");
    morph.name = detail::get_string(j, "name");
    morph.relation_ids = detail::get_string_list(j, "relation_ids");
    morph.attribute_ids = detail::get_string_list(j, "attribute_ids");
}

void to_json(nlohmann::json& j, const Node& node) {
    j = nlohmann::json::object();
    j["id"] = node.id;
    j["base_name"] = node.base_name;
    j["name"] = node.name;
    detail::put_optional(j, "adjective", node.adjective);
    detail::put_optional(j, "quantifier", node.quantifier);
    j["role"] = node.role;
    detail::put_optional(j, "description", node.description);
    j["parent_types"] = node.parent_types;
    j["deleted"] = node.deleted;
    j["morphs"] = node.morphs;
    j["nbh"] = node.nbh;
    j["morph_seq"] = node.morph_seq;
}

void from_json(const nlohmann::json& j, Node& node) {
    if (!j.is_object()) {
        throw PolygraphException(ErrorCode::DeserializationFailed, "Node record is not an object");
    }

    node.id = detail::get_string(j, "id");
    node.base_name = detail::get_string(j, "base_name", node.id);
    node.adjective = detail::get_optional(j, "adjective");
    node.name = detail::get_string(j, "name", display_name(node.base_name, node.adjective));
    node.quantifier = detail::get_optional(j, "quantifier");
    node.role = detail::get_string(j, "role", constants::DEFAULT_ROLE);
    node.description = detail::get_optional(j, "description");
    node.parent_types = detail::get_string_list(j, "parent_types");
    node.deleted = detail::get_bool(j, "deleted");
    node.nbh = detail::get_string(j, "nbh");

    node.morphs.clear();
    auto morphs_it = j.find("morphs");
    if (morphs_it != j.end() && morphs_it->is_array()) {
        for (const auto& item : *morphs_it) {
            node.morphs.push_back(item.get<Morph>());
        }
    }

    auto seq_it = j.find("morph_seq");
    if (seq_it != j.end() && seq_it->is_number_unsigned()) {
        node.morph_seq = seq_it->get<uint64_t>();
    } else {
        node.morph_seq = node.morphs.size();
    }

    // Records written by other producers may lack morphs or an nbh pointer;
    // restore the invariant the same way a fresh node would have it.
    if (node.morphs.empty() && !node.id.empty()) {
        node.add_morph(constants::BASIC_MORPH_NAME);
    }
    if (!node.morphs.empty() && node.find_morph(node.nbh) == nullptr) {
        node.nbh = node.morphs.front().morph_id;
    }
}

} // namespace polygraph::model
