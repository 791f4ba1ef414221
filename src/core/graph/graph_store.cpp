#include "graph_store.hpp"
#include "expression.hpp"
#include "core/model/identity.hpp"
#include "polygraph/error.hpp"
#include "utils/logger.hpp"
#include <cstdlib>
#include <map>
#include <set>

namespace polygraph::graph {

using storage::WriteOp;

const char* entity_prefix(EntityKind kind) {
    switch (kind) {
        case EntityKind::NODES: return constants::NODES_PREFIX;
        case EntityKind::RELATIONS: return constants::RELATIONS_PREFIX;
        case EntityKind::ATTRIBUTES: return constants::ATTRIBUTES_PREFIX;
    }
    return constants::NODES_PREFIX;
}

std::string node_key(const std::string& id) {
    return std::string(constants::NODES_PREFIX) + "/" + id;
}

std::string relation_key(const std::string& id) {
    return std::string(constants::RELATIONS_PREFIX) + "/" + id;
}

std::string attribute_key(const std::string& id) {
    return std::string(constants::ATTRIBUTES_PREFIX) + "/" + id;
}

namespace {
    template<typename T>
    std::string encode(const T& entity) {
        return nlohmann::json(entity).dump();
    }

    template<typename T>
    T decode(const nlohmann::json& j, const std::string& key) {
        try {
            return j.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Cannot decode record " + key + ": " + e.what());
        } catch (const PolygraphException& e) {
            throw StorageException(ErrorCode::StorageCorrupted,
                "Cannot decode record " + key + ": " + e.what());
        }
    }

    // Leading number of an attribute value, like "18.015 g/mol" -> 18.015
    std::optional<double> numeric_prefix(const std::string& value) {
        const char* begin = value.c_str();
        char* end = nullptr;
        double number = std::strtod(begin, &end);
        if (end == begin) {
            return std::nullopt;
        }
        return number;
    }

    bool referenced_by_any(const model::Node& node, const std::string& id, bool relation) {
        for (const auto& morph : node.morphs) {
            if (relation ? morph.has_relation(id) : morph.has_attribute(id)) {
                return true;
            }
        }
        return false;
    }
}

GraphStore::GraphStore(std::shared_ptr<storage::KeyValueStore> kv)
    : kv_(std::move(kv))
{
    if (!kv_) {
        throw PolygraphException(ErrorCode::InvalidArgument, "GraphStore requires a key-value store");
    }
}

std::optional<nlohmann::json> GraphStore::read_json(const std::string& key) const {
    auto raw = kv_->get(key);
    if (!raw) {
        return std::nullopt;
    }
    nlohmann::json j = nlohmann::json::parse(*raw, nullptr, false);
    if (j.is_discarded()) {
        throw StorageException(ErrorCode::StorageCorrupted, "Record " + key + " is not valid JSON");
    }
    return j;
}

void GraphStore::put_node(const model::Node& node) {
    kv_->put(node_key(node.id), encode(node));
}

model::Node GraphStore::require_node(const std::string& id) const {
    auto node = get_node(id);
    if (!node) {
        throw NotFoundError("Node " + id + " not found");
    }
    return *node;
}

// Nodes

model::Node GraphStore::add_node(const std::string& base_name, const model::NodeOptions& options) {
    model::Node node = model::create_node(base_name, options);

    auto guard = node_locks_.lock(node.id);
    put_node(node);
    POLYGRAPH_LOG_DEBUG("Added node {}", node.id);
    return node;
}

std::optional<model::Node> GraphStore::get_node(const std::string& id) const {
    std::string key = node_key(id);
    auto j = read_json(key);
    if (!j) {
        return std::nullopt;
    }
    auto node = decode<model::Node>(*j, key);
    if (node.deleted) {
        return std::nullopt;
    }
    return node;
}

model::Node GraphStore::update_node(const std::string& id, const NodePatch& patch) {
    auto guard = node_locks_.lock(id);
    model::Node node = require_node(id);

    if (patch.base_name) node.base_name = *patch.base_name;
    if (patch.name) node.name = *patch.name;
    if (patch.adjective) node.adjective = *patch.adjective;
    if (patch.quantifier) node.quantifier = *patch.quantifier;
    if (patch.role) node.role = *patch.role;
    if (patch.description) node.description = *patch.description;
    if (patch.parent_types) node.parent_types = *patch.parent_types;
    if (patch.morphs) node.morphs = *patch.morphs;
    if (patch.nbh) node.nbh = *patch.nbh;

    std::string reason;
    if (!node.validate(&reason)) {
        throw PolygraphException(ErrorCode::InvalidArgument,
            "Update of node " + id + " rejected: " + reason);
    }

    put_node(node);
    POLYGRAPH_LOG_DEBUG("Updated node {}", id);
    return node;
}

bool GraphStore::delete_node(const std::string& id) {
    auto guard = node_locks_.lock(id);
    bool existed = get_node(id).has_value();
    kv_->del(node_key(id));
    if (existed) {
        POLYGRAPH_LOG_DEBUG("Deleted node {}", id);
    }
    return existed;
}

// Relations

model::Relation GraphStore::add_relation(const std::string& source_id,
                                         const std::string& target_id,
                                         const std::string& name,
                                         const model::RelationOptions& options) {
    model::Relation relation = model::create_relation(source_id, target_id, name, options);

    auto guard = node_locks_.lock(source_id);
    auto source = get_node(source_id);
    bool target_exists = source_id == target_id ? source.has_value() : get_node(target_id).has_value();
    if (!source || !target_exists) {
        std::string missing;
        if (!source) missing = source_id;
        if (!target_exists) missing += (missing.empty() ? "" : ", ") + target_id;
        throw MissingEndpointError("Relation '" + name + "' references missing node(s): " + missing);
    }

    if (auto existing = get_relation(relation.id)) {
        relation.morph_ids = existing->morph_ids;
    }

    model::Morph& active = source->active_morph();
    relation.add_morph(active.morph_id);
    active.add_relation(relation.id);

    kv_->write_batch({
        WriteOp::put(relation_key(relation.id), encode(relation)),
        WriteOp::put(node_key(source->id), encode(*source))
    });
    POLYGRAPH_LOG_DEBUG("Added relation {} to morph {}", relation.id, active.morph_id);
    return relation;
}

std::optional<model::Relation> GraphStore::get_relation(const std::string& id) const {
    std::string key = relation_key(id);
    auto j = read_json(key);
    if (!j) {
        return std::nullopt;
    }
    auto relation = decode<model::Relation>(*j, key);
    if (relation.deleted) {
        return std::nullopt;
    }
    return relation;
}

bool GraphStore::delete_relation(const std::string& id) {
    auto relation = get_relation(id);
    if (!relation) {
        return false;
    }

    auto guard = node_locks_.lock(relation->source_id);
    std::vector<WriteOp> ops{WriteOp::del(relation_key(id))};
    if (auto source = get_node(relation->source_id)) {
        bool changed = false;
        for (auto& morph : source->morphs) {
            changed |= morph.remove_relation(id);
        }
        if (changed) {
            ops.push_back(WriteOp::put(node_key(source->id), encode(*source)));
        }
    }
    kv_->write_batch(ops);
    POLYGRAPH_LOG_DEBUG("Deleted relation {}", id);
    return true;
}

// Attributes

model::Attribute GraphStore::attach_attribute(model::Node& source, model::Attribute attribute) {
    if (auto existing = get_attribute(attribute.id)) {
        attribute.morph_ids = existing->morph_ids;
    }

    model::Morph& active = source.active_morph();
    attribute.add_morph(active.morph_id);
    active.add_attribute(attribute.id);

    kv_->write_batch({
        WriteOp::put(attribute_key(attribute.id), encode(attribute)),
        WriteOp::put(node_key(source.id), encode(source))
    });
    POLYGRAPH_LOG_DEBUG("Added {} {} to morph {}",
                        model::attribute_kind_to_string(attribute.kind), attribute.id, active.morph_id);
    return attribute;
}

model::Attribute GraphStore::add_attribute(const std::string& source_id,
                                           const std::string& name,
                                           const std::string& value,
                                           const model::AttributeOptions& options) {
    model::Attribute attribute = model::create_attribute(source_id, name, value, options);

    auto guard = node_locks_.lock(source_id);
    auto source = get_node(source_id);
    if (!source) {
        throw MissingSourceError("Attribute '" + name + "' references missing node " + source_id);
    }
    return attach_attribute(*source, std::move(attribute));
}

model::Attribute GraphStore::add_function(const std::string& source_id,
                                          const std::string& name,
                                          const std::string& value,
                                          const std::string& expression,
                                          const model::AttributeOptions& options) {
    model::Attribute attribute = model::create_function_attribute(source_id, name, value, expression, options);

    auto guard = node_locks_.lock(source_id);
    auto source = get_node(source_id);
    if (!source) {
        throw MissingSourceError("Function '" + name + "' references missing node " + source_id);
    }
    return attach_attribute(*source, std::move(attribute));
}

model::Attribute GraphStore::apply_function(const std::string& source_id,
                                            const std::string& name,
                                            const std::string& expression,
                                            const model::AttributeOptions& options) {
    if (model::is_blank(name)) {
        throw InvalidNameError("Function name must not be empty");
    }

    auto guard = node_locks_.lock(source_id);
    auto source = get_node(source_id);
    if (!source) {
        throw MissingSourceError("Function '" + name + "' references missing node " + source_id);
    }

    // Later records win; the active morph's own attributes win over all others
    std::map<std::string, std::string> scope;
    std::vector<model::Attribute> active_attributes;
    const model::Morph& active = source->active_morph();
    for (auto& attribute : attributes_of(source_id)) {
        scope[model::underscore_whitespace(attribute.name)] = attribute.value;
        if (active.has_attribute(attribute.id)) {
            active_attributes.push_back(std::move(attribute));
        }
    }
    for (const auto& attribute : active_attributes) {
        scope[model::underscore_whitespace(attribute.name)] = attribute.value;
    }

    double result = Expression::evaluate(expression, [&scope](const std::string& scope_name) -> std::optional<double> {
        auto it = scope.find(scope_name);
        if (it == scope.end()) {
            return std::nullopt;
        }
        auto number = numeric_prefix(it->second);
        if (!number) {
            throw ExpressionError("Attribute '" + scope_name + "' has non-numeric value '" + it->second + "'");
        }
        return number;
    });

    model::Attribute attribute = model::create_function_attribute(
        source_id, name, model::format_value(result), expression, options);
    return attach_attribute(*source, std::move(attribute));
}

std::optional<model::Attribute> GraphStore::get_attribute(const std::string& id) const {
    std::string key = attribute_key(id);
    auto j = read_json(key);
    if (!j) {
        return std::nullopt;
    }
    auto attribute = decode<model::Attribute>(*j, key);
    if (attribute.deleted) {
        return std::nullopt;
    }
    return attribute;
}

bool GraphStore::delete_attribute(const std::string& id) {
    auto attribute = get_attribute(id);
    if (!attribute) {
        return false;
    }

    auto guard = node_locks_.lock(attribute->source_id);
    std::vector<WriteOp> ops{WriteOp::del(attribute_key(id))};
    if (auto source = get_node(attribute->source_id)) {
        bool changed = false;
        for (auto& morph : source->morphs) {
            changed |= morph.remove_attribute(id);
        }
        if (changed) {
            ops.push_back(WriteOp::put(node_key(source->id), encode(*source)));
        }
    }
    kv_->write_batch(ops);
    POLYGRAPH_LOG_DEBUG("Deleted attribute {}", id);
    return true;
}

// Morphs

model::Morph GraphStore::add_morph(const std::string& node_id, const std::string& morph_name) {
    if (model::is_blank(morph_name)) {
        throw InvalidNameError("Morph name must not be empty");
    }

    auto guard = node_locks_.lock(node_id);
    model::Node node = require_node(node_id);
    if (const model::Morph* existing = node.find_morph_by_name(morph_name)) {
        return *existing;
    }

    model::Morph morph = node.add_morph(morph_name);
    put_node(node);
    POLYGRAPH_LOG_DEBUG("Added morph {} ({}) to node {}", morph.morph_id, morph_name, node_id);
    return morph;
}

model::Node GraphStore::set_active_morph(const std::string& node_id, const std::string& morph_id_or_name) {
    auto guard = node_locks_.lock(node_id);
    model::Node node = require_node(node_id);

    const model::Morph* morph = node.find_morph(morph_id_or_name);
    if (morph == nullptr) {
        morph = node.find_morph_by_name(morph_id_or_name);
    }
    if (morph == nullptr) {
        throw NotFoundError("Node " + node_id + " has no morph " + morph_id_or_name,
                            ErrorCode::MorphNotFound);
    }

    if (node.nbh != morph->morph_id) {
        node.nbh = morph->morph_id;
        put_node(node);
    }
    return node;
}

// Listing

std::vector<nlohmann::json> GraphStore::list_all(EntityKind kind) const {
    return list_all(entity_prefix(kind));
}

std::vector<nlohmann::json> GraphStore::list_all(const std::string& prefix) const {
    // '0' is the byte after '/', so this covers exactly "<prefix>/..."
    std::vector<nlohmann::json> items;
    for (const auto& entry : kv_->scan(prefix + "/", prefix + "0")) {
        nlohmann::json j = nlohmann::json::parse(entry.value, nullptr, false);
        if (j.is_discarded()) {
            POLYGRAPH_LOG_WARN("Skipping record {}: not valid JSON", entry.key);
            continue;
        }
        items.push_back(std::move(j));
    }
    return items;
}

std::vector<model::Node> GraphStore::list_nodes() const {
    std::vector<model::Node> nodes;
    for (const auto& j : list_all(EntityKind::NODES)) {
        auto node = decode<model::Node>(j, constants::NODES_PREFIX);
        if (!node.deleted) nodes.push_back(std::move(node));
    }
    return nodes;
}

std::vector<model::Relation> GraphStore::list_relations() const {
    std::vector<model::Relation> relations;
    for (const auto& j : list_all(EntityKind::RELATIONS)) {
        auto relation = decode<model::Relation>(j, constants::RELATIONS_PREFIX);
        if (!relation.deleted) relations.push_back(std::move(relation));
    }
    return relations;
}

std::vector<model::Attribute> GraphStore::list_attributes() const {
    std::vector<model::Attribute> attributes;
    for (const auto& j : list_all(EntityKind::ATTRIBUTES)) {
        auto attribute = decode<model::Attribute>(j, constants::ATTRIBUTES_PREFIX);
        if (!attribute.deleted) attributes.push_back(std::move(attribute));
    }
    return attributes;
}

std::vector<model::Attribute> GraphStore::attributes_of(const std::string& node_id) const {
    std::vector<model::Attribute> result;
    for (auto& attribute : list_attributes()) {
        if (attribute.source_id == node_id) {
            result.push_back(std::move(attribute));
        }
    }
    return result;
}

// Reconciliation

ReconcileReport GraphStore::reconcile(const ReconcileOptions& options) {
    ReconcileReport report;

    std::set<std::string> live_nodes;
    for (const auto& node : list_nodes()) {
        live_nodes.insert(node.id);
    }

    std::set<std::string> relation_ids;
    std::set<std::string> attribute_ids;
    std::map<std::string, std::vector<model::Relation>> relations_by_source;
    std::map<std::string, std::vector<model::Attribute>> attributes_by_source;
    std::vector<WriteOp> prune_ops;

    for (auto& relation : list_relations()) {
        bool dangling = live_nodes.count(relation.source_id) == 0 ||
                        live_nodes.count(relation.target_id) == 0;
        if (dangling) {
            report.dangling_relations.push_back(relation.id);
            if (options.prune_dangling) {
                prune_ops.push_back(WriteOp::del(relation_key(relation.id)));
                continue;
            }
        }
        relation_ids.insert(relation.id);
        relations_by_source[relation.source_id].push_back(std::move(relation));
    }

    for (auto& attribute : list_attributes()) {
        if (live_nodes.count(attribute.source_id) == 0) {
            report.dangling_attributes.push_back(attribute.id);
            if (options.prune_dangling) {
                prune_ops.push_back(WriteOp::del(attribute_key(attribute.id)));
                continue;
            }
        }
        attribute_ids.insert(attribute.id);
        attributes_by_source[attribute.source_id].push_back(std::move(attribute));
    }

    for (const auto& node_id : live_nodes) {
        auto guard = node_locks_.lock(node_id);
        auto node = get_node(node_id);
        if (!node) continue;

        std::vector<WriteOp> ops;
        bool node_changed = false;

        for (auto& morph : node->morphs) {
            for (const auto& id : std::vector<std::string>(morph.relation_ids)) {
                if (relation_ids.count(id) > 0) continue;
                report.stale_references.push_back(morph.morph_id + " -> " + id);
                if (options.drop_stale_references) {
                    node_changed |= morph.remove_relation(id);
                }
            }
            for (const auto& id : std::vector<std::string>(morph.attribute_ids)) {
                if (attribute_ids.count(id) > 0) continue;
                report.stale_references.push_back(morph.morph_id + " -> " + id);
                if (options.drop_stale_references) {
                    node_changed |= morph.remove_attribute(id);
                }
            }
        }

        for (auto& relation : relations_by_source[node_id]) {
            if (referenced_by_any(*node, relation.id, true)) continue;
            report.orphaned_relations.push_back(relation.id);
            if (options.attach_orphans) {
                model::Morph& active = node->active_morph();
                active.add_relation(relation.id);
                relation.add_morph(active.morph_id);
                ops.push_back(WriteOp::put(relation_key(relation.id), encode(relation)));
                node_changed = true;
            }
        }

        for (auto& attribute : attributes_by_source[node_id]) {
            if (referenced_by_any(*node, attribute.id, false)) continue;
            report.orphaned_attributes.push_back(attribute.id);
            if (options.attach_orphans) {
                model::Morph& active = node->active_morph();
                active.add_attribute(attribute.id);
                attribute.add_morph(active.morph_id);
                ops.push_back(WriteOp::put(attribute_key(attribute.id), encode(attribute)));
                node_changed = true;
            }
        }

        if (node_changed) {
            ops.push_back(WriteOp::put(node_key(node->id), encode(*node)));
        }
        if (!ops.empty()) {
            kv_->write_batch(ops);
            report.writes += ops.size();
        }
    }

    if (!prune_ops.empty()) {
        kv_->write_batch(prune_ops);
        report.writes += prune_ops.size();
    }

    if (report.clean()) {
        POLYGRAPH_LOG_DEBUG("Reconcile: graph is consistent");
    } else {
        POLYGRAPH_LOG_INFO("Reconcile: {} orphaned relations, {} orphaned attributes, "
                           "{} dangling relations, {} dangling attributes, {} stale references, {} writes",
                           report.orphaned_relations.size(), report.orphaned_attributes.size(),
                           report.dangling_relations.size(), report.dangling_attributes.size(),
                           report.stale_references.size(), report.writes);
    }
    return report;
}

} // namespace polygraph::graph
