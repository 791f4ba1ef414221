#pragma once

#include "polygraph/common.hpp"
#include "core/model/node.hpp"
#include "core/model/relation.hpp"
#include "core/model/attribute.hpp"
#include "core/graph/keyed_mutex.hpp"
#include "storage/kv_store.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace polygraph::graph {

// Key namespaces of the store
enum class EntityKind {
    NODES,
    RELATIONS,
    ATTRIBUTES
};

const char* entity_prefix(EntityKind kind);

std::string node_key(const std::string& id);
std::string relation_key(const std::string& id);
std::string attribute_key(const std::string& id);

/**
 * Fields to overwrite in update_node(); unset members are left alone
 */
struct NodePatch {
    std::optional<std::string> base_name;
    std::optional<std::string> name;
    std::optional<std::string> adjective;
    std::optional<std::string> quantifier;
    std::optional<std::string> role;
    std::optional<std::string> description;
    std::optional<std::vector<std::string>> parent_types;
    std::optional<std::vector<model::Morph>> morphs;
    std::optional<std::string> nbh;
};

struct ReconcileOptions {
    // Reference unreferenced relations/attributes from the source's active morph
    bool attach_orphans = true;
    // Remove morph references to relations/attributes that do not exist
    bool drop_stale_references = true;
    // Delete relations/attributes whose endpoints or source are gone
    bool prune_dangling = false;

    static ReconcileOptions report_only() {
        ReconcileOptions options;
        options.attach_orphans = false;
        options.drop_stale_references = false;
        options.prune_dangling = false;
        return options;
    }
};

struct ReconcileReport {
    std::vector<std::string> orphaned_relations;
    std::vector<std::string> orphaned_attributes;
    std::vector<std::string> dangling_relations;
    std::vector<std::string> dangling_attributes;
    std::vector<std::string> stale_references;  // "<morph_id> -> <entity_id>"
    size_t writes = 0;

    bool clean() const {
        return orphaned_relations.empty() && orphaned_attributes.empty() &&
               dangling_relations.empty() && dangling_attributes.empty() &&
               stale_references.empty();
    }
};

/**
 * GraphStore - Morph-aware CRUD over a KeyValueStore.
 *
 * Entities are JSON documents under `nodes/<id>`, `relations/<id>` and
 * `attributes/<id>`. Creating a relation or attribute writes the entity and
 * the source node's active morph in a single batch. Writes touching a node
 * are serialized per node id. Deleting a node never cascades.
 */
class GraphStore {
public:
    explicit GraphStore(std::shared_ptr<storage::KeyValueStore> kv);

    POLYGRAPH_DISALLOW_COPY_AND_MOVE(GraphStore);

    // Nodes

    model::Node add_node(const std::string& base_name, const model::NodeOptions& options = {});

    /**
     * @return the node, or nullopt if absent or flagged deleted
     * @throws StorageException(StorageCorrupted) if the record cannot be decoded
     */
    std::optional<model::Node> get_node(const std::string& id) const;

    /**
     * @throws NotFoundError if the node does not exist
     * @throws PolygraphException(InvalidArgument) if the patched node breaks
     *         the morph invariant; nothing is written in that case
     */
    model::Node update_node(const std::string& id, const NodePatch& patch);

    // @return false if there was no such node
    bool delete_node(const std::string& id);

    // Relations

    /**
     * @throws MissingEndpointError unless both endpoints exist
     * @throws InvalidNameError for an empty relation name
     */
    model::Relation add_relation(const std::string& source_id,
                                 const std::string& target_id,
                                 const std::string& name,
                                 const model::RelationOptions& options = {});

    std::optional<model::Relation> get_relation(const std::string& id) const;
    bool delete_relation(const std::string& id);

    // Attributes and functions

    /**
     * @throws MissingSourceError unless the source node exists
     * @throws InvalidNameError for an empty attribute name
     */
    model::Attribute add_attribute(const std::string& source_id,
                                   const std::string& name,
                                   const std::string& value,
                                   const model::AttributeOptions& options = {});

    model::Attribute add_function(const std::string& source_id,
                                  const std::string& name,
                                  const std::string& value,
                                  const std::string& expression,
                                  const model::AttributeOptions& options = {});

    /**
     * Evaluate `expression` over the source node's attributes and store the
     * result as a function attribute.
     * @throws MissingSourceError if the node does not exist
     * @throws ExpressionError if the expression cannot be evaluated
     */
    model::Attribute apply_function(const std::string& source_id,
                                    const std::string& name,
                                    const std::string& expression,
                                    const model::AttributeOptions& options = {});

    std::optional<model::Attribute> get_attribute(const std::string& id) const;
    bool delete_attribute(const std::string& id);

    // Morphs

    /**
     * Add a morph unless one with this name exists; returns the morph either way
     * @throws NotFoundError if the node does not exist
     * @throws InvalidNameError for an empty morph name
     */
    model::Morph add_morph(const std::string& node_id, const std::string& morph_name);

    /**
     * @throws NotFoundError if the node or the morph does not exist
     */
    model::Node set_active_morph(const std::string& node_id, const std::string& morph_id_or_name);

    // Listing

    // Raw records of a namespace in key order
    std::vector<nlohmann::json> list_all(EntityKind kind) const;
    std::vector<nlohmann::json> list_all(const std::string& prefix) const;

    std::vector<model::Node> list_nodes() const;
    std::vector<model::Relation> list_relations() const;
    std::vector<model::Attribute> list_attributes() const;

    // Attributes whose source is `node_id`, in key order
    std::vector<model::Attribute> attributes_of(const std::string& node_id) const;

    /**
     * Find and optionally repair references the batch writes could not
     * guarantee (records written by other tools or older versions).
     */
    ReconcileReport reconcile(const ReconcileOptions& options = {});

    storage::KeyValueStore& kv() { return *kv_; }
    bool writable() const { return kv_->writable(); }

private:
    model::Attribute attach_attribute(model::Node& source, model::Attribute attribute);
    std::optional<nlohmann::json> read_json(const std::string& key) const;
    void put_node(const model::Node& node);
    model::Node require_node(const std::string& id) const;

    std::shared_ptr<storage::KeyValueStore> kv_;
    KeyedMutex node_locks_;
};

} // namespace polygraph::graph
