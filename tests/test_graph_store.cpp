#include "core/graph/graph_store.hpp"
#include "core/model/identity.hpp"
#include "storage/append_log.hpp"
#include "storage/log_kv_store.hpp"
#include "polygraph/error.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <thread>

using namespace polygraph;
using namespace polygraph::graph;

namespace fs = std::filesystem;

class GraphStoreTest : public ::testing::Test {
protected:
    std::string test_dir = "./test_graph_store_data";
    std::shared_ptr<storage::LogKVStore> kv;
    std::unique_ptr<GraphStore> store;

    void SetUp() override {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
        kv = std::make_shared<storage::LogKVStore>(storage::AppendLog::open_writable(test_dir));
        store = std::make_unique<GraphStore>(kv);
    }

    void TearDown() override {
        store.reset();
        kv.reset();
        fs::remove_all(test_dir);
    }

    static size_t count(const std::vector<std::string>& ids, const std::string& id) {
        return static_cast<size_t>(std::count(ids.begin(), ids.end(), id));
    }
};

// Nodes

TEST_F(GraphStoreTest, AddThenGetIsStructurallyEqual) {
    model::NodeOptions options;
    options.adjective = "pure";
    options.description = "H2O";
    auto created = store->add_node("Water", options);

    auto loaded = store->get_node(created.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, created);
    EXPECT_EQ(loaded->morphs.size(), 1u);
    EXPECT_EQ(loaded->nbh, loaded->morphs.front().morph_id);
}

TEST_F(GraphStoreTest, GetMissingNodeIsAbsent) {
    EXPECT_FALSE(store->get_node("nothing").has_value());
}

TEST_F(GraphStoreTest, InvalidNodeNameWritesNothing) {
    EXPECT_THROW(store->add_node("  "), InvalidNameError);
    EXPECT_EQ(kv->version(), 0u);
}

TEST_F(GraphStoreTest, UpdateNodePatchesFields) {
    store->add_node("Water");
    NodePatch patch;
    patch.description = "universal solvent";
    patch.parent_types = std::vector<std::string>{"liquid", "compound"};
    auto updated = store->update_node("water", patch);

    EXPECT_EQ(updated.description, std::optional<std::string>("universal solvent"));
    EXPECT_EQ(store->get_node("water")->parent_types.size(), 2u);
}

TEST_F(GraphStoreTest, UpdateNodeRejectsBrokenMorphs) {
    auto node = store->add_node("Water");
    uint64_t before = kv->version();

    NodePatch no_morphs;
    no_morphs.morphs = std::vector<model::Morph>{};
    EXPECT_THROW(store->update_node("water", no_morphs), PolygraphException);

    NodePatch bad_nbh;
    bad_nbh.nbh = "water_morph_99";
    EXPECT_THROW(store->update_node("water", bad_nbh), PolygraphException);

    EXPECT_EQ(kv->version(), before);
    EXPECT_EQ(*store->get_node("water"), node);
    EXPECT_THROW(store->update_node("ice", NodePatch{}), NotFoundError);
}

TEST_F(GraphStoreTest, DeleteNodeDoesNotCascade) {
    store->add_node("Water");
    store->add_node("Hydrogen");
    auto relation = store->add_relation("hydrogen", "water", "part of");
    auto attribute = store->add_attribute("water", "chemical formula", "H2O");

    EXPECT_TRUE(store->delete_node("water"));
    EXPECT_FALSE(store->get_node("water").has_value());
    EXPECT_FALSE(store->delete_node("water"));

    // Relations and attributes referencing it are untouched
    EXPECT_EQ(store->get_relation(relation.id), relation);
    EXPECT_EQ(store->get_attribute(attribute.id), attribute);
    EXPECT_TRUE(store->get_node("hydrogen")->active_morph().has_relation(relation.id));
}

TEST_F(GraphStoreTest, DeletedFlagReadsAsAbsent) {
    auto node = model::create_node("Ghost");
    node.deleted = true;
    kv->put(node_key(node.id), nlohmann::json(node).dump());

    EXPECT_FALSE(store->get_node("ghost").has_value());
    EXPECT_TRUE(store->list_nodes().empty());
    EXPECT_THROW(store->add_attribute("ghost", "mass", "1"), MissingSourceError);
}

TEST_F(GraphStoreTest, CorruptRecordIsReported) {
    kv->put(node_key("broken"), "{not json");
    try {
        store->get_node("broken");
        FAIL() << "expected StorageCorrupted";
    } catch (const StorageException& e) {
        EXPECT_EQ(e.code(), ErrorCode::StorageCorrupted);
    }
    // Listing skips it
    EXPECT_TRUE(store->list_all(EntityKind::NODES).empty());
}

// Relations

TEST_F(GraphStoreTest, RelationNeedsBothEndpoints) {
    store->add_node("Water");
    EXPECT_THROW(store->add_relation("hydrogen", "water", "part of"), MissingEndpointError);
    EXPECT_THROW(store->add_relation("water", "hydrogen", "contains"), MissingEndpointError);

    try {
        store->add_relation("oxygen", "hydrogen", "bonds with");
        FAIL() << "expected MissingEndpointError";
    } catch (const MissingEndpointError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingEndpoint);
        std::string message = e.what();
        EXPECT_NE(message.find("oxygen"), std::string::npos);
        EXPECT_NE(message.find("hydrogen"), std::string::npos);
    }
    EXPECT_TRUE(store->list_relations().empty());
}

TEST_F(GraphStoreTest, WaterHydrogenScenario) {
    auto water = store->add_node("Water");
    auto hydrogen = store->add_node("Hydrogen");

    auto relation = store->add_relation(hydrogen.id, water.id, "part of");
    EXPECT_EQ(relation.source_id, "hydrogen");
    EXPECT_EQ(relation.target_id, "water");

    auto loaded = store->get_node("hydrogen");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->active_morph().has_relation(relation.id));
    EXPECT_EQ(relation.morph_ids, std::vector<std::string>{loaded->nbh});

    // The target's morphs are not touched
    EXPECT_TRUE(store->get_node("water")->active_morph().relation_ids.empty());
}

TEST_F(GraphStoreTest, RepeatedRelationIsReferencedOnce) {
    store->add_node("Water");
    store->add_node("Hydrogen");
    auto first = store->add_relation("hydrogen", "water", "part of");
    auto second = store->add_relation("hydrogen", "water", "part of");

    EXPECT_EQ(first.id, second.id);
    auto node = store->get_node("hydrogen");
    EXPECT_EQ(count(node->active_morph().relation_ids, first.id), 1u);
    EXPECT_EQ(store->list_relations().size(), 1u);
    EXPECT_EQ(second.morph_ids.size(), 1u);
}

TEST_F(GraphStoreTest, SelfRelation) {
    store->add_node("Water");
    auto relation = store->add_relation("water", "water", "similar to");
    EXPECT_TRUE(store->get_node("water")->active_morph().has_relation(relation.id));
}

TEST_F(GraphStoreTest, DeleteRelationRemovesReferences) {
    store->add_node("Water");
    store->add_node("Hydrogen");
    auto relation = store->add_relation("hydrogen", "water", "part of");
    uint64_t before = kv->version();

    EXPECT_TRUE(store->delete_relation(relation.id));
    EXPECT_EQ(kv->version(), before + 1);
    EXPECT_FALSE(store->get_relation(relation.id).has_value());
    EXPECT_FALSE(store->get_node("hydrogen")->active_morph().has_relation(relation.id));
    EXPECT_FALSE(store->delete_relation(relation.id));
}

// Attributes

TEST_F(GraphStoreTest, AttributeIdempotence) {
    store->add_node("Water");
    auto first = store->add_attribute("water", "chemical formula", "H2O");
    auto second = store->add_attribute("water", "chemical formula", "H2O");

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(count(store->get_node("water")->active_morph().attribute_ids, first.id), 1u);
    EXPECT_EQ(store->list_attributes().size(), 1u);
}

TEST_F(GraphStoreTest, DistinctValuesAreDistinctAttributes) {
    store->add_node("Water");
    auto a = store->add_attribute("water", "state", "liquid");
    auto b = store->add_attribute("water", "state", "solid");

    EXPECT_NE(a.id, b.id);
    ASSERT_TRUE(store->get_attribute(a.id).has_value());
    ASSERT_TRUE(store->get_attribute(b.id).has_value());

    auto morph = store->get_node("water")->active_morph();
    EXPECT_TRUE(morph.has_attribute(a.id));
    EXPECT_TRUE(morph.has_attribute(b.id));
    EXPECT_EQ(store->attributes_of("water").size(), 2u);
}

TEST_F(GraphStoreTest, AttributeNeedsSource) {
    try {
        store->add_attribute("water", "state", "liquid");
        FAIL() << "expected MissingSourceError";
    } catch (const MissingSourceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingSource);
    }
    EXPECT_EQ(kv->version(), 0u);

    store->add_node("Water");
    EXPECT_THROW(store->add_attribute("water", "", "liquid"), InvalidNameError);
}

TEST_F(GraphStoreTest, AttributeOptionsAreStored) {
    store->add_node("Water");
    model::AttributeOptions options;
    options.unit = "g/mol";
    options.modality = "measured";
    auto attribute = store->add_attribute("water", "molar mass", "18.015", options);

    auto loaded = store->get_attribute(attribute.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->unit, std::optional<std::string>("g/mol"));
    EXPECT_EQ(loaded->modality, std::optional<std::string>("measured"));
}

TEST_F(GraphStoreTest, DeleteAttributeRemovesReferencesFromAllMorphs) {
    store->add_node("Water");
    auto attribute = store->add_attribute("water", "state", "liquid");
    store->add_morph("water", "frozen");
    store->set_active_morph("water", "frozen");
    store->add_attribute("water", "state", "liquid");

    auto node = store->get_node("water");
    EXPECT_EQ(node->morphs[0].attribute_ids, node->morphs[1].attribute_ids);
    EXPECT_EQ(store->get_attribute(attribute.id)->morph_ids.size(), 2u);

    EXPECT_TRUE(store->delete_attribute(attribute.id));
    node = store->get_node("water");
    EXPECT_TRUE(node->morphs[0].attribute_ids.empty());
    EXPECT_TRUE(node->morphs[1].attribute_ids.empty());
}

// Functions

TEST_F(GraphStoreTest, AddFunctionStoresTaggedAttribute) {
    store->add_node("Water");
    auto fn = store->add_function("water", "double mass", "36", "2 * mass");
    EXPECT_TRUE(fn.is_function());

    auto loaded = store->get_attribute(fn.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->is_function());
    EXPECT_EQ(loaded->function->expression, "2 * mass");
    EXPECT_TRUE(store->get_node("water")->active_morph().has_attribute(fn.id));
}

TEST_F(GraphStoreTest, ApplyFunctionEvaluatesOverAttributes) {
    store->add_node("Water");
    store->add_attribute("water", "molar mass", "18 g/mol");
    store->add_attribute("water", "count", "4");

    auto fn = store->apply_function("water", "total mass", "\"molar mass\" * count");
    EXPECT_TRUE(fn.is_function());
    EXPECT_DOUBLE_EQ(std::stod(fn.value), 72.0);
    EXPECT_EQ(fn.function->expression, "\"molar mass\" * count");
    EXPECT_TRUE(store->get_node("water")->active_morph().has_attribute(fn.id));

    // Same inputs, same record
    auto again = store->apply_function("water", "total mass", "\"molar mass\" * count");
    EXPECT_EQ(again.id, fn.id);
}

TEST_F(GraphStoreTest, ApplyFunctionPrefersActiveMorph) {
    store->add_node("Water");
    store->add_attribute("water", "temperature", "20");
    store->add_morph("water", "boiling");
    store->set_active_morph("water", "boiling");
    store->add_attribute("water", "temperature", "100");

    auto fn = store->apply_function("water", "kelvin", "temperature + 273");
    EXPECT_DOUBLE_EQ(std::stod(fn.value), 373.0);
}

TEST_F(GraphStoreTest, ApplyFunctionErrors) {
    EXPECT_THROW(store->apply_function("water", "x", "1 + 1"), MissingSourceError);

    store->add_node("Water");
    store->add_attribute("water", "state", "liquid");
    uint64_t before = kv->version();

    EXPECT_THROW(store->apply_function("water", "x", "unknown * 2"), ExpressionError);
    EXPECT_THROW(store->apply_function("water", "x", "state * 2"), ExpressionError);
    EXPECT_THROW(store->apply_function("water", "x", "1 / 0"), ExpressionError);
    EXPECT_THROW(store->apply_function("water", "", "1"), InvalidNameError);
    EXPECT_EQ(kv->version(), before);
}

// Morphs

TEST_F(GraphStoreTest, AddMorphUsesCounterAndIsIdempotentByName) {
    store->add_node("Water");
    auto solid = store->add_morph("water", "solid");
    EXPECT_EQ(solid.morph_id, "water_morph_1");
    EXPECT_EQ(solid.node_id, "water");

    auto again = store->add_morph("water", "solid");
    EXPECT_EQ(again.morph_id, solid.morph_id);
    EXPECT_EQ(store->get_node("water")->morphs.size(), 2u);

    // Adding a morph does not switch the active one
    EXPECT_EQ(store->get_node("water")->nbh, "water_morph_0");

    EXPECT_THROW(store->add_morph("ice", "solid"), NotFoundError);
    EXPECT_THROW(store->add_morph("water", " "), InvalidNameError);
}

TEST_F(GraphStoreTest, SetActiveMorphByIdOrName) {
    store->add_node("Water");
    auto solid = store->add_morph("water", "solid");

    EXPECT_EQ(store->set_active_morph("water", "solid").nbh, solid.morph_id);
    EXPECT_EQ(store->set_active_morph("water", "water_morph_0").nbh, "water_morph_0");

    try {
        store->set_active_morph("water", "plasma");
        FAIL() << "expected MorphNotFound";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MorphNotFound);
    }
    EXPECT_THROW(store->set_active_morph("ice", "basic"), NotFoundError);
}

TEST_F(GraphStoreTest, WritesGoToActiveMorph) {
    store->add_node("Water");
    store->add_node("Ice");
    store->add_morph("water", "frozen");
    store->set_active_morph("water", "frozen");
    auto relation = store->add_relation("water", "ice", "becomes");

    auto node = store->get_node("water");
    EXPECT_FALSE(node->morphs[0].has_relation(relation.id));
    EXPECT_TRUE(node->morphs[1].has_relation(relation.id));
}

// Listing

TEST_F(GraphStoreTest, ListAllIsScopedToPrefix) {
    store->add_node("Water");
    store->add_node("Hydrogen");
    store->add_relation("hydrogen", "water", "part of");
    kv->put("nodesX/other", "{}");

    auto nodes = store->list_all(EntityKind::NODES);
    ASSERT_EQ(nodes.size(), 2u);
    EXPECT_EQ(nodes[0]["id"], "hydrogen");
    EXPECT_EQ(nodes[1]["id"], "water");
    EXPECT_EQ(store->list_all("relations").size(), 1u);
    EXPECT_TRUE(store->list_all("missing").empty());
}

TEST_F(GraphStoreTest, ConcurrentWritesToOneNode) {
    store->add_node("Water");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t] {
            for (int i = 0; i < 10; ++i) {
                store->add_attribute("water", "sample", std::to_string(t * 100 + i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // No read-modify-write of the node was lost
    EXPECT_EQ(store->get_node("water")->active_morph().attribute_ids.size(), 40u);
}

TEST_F(GraphStoreTest, ReadOnlyStoreRejectsWrites) {
    auto writer = storage::AppendLog::open_writable(test_dir + "_peer");
    auto replica_log = storage::AppendLog::open_replica(test_dir + "/replica", writer->public_key(), true);
    GraphStore replica(std::make_shared<storage::LogKVStore>(replica_log));

    EXPECT_FALSE(replica.writable());
    EXPECT_THROW(replica.add_node("Water"), StorageException);
    fs::remove_all(test_dir + "_peer");
}

// Reconciliation

TEST_F(GraphStoreTest, ReconcileOnConsistentGraph) {
    store->add_node("Water");
    store->add_node("Hydrogen");
    store->add_relation("hydrogen", "water", "part of");
    store->add_attribute("water", "state", "liquid");

    auto report = store->reconcile();
    EXPECT_TRUE(report.clean());
    EXPECT_EQ(report.writes, 0u);
}

TEST_F(GraphStoreTest, ReconcileAttachesOrphans) {
    store->add_node("Water");
    store->add_node("Hydrogen");

    // Child written without its parent morph, as another tool might
    auto relation = model::create_relation("hydrogen", "water", "part of");
    auto attribute = model::create_attribute("water", "state", "liquid");
    kv->put(relation_key(relation.id), nlohmann::json(relation).dump());
    kv->put(attribute_key(attribute.id), nlohmann::json(attribute).dump());

    auto report = store->reconcile(ReconcileOptions::report_only());
    EXPECT_EQ(report.orphaned_relations, std::vector<std::string>{relation.id});
    EXPECT_EQ(report.orphaned_attributes, std::vector<std::string>{attribute.id});
    EXPECT_EQ(report.writes, 0u);

    report = store->reconcile();
    EXPECT_GT(report.writes, 0u);
    EXPECT_TRUE(store->get_node("hydrogen")->active_morph().has_relation(relation.id));
    EXPECT_TRUE(store->get_node("water")->active_morph().has_attribute(attribute.id));
    EXPECT_EQ(store->get_relation(relation.id)->morph_ids, std::vector<std::string>{"hydrogen_morph_0"});

    EXPECT_TRUE(store->reconcile().clean());
}

TEST_F(GraphStoreTest, ReconcileDropsStaleReferences) {
    store->add_node("Water");
    auto attribute = store->add_attribute("water", "state", "liquid");
    kv->del(attribute_key(attribute.id));

    auto report = store->reconcile();
    ASSERT_EQ(report.stale_references.size(), 1u);
    EXPECT_EQ(report.stale_references[0], "water_morph_0 -> " + attribute.id);
    EXPECT_TRUE(store->get_node("water")->active_morph().attribute_ids.empty());
}

TEST_F(GraphStoreTest, ReconcilePrunesDanglingOnlyWhenAsked) {
    store->add_node("Water");
    store->add_node("Hydrogen");
    auto relation = store->add_relation("hydrogen", "water", "part of");
    auto attribute = store->add_attribute("water", "state", "liquid");
    store->delete_node("water");

    auto report = store->reconcile();
    EXPECT_EQ(report.dangling_relations, std::vector<std::string>{relation.id});
    EXPECT_EQ(report.dangling_attributes, std::vector<std::string>{attribute.id});
    EXPECT_TRUE(store->get_relation(relation.id).has_value());

    ReconcileOptions prune;
    prune.prune_dangling = true;
    store->reconcile(prune);
    EXPECT_FALSE(store->get_relation(relation.id).has_value());
    EXPECT_FALSE(store->get_attribute(attribute.id).has_value());
    EXPECT_FALSE(store->get_node("hydrogen")->active_morph().has_relation(relation.id));
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
