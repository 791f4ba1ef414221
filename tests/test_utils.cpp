#include "polygraph/common.hpp"
#include "polygraph/error.hpp"
#include "polygraph/serialization.hpp"
#include "polygraph/time_utils.hpp"
#include "utils/config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace polygraph;

namespace fs = std::filesystem;

// Config

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir = "./test_config_data";

    void SetUp() override {
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigTest, DottedKeysReachNestedValues) {
    auto config = utils::Config::load_from_json(R"({
        "data_dir": "/var/lib/polygraph",
        "network": {"listen_port": 9000, "bootstrap": ["10.0.0.1:7878"]}
    })");

    EXPECT_EQ(config.get<std::string>("data_dir"), "/var/lib/polygraph");
    EXPECT_EQ(config.get<int>("network.listen_port"), 9000);
    auto bootstrap = config.get<std::vector<std::string>>("network.bootstrap");
    ASSERT_TRUE(bootstrap.has_value());
    EXPECT_EQ(bootstrap->size(), 1u);
    EXPECT_TRUE(config.has("network"));
    EXPECT_FALSE(config.has("network.missing"));
    EXPECT_FALSE(config.has("data_dir.child"));
}

TEST_F(ConfigTest, WrongTypeFallsBackToDefault) {
    auto config = utils::Config::load_from_json(R"({"sparse": "yes"})");
    EXPECT_FALSE(config.get<bool>("sparse").has_value());
    EXPECT_TRUE(config.get_or<bool>("sparse", true));
    EXPECT_EQ(config.get_or<std::string>("log_level", "info"), "info");
}

TEST_F(ConfigTest, SetCreatesIntermediateObjects) {
    utils::Config config;
    config.set("network.listen_port", 7000);
    config.set("log_level", std::string("debug"));

    EXPECT_EQ(config.get<int>("network.listen_port"), 7000);
    EXPECT_TRUE(config.data()["network"].is_object());
    EXPECT_EQ(config.get_or<std::string>("log_level", ""), "debug");
}

TEST_F(ConfigTest, SaveAndLoadFile) {
    std::string path = test_dir + "/polygraph.json";

    utils::Config config;
    config.set("data_dir", std::string("./graph"));
    config.set("network.sync_timeout_ms", 2500);
    config.save_to_file(path);

    auto loaded = utils::Config::load_from_file(path);
    EXPECT_EQ(loaded.get<std::string>("data_dir"), "./graph");
    EXPECT_EQ(loaded.get<int>("network.sync_timeout_ms"), 2500);
}

TEST_F(ConfigTest, RejectsMalformedInput) {
    EXPECT_THROW(utils::Config::load_from_json("{not json"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_json("[1, 2]"), std::runtime_error);
    EXPECT_THROW(utils::Config::load_from_file(test_dir + "/missing.json"), std::runtime_error);
}

// Serialization

TEST(SerializationTest, LittleEndianLayout) {
    ByteWriter writer;
    writer.write_u32(0x01020304);
    writer.write_u64(1);

    const bytes& data = writer.data();
    ASSERT_EQ(data.size(), 12u);
    EXPECT_EQ(data[0], 0x04);
    EXPECT_EQ(data[3], 0x01);
    EXPECT_EQ(data[4], 0x01);
    EXPECT_EQ(data[11], 0x00);
}

TEST(SerializationTest, MixedRecordReadsBack) {
    fixed_bytes<4> tag = {9, 8, 7, 6};

    ByteWriter writer;
    writer.write_u8(2);
    writer.write_string("nodes/water");
    writer.write_bytes(bytes{1, 2, 3});
    writer.write_fixed(tag);

    bytes encoded = writer.take();
    ByteReader reader(encoded);
    EXPECT_EQ(reader.read_u8(), 2);
    EXPECT_EQ(reader.read_string(), "nodes/water");
    EXPECT_EQ(reader.read_bytes(), (bytes{1, 2, 3}));
    EXPECT_EQ(reader.read_fixed<4>(), tag);
    EXPECT_TRUE(reader.at_end());
}

TEST(SerializationTest, TruncatedInputThrows) {
    ByteWriter writer;
    writer.write_string("hydrogen");
    bytes encoded = writer.take();
    encoded.resize(encoded.size() - 3);

    ByteReader reader(encoded);
    try {
        reader.read_string();
        FAIL() << "expected DeserializationFailed";
    } catch (const PolygraphException& e) {
        EXPECT_EQ(e.code(), ErrorCode::DeserializationFailed);
    }
}

// Errors

TEST(ErrorTest, ResultCarriesValueOrError) {
    auto ok = Result<int>::Ok(42);
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), 42);

    auto err = Result<int>::Err(ErrorCode::NetworkTimeout, "flush timed out");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error().code(), ErrorCode::NetworkTimeout);
    EXPECT_EQ(err.value_or(7), 7);
    EXPECT_FALSE(err.ok().has_value());
    EXPECT_THROW(err.value(), std::runtime_error);
}

Result<void> fails_with(ErrorCode code) {
    return Result<void>::Err(code, "inner");
}

Result<void> propagates(ErrorCode code) {
    POLYGRAPH_TRY(fails_with(code));
    return Result<void>::Ok();
}

TEST(ErrorTest, TryMacroPropagates) {
    auto result = propagates(ErrorCode::StorageWriteFailed);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().code(), ErrorCode::StorageWriteFailed);
}

TEST(ErrorTest, ExceptionHierarchy) {
    try {
        throw MissingEndpointError("rel_a_b_c");
    } catch (const GraphException& e) {
        EXPECT_EQ(e.code(), ErrorCode::MissingEndpoint);
        EXPECT_NE(std::string(e.what()).find("rel_a_b_c"), std::string::npos);
    }

    NetworkException from_error(Error(ErrorCode::NetworkTimeout, "join", "10000 ms"));
    EXPECT_EQ(from_error.code(), ErrorCode::NetworkTimeout);
    EXPECT_NE(std::string(from_error.what()).find("10000 ms"), std::string::npos);

    NotFoundError morph_missing("no morph", ErrorCode::MorphNotFound);
    EXPECT_EQ(morph_missing.code(), ErrorCode::MorphNotFound);
}

TEST(ErrorTest, ToStringIncludesDetails) {
    Error error(ErrorCode::StorageCorrupted, "bad record", "nodes/water");
    EXPECT_EQ(error.to_string(), "[Storage corrupted] bad record (nodes/water)");
}

// Hex and time

TEST(CommonTest, HexHelpers) {
    fixed_bytes<3> value = {0x00, 0xab, 0xff};
    EXPECT_EQ(to_hex(value), "00abff");
    EXPECT_EQ(from_hex<3>("00abff"), value);
    EXPECT_FALSE(from_hex<3>("00abf").has_value());
    EXPECT_FALSE(from_hex<3>("00abzz").has_value());
}

TEST(TimeTest, TimestampsAdvance) {
    uint64_t before = time::timestamp_milliseconds();
    time::sleep_milliseconds(5);
    uint64_t after = time::timestamp_milliseconds();
    EXPECT_GE(after, before + 5);
    EXPECT_FALSE(time::millis_to_string(after).empty());

    time::Timer timer;
    time::sleep_milliseconds(2);
    EXPECT_GE(timer.elapsed_milliseconds(), 2u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
