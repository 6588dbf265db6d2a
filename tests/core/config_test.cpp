#include <gtest/gtest.h>
#include <peerlink/core/config.hpp>
#include <filesystem>
#include <fstream>

namespace peerlink::core::test {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config().clear();
    }

    void TearDown() override {
        config().clear();
    }
};

TEST_F(ConfigTest, BasicTypes) {
    config().set("null_value", nullptr);
    config().set("bool_value", true);
    config().set("int_value", int64_t{42});
    config().set("double_value", 3.14);
    config().set("string_value", std::string("hello"));

    EXPECT_TRUE(config().get<std::nullptr_t>("null_value").is_ok());
    EXPECT_EQ(config().get<bool>("bool_value").value(), true);
    EXPECT_EQ(config().get<int64_t>("int_value").value(), 42);
    EXPECT_EQ(config().get<double>("double_value").value(), 3.14);
    EXPECT_EQ(config().get<std::string>("string_value").value(), "hello");
}

TEST_F(ConfigTest, ArrayType) {
    ConfigArray arr = {
        nullptr,
        true,
        int64_t{42},
        std::string("hello")
    };
    config().set("array", arr);

    auto result = config().get<ConfigArray>("array");
    ASSERT_TRUE(result.is_ok());

    const auto& value = result.value();
    ASSERT_EQ(value.size(), 4u);
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(value[0].base()));
    EXPECT_EQ(std::get<bool>(value[1].base()), true);
    EXPECT_EQ(std::get<int64_t>(value[2].base()), 42);
    EXPECT_EQ(std::get<std::string>(value[3].base()), "hello");
}

TEST_F(ConfigTest, NestedObject) {
    auto nested = ConfigNode::create();
    nested->set("key", std::string("value"));
    config().set("object", nested);

    auto result = config().get<ConfigNodePtr>("object");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value()->get<std::string>("key").value(), "value");
}

TEST_F(ConfigTest, ErrorHandling) {
    config().set("value", 42);

    auto missing = config().get<int64_t>("nonexistent");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().code(), ErrorCode::InvalidArgument);

    auto mismatch = config().get<std::string>("value");
    ASSERT_TRUE(mismatch.is_error());
    EXPECT_EQ(mismatch.error().code(), ErrorCode::InvalidData);
}

TEST_F(ConfigTest, GetOrConvertsNumbers) {
    config().set("ratio", 2.5);
    config().set("count", 3);

    auto root = config().root();
    EXPECT_EQ(root->getOr<int>("ratio", 0), 2);
    EXPECT_DOUBLE_EQ(root->getOr<double>("count", 0.0), 3.0);
    EXPECT_EQ(root->getOr<std::string>("count", "fallback"), "fallback");
    EXPECT_EQ(root->getOr<int>("missing", 9), 9);
}

TEST_F(ConfigTest, LoadFromString) {
    auto loaded = config().loadFromString(R"({
        "role": "answerer",
        "chunk_size": 1024,
        "ice_servers": ["stun:stun.example.org:3478"],
        "transfer": {"window_size": 8}
    })");
    ASSERT_TRUE(loaded.is_ok());

    EXPECT_EQ(config().get<std::string>("role").value(), "answerer");
    EXPECT_EQ(config().get<int64_t>("chunk_size").value(), 1024);
    EXPECT_EQ(config().get<ConfigArray>("ice_servers").value().size(), 1u);

    auto nested = config().get<ConfigNodePtr>("transfer");
    ASSERT_TRUE(nested.is_ok());
    EXPECT_EQ(nested.value()->get<int64_t>("window_size").value(), 8);
}

TEST_F(ConfigTest, RejectsInvalidJson) {
    auto bad = config().loadFromString("{ not json");
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().code(), ErrorCode::InvalidData);

    auto not_object = config().loadFromString("[1, 2, 3]");
    ASSERT_TRUE(not_object.is_error());
    EXPECT_EQ(not_object.error().code(), ErrorCode::InvalidData);
}

TEST_F(ConfigTest, FileRoundTrip) {
    auto path = std::filesystem::temp_directory_path() / "peerlink_config_test.json";

    config().set("endpoint", std::string("server"));
    config().set("retry_budget", 5);
    ASSERT_TRUE(config().saveToFile(path).is_ok());

    config().clear();
    EXPECT_FALSE(config().has("endpoint"));

    ASSERT_TRUE(config().loadFromFile(path).is_ok());
    EXPECT_EQ(config().get<std::string>("endpoint").value(), "server");
    EXPECT_EQ(config().get<int64_t>("retry_budget").value(), 5);

    std::filesystem::remove(path);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config().loadFromFile("/nonexistent/peerlink.json");
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code(), ErrorCode::FileNotFound);
}

} // namespace peerlink::core::test
