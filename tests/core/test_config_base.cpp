#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "trade_sim/core/config_base.hpp"

using namespace trade_sim;

class ConfigBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "trade_sim_config_base_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
};

class TestConfig : public ConfigBase {
public:
    std::string name = "default";
    int value = 42;
    double ratio = 0.5;

    nlohmann::json to_json() const override {
        nlohmann::json j;
        j["name"] = name;
        j["value"] = value;
        j["ratio"] = ratio;
        return j;
    }

    void from_json(const nlohmann::json& j) override {
        if (j.contains("name"))
            name = j["name"].get<std::string>();
        if (j.contains("value"))
            value = j["value"].get<int>();
        if (j.contains("ratio"))
            ratio = j["ratio"].get<double>();
    }

    void validate(std::vector<std::string>& violations) const override {
        if (value < 0)
            violations.push_back("value must be >= 0");
        if (!(ratio > 0.0 && ratio <= 1.0))
            violations.push_back("ratio must be within (0, 1]");
    }
};

class UncheckedConfig : public ConfigBase {
public:
    nlohmann::json to_json() const override {
        return nlohmann::json::object();
    }
    void from_json(const nlohmann::json&) override {}
};

TEST_F(ConfigBaseTest, SaveAndLoadFile) {
    TestConfig config;
    config.name = "test";
    config.value = 100;
    config.ratio = 0.75;

    std::filesystem::path file_path = test_dir / "test_config.json";
    auto save_result = config.save_to_file(file_path.string());
    ASSERT_TRUE(save_result.is_ok())
        << (save_result.error() ? save_result.error()->what() : "unknown error");
    ASSERT_TRUE(std::filesystem::exists(file_path));

    TestConfig loaded_config;
    auto load_result = loaded_config.load_from_file(file_path.string());
    ASSERT_TRUE(load_result.is_ok())
        << (load_result.error() ? load_result.error()->what() : "unknown error");

    EXPECT_EQ(loaded_config.name, "test");
    EXPECT_EQ(loaded_config.value, 100);
    EXPECT_DOUBLE_EQ(loaded_config.ratio, 0.75);
}

TEST_F(ConfigBaseTest, DefaultValuesPreserved) {
    TestConfig config;
    config.from_json({{"name", "partial"}});

    EXPECT_EQ(config.name, "partial");
    EXPECT_EQ(config.value, 42);
    EXPECT_DOUBLE_EQ(config.ratio, 0.5);
}

TEST_F(ConfigBaseTest, MissingFileReported) {
    TestConfig config;
    auto result = config.load_from_file((test_dir / "absent.json").string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(ConfigBaseTest, InvalidJsonHandling) {
    TestConfig config;

    std::filesystem::path file_path = test_dir / "invalid.json";
    std::ofstream file(file_path);
    file << "{ this is not valid JSON }";
    file.close();

    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::JSON_PARSE_ERROR);
    EXPECT_EQ(config.name, "default");
}

TEST_F(ConfigBaseTest, ViolationsCollectedThroughBase) {
    TestConfig config;
    config.value = -1;
    config.ratio = 2.0;

    const ConfigBase& base = config;
    auto violations = base.collect_violations();
    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0], "value must be >= 0");

    auto checked = base.check("TestConfig");
    ASSERT_TRUE(checked.is_error());
    EXPECT_EQ(checked.error()->code(), ErrorCode::INVALID_CONFIGURATION);
    auto* validation = dynamic_cast<const ValidationError*>(checked.error());
    ASSERT_NE(validation, nullptr);
    EXPECT_EQ(validation->violations().size(), 2u);

    EXPECT_TRUE(TestConfig().check().is_ok());
    EXPECT_TRUE(UncheckedConfig().collect_violations().empty());
}

TEST_F(ConfigBaseTest, LoadRejectsInvalidValues) {
    std::filesystem::path file_path = test_dir / "out_of_range.json";
    std::ofstream file(file_path);
    file << R"({"name": "loaded", "ratio": 1.5})";
    file.close();

    TestConfig config;
    auto result = config.load_from_file(file_path.string());
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_CONFIGURATION);
    auto* validation = dynamic_cast<const ValidationError*>(result.error());
    ASSERT_NE(validation, nullptr);
    ASSERT_EQ(validation->violations().size(), 1u);
    EXPECT_EQ(validation->violations()[0], "ratio must be within (0, 1]");
}
