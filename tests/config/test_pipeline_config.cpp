// test_pipeline_config.cpp
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "finpipe/config/pipeline_config.hpp"

using namespace finpipe;

class PipelineConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("FINPIPE_CONFIG_PATH");
        test_dir = std::filesystem::temp_directory_path() / "finpipe_pipeline_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        unsetenv("FINPIPE_CONFIG_PATH");
        std::filesystem::remove_all(test_dir);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(PipelineConfigTest, DefaultsAreValid) {
    PipelineConfig config = PipelineConfig::defaults();
    EXPECT_TRUE(config.validate().is_ok());
    ASSERT_NE(config.source("yahoo_eod"), nullptr);
    ASSERT_NE(config.source("yahoo_intraday"), nullptr);
    ASSERT_NE(config.source("fred"), nullptr);
    EXPECT_EQ(config.source("fred")->quota, 0);
    EXPECT_EQ(config.source("fred")->batch_size, 1);
    EXPECT_EQ(config.source("alpha"), nullptr);
    EXPECT_EQ(config.store.backend, StoreBackend::MEMORY);

    auto specs = config.indicator_specs();
    ASSERT_TRUE(specs.is_ok());
    EXPECT_EQ(specs.value().size(), default_indicator_set().size());
}

TEST_F(PipelineConfigTest, LoadRefinesDefaults) {
    std::string path = write("config.json", R"json({
        "store": {"backend": "postgres", "connection_string": "postgresql://localhost/finpipe"},
        "sources": {"yahoo_eod": {"quota": 2, "batch_size": 2, "window_kind": "fixed"}},
        "indicators": ["SMA(20)", "sma(20)", "RSI"],
        "scheduler": {"interval_seconds": 60, "range": "full", "macro_codes": ["DFF"]}
    })json");

    auto loaded = load_pipeline_config(path);
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->what();
    const PipelineConfig& config = loaded.value();

    EXPECT_EQ(config.store.backend, StoreBackend::POSTGRES);
    const SourceConfig* eod = config.source("yahoo_eod");
    ASSERT_NE(eod, nullptr);
    EXPECT_EQ(eod->quota, 2);
    EXPECT_EQ(eod->window_kind, WindowKind::FIXED);
    EXPECT_EQ(eod->base_url, "https://query1.finance.yahoo.com");
    EXPECT_EQ(config.scheduler.interval_seconds, 60);
    EXPECT_EQ(config.scheduler.range, FetchRange::FULL);

    auto specs = config.indicator_specs();
    ASSERT_TRUE(specs.is_ok());
    ASSERT_EQ(specs.value().size(), 2u);
    EXPECT_EQ(specs.value()[0].label(), "SMA(20)");
    EXPECT_EQ(specs.value()[1].label(), "RSI(14)");
}

TEST_F(PipelineConfigTest, EnvironmentOverridesPath) {
    std::string path = write("override.json", R"({"scheduler": {"interval_seconds": 30}})");
    setenv("FINPIPE_CONFIG_PATH", path.c_str(), 1);

    auto loaded = load_pipeline_config((test_dir / "missing.json").string());
    ASSERT_TRUE(loaded.is_ok()) << loaded.error()->what();
    EXPECT_EQ(loaded.value().scheduler.interval_seconds, 30);
}

TEST_F(PipelineConfigTest, MissingFileReported) {
    auto loaded = load_pipeline_config((test_dir / "missing.json").string());
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::FILE_NOT_FOUND);
}

TEST_F(PipelineConfigTest, UnknownEnumValuesRejected) {
    std::string path = write("bad_range.json", R"({"scheduler": {"range": "weekly"}})");
    auto loaded = load_pipeline_config(path);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::INVALID_ARGUMENT);

    path = write("bad_backend.json", R"({"store": {"backend": "sqlite"}})");
    loaded = load_pipeline_config(path);
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PipelineConfigTest, ValidateRejectsInconsistentSettings) {
    PipelineConfig config = PipelineConfig::defaults();
    config.store.backend = StoreBackend::POSTGRES;
    EXPECT_TRUE(config.validate().is_error());

    config = PipelineConfig::defaults();
    config.sources["yahoo_eod"].quota = -1;
    EXPECT_TRUE(config.validate().is_error());

    config = PipelineConfig::defaults();
    config.sources["yahoo_eod"].window_seconds = 0;
    EXPECT_TRUE(config.validate().is_error());

    config = PipelineConfig::defaults();
    config.sources["fred"].batch_size = 0;
    EXPECT_TRUE(config.validate().is_error());

    // A batch larger than the quota could never be granted
    config = PipelineConfig::defaults();
    config.sources["yahoo_eod"].quota = 2;
    config.sources["yahoo_eod"].batch_size = 5;
    EXPECT_TRUE(config.validate().is_error());
    config.sources["yahoo_eod"].batch_size = 2;
    EXPECT_TRUE(config.validate().is_ok());

    config = PipelineConfig::defaults();
    config.indicators = {"VWAP(10)"};
    EXPECT_TRUE(config.validate().is_error());

    config = PipelineConfig::defaults();
    config.scheduler.interval_seconds = 0;
    EXPECT_TRUE(config.validate().is_error());

    config = PipelineConfig::defaults();
    config.scheduler.macro_codes = {"NOPE"};
    auto result = config.validate();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);
}

TEST_F(PipelineConfigTest, FetchRangeStrings) {
    EXPECT_EQ(fetch_range_from_string("compact").value(), FetchRange::COMPACT);
    EXPECT_EQ(fetch_range_from_string("full").value(), FetchRange::FULL);
    EXPECT_TRUE(fetch_range_from_string("FULL").is_error());
    EXPECT_EQ(fetch_range_to_string(FetchRange::FULL), "full");
}
