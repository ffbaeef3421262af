#include "test_base.hpp"
#include "core/poco_config_manager.hpp"
#include <fstream>

class PocoConfigManagerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        PocoConfigManager::getInstance().reset();
    }

    void TearDown() override
    {
        PocoConfigManager::getInstance().reset();
        TestBase::TearDown();
    }

    std::string writeConfig(const std::string &contents)
    {
        const std::string path = testPath("bioproof.json");
        std::ofstream(path) << contents;
        return path;
    }
};

TEST_F(PocoConfigManagerTest, EmptyConfigurationGivesDefaults)
{
    auto &config = PocoConfigManager::getInstance();
    AnalysisConfig analysis = config.toAnalysisConfig();
    AnalysisConfig defaults;

    EXPECT_EQ(analysis.clone.sample_count, defaults.clone.sample_count);
    EXPECT_DOUBLE_EQ(analysis.risk.periodicity_threshold, defaults.risk.periodicity_threshold);
    EXPECT_EQ(analysis.provenance.raw_formats, defaults.provenance.raw_formats);
    EXPECT_FALSE(analysis.clone.seed.has_value());
    EXPECT_EQ(config.getLogLevel(), "INFO");
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, LoadsValuesFromFile)
{
    auto &config = PocoConfigManager::getInstance();
    ASSERT_TRUE(config.load(writeConfig(R"({
        "logging": { "level": "DEBUG" },
        "threading": { "max_analysis_threads": 8 },
        "clone": { "sample_count": 32, "seed": 7 },
        "risk": { "periodicity_threshold": 0.3, "clone_weight": 45 },
        "provenance": { "raw_formats": ["tif", "czi"] }
    })")));

    AnalysisConfig analysis = config.toAnalysisConfig();
    EXPECT_EQ(config.getLogLevel(), "DEBUG");
    EXPECT_EQ(analysis.max_analysis_threads, 8);
    EXPECT_EQ(analysis.clone.sample_count, 32);
    ASSERT_TRUE(analysis.clone.seed.has_value());
    EXPECT_EQ(*analysis.clone.seed, 7u);
    EXPECT_DOUBLE_EQ(analysis.risk.periodicity_threshold, 0.3);
    EXPECT_EQ(analysis.risk.clone_weight, 45);
    EXPECT_EQ(analysis.risk.periodicity_weight, 30);
    EXPECT_EQ(analysis.provenance.raw_formats, (std::vector<std::string>{"tif", "czi"}));
}

TEST_F(PocoConfigManagerTest, MissingFileKeepsCurrentConfiguration)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"clone", {{"sample_count", 20}}}});
    EXPECT_FALSE(config.load(testPath("does_not_exist.json")));
    EXPECT_EQ(config.getInt("clone.sample_count", 0), 20);
}

TEST_F(PocoConfigManagerTest, MalformedFileIsRejected)
{
    auto &config = PocoConfigManager::getInstance();
    EXPECT_FALSE(config.load(writeConfig("{ not json")));
}

TEST_F(PocoConfigManagerTest, UpdateMergesNestedObjects)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"risk", {{"pass_max_risk", 30}, {"clone_threshold", 0.95}}},
                   {"watermark", {{"stamp_path", "stamps/dg.png"}}}});

    EXPECT_EQ(config.getInt("risk.pass_max_risk", 0), 30);
    EXPECT_DOUBLE_EQ(config.getDouble("risk.clone_threshold", 0.0), 0.95);
    EXPECT_EQ(config.getString("watermark.stamp_path", ""), "stamps/dg.png");

    AnalysisConfig analysis = config.toAnalysisConfig();
    EXPECT_EQ(analysis.risk.pass_max_risk, 30);
    EXPECT_EQ(analysis.watermark.stamp_path, "stamps/dg.png");
}

TEST_F(PocoConfigManagerTest, InvalidValuesFailValidation)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"clone", {{"sample_count", 0}}}});
    EXPECT_FALSE(config.validateConfig());
    EXPECT_THROW(config.toAnalysisConfig().validate(), ConfigurationError);
}

TEST_F(PocoConfigManagerTest, UnknownLogLevelFailsValidation)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"logging", {{"level", "VERBOSE"}}}});
    EXPECT_FALSE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, WrongTypeIsConfigurationError)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"clone", {{"sample_count", "many"}}}});
    EXPECT_THROW(config.toAnalysisConfig(), ConfigurationError);
}

TEST_F(PocoConfigManagerTest, SaveAndReload)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"periodicity", {{"peak_ratio", 20.0}}}});
    const std::string path = testPath("saved.json");
    ASSERT_TRUE(config.save(path));

    config.reset();
    EXPECT_DOUBLE_EQ(config.getDouble("periodicity.peak_ratio", 0.0), 0.0);

    ASSERT_TRUE(config.load(path));
    EXPECT_DOUBLE_EQ(config.getDouble("periodicity.peak_ratio", 0.0), 20.0);
    EXPECT_DOUBLE_EQ(config.getAll()["periodicity"]["peak_ratio"].get<double>(), 20.0);
}

TEST_F(PocoConfigManagerTest, SeedAcceptsFullUnsignedRange)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"clone", {{"seed", 4000000000u}}}});

    AnalysisConfig analysis = config.toAnalysisConfig();
    ASSERT_TRUE(analysis.clone.seed.has_value());
    EXPECT_EQ(*analysis.clone.seed, 4000000000u);
    EXPECT_TRUE(config.validateConfig());
}

TEST_F(PocoConfigManagerTest, NegativeSeedIsConfigurationError)
{
    auto &config = PocoConfigManager::getInstance();
    config.update({{"clone", {{"seed", -5}}}});
    EXPECT_THROW(config.toAnalysisConfig(), ConfigurationError);
}
