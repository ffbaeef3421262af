#include "test_base.hpp"
#include "core/image_analyzer.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace
{
    class ConstantDetector : public Detector
    {
    public:
        ConstantDetector(std::string name, double value) : name_(std::move(name)), value_(value) {}

        std::string name() const override { return name_; }
        double score(const ImageBuffer &) const override { return value_; }

    private:
        std::string name_;
        double value_;
    };
}

class ImageAnalyzerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_.clone.seed = 99;
    }

    AnalysisInput input(const cv::Mat &pixels, const std::string &format) const
    {
        AnalysisInput in;
        in.image = ImageBuffer(pixels);
        in.format = format;
        return in;
    }

    AnalysisConfig config_;
};

TEST_F(ImageAnalyzerTest, InvalidConfigurationFailsBeforeAnalysis)
{
    config_.clone.sample_count = 0;
    EXPECT_THROW(ImageAnalyzer analyzer(config_), ConfigurationError);
}

TEST_F(ImageAnalyzerTest, AuthenticTiffWithExifPasses)
{
    ImageAnalyzer analyzer(config_);
    AnalysisInput in = input(noiseMat(256, 256, 4), "tif");
    in.metadata.setTag(CaptureTag::MAKE, "Bio-Rad");
    in.metadata.setTag(CaptureTag::MODEL, "ChemiDoc");

    auto verdict = analyzer.analyze(in);
    EXPECT_EQ(verdict.status(), VerdictStatus::PASS);
    EXPECT_EQ(verdict.risk(), 0);
    EXPECT_TRUE(verdict.checks().has_raw);
    EXPECT_TRUE(verdict.checks().exif_ok);
}

TEST_F(ImageAnalyzerTest, ClonedPngWithoutMetadataIsPolicyIssue)
{
    config_.clone.sample_count = 64;
    ImageAnalyzer analyzer(config_);

    auto verdict = analyzer.analyze(input(clonedNoiseMat(8), "png"));
    EXPECT_EQ(verdict.status(), VerdictStatus::POLICY_ISSUE);
    EXPECT_EQ(verdict.risk(), 80);
    EXPECT_GT(verdict.checks().clone_score, 0.98);
    EXPECT_FALSE(verdict.checks().has_raw);
}

TEST_F(ImageAnalyzerTest, PeriodicTiffNeedsReview)
{
    ImageAnalyzer analyzer(config_);

    auto verdict = analyzer.analyze(input(gridMat(256, 256, 8.0), "tif"));
    EXPECT_GT(verdict.checks().periodicity_score, 0.25);
    EXPECT_TRUE(verdict.checks().has_raw);
    EXPECT_EQ(verdict.status(), VerdictStatus::NEEDS_REVIEW);
    EXPECT_GE(verdict.risk(), 30);
}

TEST_F(ImageAnalyzerTest, AnalysisIsIdempotentWithFixedSeed)
{
    ImageAnalyzer analyzer(config_);
    AnalysisInput in = input(noiseMat(200, 180, 12), "jpg");

    EXPECT_EQ(analyzer.analyze(in), analyzer.analyze(in));
}

TEST_F(ImageAnalyzerTest, EmptyImageIsRejected)
{
    ImageAnalyzer analyzer(config_);
    AnalysisInput in;
    in.format = "png";
    EXPECT_THROW(analyzer.analyze(in), std::invalid_argument);
}

TEST_F(ImageAnalyzerTest, MetadataMarkerSetsMarkPresent)
{
    ImageAnalyzer analyzer(config_);
    AnalysisInput in = input(noiseMat(128, 128, 5), "tif");
    const std::string header = "....http://ns.adobe.com/xap/1.0/ <x:xmpmeta> c2pa ....";
    in.header_bytes.assign(header.begin(), header.end());

    auto verdict = analyzer.analyze(in);
    EXPECT_TRUE(verdict.checks().mark_present);
    EXPECT_FALSE(verdict.checks().ai_declared);
    EXPECT_EQ(verdict.risk(), 50);
    EXPECT_EQ(verdict.status(), VerdictStatus::NEEDS_REVIEW);

    in.ai_declared = true;
    auto declared = analyzer.analyze(in);
    EXPECT_EQ(declared.status(), VerdictStatus::PASS);
    EXPECT_EQ(declared.risk(), 10);
}

TEST_F(ImageAnalyzerTest, ExtraDetectorFeedsItsRule)
{
    ImageAnalyzer analyzer(config_);
    analyzer.addDetector(std::make_unique<ConstantDetector>("noise", 0.9),
                         {"noise", 20,
                          [](const CheckResult &c)
                          { return c.extra_scores.at("noise") > 0.5; },
                          "Inconsistent sensor noise"});

    AnalysisInput in = input(noiseMat(128, 128, 6), "tif");
    auto checks = analyzer.runChecks(in);
    ASSERT_EQ(checks.extra_scores.count("noise"), 1u);
    EXPECT_DOUBLE_EQ(checks.extra_scores.at("noise"), 0.9);

    auto verdict = analyzer.analyze(in);
    EXPECT_EQ(verdict.risk(), 20);
    EXPECT_EQ(verdict.reason(), "Inconsistent sensor noise");
}

TEST_F(ImageAnalyzerTest, NullDetectorIsRejected)
{
    ImageAnalyzer analyzer(config_);
    EXPECT_THROW(analyzer.addDetector(nullptr, {"none", 0, nullptr, ""}), std::invalid_argument);
}

TEST_F(ImageAnalyzerTest, DetectorScoresAreKeyedByName)
{
    ImageAnalyzer analyzer(config_);
    auto scores = analyzer.detectorScores(ImageBuffer(noiseMat(128, 128, 7)));
    EXPECT_EQ(scores.size(), 2u);
    EXPECT_EQ(scores.count("clone"), 1u);
    EXPECT_EQ(scores.count("periodicity"), 1u);
}
