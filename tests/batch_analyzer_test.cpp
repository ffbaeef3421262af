#include "test_base.hpp"
#include "core/batch_analyzer.hpp"
#include <fstream>
#include <memory>
#include <stdexcept>
#include <opencv2/imgcodecs.hpp>

class BatchAnalyzerTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_.clone.seed = 5;
        analyzer_ = std::make_unique<ImageAnalyzer>(config_);

        ASSERT_TRUE(cv::imwrite(testPath("a_noise.tif"), toU8(noiseMat(128, 128, 1))));
        ASSERT_TRUE(cv::imwrite(testPath("b_noise.png"), toU8(noiseMat(128, 128, 2))));
        ASSERT_TRUE(cv::imwrite(testPath("c_grid.tif"), toU8(gridMat(128, 128, 8.0))));
        std::ofstream(testPath("d_broken.jpg")) << "not an image";
        std::ofstream(testPath("notes.txt")) << "ignored";
    }

    AnalysisConfig config_;
    std::unique_ptr<ImageAnalyzer> analyzer_;
    ImageLoader loader_;
};

TEST_F(BatchAnalyzerTest, AnalyzesSupportedFilesInOrder)
{
    BatchAnalyzer batch(*analyzer_, loader_, 2);
    auto reports = batch.analyzeFolder(test_dir_.string(), false);

    ASSERT_EQ(reports.size(), 4u);
    EXPECT_EQ(reports[0].file, "a_noise.tif");
    EXPECT_EQ(reports[1].file, "b_noise.png");
    EXPECT_EQ(reports[2].file, "c_grid.tif");
    EXPECT_EQ(reports[3].file, "d_broken.jpg");
}

TEST_F(BatchAnalyzerTest, VerdictsFollowTheChecks)
{
    BatchAnalyzer batch(*analyzer_, loader_, 4);
    auto reports = batch.analyzeFolder(test_dir_.string(), false);
    ASSERT_EQ(reports.size(), 4u);

    // Noise TIFF: raw container, nothing suspicious
    EXPECT_EQ(reports[0].verdict.status(), VerdictStatus::PASS);
    EXPECT_TRUE(reports[0].verdict.checks().has_raw);

    // Noise PNG without metadata: provenance only
    EXPECT_EQ(reports[1].verdict.risk(), 40);
    EXPECT_EQ(reports[1].verdict.status(), VerdictStatus::POLICY_ISSUE);

    // Grid TIFF: periodic
    EXPECT_GT(reports[2].verdict.checks().periodicity_score, 0.25);
    EXPECT_EQ(reports[2].verdict.status(), VerdictStatus::NEEDS_REVIEW);
}

TEST_F(BatchAnalyzerTest, UnreadableFileNeedsReview)
{
    BatchAnalyzer batch(*analyzer_, loader_, 1);
    auto report = batch.analyzeFile(testPath("d_broken.jpg"), false);

    EXPECT_EQ(report.file, "d_broken.jpg");
    EXPECT_EQ(report.verdict.status(), VerdictStatus::NEEDS_REVIEW);
    EXPECT_EQ(report.verdict.risk(), 70);
    EXPECT_EQ(report.verdict.reason(), "cannot read image");
}

TEST_F(BatchAnalyzerTest, DeclaredFilesUseDeclarationPolicy)
{
    BatchAnalyzer batch(*analyzer_, loader_, 2);
    auto reports = batch.analyzeFolder(test_dir_.string(), false, {"b_noise.png"});
    ASSERT_EQ(reports.size(), 4u);

    EXPECT_TRUE(reports[1].verdict.checks().ai_declared);
    EXPECT_EQ(reports[1].verdict.status(), VerdictStatus::POLICY_ISSUE);
    EXPECT_EQ(reports[1].verdict.risk(), 100);
    EXPECT_FALSE(reports[0].verdict.checks().ai_declared);
}

TEST_F(BatchAnalyzerTest, ThreadCountDoesNotChangeResults)
{
    BatchAnalyzer single(*analyzer_, loader_, 1);
    BatchAnalyzer parallel(*analyzer_, loader_, 4);

    auto a = single.analyzeFolder(test_dir_.string(), false);
    auto b = parallel.analyzeFolder(test_dir_.string(), false);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i)
    {
        EXPECT_EQ(a[i].file, b[i].file);
        EXPECT_EQ(a[i].verdict, b[i].verdict);
    }
}

TEST_F(BatchAnalyzerTest, RecursiveScanFindsSubfolders)
{
    std::filesystem::create_directories(test_dir_ / "nested");
    ASSERT_TRUE(cv::imwrite(testPath("nested/e_noise.png"), toU8(noiseMat(64, 64, 9))));

    BatchAnalyzer batch(*analyzer_, loader_, 2);
    EXPECT_EQ(batch.analyzeFolder(test_dir_.string(), false).size(), 4u);
    EXPECT_EQ(batch.analyzeFolder(test_dir_.string(), true).size(), 5u);
}

TEST_F(BatchAnalyzerTest, MissingFolderThrows)
{
    BatchAnalyzer batch(*analyzer_, loader_, 2);
    EXPECT_THROW(batch.analyzeFolder(testPath("missing"), false), std::runtime_error);
}

TEST_F(BatchAnalyzerTest, ZeroThreadsIsRejected)
{
    EXPECT_THROW((void)BatchAnalyzer(*analyzer_, loader_, 0), std::invalid_argument);
}

TEST_F(BatchAnalyzerTest, EmptyFileListGivesEmptyReport)
{
    BatchAnalyzer batch(*analyzer_, loader_, 2);
    EXPECT_TRUE(batch.analyzeFiles({}).empty());
}
