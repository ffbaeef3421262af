#include "core/batch_analyzer.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>
#include <optional>
#include <stdexcept>
#include <utility>

namespace
{
    constexpr int kUnreadableRisk = 70;
    const char *const kUnreadableReason = "cannot read image";
}

BatchAnalyzer::BatchAnalyzer(const ImageAnalyzer &analyzer, const ImageLoader &loader, size_t max_threads)
    : analyzer_(analyzer), loader_(loader), max_threads_(max_threads)
{
    if (max_threads_ == 0)
    {
        throw std::invalid_argument("BatchAnalyzer needs at least one thread");
    }
}

VerdictRecord BatchAnalyzer::unreadableVerdict()
{
    return VerdictRecord(VerdictStatus::NEEDS_REVIEW, kUnreadableRisk, kUnreadableReason, CheckResult());
}

std::vector<AnalysisReport> BatchAnalyzer::analyzeFolder(const std::string &folder, bool recursive,
                                                         const std::set<std::string> &declared)
{
    const auto files = FileUtils::listImageFiles(folder, recursive, ImageLoader::supportedExtensions());
    return analyzeFiles(files, declared);
}

std::vector<AnalysisReport> BatchAnalyzer::analyzeFiles(const std::vector<std::string> &files,
                                                        const std::set<std::string> &declared)
{
    cancelled_.store(false);
    Logger::info("Analyzing " + std::to_string(files.size()) + " images with up to " +
                 std::to_string(max_threads_) + " threads");

    std::vector<std::optional<AnalysisReport>> slots(files.size());
    {
        tbb::global_control control(tbb::global_control::max_allowed_parallelism, max_threads_);

        tbb::parallel_for(tbb::blocked_range<size_t>(0, files.size()),
                          [&](const tbb::blocked_range<size_t> &range)
                          {
                              for (size_t i = range.begin(); i != range.end(); ++i)
                              {
                                  if (cancelled_.load())
                                  {
                                      return;
                                  }
                                  const std::string name = fs::path(files[i]).filename().string();
                                  slots[i] = analyzeFile(files[i], declared.count(name) > 0);
                              }
                          });
    }

    std::vector<AnalysisReport> reports;
    reports.reserve(files.size());
    for (auto &slot : slots)
    {
        if (slot)
        {
            reports.push_back(std::move(*slot));
        }
    }

    if (reports.size() < files.size())
    {
        Logger::warn("Batch cancelled after " + std::to_string(reports.size()) + " of " +
                     std::to_string(files.size()) + " images");
    }
    return reports;
}

AnalysisReport BatchAnalyzer::analyzeFile(const std::string &file_path, bool ai_declared) const
{
    const std::string name = fs::path(file_path).filename().string();

    LoadResult loaded = loader_.load(file_path);
    if (!loaded.success)
    {
        Logger::warn("Cannot read image " + file_path + ": " + loaded.error_message);
        return AnalysisReport{name, unreadableVerdict()};
    }

    loaded.input.ai_declared = ai_declared;
    VerdictRecord verdict = analyzer_.analyze(loaded.input);
    Logger::info(name + ": " + VerdictStatuses::getStatusName(verdict.status()) + " (risk " +
                 std::to_string(verdict.risk()) + ")");
    return AnalysisReport{name, verdict};
}
