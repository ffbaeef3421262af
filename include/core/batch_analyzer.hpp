#pragma once

#include <atomic>
#include <cstddef>
#include <set>
#include <string>
#include <vector>
#include "core/check_result.hpp"
#include "core/image_analyzer.hpp"
#include "core/image_loader.hpp"

/**
 * @brief Verdict for one file of a batch
 */
struct AnalysisReport
{
    std::string file; // Base file name
    VerdictRecord verdict;
};

/**
 * @brief Folder scan with parallel per-image analysis
 *
 * Images are analyzed with tbb::parallel_for, capped by tbb::global_control
 * at max_threads. Each image writes only its own pre-sized result slot, so the
 * reports come back in the order of the input file list.
 */
class BatchAnalyzer
{
public:
    /**
     * @param analyzer Shared analyzer; must outlive the batch analyzer
     * @param loader Shared loader; must outlive the batch analyzer
     * @param max_threads Maximum number of images analyzed concurrently
     * @throws std::invalid_argument if max_threads is 0
     */
    BatchAnalyzer(const ImageAnalyzer &analyzer, const ImageLoader &loader, size_t max_threads);

    /**
     * @brief Analyze every supported image of a folder, sorted by path
     * @param declared Base file names whose uploader declared digital generation
     * @throws std::runtime_error if the folder cannot be listed
     */
    std::vector<AnalysisReport> analyzeFolder(const std::string &folder, bool recursive,
                                              const std::set<std::string> &declared = {});

    /**
     * @brief Analyze an explicit list of files
     *
     * Files still pending when cancel() is called are left out of the result.
     */
    std::vector<AnalysisReport> analyzeFiles(const std::vector<std::string> &files,
                                             const std::set<std::string> &declared = {});

    /**
     * @brief Load and analyze a single file
     *
     * Never throws for a bad file: unreadable images get unreadableVerdict().
     */
    AnalysisReport analyzeFile(const std::string &file_path, bool ai_declared) const;

    /**
     * @brief Stop the running batch after the images already in progress
     */
    void cancel() { cancelled_.store(true); }

    /**
     * @brief Verdict reported for a file that cannot be decoded
     */
    static VerdictRecord unreadableVerdict();

    size_t maxThreads() const { return max_threads_; }

private:
    const ImageAnalyzer &analyzer_;
    const ImageLoader &loader_;
    size_t max_threads_;
    std::atomic<bool> cancelled_{false};
};
