#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/batch_analyzer.hpp"
#include "core/check_result.hpp"

using json = nlohmann::json;

/**
 * @brief JSON serialization of analysis verdicts
 *
 * Record shape:
 * { "file", "status", "risk", "reason",
 *   "checks": { "has_raw", "exif_ok", "clone_score", "periodicity_score",
 *               "ai_declared", "mark_present" } }
 */
class ReportWriter
{
public:
    static json checksToJson(const CheckResult &checks);
    static json toJson(const std::string &file, const VerdictRecord &verdict);
    static json toJson(const std::vector<AnalysisReport> &reports);

    /**
     * @brief Write the reports as a JSON array (2-space indent)
     * @throws std::runtime_error if the file cannot be written
     */
    static void writeReport(const std::string &path, const std::vector<AnalysisReport> &reports);
};
