#include "core/report_writer.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <stdexcept>

json ReportWriter::checksToJson(const CheckResult &checks)
{
    json j = {
        {"has_raw", checks.has_raw},
        {"exif_ok", checks.exif_ok},
        {"clone_score", checks.clone_score},
        {"periodicity_score", checks.periodicity_score},
        {"ai_declared", checks.ai_declared},
        {"mark_present", checks.mark_present}};

    for (const auto &[name, score] : checks.extra_scores)
    {
        j[name + "_score"] = score;
    }
    return j;
}

json ReportWriter::toJson(const std::string &file, const VerdictRecord &verdict)
{
    return {
        {"file", file},
        {"status", VerdictStatuses::getStatusName(verdict.status())},
        {"risk", verdict.risk()},
        {"reason", verdict.reason()},
        {"checks", checksToJson(verdict.checks())}};
}

json ReportWriter::toJson(const std::vector<AnalysisReport> &reports)
{
    json array = json::array();
    for (const auto &report : reports)
    {
        array.push_back(toJson(report.file, report.verdict));
    }
    return array;
}

void ReportWriter::writeReport(const std::string &path, const std::vector<AnalysisReport> &reports)
{
    // File names are raw bytes; invalid UTF-8 is replaced with U+FFFD instead of throwing
    const std::string text = toJson(reports).dump(2, ' ', false, json::error_handler_t::replace);

    std::ofstream out(path);
    if (!out)
    {
        throw std::runtime_error("Cannot open report file for writing: " + path);
    }

    out << text << std::endl;
    if (!out)
    {
        throw std::runtime_error("Error writing report file: " + path);
    }
    Logger::info("Wrote report " + path + " with " + std::to_string(reports.size()) + " items");
}
