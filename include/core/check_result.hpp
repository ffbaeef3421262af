#pragma once

#include <map>
#include <string>

/**
 * @brief Raw outputs of the provenance, clone and periodicity checks for one image
 *
 * ai_declared and mark_present carry the digital-generation declaration and the
 * watermark check. Their defaults leave the scoring of the other four fields
 * unaffected. extra_scores holds the scores of any detector registered beyond
 * the built-in clone and periodicity detectors, keyed by detector name.
 */
struct CheckResult
{
    bool has_raw = false;
    bool exif_ok = false;
    double clone_score = 0.0;       // [0, 1]
    double periodicity_score = 0.0; // [0, 1]
    bool ai_declared = false;
    bool mark_present = false;
    std::map<std::string, double> extra_scores;

    bool hasDeviceData() const { return has_raw || exif_ok; }

    bool operator==(const CheckResult &other) const
    {
        return has_raw == other.has_raw && exif_ok == other.exif_ok &&
               clone_score == other.clone_score && periodicity_score == other.periodicity_score &&
               ai_declared == other.ai_declared && mark_present == other.mark_present &&
               extra_scores == other.extra_scores;
    }
    bool operator!=(const CheckResult &other) const { return !(*this == other); }
};

enum class VerdictStatus
{
    PASS,
    NEEDS_REVIEW,
    POLICY_ISSUE
};

class VerdictStatuses
{
public:
    /**
     * @brief Get the report string of a status
     * @param status The verdict status
     * @return "Pass", "Needs review" or "Policy issue"
     */
    static std::string getStatusName(VerdictStatus status)
    {
        switch (status)
        {
        case VerdictStatus::PASS:
            return "Pass";
        case VerdictStatus::NEEDS_REVIEW:
            return "Needs review";
        case VerdictStatus::POLICY_ISSUE:
            return "Policy issue";
        default:
            return "Unknown";
        }
    }
};

/**
 * @brief Final classification of one image
 *
 * Created once by the RiskAggregator and never modified afterwards.
 */
class VerdictRecord
{
public:
    VerdictRecord(VerdictStatus status, int risk, const std::string &reason, const CheckResult &checks)
        : status_(status), risk_(risk), reason_(reason), checks_(checks) {}

    VerdictStatus status() const { return status_; }
    int risk() const { return risk_; }
    const std::string &reason() const { return reason_; }
    const CheckResult &checks() const { return checks_; }

    bool operator==(const VerdictRecord &other) const
    {
        return status_ == other.status_ && risk_ == other.risk_ &&
               reason_ == other.reason_ && checks_ == other.checks_;
    }

private:
    VerdictStatus status_;
    int risk_;
    std::string reason_;
    CheckResult checks_;
};
