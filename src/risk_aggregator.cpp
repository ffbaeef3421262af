#include "core/risk_aggregator.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace
{
    const char *const kVerifiedReason = "Verified authentic - has lab equipment metadata and no suspicious patterns";
    const char *const kNoPatternReason = "No suspicious patterns detected";
    const char *const kDeclaredCompliantReason = "Digitally generated with proper watermark - compliant with policy";
    const char *const kDeclaredViolationReason = "Digital generation declared but watermark missing - policy violation";
}

RiskAggregator::RiskAggregator(const RiskSettings &settings)
    : settings_(settings), rules_(defaultRules(settings))
{
}

std::vector<RiskRule> RiskAggregator::defaultRules(const RiskSettings &settings)
{
    const double clone_threshold = settings.clone_threshold;
    const double periodicity_threshold = settings.periodicity_threshold;

    return {
        {"provenance", settings.provenance_weight,
         [](const CheckResult &checks)
         { return !checks.hasDeviceData(); },
         "No device metadata - cannot confirm image came from real lab equipment"},
        {"undeclared_mark", settings.undeclared_mark_weight,
         [](const CheckResult &checks)
         { return checks.mark_present && !checks.ai_declared; },
         "Watermark detected but digital generation not declared"},
        {"clone", settings.clone_weight,
         [clone_threshold](const CheckResult &checks)
         { return checks.clone_score > clone_threshold; },
         "Duplicated regions detected"},
        {"periodicity", settings.periodicity_weight,
         [periodicity_threshold](const CheckResult &checks)
         { return checks.periodicity_score > periodicity_threshold; },
         "Synthetic patterns detected"}};
}

void RiskAggregator::addRule(const RiskRule &rule)
{
    rules_.push_back(rule);
}

std::vector<const RiskRule *> RiskAggregator::firedRules(const CheckResult &checks) const
{
    std::vector<const RiskRule *> fired;
    for (const auto &rule : rules_)
    {
        if (rule.fires && rule.fires(checks))
        {
            fired.push_back(&rule);
        }
    }
    return fired;
}

int RiskAggregator::computeRisk(const CheckResult &checks) const
{
    long long total = 0;
    for (const auto *rule : firedRules(checks))
    {
        total += rule->weight;
    }
    return clampRisk(total);
}

VerdictStatus RiskAggregator::decide(int risk, const CheckResult &checks) const
{
    if (risk <= settings_.pass_max_risk)
        return VerdictStatus::PASS;
    if (checks.hasDeviceData())
        return VerdictStatus::NEEDS_REVIEW;
    return VerdictStatus::POLICY_ISSUE;
}

VerdictRecord RiskAggregator::aggregate(const CheckResult &checks) const
{
    if (checks.ai_declared)
    {
        if (checks.mark_present)
        {
            return VerdictRecord(VerdictStatus::PASS, clampRisk(settings_.declared_compliant_risk),
                                 kDeclaredCompliantReason, checks);
        }
        return VerdictRecord(VerdictStatus::POLICY_ISSUE, clampRisk(settings_.declared_violation_risk),
                             kDeclaredViolationReason, checks);
    }

    const auto fired = firedRules(checks);

    long long total = 0;
    std::string reason;
    for (const auto *rule : fired)
    {
        total += rule->weight;
        if (!reason.empty())
            reason += "; ";
        reason += rule->reason;
    }

    if (fired.empty())
    {
        reason = checks.hasDeviceData() ? kVerifiedReason : kNoPatternReason;
    }

    const int risk = clampRisk(total);
    const VerdictStatus status = decide(risk, checks);

    Logger::debug("Risk " + std::to_string(risk) + " -> " + VerdictStatuses::getStatusName(status) + ": " + reason);
    return VerdictRecord(status, risk, reason, checks);
}

int RiskAggregator::clampRisk(long long risk)
{
    return static_cast<int>(std::clamp<long long>(risk, 0, 100));
}
