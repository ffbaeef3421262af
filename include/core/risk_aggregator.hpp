#pragma once

#include <functional>
#include <string>
#include <vector>
#include "core/analysis_config.hpp"
#include "core/check_result.hpp"

/**
 * @brief One additive term of the risk score
 *
 * The same predicate decides both the weight and the reason, so the reason
 * string can never disagree with the score.
 */
struct RiskRule
{
    std::string name;                                // e.g. "clone"
    int weight;                                      // Added to the risk when the rule fires
    std::function<bool(const CheckResult &)> fires;  // Condition on the check results
    std::string reason;                              // Text reported when the rule fires
};

/**
 * @brief Turns a CheckResult into a VerdictRecord
 *
 * Rules are kept in reason precedence order: provenance, undeclared
 * watermark, clone, periodicity. The total is the sum of the fired weights
 * clamped to [0, 100], so it does not depend on evaluation order.
 *
 * Decision:
 *  - digital generation declared: Pass with the compliant risk if a mark is
 *    present, otherwise Policy issue with the violation risk
 *  - risk <= pass_max_risk: Pass
 *  - otherwise Needs review with device data, Policy issue without
 */
class RiskAggregator
{
public:
    explicit RiskAggregator(const RiskSettings &settings);

    /**
     * @brief The built-in rule table for the given thresholds and weights
     */
    static std::vector<RiskRule> defaultRules(const RiskSettings &settings);

    /**
     * @brief Append a rule with the lowest reason precedence
     */
    void addRule(const RiskRule &rule);

    const std::vector<RiskRule> &rules() const { return rules_; }

    /**
     * @brief Rules whose condition holds, in precedence order
     */
    std::vector<const RiskRule *> firedRules(const CheckResult &checks) const;

    /**
     * @brief Additive risk in [0, 100], ignoring the declaration path
     */
    int computeRisk(const CheckResult &checks) const;

    /**
     * @brief Classify a risk value given the provenance flags
     */
    VerdictStatus decide(int risk, const CheckResult &checks) const;

    /**
     * @brief Full verdict for one image
     */
    VerdictRecord aggregate(const CheckResult &checks) const;

private:
    RiskSettings settings_;
    std::vector<RiskRule> rules_;

    static int clampRisk(long long risk);
};
