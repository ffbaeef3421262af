#include "core/analysis_config.hpp"
#include <string>

namespace
{
    void require(bool condition, const std::string &message)
    {
        if (!condition)
        {
            throw ConfigurationError(message);
        }
    }

    bool isUnitInterval(double value)
    {
        return value >= 0.0 && value <= 1.0;
    }
}

void AnalysisConfig::validate() const
{
    // Periodicity
    require(periodicity.max_dimension >= periodicity.min_dimension,
            "periodicity.max_dimension must be >= periodicity.min_dimension");
    require(periodicity.min_dimension >= 4, "periodicity.min_dimension must be >= 4");
    require(periodicity.dc_exclusion_radius >= 0.0 && periodicity.dc_exclusion_radius < 0.5,
            "periodicity.dc_exclusion_radius must be in [0, 0.5)");
    require(periodicity.peak_ratio > 1.0, "periodicity.peak_ratio must be > 1");
    require(periodicity.peak_radius >= 0, "periodicity.peak_radius must be >= 0");

    // Clone
    require(clone.sample_count > 0,
            "clone.sample_count must be positive, got " + std::to_string(clone.sample_count));
    require(clone.max_dimension >= clone.min_patch_size * 2,
            "clone.max_dimension must be at least twice clone.min_patch_size");
    require(clone.patch_fraction > 0.0 && clone.patch_fraction <= 0.5,
            "clone.patch_fraction must be in (0, 0.5]");
    require(clone.min_patch_size >= 4, "clone.min_patch_size must be >= 4");
    require(clone.guard_margin >= 0, "clone.guard_margin must be >= 0");
    require(clone.border_margin >= 0, "clone.border_margin must be >= 0");
    require(clone.min_patch_stddev >= 0.0, "clone.min_patch_stddev must be >= 0");

    // Provenance
    require(!provenance.raw_formats.empty(), "provenance.raw_formats must not be empty");

    // Watermark
    require(watermark.stamp_size > 0, "watermark.stamp_size must be positive");
    require(watermark.corner_size >= watermark.stamp_size,
            "watermark.corner_size must be >= watermark.stamp_size");
    require(isUnitInterval(watermark.stamp_threshold), "watermark.stamp_threshold must be in [0, 1]");

    // Risk
    require(isUnitInterval(risk.periodicity_threshold), "risk.periodicity_threshold must be in [0, 1]");
    require(isUnitInterval(risk.clone_threshold), "risk.clone_threshold must be in [0, 1]");
    require(risk.periodicity_weight >= 0, "risk.periodicity_weight must be >= 0");
    require(risk.clone_weight >= 0, "risk.clone_weight must be >= 0");
    require(risk.provenance_weight >= 0, "risk.provenance_weight must be >= 0");
    require(risk.undeclared_mark_weight >= 0, "risk.undeclared_mark_weight must be >= 0");
    require(risk.pass_max_risk >= 0 && risk.pass_max_risk <= 100, "risk.pass_max_risk must be in [0, 100]");
    require(risk.declared_compliant_risk >= 0 && risk.declared_compliant_risk <= 100,
            "risk.declared_compliant_risk must be in [0, 100]");
    require(risk.declared_violation_risk >= 0 && risk.declared_violation_risk <= 100,
            "risk.declared_violation_risk must be in [0, 100]");

    require(max_analysis_threads > 0 && max_analysis_threads <= MAX_ANALYSIS_THREADS,
            "max_analysis_threads must be in [1, " + std::to_string(MAX_ANALYSIS_THREADS) + "]");
}
