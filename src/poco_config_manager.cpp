#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

void PocoConfigManager::reset()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (node.is_array())
        {
            for (size_t i = 0; i < node.size(); ++i)
            {
                apply(prefix + "[" + std::to_string(i) + "]", node[i]);
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer() && !node.is_number_unsigned())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

bool PocoConfigManager::has(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

double PocoConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getDouble(key, def);
}

unsigned PocoConfigManager::getUInt(const std::string &key, unsigned def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getUInt(key, def);
}

std::vector<std::string> PocoConfigManager::getStringList(const std::string &key,
                                                          const std::vector<std::string> &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cfg_->has(key + "[0]"))
    {
        if (!cfg_->has(key))
            return def;

        // Comma-separated string form
        std::vector<std::string> values;
        std::stringstream ss(cfg_->getString(key));
        std::string item;
        while (std::getline(ss, item, ','))
        {
            if (!item.empty())
                values.push_back(item);
        }
        return values;
    }

    std::vector<std::string> values;
    for (size_t i = 0; cfg_->has(key + "[" + std::to_string(i) + "]"); ++i)
    {
        values.push_back(cfg_->getString(key + "[" + std::to_string(i) + "]"));
    }
    return values;
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("logging.level", "INFO");
}

int PocoConfigManager::getNonNegativeInt(const std::string &key, int def) const
{
    const int value = getInt(key, def);
    if (value < 0)
    {
        throw ConfigurationError(key + " must not be negative");
    }
    return value;
}

AnalysisConfig PocoConfigManager::toAnalysisConfig() const
{
    AnalysisConfig config;
    try
    {
        auto &p = config.periodicity;
        p.max_dimension = getInt("periodicity.max_dimension", p.max_dimension);
        p.min_dimension = getInt("periodicity.min_dimension", p.min_dimension);
        p.dc_exclusion_radius = getDouble("periodicity.dc_exclusion_radius", p.dc_exclusion_radius);
        p.peak_ratio = getDouble("periodicity.peak_ratio", p.peak_ratio);
        p.peak_radius = getInt("periodicity.peak_radius", p.peak_radius);

        auto &c = config.clone;
        c.sample_count = getInt("clone.sample_count", c.sample_count);
        c.max_dimension = getInt("clone.max_dimension", c.max_dimension);
        c.patch_fraction = getDouble("clone.patch_fraction", c.patch_fraction);
        c.min_patch_size = getInt("clone.min_patch_size", c.min_patch_size);
        c.guard_margin = getInt("clone.guard_margin", c.guard_margin);
        c.border_margin = getInt("clone.border_margin", c.border_margin);
        c.min_patch_stddev = getDouble("clone.min_patch_stddev", c.min_patch_stddev);
        if (has("clone.seed"))
        {
            c.seed = static_cast<uint32_t>(getUInt("clone.seed", 0));
        }

        config.provenance.raw_formats = getStringList("provenance.raw_formats", config.provenance.raw_formats);

        auto &w = config.watermark;
        w.metadata_markers = getStringList("watermark.metadata_markers", w.metadata_markers);
        w.metadata_scan_bytes = static_cast<size_t>(
            getNonNegativeInt("watermark.metadata_scan_bytes", static_cast<int>(w.metadata_scan_bytes)));
        w.stamp_path = getString("watermark.stamp_path", w.stamp_path);
        w.stamp_size = getInt("watermark.stamp_size", w.stamp_size);
        w.corner_size = getInt("watermark.corner_size", w.corner_size);
        w.stamp_threshold = getDouble("watermark.stamp_threshold", w.stamp_threshold);

        auto &r = config.risk;
        r.periodicity_threshold = getDouble("risk.periodicity_threshold", r.periodicity_threshold);
        r.clone_threshold = getDouble("risk.clone_threshold", r.clone_threshold);
        r.periodicity_weight = getInt("risk.periodicity_weight", r.periodicity_weight);
        r.clone_weight = getInt("risk.clone_weight", r.clone_weight);
        r.provenance_weight = getInt("risk.provenance_weight", r.provenance_weight);
        r.undeclared_mark_weight = getInt("risk.undeclared_mark_weight", r.undeclared_mark_weight);
        r.pass_max_risk = getInt("risk.pass_max_risk", r.pass_max_risk);
        r.declared_compliant_risk = getInt("risk.declared_compliant_risk", r.declared_compliant_risk);
        r.declared_violation_risk = getInt("risk.declared_violation_risk", r.declared_violation_risk);

        config.max_analysis_threads = getInt("threading.max_analysis_threads", config.max_analysis_threads);
    }
    catch (const Poco::Exception &e)
    {
        throw ConfigurationError(e.displayText());
    }
    return config;
}

bool PocoConfigManager::validateConfig() const
{
    try
    {
        toAnalysisConfig().validate();
    }
    catch (const ConfigurationError &e)
    {
        Logger::error(e.what());
        return false;
    }

    const std::string level = getLogLevel();
    if (!Logger::isValidLevel(level))
    {
        Logger::error("Invalid configuration: unknown logging.level " + level);
        return false;
    }
    return true;
}
