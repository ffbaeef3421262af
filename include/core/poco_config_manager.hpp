#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/analysis_config.hpp"

/**
 * @brief Process-wide JSON configuration (default file bioproof.json)
 *
 * Keys are dotted paths ("clone.sample_count", "risk.pass_max_risk").
 * Missing keys fall back to the AnalysisConfig defaults, so an empty file is
 * a valid configuration.
 */
class PocoConfigManager
{
public:
    static constexpr const char *DEFAULT_CONFIG_FILE = "bioproof.json";

    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    /**
     * @brief Replace the configuration with the contents of a JSON file
     * @return false if the file cannot be opened or parsed; the current configuration is kept
     */
    bool load(const std::string &path);
    bool save(const std::string &path) const;

    /**
     * @brief Drop every key, back to built-in defaults
     */
    void reset();

    nlohmann::json getAll() const;

    /**
     * @brief Merge a JSON object into the configuration (objects become dotted keys)
     */
    void update(const nlohmann::json &patch);

    bool has(const std::string &key) const;

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    double getDouble(const std::string &key, double def) const;
    unsigned getUInt(const std::string &key, unsigned def) const;
    std::vector<std::string> getStringList(const std::string &key, const std::vector<std::string> &def) const;

    std::string getLogLevel() const;

    /**
     * @brief Build the explicit analysis configuration from the stored keys
     * @throws ConfigurationError if a value has the wrong type or is out of range for its field
     */
    AnalysisConfig toAnalysisConfig() const;

    /**
     * @brief Check that the stored keys form a valid AnalysisConfig and a known log level
     * @return false (with the reason logged) if not
     */
    bool validateConfig() const;

private:
    PocoConfigManager();
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;

    int getNonNegativeInt(const std::string &key, int def) const;
};
