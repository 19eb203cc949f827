/**
 * @file ConfigReader.hpp
 * @brief INI-style configuration reader for forecast runs
 *
 * Format:
 *   [SECTION]
 *   key = value      # inline comment
 * Lines starting with # or ; are comments.
 */

#ifndef MMWF_CONFIG_READER_HPP
#define MMWF_CONFIG_READER_HPP

#include "ForecastConfig.hpp"
#include <map>
#include <string>
#include <vector>

namespace MMWF {

class ConfigReader {
public:
    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file (false if it cannot be opened)
    bool loadFile(const std::string& filename);

    // Load from in-memory text
    void loadString(const std::string& text);

    // =========================================================================
    // Typed Parsing
    // =========================================================================

    bool parseGraphConfig(GraphBuildConfig& config) const;
    bool parseModelConfig(ModelConfig& config) const;
    bool parseDataConfig(DataConfig& config) const;
    bool parseEvalConfig(EvalConfig& config) const;

    /**
     * @brief Parse and validate every section
     * @throws ConfigurationError listing every problem found
     */
    ForecastConfig parseForecastConfig() const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    // A value that is present but cannot be parsed raises ConfigurationError
    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<double> getDoubleArray(const std::string& section,
                                       const std::string& key) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static void generateTemplate(const std::string& filename);

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    void parseLines(std::istream& in);
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace MMWF

#endif // MMWF_CONFIG_READER_HPP
