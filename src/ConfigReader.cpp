#include "ConfigReader.hpp"
#include "ForecastErrors.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace MMWF {

namespace {

std::string describe(const std::string& section, const std::string& key) {
    return "[" + section + "] " + key;
}

} // namespace

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }

    parseLines(file);
    file.close();
    return true;
}

void ConfigReader::loadString(const std::string& text) {
    std::istringstream in(text);
    parseLines(in);
}

void ConfigReader::parseLines(std::istream& in) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(in, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t pos = 0;
    int result = 0;
    try {
        result = std::stoi(val, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != val.size()) {
        throw ConfigurationError(describe(section, key) + ": cannot parse '" + val +
                                 "' as an integer");
    }
    return result;
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    size_t pos = 0;
    double result = 0.0;
    try {
        result = std::stod(val, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos == 0 || pos != val.size()) {
        throw ConfigurationError(describe(section, key) + ": cannot parse '" + val +
                                 "' as a number");
    }
    return result;
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    throw ConfigurationError(describe(section, key) + ": cannot parse '" + val +
                             "' as a boolean");
}

std::vector<double> ConfigReader::getDoubleArray(const std::string& section,
                                                 const std::string& key) const {
    std::vector<double> result;
    std::string val = getString(section, key);
    if (val.empty()) return result;

    for (const auto& token : split(val, ',')) {
        size_t pos = 0;
        double x = 0.0;
        try {
            x = std::stod(token, &pos);
        } catch (const std::exception&) {
            pos = 0;
        }
        if (pos == 0 || pos != token.size()) {
            throw ConfigurationError(describe(section, key) + ": cannot parse '" + token +
                                     "' as a number");
        }
        result.push_back(x);
    }

    return result;
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Typed Parsing
// =============================================================================

bool ConfigReader::parseGraphConfig(GraphBuildConfig& config) const {
    if (!hasSection("GRAPH")) return false;

    config.mesh_size = getInt("GRAPH", "mesh_size", config.mesh_size);
    config.multimesh = getBool("GRAPH", "multimesh", config.multimesh);
    config.radius_query_fraction_edge_length =
        getDouble("GRAPH", "radius_query_fraction_edge_length",
                  config.radius_query_fraction_edge_length);
    config.mesh2grid_edge_normalization_factor =
        getDouble("GRAPH", "mesh2grid_edge_normalization_factor",
                  config.mesh2grid_edge_normalization_factor);
    config.resolution = getDouble("GRAPH", "resolution", config.resolution);

    // Comma-separated point list overriding the regular grid
    if (hasKey("GRAPH", "grid_latitudes") || hasKey("GRAPH", "grid_longitudes")) {
        config.grid_latitudes = getDoubleArray("GRAPH", "grid_latitudes");
        config.grid_longitudes = getDoubleArray("GRAPH", "grid_longitudes");
    }

    return true;
}

bool ConfigReader::parseModelConfig(ModelConfig& config) const {
    if (!hasSection("MODEL")) return false;

    config.grid_node_dim = getInt("MODEL", "grid_node_dim", config.grid_node_dim);
    config.grid_node_num = getInt("MODEL", "grid_node_num", config.grid_node_num);
    config.grid_node_emb_dim = getInt("MODEL", "grid_node_emb_dim", config.grid_node_emb_dim);
    config.mesh_node_dim = getInt("MODEL", "mesh_node_dim", config.mesh_node_dim);
    config.mesh_node_num = getInt("MODEL", "mesh_node_num", config.mesh_node_num);
    config.mesh_node_emb_dim = getInt("MODEL", "mesh_node_emb_dim", config.mesh_node_emb_dim);
    config.mesh_edge_dim = getInt("MODEL", "mesh_edge_dim", config.mesh_edge_dim);
    config.mesh_edge_emb_dim = getInt("MODEL", "mesh_edge_emb_dim", config.mesh_edge_emb_dim);
    config.grid2mesh_edge_dim = getInt("MODEL", "grid2mesh_edge_dim", config.grid2mesh_edge_dim);
    config.grid2mesh_edge_emb_dim =
        getInt("MODEL", "grid2mesh_edge_emb_dim", config.grid2mesh_edge_emb_dim);
    config.mesh2grid_edge_dim = getInt("MODEL", "mesh2grid_edge_dim", config.mesh2grid_edge_dim);
    config.mesh2grid_edge_emb_dim =
        getInt("MODEL", "mesh2grid_edge_emb_dim", config.mesh2grid_edge_emb_dim);
    config.gnn_msg_steps = getInt("MODEL", "gnn_msg_steps", config.gnn_msg_steps);
    config.node_output_dim = getInt("MODEL", "node_output_dim", config.node_output_dim);

    config.history_length = getInt("MODEL", "history_length", config.history_length);
    config.forcing_dim = getInt("MODEL", "forcing_dim", config.forcing_dim);

    config.activation = getString("MODEL", "activation", config.activation);
    config.use_layer_norm = getBool("MODEL", "use_layer_norm", config.use_layer_norm);
    config.weight_init = getString("MODEL", "weight_init", config.weight_init);

    return true;
}

bool ConfigReader::parseDataConfig(DataConfig& config) const {
    bool found = hasSection("DATA") || hasSection("NORMALIZATION");

    config.mean_path = getString("DATA", "mean_path", config.mean_path);
    config.stddev_path = getString("DATA", "stddev_path", config.stddev_path);
    config.stddev_diffs_path = getString("DATA", "stddev_diffs_path", config.stddev_diffs_path);
    config.forcing_mean_path = getString("DATA", "forcing_mean_path", config.forcing_mean_path);
    config.forcing_stddev_path =
        getString("DATA", "forcing_stddev_path", config.forcing_stddev_path);

    config.stddev_epsilon = getDouble("NORMALIZATION", "stddev_epsilon", config.stddev_epsilon);

    return found;
}

bool ConfigReader::parseEvalConfig(EvalConfig& config) const {
    if (!hasSection("EVAL")) return false;

    config.pretrained_model_path =
        getString("EVAL", "pretrained_model_path", config.pretrained_model_path);
    config.batch_size = getInt("EVAL", "batch_size", config.batch_size);
    config.forecast_steps = getInt("EVAL", "forecast_steps", config.forecast_steps);
    config.output_prefix = getString("EVAL", "output_prefix", config.output_prefix);

    return true;
}

ForecastConfig ConfigReader::parseForecastConfig() const {
    ForecastConfig config;

    config.seed = static_cast<unsigned int>(getInt("GENERAL", "seed", config.seed));
    config.verbose = getBool("GENERAL", "verbose", config.verbose);

    parseGraphConfig(config.graph);
    parseModelConfig(config.model);
    parseDataConfig(config.data);
    parseEvalConfig(config.eval);

    auto errors = config.validate();
    if (!errors.empty()) {
        std::string msg = std::to_string(errors.size()) + " invalid setting(s):";
        for (const auto& e : errors) msg += "\n  " + e;
        throw ConfigurationError(msg);
    }
    return config;
}

// =============================================================================
// Template Generation
// =============================================================================

void ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw ConfigurationError("cannot write template: " + filename);
    }

    file << "# MMWF Forecast Configuration File\n";
    file << "#\n";
    file << "# Lines starting with # or ; are comments\n";
    file << "# Format: key = value\n\n";

    file << "[GENERAL]\n";
    file << "seed = 2024\n";
    file << "verbose = true\n\n";

    file << "[GRAPH]\n";
    file << "mesh_size = 5                              # Icosahedron refinement level\n";
    file << "multimesh = true                           # Keep the edges of every level\n";
    file << "radius_query_fraction_edge_length = 0.6\n";
    file << "mesh2grid_edge_normalization_factor = 0.6180338738074472\n";
    file << "resolution = 1.0                           # Grid spacing [deg]\n";
    file << "# grid_latitudes = 10.0, -45.0, 60.0         # Explicit points replace the grid\n";
    file << "# grid_longitudes = 0.0, 90.0, 200.0\n\n";

    file << "[MODEL]\n";
    file << "grid_node_num = 65160                      # (180/resolution + 1) * 360/resolution\n";
    file << "grid_node_dim = 186                        # history_length * node_output_dim + forcing_dim\n";
    file << "grid_node_emb_dim = 512\n";
    file << "mesh_node_num = 10242                      # 10 * 4^mesh_size + 2\n";
    file << "mesh_node_dim = 186\n";
    file << "mesh_node_emb_dim = 512\n";
    file << "mesh_edge_dim = 4\n";
    file << "mesh_edge_emb_dim = 512\n";
    file << "grid2mesh_edge_dim = 4\n";
    file << "grid2mesh_edge_emb_dim = 512\n";
    file << "mesh2grid_edge_dim = 4\n";
    file << "mesh2grid_edge_emb_dim = 512\n";
    file << "gnn_msg_steps = 16\n";
    file << "node_output_dim = 83\n";
    file << "history_length = 2\n";
    file << "forcing_dim = 20\n";
    file << "activation = silu                          # silu, gelu, relu, tanh\n";
    file << "use_layer_norm = true\n";
    file << "weight_init = linear                       # linear, xavier, kaiming, trunc_normal\n\n";

    file << "[DATA]\n";
    file << "mean_path = stats/mean_by_level.txt\n";
    file << "stddev_path = stats/stddev_by_level.txt\n";
    file << "stddev_diffs_path = stats/diffs_stddev_by_level.txt\n";
    file << "# forcing_mean_path = stats/forcing_mean.txt\n";
    file << "# forcing_stddev_path = stats/forcing_stddev.txt\n\n";

    file << "[NORMALIZATION]\n";
    file << "stddev_epsilon = 1e-8\n\n";

    file << "[EVAL]\n";
    file << "pretrained_model_path = weights/mmwf.ckpt\n";
    file << "batch_size = 1\n";
    file << "forecast_steps = 4\n";
    file << "output_prefix = forecast\n";

    file.close();
    std::cout << "Configuration template written to " << filename << std::endl;
}

} // namespace MMWF
