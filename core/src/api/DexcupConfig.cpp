#include "dexcup/core/api/DexcupConfig.h"

#include "dexcup/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace dexcup::core::api {

namespace {

bool LoadJson(const std::string& path, nlohmann::json& config, std::string* error) {
    std::ifstream input(path);
    if (!input) {
        if (error) {
            *error = "Failed to open config: " + path;
        }
        return false;
    }
    try {
        input >> config;
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse JSON: ") + ex.what();
        }
        return false;
    }
    return true;
}

bool IsPowerOfTwo(int value) {
    return value > 0 && (value & (value - 1)) == 0;
}

nlohmann::json ToJson(const DexcupConfig& config) {
    nlohmann::json root;
    root["storage"] = {
        {"type", config.storage.type},
        {"directory", config.storage.directory},
    };
    root["logging"] = {
        {"max_log_lines", config.logging.max_log_lines},
        {"echo_stderr", config.logging.echo_stderr},
    };
    root["format"] = {
        {"format", config.format.format},
        {"playoff", config.format.playoff},
        {"playoff_cutoff", config.format.playoff_cutoff},
    };
    root["output"] = {
        {"standings_csv", config.output.standings_csv},
        {"summary_json", config.output.summary_json},
    };
    return root;
}

}  // namespace

bool DexcupConfig::LoadFromFile(const std::string& path, DexcupConfig& config, std::string* error) {
    nlohmann::json root;
    if (!LoadJson(path, root, error)) {
        return false;
    }

    config = DexcupConfig{};

    try {
        if (root.contains("storage")) {
            const auto& node = root.at("storage");
            config.storage.type = node.value("type", config.storage.type);
            config.storage.directory = node.value("directory", config.storage.directory);
        }

        if (root.contains("logging")) {
            const auto& node = root.at("logging");
            config.logging.max_log_lines = node.value("max_log_lines", config.logging.max_log_lines);
            config.logging.echo_stderr = node.value("echo_stderr", config.logging.echo_stderr);
        }

        if (root.contains("format")) {
            const auto& node = root.at("format");
            config.format.format = node.value("format", config.format.format);
            config.format.playoff = node.value("playoff", config.format.playoff);
            config.format.playoff_cutoff = node.value("playoff_cutoff", config.format.playoff_cutoff);
        }

        if (root.contains("output")) {
            const auto& node = root.at("output");
            config.output.standings_csv = node.value("standings_csv", config.output.standings_csv);
            config.output.summary_json = node.value("summary_json", config.output.summary_json);
        }
    } catch (const nlohmann::json::exception& ex) {
        if (error) {
            *error = std::string("Invalid config value: ") + ex.what();
        }
        return false;
    }

    return Validate(config, error);
}

bool DexcupConfig::SaveToFile(const std::string& path, const DexcupConfig& config, std::string* error) {
    return util::AtomicFileWriter::Write(path, ToJson(config).dump(2), error);
}

std::string DexcupConfig::ToJsonString(const DexcupConfig& config) {
    return ToJson(config).dump(2);
}

bool DexcupConfig::Validate(const DexcupConfig& config, std::string* error) {
    std::string problem;
    if (config.storage.type != "memory" && config.storage.type != "json_dir") {
        problem = "storage.type must be 'memory' or 'json_dir', got '" + config.storage.type + "'";
    } else if (config.storage.type == "json_dir" && config.storage.directory.empty()) {
        problem = "storage.directory is required for json_dir storage";
    } else if (config.logging.max_log_lines <= 0) {
        problem = "logging.max_log_lines must be positive";
    } else if (config.format.format != "swiss-tournament") {
        problem = "Unsupported tournament format: '" + config.format.format + "'";
    } else if (!config.format.playoff.empty() && config.format.playoff != "single-elimination" &&
               config.format.playoff != "double-elimination") {
        problem = "format.playoff must be 'single-elimination' or 'double-elimination', got '" +
                  config.format.playoff + "'";
    } else if (!config.format.playoff.empty() &&
               (config.format.playoff_cutoff < 2 || !IsPowerOfTwo(config.format.playoff_cutoff))) {
        std::ostringstream out;
        out << "format.playoff_cutoff must be a power of two of at least 2, got " << config.format.playoff_cutoff;
        problem = out.str();
    } else if (config.format.playoff == "double-elimination" && config.format.playoff_cutoff != 16) {
        std::ostringstream out;
        out << "Double elimination requires a playoff_cutoff of 16, got " << config.format.playoff_cutoff;
        problem = out.str();
    }

    if (problem.empty()) {
        return true;
    }
    if (error) {
        *error = problem;
    }
    return false;
}

}  // namespace dexcup::core::api
