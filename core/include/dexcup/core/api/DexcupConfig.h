#pragma once

#include <string>

namespace dexcup::core::api {

struct StorageConfig {
    std::string type = "memory";
    std::string directory = "data/tournaments";
};

struct LoggingConfig {
    int max_log_lines = 2000;
    bool echo_stderr = true;
};

// How a tournament is run: the Swiss phase, then an optional knockout cut.
struct FormatConfig {
    std::string format = "swiss-tournament";
    std::string playoff = "double-elimination";
    int playoff_cutoff = 16;
};

struct OutputConfig {
    std::string standings_csv = "out/standings.csv";
    std::string summary_json = "out/summary.json";
};

struct DexcupConfig {
    StorageConfig storage;
    LoggingConfig logging;
    FormatConfig format;
    OutputConfig output;

    static bool LoadFromFile(const std::string& path, DexcupConfig& config, std::string* error);
    static bool SaveToFile(const std::string& path, const DexcupConfig& config, std::string* error);
    static std::string ToJsonString(const DexcupConfig& config);
    static bool Validate(const DexcupConfig& config, std::string* error);
};

}  // namespace dexcup::core::api
