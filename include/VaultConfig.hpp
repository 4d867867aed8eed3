#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <spdlog/common.h>

// Runtime settings for the console front end.
// Precedence: built-in defaults < LEDGER_* environment < command-line flags.
struct VaultConfig {
    std::string dbPath  = "data/ledger.sqlite";
    std::string logPath = "data/ledger.log";
    spdlog::level::level_enum logLevel = spdlog::level::info;
    double matchThreshold = 0.6;      // face_recognition's default tolerance
    std::size_t encodingDim = 128;
    bool showHelp = false;
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

// args excludes the program name. Throws std::invalid_argument naming the
// offending flag or variable.
VaultConfig loadConfig(const std::vector<std::string>& args, const EnvLookup& env);

std::string configUsage(const std::string& program);
