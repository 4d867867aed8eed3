#include "VaultConfig.hpp"

#include <cmath>
#include <stdexcept>

namespace {
    double parse_threshold(const std::string& key, const std::string& v) {
        std::size_t used = 0;
        double d = 0.0;
        try {
            d = std::stod(v, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used != v.size() || !std::isfinite(d) || d <= 0.0) {
            throw std::invalid_argument(key + ": expected a positive number, got '" + v + "'");
        }
        return d;
    }

    std::size_t parse_dim(const std::string& key, const std::string& v) {
        std::size_t used = 0;
        unsigned long n = 0;
        try {
            n = std::stoul(v, &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        if (used != v.size() || v.empty() || v[0] == '-' || n == 0) {
            throw std::invalid_argument(key + ": expected a positive integer, got '" + v + "'");
        }
        return static_cast<std::size_t>(n);
    }

    spdlog::level::level_enum parse_level(const std::string& key, const std::string& v) {
        auto lvl = spdlog::level::from_str(v);
        // from_str maps unknown names to "off"
        if (lvl == spdlog::level::off && v != "off") {
            throw std::invalid_argument(key + ": unknown log level '" + v + "'");
        }
        return lvl;
    }

    void apply(VaultConfig& cfg, const std::string& key, const std::string& name,
               const std::string& value) {
        if (name == "db") {
            if (value.empty()) throw std::invalid_argument(key + ": path must not be empty");
            cfg.dbPath = value;
        } else if (name == "log") {
            if (value.empty()) throw std::invalid_argument(key + ": path must not be empty");
            cfg.logPath = value;
        } else if (name == "log-level") {
            cfg.logLevel = parse_level(key, value);
        } else if (name == "threshold") {
            cfg.matchThreshold = parse_threshold(key, value);
        } else if (name == "dim") {
            cfg.encodingDim = parse_dim(key, value);
        }
    }
}

VaultConfig loadConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    VaultConfig cfg;

    static const struct { const char* var; const char* name; } kEnv[] = {
        { "LEDGER_DB_PATH",         "db" },
        { "LEDGER_LOG_PATH",        "log" },
        { "LEDGER_LOG_LEVEL",       "log-level" },
        { "LEDGER_MATCH_THRESHOLD", "threshold" },
        { "LEDGER_ENCODING_DIM",    "dim" },
    };
    if (env) {
        for (const auto& e : kEnv) {
            if (const char* v = env(e.var)) apply(cfg, e.var, e.name, v);
        }
    }

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "-h" || a == "--help") {
            cfg.showHelp = true;
            continue;
        }
        if (a != "--db" && a != "--log" && a != "--log-level" &&
            a != "--threshold" && a != "--dim") {
            throw std::invalid_argument("unknown option '" + a + "'");
        }
        if (i + 1 >= args.size()) {
            throw std::invalid_argument(a + ": missing value");
        }
        apply(cfg, a, a.substr(2), args[++i]);
    }
    return cfg;
}

std::string configUsage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "  --db PATH          SQLite vault file (LEDGER_DB_PATH, default data/ledger.sqlite)\n"
           "  --log PATH         log file (LEDGER_LOG_PATH, default data/ledger.log)\n"
           "  --log-level LEVEL  trace|debug|info|warn|error|critical|off (LEDGER_LOG_LEVEL)\n"
           "  --threshold X      face match distance threshold (LEDGER_MATCH_THRESHOLD, default 0.6)\n"
           "  --dim N            face encoding dimension (LEDGER_ENCODING_DIM, default 128)\n"
           "  -h, --help         show this help\n";
}
