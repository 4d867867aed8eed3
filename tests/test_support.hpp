#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <cstdint>

// Throwaway SQLite file in the working directory; removed before and after.
struct TempDbFile {
    std::string path;

    explicit TempDbFile(std::string p) : path(std::move(p)) { cleanup(); }
    ~TempDbFile() { cleanup(); }

    void cleanup() const {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        std::filesystem::remove(path + "-journal", ec);
    }
};

inline std::vector<std::uint8_t> toBytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}
