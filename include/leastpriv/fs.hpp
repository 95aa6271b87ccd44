/*
 * leastpriv filesystem helpers
 *
 * Small inline wrappers over std::ifstream / std::ofstream used by the
 * document loaders and the command-line tool.
 */

#pragma once

#include <fstream>
#include <optional>
#include <sstream>
#include <string>

namespace leastpriv {
namespace fs {

/**
 * Read an entire file as a string.
 */
inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Write string to file, replacing any previous content.
 */
inline bool write_file(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        return false;
    }
    file << content;
    return static_cast<bool>(file);
}

} // namespace fs
} // namespace leastpriv
