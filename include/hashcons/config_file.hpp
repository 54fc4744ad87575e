#pragma once

/**
 * @file config_file.hpp
 * @brief Settings file read and written by InternConfig
 */

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hashcons {

// ============================================================================
// ConfigFile - "key: value" settings with comments kept on save
// ============================================================================
//
//   # interner settings
//   debug.logging: true
//   store.bucket_reserve: 256
//
// '#' lines and blank lines are written back unchanged. Setting an existing
// key rewrites its value in place; a new key is appended.
//
// Thread-safety: NOT thread-safe. InternConfig serializes access.
//
class ConfigFile {
public:
    ConfigFile() = default;

    // Returns false if the file can't be read. The path is remembered either
    // way so save() can create it.
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Replace the contents with text (path unchanged)
    void parse(std::string_view text);

    // Creates parent directories if needed
    [[nodiscard]] bool save() const;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // true/yes or false/no, otherwise defaultVal
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal) const;

    // Decimal or 0x-prefixed hex. Missing, malformed and out-of-range
    // values give defaultVal.
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal) const;

    void set(std::string_view key, bool value);
    void set(std::string_view key, int64_t value);

private:
    struct Entry {
        std::string text;    // Full line as written
        std::string key;     // Empty for comments and blank lines
        size_t valueAt = 0;  // Offset of the value within text
    };

    [[nodiscard]] const Entry* find(std::string_view key) const;
    [[nodiscard]] std::optional<std::string_view> value(std::string_view key) const;
    void assign(std::string_view key, const std::string& value);

    std::filesystem::path path_;
    std::vector<Entry> entries_;
};

}  // namespace hashcons
