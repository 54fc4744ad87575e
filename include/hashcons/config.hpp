#pragma once

/**
 * @file config.hpp
 * @brief Runtime settings for the intern store
 */

#include "hashcons/config_file.hpp"

#include <cstddef>
#include <filesystem>
#include <shared_mutex>

namespace hashcons {

// ============================================================================
// InternConfig - Global interner configuration
// ============================================================================
//
// Config file format (key: value pairs):
//   debug.logging: true
//   store.bucket_reserve: 256
//
// Settings are read when a partition is created (bucket_reserve) and on
// every gc() (debug.logging). Changing them never affects existing slots.
//
// Thread safety: All public methods are thread-safe.
//
class InternConfig {
public:
    // Larger store.bucket_reserve values are capped to this
    static constexpr size_t MAX_BUCKET_RESERVE = size_t{1} << 20;

    static InternConfig& instance();

    // Load settings from configPath. Missing file keeps defaults and
    // returns false; save() will create it.
    bool init(const std::filesystem::path& configPath);

    [[nodiscard]] bool isInitialized() const;

    bool save();

    // Reset to defaults and forget the file (for testing)
    void reset();

    // Log gc passes and partition creation to stderr
    [[nodiscard]] bool debugLogging() const;
    void setDebugLogging(bool enabled);

    // Initial hash-table capacity for newly created buckets,
    // at most MAX_BUCKET_RESERVE
    [[nodiscard]] size_t bucketReserve() const;
    void setBucketReserve(size_t count);

    InternConfig(const InternConfig&) = delete;
    InternConfig& operator=(const InternConfig&) = delete;

private:
    InternConfig();

    void setDefaults();

    mutable std::shared_mutex mutex_;
    ConfigFile file_;
    bool initialized_ = false;
    bool debugLogging_ = false;
    size_t bucketReserve_ = 0;
};

}  // namespace hashcons
