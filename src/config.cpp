#include "hashcons/config.hpp"

#include <iostream>
#include <mutex>

namespace hashcons {

namespace {

constexpr const char* KEY_DEBUG_LOGGING = "debug.logging";
constexpr const char* KEY_BUCKET_RESERVE = "store.bucket_reserve";

size_t clampReserve(int64_t requested) {
    if (requested < 0) {
        std::cerr << "[InternConfig] " << KEY_BUCKET_RESERVE
                  << " must not be negative, using 0\n";
        return 0;
    }
    if (static_cast<uint64_t>(requested) > InternConfig::MAX_BUCKET_RESERVE) {
        std::cerr << "[InternConfig] " << KEY_BUCKET_RESERVE << " " << requested
                  << " exceeds " << InternConfig::MAX_BUCKET_RESERVE << ", capping\n";
        return InternConfig::MAX_BUCKET_RESERVE;
    }
    return static_cast<size_t>(requested);
}

}  // namespace

InternConfig& InternConfig::instance() {
    static InternConfig instance;
    return instance;
}

InternConfig::InternConfig() {
    setDefaults();
}

void InternConfig::setDefaults() {
    file_ = ConfigFile{};
    debugLogging_ = false;
    bucketReserve_ = 0;
}

bool InternConfig::init(const std::filesystem::path& configPath) {
    std::unique_lock lock(mutex_);

    setDefaults();
    initialized_ = true;

    if (!std::filesystem::exists(configPath)) {
        // load() still records the path, so save() can create the file
        static_cast<void>(file_.load(configPath));
        return false;
    }

    if (!file_.load(configPath)) {
        std::cerr << "[InternConfig] Cannot open file: " << configPath << '\n';
        return false;
    }

    debugLogging_ = file_.getBool(KEY_DEBUG_LOGGING, false);

    bucketReserve_ = clampReserve(file_.getInt(KEY_BUCKET_RESERVE, 0));

    return true;
}

bool InternConfig::isInitialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

bool InternConfig::save() {
    std::unique_lock lock(mutex_);
    if (!initialized_) return false;

    file_.set(KEY_DEBUG_LOGGING, debugLogging_);
    file_.set(KEY_BUCKET_RESERVE, static_cast<int64_t>(bucketReserve_));
    if (!file_.save()) {
        std::cerr << "[InternConfig] Failed to write " << file_.path() << '\n';
        return false;
    }
    return true;
}

void InternConfig::reset() {
    std::unique_lock lock(mutex_);
    setDefaults();
    initialized_ = false;
}

bool InternConfig::debugLogging() const {
    std::shared_lock lock(mutex_);
    return debugLogging_;
}

void InternConfig::setDebugLogging(bool enabled) {
    std::unique_lock lock(mutex_);
    debugLogging_ = enabled;
}

size_t InternConfig::bucketReserve() const {
    std::shared_lock lock(mutex_);
    return bucketReserve_;
}

void InternConfig::setBucketReserve(size_t count) {
    if (count > MAX_BUCKET_RESERVE) {
        std::cerr << "[InternConfig] bucket reserve " << count
                  << " exceeds " << MAX_BUCKET_RESERVE << ", capping\n";
        count = MAX_BUCKET_RESERVE;
    }
    std::unique_lock lock(mutex_);
    bucketReserve_ = count;
}

}  // namespace hashcons
