#include "hashcons/config_file.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace hashcons {

namespace {

bool isBlank(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view stripRight(std::string_view s) {
    while (!s.empty() && isBlank(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    entries_.clear();

    std::ifstream in(path);
    if (!in) {
        return false;
    }

    std::ostringstream text;
    text << in.rdbuf();
    parse(text.str());
    return true;
}

void ConfigFile::parse(std::string_view text) {
    entries_.clear();

    std::istringstream lines{std::string(text)};
    std::string line;
    size_t lineNum = 0;
    while (std::getline(lines, line)) {
        ++lineNum;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        Entry entry;
        entry.text = line;

        bool isComment = line.empty() || line.front() == '#' || isBlank(line.front());
        if (!isComment) {
            size_t colon = line.find(':');
            if (colon == std::string::npos) {
                std::cerr << "[ConfigFile] Line " << lineNum
                          << ": expected 'key: value', ignoring\n";
            } else {
                entry.key = std::string(stripRight(std::string_view(line).substr(0, colon)));
                entry.valueAt = colon + 1;
                while (entry.valueAt < line.size() && isBlank(line[entry.valueAt])) {
                    ++entry.valueAt;
                }
            }
        }

        entries_.push_back(std::move(entry));
    }
}

bool ConfigFile::save() const {
    auto dir = path_.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[ConfigFile] Cannot create directory " << dir
                      << ": " << ec.message() << '\n';
            return false;
        }
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        return false;
    }
    for (const auto& entry : entries_) {
        out << entry.text << '\n';
    }
    return out.good();
}

// Last occurrence wins, matching how the file reads top to bottom
const ConfigFile::Entry* ConfigFile::find(std::string_view key) const {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (!it->key.empty() && it->key == key) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<std::string_view> ConfigFile::value(std::string_view key) const {
    const Entry* entry = find(key);
    if (entry == nullptr) {
        return std::nullopt;
    }
    return stripRight(std::string_view(entry->text).substr(entry->valueAt));
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    auto v = value(key);
    if (!v) return defaultVal;
    if (*v == "true" || *v == "yes") return true;
    if (*v == "false" || *v == "no") return false;
    return defaultVal;
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    auto v = value(key);
    if (!v || v->empty()) {
        return defaultVal;
    }

    std::string digits(*v);
    int base = 10;
    if (digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        base = 16;
    }

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(digits.c_str(), &end, base);
    if (end != digits.c_str() + digits.size()) {
        return defaultVal;
    }
    if (errno == ERANGE) {
        std::cerr << "[ConfigFile] " << key << ": " << digits << " is out of range\n";
        return defaultVal;
    }
    return static_cast<int64_t>(parsed);
}

void ConfigFile::assign(std::string_view key, const std::string& value) {
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->key == key) {
            it->text.resize(it->valueAt);
            if (it->valueAt > 0 && it->text.back() == ':') {
                it->text += ' ';
                ++it->valueAt;
            }
            it->text += value;
            return;
        }
    }

    Entry entry;
    entry.key = std::string(key);
    entry.text = entry.key + ": " + value;
    entry.valueAt = entry.key.size() + 2;
    entries_.push_back(std::move(entry));
}

void ConfigFile::set(std::string_view key, bool value) {
    assign(key, value ? "true" : "false");
}

void ConfigFile::set(std::string_view key, int64_t value) {
    assign(key, std::to_string(value));
}

}  // namespace hashcons
