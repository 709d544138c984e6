#pragma once

#include <iosfwd>
#include <string>
#include <map>
#include <mutex>
#include <optional>
#include "s3meter/common/noncopyable.h"

namespace s3meter {
namespace common {

// INI-style settings: "[section]" headers, "key = value" lines, '#' or ';' comments.
// Keys before the first section header belong to "global".
class Config : noncopyable {
public:
    static Config& Instance();

    Config() = default;

    bool Load(const std::string& filename);
    // Parse INI text into in-memory settings (does not change loaded filename).
    bool LoadFromString(const std::string& iniText);
    void Clear();

    void SetString(const std::string& section, const std::string& key, const std::string& value);

    std::optional<std::string> LoadedFilename() const;

    // Get value as string, return default if not found
    std::string GetString(const std::string& section, const std::string& key, const std::string& defaultVal = "") const;

    // Environment variable (when set and non-empty) overrides the INI value.
    std::string GetStringEnv(const std::string& section, const std::string& key,
                             const char* envName, const std::string& defaultVal = "") const;

    int GetInt(const std::string& section, const std::string& key, int defaultVal = 0) const;

    // "1", "true", "yes", "on" (any case) are true; "0", "false", "no", "off" are false.
    bool GetBool(const std::string& section, const std::string& key, bool defaultVal = false) const;

private:
    using Settings = std::map<std::string, std::map<std::string, std::string>>;

    static std::string Trim(const std::string& s);
    static Settings Parse(std::istream& in);

    mutable std::mutex mutex_;
    Settings settings_;
    std::string loadedFilename_;
};

} // namespace common
} // namespace s3meter
