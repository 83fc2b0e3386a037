#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace rro {

// Compile with the modern encoding even when the compiler rejects resource types
inline constexpr const char* PREF_FORCE_NEW_COMPILER = "force_new_compiler";

// ============================================================================
// Preferences (key/value lookup)
// ============================================================================

class Preferences {
public:
    virtual ~Preferences() = default;

    virtual bool get_boolean(const std::string& key, bool default_value) const = 0;
};

class MapPreferences : public Preferences {
public:
    MapPreferences() = default;
    explicit MapPreferences(std::unordered_map<std::string, bool> values)
        : values_(std::move(values)) {}

    void set_boolean(const std::string& key, bool value) { values_[key] = value; }

    bool get_boolean(const std::string& key, bool default_value) const override {
        auto it = values_.find(key);
        return it != values_.end() ? it->second : default_value;
    }

private:
    std::unordered_map<std::string, bool> values_;
};

} // namespace rro
