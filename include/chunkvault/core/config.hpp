#pragma once

#include <fstream>
#include <map>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace chunkvault::core {

// Process-wide key=value settings.
// Precedence is defaults < file < environment < explicit set().
class Config {
public:
    static Config& instance();

    bool load_from_file(const std::string& filename);
    bool save_to_file(const std::string& filename) const;

    // Maps CHUNKVAULT_<SECTION>_<NAME> style variables onto known keys.
    size_t load_from_environment();

    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;

    template<typename T>
    std::optional<T> get_as(const std::string& key) const {
        auto value = get(key);
        if (!value) return std::nullopt;

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result) || !iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    bool get_bool(const std::string& key, bool default_value = false) const;
    int get_int(const std::string& key, int default_value = 0) const;
    uint64_t get_uint64(const std::string& key, uint64_t default_value = 0) const;
    double get_double(const std::string& key, double default_value = 0.0) const;
    std::string get_string(const std::string& key, const std::string& default_value = "") const;

    void set_defaults();
    void clear();

private:
    Config() = default;

    std::string trim(const std::string& str) const;

    std::map<std::string, std::string> values_;
    mutable std::mutex mutex_;
};

}
