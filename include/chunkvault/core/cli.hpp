#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault::core {

// Options shared by both binaries (help, version, config, verbose) are registered up front.
class CommandLineParser {
public:
    explicit CommandLineParser(const std::string& program_name);

    void add_option(const std::string& short_name, const std::string& long_name,
                    const std::string& description, bool has_value = false,
                    const std::string& default_value = "");

    void set_usage(const std::string& usage) { usage_ = usage; }

    bool parse(int argc, char* argv[]);

    bool has_option(const std::string& name) const;
    std::string get_option(const std::string& name, const std::string& default_value = "") const;
    int get_int_option(const std::string& name, int default_value = 0) const;
    bool get_bool_option(const std::string& name, bool default_value = false) const;

    const std::vector<std::string>& get_positional_args() const { return positional_args_; }
    const std::string& get_error() const { return error_; }

    void print_help() const;
    void print_version() const;

private:
    struct Option {
        std::string short_name;
        std::string description;
        bool has_value = false;
        std::string default_value;
    };

    // Both return the index of the last argv element consumed, or nullopt with error_ set.
    std::optional<int> parse_long(int index, int argc, char* argv[]);
    std::optional<int> parse_short_group(int index, int argc, char* argv[]);

    const std::string& resolve(const std::string& name) const;

    std::string program_name_;
    std::string usage_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> aliases_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positional_args_;
    std::string error_;
};

}
