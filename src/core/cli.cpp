#include "chunkvault/core/cli.hpp"
#include "chunkvault/core/utils.hpp"
#include <charconv>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace chunkvault::core {

CommandLineParser::CommandLineParser(const std::string& program_name)
    : program_name_(program_name)
    , usage_(program_name + " [options]") {

    add_option("h", "help", "Show this help message");
    add_option("v", "version", "Show version information");
    add_option("c", "config", "Configuration file path", true);
    add_option("", "verbose", "Enable debug logging");
}

void CommandLineParser::add_option(const std::string& short_name, const std::string& long_name,
                                   const std::string& description, bool has_value,
                                   const std::string& default_value) {
    const std::string& key = long_name.empty() ? short_name : long_name;
    options_[key] = Option{short_name, description, has_value, default_value};
    if (!short_name.empty()) {
        aliases_[short_name] = key;
    }
}

bool CommandLineParser::parse(int argc, char* argv[]) {
    values_.clear();
    positional_args_.clear();
    error_.clear();

    int index = 1;
    while (index < argc) {
        std::string arg = argv[index];

        if (arg == "--") {
            positional_args_.insert(positional_args_.end(), argv + index + 1, argv + argc);
            break;
        }

        std::optional<int> consumed = index;
        if (arg.starts_with("--")) {
            consumed = parse_long(index, argc, argv);
        } else if (arg.size() > 1 && arg.front() == '-') {
            consumed = parse_short_group(index, argc, argv);
        } else {
            positional_args_.push_back(std::move(arg));
        }

        if (!consumed) {
            return false;
        }
        index = *consumed + 1;
    }
    return true;
}

std::optional<int> CommandLineParser::parse_long(int index, int argc, char* argv[]) {
    std::string body = std::string(argv[index]).substr(2);
    std::optional<std::string> inline_value;
    if (auto eq = body.find('='); eq != std::string::npos) {
        inline_value = body.substr(eq + 1);
        body.resize(eq);
    }

    auto it = options_.find(body);
    if (it == options_.end()) {
        error_ = "Unknown option: --" + body;
        return std::nullopt;
    }

    if (!it->second.has_value) {
        values_[body] = "true";
        return index;
    }
    if (inline_value) {
        values_[body] = *inline_value;
        return index;
    }
    if (index + 1 >= argc) {
        error_ = "Option --" + body + " requires a value";
        return std::nullopt;
    }
    values_[body] = argv[index + 1];
    return index + 1;
}

// -abc sets three flags; -p9400 and -p 9400 both give p a value.
std::optional<int> CommandLineParser::parse_short_group(int index, int argc, char* argv[]) {
    std::string group = std::string(argv[index]).substr(1);

    for (size_t pos = 0; pos < group.size(); ++pos) {
        std::string letter(1, group[pos]);
        auto alias = aliases_.find(letter);
        if (alias == aliases_.end()) {
            error_ = "Unknown option: -" + letter;
            return std::nullopt;
        }

        const std::string& key = alias->second;
        if (!options_.at(key).has_value) {
            values_[key] = "true";
            continue;
        }

        if (pos + 1 < group.size()) {
            values_[key] = group.substr(pos + 1);
            return index;
        }
        if (index + 1 >= argc) {
            error_ = "Option -" + letter + " requires a value";
            return std::nullopt;
        }
        values_[key] = argv[index + 1];
        return index + 1;
    }
    return index;
}

const std::string& CommandLineParser::resolve(const std::string& name) const {
    auto alias = aliases_.find(name);
    return alias == aliases_.end() ? name : alias->second;
}

bool CommandLineParser::has_option(const std::string& name) const {
    return values_.count(resolve(name)) > 0;
}

std::string CommandLineParser::get_option(const std::string& name, const std::string& default_value) const {
    const auto& key = resolve(name);
    if (auto it = values_.find(key); it != values_.end()) {
        return it->second;
    }
    if (auto it = options_.find(key); it != options_.end() && !it->second.default_value.empty()) {
        return it->second.default_value;
    }
    return default_value;
}

int CommandLineParser::get_int_option(const std::string& name, int default_value) const {
    auto text = get_option(name);
    int parsed = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (text.empty() || ec != std::errc() || end != text.data() + text.size()) {
        return default_value;
    }
    return parsed;
}

bool CommandLineParser::get_bool_option(const std::string& name, bool default_value) const {
    if (!has_option(name)) {
        return default_value;
    }
    auto value = utils::StringUtils::to_lower(get_option(name));
    return value.empty() || value == "true" || value == "1" || value == "yes" || value == "on";
}

void CommandLineParser::print_help() const {
    std::cout << "Usage: " << usage_ << "\n\nOptions:\n";

    for (const auto& [key, option] : options_) {
        std::ostringstream flags;
        if (!option.short_name.empty()) {
            flags << "-" << option.short_name;
            if (option.short_name != key) flags << ", ";
        }
        if (option.short_name != key) {
            flags << "--" << key;
        }
        if (option.has_value) {
            flags << " <value>";
        }

        std::cout << "  " << std::left << std::setw(28) << flags.str() << option.description;
        if (!option.default_value.empty()) {
            std::cout << " [" << option.default_value << "]";
        }
        std::cout << "\n";
    }
}

void CommandLineParser::print_version() const {
    std::cout << program_name_ << " " << CHUNKVAULT_VERSION << "\n";
}

}
