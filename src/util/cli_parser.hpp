#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace epitizer {

// Command-line parser for "-key value", "--key=value" and bare "-flag" arguments.
// Repeated keys keep every value in order.
class CliParser {
public:
    CliParser(int argc, char* argv[]);

    // Check if a flag/option is present.
    bool has(const std::string& key) const;

    // Last value given for key, or default_val if absent.
    std::string get_string(const std::string& key,
                           const std::string& default_val = {}) const;

    // All values given for key, in command-line order.
    std::vector<std::string> get_strings(const std::string& key) const;

    // Integer value for key. Returns default_val if absent or not a number.
    int get_int(const std::string& key, int default_val = 0) const;

    const std::string& program() const { return program_; }

    // Arguments not consumed as an option value.
    const std::vector<std::string>& positional() const { return positional_; }

private:
    std::string program_;
    std::unordered_map<std::string, std::vector<std::string>> opts_;
    std::vector<std::string> positional_;
};

} // namespace epitizer
