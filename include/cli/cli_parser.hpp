#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace hcodec {

// Small CLI parser:
//   --key value
//   --key=value
//   --flag (treated as "true")
// Anything else is kept as a positional argument.
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // true for "true", "1", "yes", "on"
    bool flag(const std::string& key) const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace hcodec
