#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace satish {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
//   anything else is positional
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    // Present and not "false"/"0".
    bool flag(const std::string& key) const;
    const std::vector<std::string>& positional() const { return positional_; }
private:
    std::unordered_map<std::string, std::string> kv_;
    std::vector<std::string> positional_;
};

} // namespace satish
