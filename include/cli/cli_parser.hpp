#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace hufz {

// Very small CLI parser:
//   --key value
//   --flag (treated as "true")
// A repeated key keeps every value; get() returns the last one.
class CliParser {
public:
    void parse(int argc, char** argv);
    bool has(const std::string& key) const;
    std::string get(const std::string& key, const std::string& def = "") const;
    std::vector<std::string> get_all(const std::string& key) const;
private:
    std::unordered_map<std::string, std::vector<std::string>> kv_;
};

} // namespace hufz
