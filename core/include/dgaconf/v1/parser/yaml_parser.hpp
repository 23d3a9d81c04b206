#pragma once

#include "dgaconf/v1/config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dgaconf::v1::parser {

struct YamlParserOptions {
    bool strict = true;  // Unknown fields are errors instead of warnings
};

class YamlParser {
public:
    explicit YamlParser(YamlParserOptions options = {});

    // Parse from file
    DgaConfig load(const std::filesystem::path& path);

    // Parse from string
    DgaConfig load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }
    [[nodiscard]] bool has_errors() const { return !errors_.empty(); }

private:
    YamlParserOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, DgaConfig& config);
};

}  // namespace dgaconf::v1::parser
