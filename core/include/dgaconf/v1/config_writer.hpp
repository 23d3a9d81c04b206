#pragma once

#include "dgaconf/v1/config.hpp"
#include "dgaconf/v1/resolution.hpp"

#include <filesystem>
#include <string>

namespace dgaconf::v1 {

/// Canonical YAML document with every field spelled out. Loading it back
/// with the parser yields an equal configuration.
[[nodiscard]] std::string write_yaml(const DgaConfig& config);

/// Resolved configuration followed by a `derived` section (band count,
/// k/q grid sizes, absolute paths, pairing box). The extra section is
/// reported as unknown by a strict parser.
[[nodiscard]] std::string write_yaml(const ResolvedConfig& resolved);

/// Write `content` to `path`, creating parent folders. Throws
/// std::runtime_error when the file cannot be written.
void write_text_file(const std::filesystem::path& path, const std::string& content);

}  // namespace dgaconf::v1
