#pragma once

#include "dgaconf/v1/config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dgaconf::v1 {

struct ValidationOptions {
    // Require referenced input files and folders to exist
    bool check_paths = false;
    // Anchor for relative paths when check_paths is set
    std::filesystem::path base_directory = ".";
    // Band count known from elsewhere (DMFT data, input file), kUnset if not
    int n_bands = kUnset;
};

struct ValidationReport {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

/// First entry of a Kanamori `interaction_input` list as a band count.
/// Empty unless it is a whole number between 1 and INT_MAX.
[[nodiscard]] std::optional<int> kanamori_band_count(const LatticeConfig& lattice);

/// Band count implied by the configuration alone: the first entry of a
/// Kanamori list, or 1 for the single-band tight-binding lattice.
[[nodiscard]] std::optional<int> configured_band_count(const DgaConfig& config);

/// Cross-field and range checks that must pass before any consumer runs.
[[nodiscard]] ValidationReport validate_config(const DgaConfig& config, const ValidationOptions& options = {});

}  // namespace dgaconf::v1
