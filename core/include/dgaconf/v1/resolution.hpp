#pragma once

#include "dgaconf/v1/brillouin_zone.hpp"
#include "dgaconf/v1/config.hpp"
#include "dgaconf/v1/frequency_box.hpp"
#include "dgaconf/v1/hamiltonian.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace dgaconf::v1 {

/// What the caller knows beyond the YAML document.
struct ResolveContext {
    AvailableFrequencies available;
    int n_bands = kUnset;  // from the DMFT data, kUnset if not known
    std::filesystem::path base_directory = ".";
    // Read the headers of hr/umatrix/hk input files to learn the band count
    bool inspect_inputs = false;
};

struct GridSummary {
    MeshSize n{0, 0, 0};
    int n_tot = 0;
    int n_irr = 0;
};

struct ResolvedPaths {
    std::filesystem::path hr_input;           // empty for t_tp_tpp
    std::filesystem::path interaction_input;  // custom interaction only
    std::filesystem::path input_path;
    std::filesystem::path file_1p;
    std::filesystem::path file_2p;
    std::filesystem::path previous_sc;
    std::filesystem::path output;
    std::filesystem::path eliashberg;
    std::filesystem::path plots;
};

struct ResolvedConfig {
    // Input with every derivable sentinel replaced
    DgaConfig config;

    FrequencyBox box;
    int n_fit = kUnset;
    int n_bands = kUnset;

    std::vector<KnownSymmetry> symmetries;
    GridSummary k_grid;
    GridSummary q_grid;

    std::optional<std::array<Real, 3>> hopping;  // [t, tp, tpp]
    std::optional<KanamoriParameters> kanamori;
    std::optional<FrequencyBox> pairing_box;     // Eliashberg pp-channel box

    ResolvedPaths paths;

    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] bool ok() const { return errors.empty(); }
};

/// Turns a parsed configuration into the concrete values consumed by the
/// calculation. Validation runs first; resolution stops at its errors.
class ConfigResolver {
public:
    explicit ConfigResolver(ResolveContext context = {});

    [[nodiscard]] const ResolveContext& context() const { return context_; }

    [[nodiscard]] ResolvedConfig resolve(const DgaConfig& config) const;

private:
    ResolveContext context_;

    void resolve_box(ResolvedConfig& out) const;
    void resolve_lattice(ResolvedConfig& out) const;
    void resolve_bands(ResolvedConfig& out) const;
    void resolve_paths(ResolvedConfig& out) const;

    [[nodiscard]] std::optional<int> inspect_band_count(const ResolvedConfig& out,
                                                        std::vector<std::string>& errors) const;
};

}  // namespace dgaconf::v1
