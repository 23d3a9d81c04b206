#pragma once

#include "dgaconf/v1/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dgaconf::v1 {

// =============================================================================
// Enumerations
// =============================================================================

enum class LatticeType {
    FromWannier90,   // real-space hopping from a wannier_hr.dat file
    FromWannierHK,   // H(k) on a mesh from a wannier .hk file
    TTpTpp           // single-band 2D tight binding [t, tp, tpp]
};

enum class InteractionType {
    LocalFromDmft,
    KanamoriFromDmft,
    Kanamori,
    Custom
};

enum class MixingStrategy {
    Linear,
    Pulay
};

enum class DmftInputType {
    W2dyn
};

enum class LambdaCorrectionType {
    Sp,     // magnetic channel only
    Spch    // density and magnetic channel
};

enum class GapSymmetry {
    PWaveX,
    PWaveY,
    DWave,
    Random
};

[[nodiscard]] const char* to_string(LatticeType type) noexcept;
[[nodiscard]] const char* to_string(InteractionType type) noexcept;
[[nodiscard]] const char* to_string(MixingStrategy strategy) noexcept;
[[nodiscard]] const char* to_string(DmftInputType type) noexcept;
[[nodiscard]] const char* to_string(LambdaCorrectionType type) noexcept;
[[nodiscard]] const char* to_string(GapSymmetry symmetry) noexcept;

// Parsers accept any case and treat '-' and '_' alike.
[[nodiscard]] std::optional<LatticeType> parse_lattice_type(std::string_view raw);
[[nodiscard]] std::optional<InteractionType> parse_interaction_type(std::string_view raw);
[[nodiscard]] std::optional<MixingStrategy> parse_mixing_strategy(std::string_view raw);
[[nodiscard]] std::optional<DmftInputType> parse_dmft_input_type(std::string_view raw);
[[nodiscard]] std::optional<LambdaCorrectionType> parse_lambda_correction_type(std::string_view raw);
[[nodiscard]] std::optional<GapSymmetry> parse_gap_symmetry(std::string_view raw);

// =============================================================================
// Sections
// =============================================================================

// Either a file path or a literal list of numbers, depending on the
// selected lattice/interaction type.
using LatticeInput = std::variant<std::string, std::vector<Real>>;

[[nodiscard]] inline bool is_path(const LatticeInput& input) {
    return std::holds_alternative<std::string>(input);
}

[[nodiscard]] inline bool is_numeric_list(const LatticeInput& input) {
    return std::holds_alternative<std::vector<Real>>(input);
}

struct BoxSizes {
    int niw_core = kUnset;  // bosonic frequencies taken from G2, -1: all
    int niv_core = kUnset;  // fermionic frequencies taken from G2, -1: all
    int niv_shell = 0;      // asymptotic shell, 0: none
};

struct LatticeConfig {
    // Preset name ("two_dimensional_square", "none", ...) or explicit list
    // of symmetry operations ("x-inv", "x-y-sym", ...).
    std::variant<std::string, std::vector<std::string>> symmetries = std::string("two_dimensional_square");
    LatticeType type = LatticeType::TTpTpp;
    LatticeInput hr_input = std::string();
    InteractionType interaction_type = InteractionType::LocalFromDmft;
    LatticeInput interaction_input = std::string();
    MeshSize nk{16, 16, 1};
    std::optional<MeshSize> nq;  // unset: same as nk
};

struct SelfConsistencyConfig {
    int max_iter = 20;
    bool save_iter = true;
    Real epsilon = 1e-4;
    Real mixing = 0.3;
    MixingStrategy mixing_strategy = MixingStrategy::Linear;
    int mixing_history_length = 2;
    std::string previous_sc_path;  // empty: fresh start
};

struct DmftInputConfig {
    DmftInputType type = DmftInputType::W2dyn;
    std::string input_path = "./";
    std::string fname_1p = "1p-data.hdf5";
    std::string fname_2p = "g4iw_sym.hdf5";
    bool do_sym_v_vp = true;
};

struct LambdaCorrectionConfig {
    bool perform_lambda_correction = false;
    LambdaCorrectionType type = LambdaCorrectionType::Sp;
};

struct EliashbergConfig {
    bool perform_eliashberg = false;
    bool save_pairing_vertex = false;
    bool save_fq = false;
    int n_eig = 4;
    Real epsilon = 1e-12;
    GapSymmetry symmetry = GapSymmetry::Random;
    bool include_local_part = false;
    std::string subfolder_name = "Eliashberg";
};

struct PolyFittingConfig {
    bool do_poly_fitting = false;
    int n_fit = kUnset;  // -1: niv_core + 40
    int o_fit = 8;
};

struct OutputConfig {
    std::string output_path;  // empty: DMFT input folder
    bool do_plotting = true;
    bool save_quantities = true;
    std::string plotting_subfolder_name = "Plots";
};

struct DgaConfig {
    BoxSizes box;
    LatticeConfig lattice;
    SelfConsistencyConfig self_consistency;
    DmftInputConfig dmft;
    LambdaCorrectionConfig lambda_correction;
    EliashbergConfig eliashberg;
    PolyFittingConfig poly_fitting;
    OutputConfig output;

    // q-mesh with the "same as nk" fallback applied
    [[nodiscard]] MeshSize effective_nq() const { return lattice.nq.value_or(lattice.nk); }
};

// Extra fitting frequencies added to niv_core when n_fit is left at -1
inline constexpr int kPolyFitPadding = 40;

/// Absolute, normalized form of `path`; relative paths are taken relative
/// to `base`. An empty path stays empty.
[[nodiscard]] std::filesystem::path resolve_path(const std::filesystem::path& base,
                                                 const std::filesystem::path& path);

}  // namespace dgaconf::v1
