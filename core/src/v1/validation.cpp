#include "dgaconf/v1/validation.hpp"
#include "dgaconf/v1/brillouin_zone.hpp"
#include "dgaconf/v1/diagnostics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <system_error>

namespace dgaconf::v1 {

namespace {

using Diagnostics = std::vector<std::string>;

std::string mesh_to_string(const MeshSize& mesh) {
    return "[" + std::to_string(mesh[0]) + ", " + std::to_string(mesh[1]) + ", " +
           std::to_string(mesh[2]) + "]";
}

// Whole number in [1, INT_MAX], safe to cast to int
bool is_positive_integer(Real value) {
    return std::isfinite(value) && value >= 1.0 && value <= static_cast<Real>(std::numeric_limits<int>::max()) &&
           std::floor(value) == value;
}

bool all_finite(const std::vector<Real>& values) {
    return std::all_of(values.begin(), values.end(), [](Real v) { return std::isfinite(v); });
}

bool is_blank(const LatticeInput& input) {
    if (const auto* path = std::get_if<std::string>(&input)) {
        return path->empty();
    }
    return std::get<std::vector<Real>>(input).empty();
}

void check_range(bool ok, const std::string& message, Diagnostics& errors) {
    if (!ok) {
        push_error(errors, diag::kRange, message);
    }
}

void check_box(const BoxSizes& box, Diagnostics& errors) {
    check_range(box.niw_core >= kUnset,
                "box_sizes.niw_core must be -1 (all) or >= 0, got " + std::to_string(box.niw_core), errors);
    check_range(box.niv_core == kUnset || box.niv_core > 0,
                "box_sizes.niv_core must be -1 (all) or > 0, got " + std::to_string(box.niv_core), errors);
    check_range(box.niv_shell >= 0,
                "box_sizes.niv_shell must be >= 0, got " + std::to_string(box.niv_shell), errors);
}

void check_mesh(const MeshSize& mesh, const char* name, Diagnostics& errors) {
    const bool positive = std::all_of(mesh.begin(), mesh.end(), [](int n) { return n > 0; });
    check_range(positive, std::string("lattice.") + name + " entries must be > 0, got " + mesh_to_string(mesh),
                errors);
    if (positive && mesh_point_count(mesh) > kMaxMeshPoints) {
        push_error(errors, diag::kRange,
                   std::string("lattice.") + name + " " + mesh_to_string(mesh) + " holds " +
                       std::to_string(mesh_point_count(mesh)) + " points, at most " +
                       std::to_string(kMaxMeshPoints) + " are supported");
    }
}

void check_symmetries(const DgaConfig& config, Diagnostics& errors, Diagnostics& warnings) {
    std::string offending;
    const auto group = expand_symmetries(config.lattice.symmetries, offending);
    if (!group) {
        push_error(errors, diag::kSymmetryUnknown,
                   "Unknown lattice symmetry '" + offending +
                       "' (presets: two_dimensional_square, two_dimensional_nematic, "
                       "quasi_one_dimensional_square, quasi_two_dimensional_square, "
                       "simultaneous_x_y_inversion, none; operations: x-inv, y-inv, z-inv, x-y-sym, x-y-inv)");
        return;
    }
    if (std::find(group->begin(), group->end(), KnownSymmetry::XYSym) == group->end()) {
        return;
    }
    const std::pair<const char*, MeshSize> meshes[] = {{"nk", config.lattice.nk}, {"nq", config.effective_nq()}};
    for (const auto& [name, mesh] : meshes) {
        if (mesh[0] != mesh[1]) {
            push_warning(warnings, diag::kMeshSymmetry,
                         std::string("x-y-sym is skipped on the non-square lattice.") + name + " " +
                             mesh_to_string(mesh));
        }
    }
}

void check_hopping_input(const LatticeConfig& lattice, Diagnostics& errors) {
    if (lattice.type == LatticeType::TTpTpp) {
        const auto* params = std::get_if<std::vector<Real>>(&lattice.hr_input);
        if (!params || params->size() != 3) {
            push_error(errors, diag::kHoppingInput,
                       "lattice.type 't_tp_tpp' requires lattice.hr_input to be a list [t, tp, tpp]");
        } else if (!all_finite(*params)) {
            push_error(errors, diag::kHoppingInput, "lattice.hr_input entries [t, tp, tpp] must be finite");
        }
        return;
    }
    const auto* path = std::get_if<std::string>(&lattice.hr_input);
    if (!path || path->empty()) {
        push_error(errors, diag::kPathRequired,
                   std::string("lattice.type '") + to_string(lattice.type) +
                       "' requires lattice.hr_input to be the path of the hopping file");
    }
}

void check_interaction_input(const LatticeConfig& lattice, Diagnostics& errors, Diagnostics& warnings) {
    switch (lattice.interaction_type) {
        case InteractionType::Kanamori: {
            const auto* params = std::get_if<std::vector<Real>>(&lattice.interaction_input);
            if (!params || params->size() < 3 || params->size() > 4) {
                push_error(errors, diag::kKanamoriInput,
                           "interaction_type 'kanamori' requires lattice.interaction_input to be a list "
                           "[n_bands, U, J] or [n_bands, U, J, U']");
                return;
            }
            if (!kanamori_band_count(lattice)) {
                push_error(errors, diag::kKanamoriInput,
                           "lattice.interaction_input[0] (n_bands) must be an integer between 1 and " +
                               std::to_string(std::numeric_limits<int>::max()));
            }
            if (!all_finite(*params)) {
                push_error(errors, diag::kKanamoriInput, "lattice.interaction_input entries must be finite");
            }
            return;
        }
        case InteractionType::Custom: {
            const auto* path = std::get_if<std::string>(&lattice.interaction_input);
            if (!path || path->empty()) {
                push_error(errors, diag::kPathRequired,
                           "interaction_type 'custom' requires lattice.interaction_input to be the path "
                           "of the interaction file");
            }
            return;
        }
        case InteractionType::LocalFromDmft:
        case InteractionType::KanamoriFromDmft:
            if (!is_blank(lattice.interaction_input)) {
                push_warning(warnings, diag::kUnusedInput,
                             std::string("lattice.interaction_input is ignored for interaction_type '") +
                                 to_string(lattice.interaction_type) + "'");
            }
            return;
    }
}

void check_self_consistency(const DgaConfig& config, Diagnostics& errors) {
    const auto& sc = config.self_consistency;
    check_range(sc.max_iter >= 1, "self_consistency.max_iter must be >= 1", errors);
    check_range(sc.epsilon > 0.0, "self_consistency.epsilon must be > 0", errors);
    check_range(sc.mixing > 0.0 && sc.mixing <= 1.0, "self_consistency.mixing must lie in (0, 1]", errors);
    check_range(sc.mixing_history_length >= 1, "self_consistency.mixing_history_length must be >= 1", errors);

    if (sc.mixing_strategy == MixingStrategy::Pulay && !(sc.save_iter && config.output.save_quantities)) {
        push_error(errors, diag::kPulayPersistence,
                   "mixing_strategy 'pulay' needs the iteration history on disk: set "
                   "self_consistency.save_iter and output.save_quantities to true");
    }
}

void check_eliashberg(const EliashbergConfig& el, Diagnostics& errors, Diagnostics& warnings) {
    check_range(el.n_eig >= 1, "eliashberg.n_eig must be >= 1", errors);
    check_range(el.epsilon > 0.0, "eliashberg.epsilon must be > 0", errors);
    check_range(!el.subfolder_name.empty(), "eliashberg.subfolder_name must not be empty", errors);
    if (!el.perform_eliashberg && (el.save_pairing_vertex || el.save_fq)) {
        push_warning(warnings, diag::kInactiveOption,
                     "eliashberg.save_pairing_vertex/save_fq have no effect without perform_eliashberg");
    }
}

void check_poly_fitting(const PolyFittingConfig& pf, Diagnostics& errors) {
    check_range(pf.n_fit == kUnset || pf.n_fit > 0,
                "poly_fitting.n_fit must be -1 (niv_core + 40) or > 0, got " + std::to_string(pf.n_fit), errors);
    check_range(pf.o_fit >= 0, "poly_fitting.o_fit must be >= 0", errors);
    if (pf.n_fit > 0 && pf.o_fit >= pf.n_fit) {
        push_error(errors, diag::kRange,
                   "poly_fitting.o_fit (" + std::to_string(pf.o_fit) + ") must be smaller than n_fit (" +
                       std::to_string(pf.n_fit) + ")");
    }
}

void check_band_constraints(const DgaConfig& config, int n_bands, Diagnostics& errors) {
    if (n_bands <= 1) {
        return;
    }
    if (config.lattice.type == LatticeType::TTpTpp) {
        push_error(errors, diag::kSingleOrbital,
                   "lattice.type 't_tp_tpp' describes a single orbital, but " + std::to_string(n_bands) +
                       " bands are configured");
    }
    if (config.lambda_correction.perform_lambda_correction) {
        push_error(errors, diag::kLambdaMultiOrbital,
                   "lambda correction is only available for single-orbital systems (n_bands = " +
                       std::to_string(n_bands) + ")");
    }
}

void require_existing(const std::filesystem::path& base, const std::string& raw, const std::string& what,
                      bool directory, Diagnostics& errors) {
    const auto path = resolve_path(base, raw);
    std::error_code ec;
    const bool found = directory ? std::filesystem::is_directory(path, ec)
                                 : std::filesystem::is_regular_file(path, ec);
    if (!found) {
        push_error(errors, diag::kPathNotFound,
                   what + " not found: " + path.string());
    }
}

void check_paths(const DgaConfig& config, const std::filesystem::path& base, Diagnostics& errors) {
    const auto& lattice = config.lattice;
    if (lattice.type != LatticeType::TTpTpp) {
        if (const auto* path = std::get_if<std::string>(&lattice.hr_input); path && !path->empty()) {
            require_existing(base, *path, "lattice.hr_input", false, errors);
        }
    }
    if (lattice.interaction_type == InteractionType::Custom) {
        if (const auto* path = std::get_if<std::string>(&lattice.interaction_input); path && !path->empty()) {
            require_existing(base, *path, "lattice.interaction_input", false, errors);
        }
    }

    const auto input_dir = resolve_path(base, config.dmft.input_path);
    require_existing(base, config.dmft.input_path, "dmft_input.input_path", true, errors);
    if (!config.dmft.fname_1p.empty()) {
        require_existing(input_dir, config.dmft.fname_1p, "dmft_input.fname_1p", false, errors);
    }
    if (!config.dmft.fname_2p.empty()) {
        require_existing(input_dir, config.dmft.fname_2p, "dmft_input.fname_2p", false, errors);
    }
    if (!config.self_consistency.previous_sc_path.empty()) {
        require_existing(base, config.self_consistency.previous_sc_path, "self_consistency.previous_sc_path",
                         true, errors);
    }
}

}  // namespace

std::optional<int> kanamori_band_count(const LatticeConfig& lattice) {
    const auto* params = std::get_if<std::vector<Real>>(&lattice.interaction_input);
    if (params && !params->empty() && is_positive_integer(params->front())) {
        return static_cast<int>(params->front());
    }
    return std::nullopt;
}

std::optional<int> configured_band_count(const DgaConfig& config) {
    if (config.lattice.interaction_type == InteractionType::Kanamori) {
        if (const auto n_bands = kanamori_band_count(config.lattice)) {
            return n_bands;
        }
    }
    if (config.lattice.type == LatticeType::TTpTpp) {
        return 1;
    }
    return std::nullopt;
}

ValidationReport validate_config(const DgaConfig& config, const ValidationOptions& options) {
    ValidationReport report;
    auto& errors = report.errors;
    auto& warnings = report.warnings;

    check_box(config.box, errors);
    check_mesh(config.lattice.nk, "nk", errors);
    if (config.lattice.nq) {
        check_mesh(*config.lattice.nq, "nq", errors);
    }
    check_symmetries(config, errors, warnings);
    check_hopping_input(config.lattice, errors);
    check_interaction_input(config.lattice, errors, warnings);
    check_self_consistency(config, errors);
    check_eliashberg(config.eliashberg, errors, warnings);
    check_poly_fitting(config.poly_fitting, errors);

    if (config.dmft.fname_1p.empty() || config.dmft.fname_2p.empty()) {
        push_error(errors, diag::kPathRequired, "dmft_input.fname_1p and dmft_input.fname_2p must not be empty");
    }
    check_range(!config.output.plotting_subfolder_name.empty(),
                "output.plotting_subfolder_name must not be empty", errors);

    // Interaction input wins over an externally supplied count, so that a
    // Kanamori list is always checked against itself.
    int n_bands = options.n_bands;
    if (config.lattice.interaction_type == InteractionType::Kanamori) {
        n_bands = configured_band_count(config).value_or(n_bands);
    }
    check_band_constraints(config, n_bands, errors);

    if (options.check_paths) {
        check_paths(config, options.base_directory, errors);
    }
    return report;
}

}  // namespace dgaconf::v1
