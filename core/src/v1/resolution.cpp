#include "dgaconf/v1/resolution.hpp"
#include "dgaconf/v1/diagnostics.hpp"
#include "dgaconf/v1/validation.hpp"

#include <exception>
#include <utility>

namespace dgaconf::v1 {

namespace {

GridSummary summarize(const KGrid& grid) {
    return GridSummary{grid.nk(), grid.nk_tot(), grid.nk_irr()};
}

}  // namespace

ConfigResolver::ConfigResolver(ResolveContext context)
    : context_(std::move(context)) {}

ResolvedConfig ConfigResolver::resolve(const DgaConfig& config) const {
    ResolvedConfig out;
    out.config = config;

    ValidationOptions options;
    options.base_directory = context_.base_directory;
    options.n_bands = context_.n_bands;
    auto report = validate_config(config, options);
    out.errors = std::move(report.errors);
    out.warnings = std::move(report.warnings);
    if (!out.errors.empty()) {
        return out;
    }

    resolve_paths(out);
    resolve_box(out);
    resolve_lattice(out);
    resolve_bands(out);

    if (out.config.eliashberg.perform_eliashberg && out.box.is_resolved()) {
        out.pairing_box = out.box.pp_channel_box();
    }
    return out;
}

void ConfigResolver::resolve_box(ResolvedConfig& out) const {
    auto& box_cfg = out.config.box;
    const FrequencyBox requested{box_cfg.niw_core, box_cfg.niv_core, box_cfg.niv_shell};
    const auto resolution = resolve_frequency_box(requested, context_.available);
    out.box = resolution.box;

    if (resolution.niw_clamped) {
        push_warning(out.warnings, diag::kBoxClamped,
                     "box_sizes.niw_core = " + std::to_string(requested.niw_core) +
                         " exceeds the available " + std::to_string(context_.available.niw) +
                         " bosonic frequencies; clamped");
    }
    if (resolution.niv_clamped) {
        push_warning(out.warnings, diag::kBoxClamped,
                     "box_sizes.niv_core = " + std::to_string(requested.niv_core) +
                         " exceeds the available " + std::to_string(context_.available.niv) +
                         " fermionic frequencies; clamped");
    }
    if (out.box.niw_core == kUnset || out.box.niv_core == kUnset) {
        push_warning(out.warnings, diag::kBoxUnresolved,
                     "box size left at -1: the frequencies available in the two-particle data are unknown");
    }

    box_cfg.niw_core = out.box.niw_core;
    box_cfg.niv_core = out.box.niv_core;

    auto& fit = out.config.poly_fitting;
    out.n_fit = fit.n_fit;
    if (fit.n_fit == kUnset && out.box.niv_core != kUnset) {
        out.n_fit = out.box.niv_core + kPolyFitPadding;
        fit.n_fit = out.n_fit;
        if (fit.do_poly_fitting && fit.o_fit >= out.n_fit) {
            push_error(out.errors, diag::kFitWindow,
                       "poly_fitting.o_fit (" + std::to_string(fit.o_fit) +
                           ") must be smaller than the derived n_fit (" + std::to_string(out.n_fit) + ")");
        }
    }
}

void ConfigResolver::resolve_lattice(ResolvedConfig& out) const {
    auto& lattice = out.config.lattice;

    std::string offending;
    out.symmetries = expand_symmetries(lattice.symmetries, offending).value_or(std::vector<KnownSymmetry>{});

    lattice.nq = out.config.effective_nq();
    out.k_grid = summarize(KGrid(lattice.nk, out.symmetries));
    out.q_grid = summarize(KGrid(*lattice.nq, out.symmetries));

    if (lattice.type == LatticeType::TTpTpp) {
        const auto& params = std::get<std::vector<Real>>(lattice.hr_input);
        out.hopping = std::array<Real, 3>{params[0], params[1], params[2]};
    }

    if (lattice.interaction_type == InteractionType::Kanamori) {
        const auto n_bands = kanamori_band_count(lattice);
        if (!n_bands) {
            push_error(out.errors, diag::kKanamoriInput,
                       "lattice.interaction_input[0] (n_bands) is not a usable band count");
            return;
        }
        auto& params = std::get<std::vector<Real>>(lattice.interaction_input);
        const std::optional<Real> u_prime =
            params.size() == 4 ? std::optional<Real>(params[3]) : std::nullopt;
        out.kanamori = make_kanamori_parameters(*n_bands, params[1], params[2], u_prime);
        params = {static_cast<Real>(out.kanamori->n_bands), out.kanamori->u, out.kanamori->j,
                  out.kanamori->u_prime};
    }
}

std::optional<int> ConfigResolver::inspect_band_count(const ResolvedConfig& out,
                                                      std::vector<std::string>& errors) const {
    const auto& lattice = out.config.lattice;
    std::optional<int> kinetic;
    std::optional<int> interaction;

    try {
        if (lattice.type == LatticeType::FromWannier90) {
            kinetic = Hamiltonian::read_real_space_header(out.paths.hr_input).n_bands;
        } else if (lattice.type == LatticeType::FromWannierHK) {
            kinetic = Hamiltonian::read_hk_w2k(out.paths.hr_input).n_bands;
        }
    } catch (const std::exception& e) {
        push_error(errors, diag::kInputUnreadable,
                   "lattice.hr_input " + out.paths.hr_input.string() + ": " + e.what());
    }

    if (lattice.interaction_type == InteractionType::Custom) {
        try {
            interaction = Hamiltonian::read_real_space_header(out.paths.interaction_input).n_bands;
        } catch (const std::exception& e) {
            push_error(errors, diag::kInputUnreadable,
                       "lattice.interaction_input " + out.paths.interaction_input.string() + ": " + e.what());
        }
    }

    if (kinetic && interaction && *kinetic != *interaction) {
        push_error(errors, diag::kBandsMismatch,
                   "hopping file has " + std::to_string(*kinetic) + " bands, interaction file has " +
                       std::to_string(*interaction));
    }
    return kinetic ? kinetic : interaction;
}

void ConfigResolver::resolve_bands(ResolvedConfig& out) const {
    std::vector<std::pair<std::string, int>> sources;

    if (out.kanamori) {
        sources.emplace_back("lattice.interaction_input", out.kanamori->n_bands);
    }
    if (out.config.lattice.type == LatticeType::TTpTpp) {
        sources.emplace_back("lattice.type t_tp_tpp", 1);
    }
    if (context_.inspect_inputs) {
        if (const auto inspected = inspect_band_count(out, out.errors)) {
            sources.emplace_back("input file header", *inspected);
        }
    }
    if (context_.n_bands > 0) {
        sources.emplace_back("DMFT input", context_.n_bands);
    }

    if (sources.empty()) {
        push_warning(out.warnings, diag::kBandsUnknown,
                     "number of bands is not known yet; it will be taken from the DMFT input");
        return;
    }

    const auto& [first_source, first_count] = sources.front();
    out.n_bands = first_count;
    for (std::size_t i = 1; i < sources.size(); ++i) {
        if (sources[i].second != first_count) {
            push_error(out.errors, diag::kBandsMismatch,
                       first_source + " gives " + std::to_string(first_count) + " bands, " +
                           sources[i].first + " gives " + std::to_string(sources[i].second));
        }
    }

    if (out.n_bands > 1 && out.config.lambda_correction.perform_lambda_correction &&
        !has_diag_code(out.errors, diag::kLambdaMultiOrbital)) {
        push_error(out.errors, diag::kLambdaMultiOrbital,
                   "lambda correction is only available for single-orbital systems (n_bands = " +
                       std::to_string(out.n_bands) + ")");
    }
}

void ConfigResolver::resolve_paths(ResolvedConfig& out) const {
    const auto& base = context_.base_directory;
    auto& cfg = out.config;
    auto& paths = out.paths;

    if (const auto* hr = std::get_if<std::string>(&cfg.lattice.hr_input)) {
        paths.hr_input = resolve_path(base, *hr);
    }
    if (cfg.lattice.interaction_type == InteractionType::Custom) {
        paths.interaction_input = resolve_path(base, std::get<std::string>(cfg.lattice.interaction_input));
    }

    paths.input_path = resolve_path(base, cfg.dmft.input_path);
    paths.file_1p = resolve_path(paths.input_path, cfg.dmft.fname_1p);
    paths.file_2p = resolve_path(paths.input_path, cfg.dmft.fname_2p);
    paths.previous_sc = resolve_path(base, cfg.self_consistency.previous_sc_path);

    paths.output = cfg.output.output_path.empty() ? paths.input_path : resolve_path(base, cfg.output.output_path);
    paths.eliashberg = resolve_path(paths.output, cfg.eliashberg.subfolder_name);
    paths.plots = resolve_path(paths.output, cfg.output.plotting_subfolder_name);

    cfg.output.output_path = paths.output.string();
}

}  // namespace dgaconf::v1
