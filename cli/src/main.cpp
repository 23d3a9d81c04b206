#include <CLI/CLI.hpp>
#include <dgaconf/v1/core.hpp>
#include <cstdlib>
#include <iostream>
#include <iomanip>
#include <optional>

using namespace dgaconf::v1;

namespace {

struct ContextOptions {
    std::string base_dir = ".";
    int niw_available = kUnset;
    int niv_available = kUnset;
    int n_bands = kUnset;
    bool inspect_inputs = false;
};

ResolveContext make_context(const ContextOptions& opts) {
    ResolveContext ctx;
    ctx.available.niw = opts.niw_available;
    ctx.available.niv = opts.niv_available;
    ctx.n_bands = opts.n_bands;
    ctx.base_directory = opts.base_dir;
    ctx.inspect_inputs = opts.inspect_inputs;
    return ctx;
}

void print_diagnostics(const std::vector<std::string>& messages, const char* label) {
    for (const auto& msg : messages) {
        std::cerr << label << ": " << msg << std::endl;
    }
}

// Loads the YAML file, reporting parser diagnostics. Empty on parse errors.
std::optional<DgaConfig> load_config(const std::string& config_file, bool strict, bool quiet) {
    if (!quiet) {
        std::cerr << "Reading configuration: " << config_file << std::endl;
    }
    parser::YamlParser yaml_parser(parser::YamlParserOptions{strict});
    DgaConfig config = yaml_parser.load(config_file);
    if (!quiet) {
        print_diagnostics(yaml_parser.warnings(), "Warning");
    }
    if (yaml_parser.has_errors()) {
        print_diagnostics(yaml_parser.errors(), "Error");
        return std::nullopt;
    }
    return config;
}

std::string mesh_string(const MeshSize& mesh) {
    return std::to_string(mesh[0]) + " x " + std::to_string(mesh[1]) + " x " + std::to_string(mesh[2]);
}

std::string count_string(int value) {
    return value == kUnset ? std::string("unknown") : std::to_string(value);
}

int cmd_validate(const std::string& config_file, bool strict, bool check_paths,
                 const std::string& base_dir, bool verbose, bool quiet) {
    try {
        auto config = load_config(config_file, strict, quiet);
        if (!config) {
            return 1;
        }

        ValidationOptions options;
        options.check_paths = check_paths;
        options.base_directory = base_dir;
        const auto report = validate_config(*config, options);

        if (!quiet) {
            print_diagnostics(report.warnings, "Warning");
        }
        if (!report.ok()) {
            print_diagnostics(report.errors, "Error");
            std::cerr << "Validation failed: " << report.errors.size() << " error(s)" << std::endl;
            return 2;
        }

        if (verbose) {
            std::cout << "Configuration is valid." << std::endl;
            std::cout << "  Lattice: " << to_string(config->lattice.type) << std::endl;
            std::cout << "  Interaction: " << to_string(config->lattice.interaction_type) << std::endl;
            std::cout << "  nk: " << mesh_string(config->lattice.nk) << std::endl;
            std::cout << "  nq: " << mesh_string(config->effective_nq()) << std::endl;
            std::cout << "  Warnings: " << report.warnings.size() << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_info(const std::string& config_file, const ContextOptions& ctx_opts, bool verbose, bool quiet) {
    try {
        auto config = load_config(config_file, true, quiet);
        if (!config) {
            return 1;
        }

        const ConfigResolver resolver(make_context(ctx_opts));
        const auto resolved = resolver.resolve(*config);
        if (!quiet) {
            print_diagnostics(resolved.warnings, "Warning");
        }
        if (!resolved.ok()) {
            print_diagnostics(resolved.errors, "Error");
            return 2;
        }

        const auto& cfg = resolved.config;
        std::cout << "Configuration: " << config_file << std::endl;

        std::cout << "\nFrequency box:" << std::endl;
        std::cout << "  niw_core: " << count_string(resolved.box.niw_core) << std::endl;
        std::cout << "  niv_core: " << count_string(resolved.box.niv_core) << std::endl;
        std::cout << "  niv_shell: " << resolved.box.niv_shell << std::endl;
        if (resolved.box.niv_core != kUnset) {
            std::cout << "  niv_full: " << resolved.box.niv_full() << std::endl;
        }

        std::cout << "\nLattice:" << std::endl;
        std::cout << "  Type: " << to_string(cfg.lattice.type) << std::endl;
        if (resolved.hopping) {
            const auto& [t, tp, tpp] = *resolved.hopping;
            std::cout << "  Hopping: t=" << t << " tp=" << tp << " tpp=" << tpp << std::endl;
        } else {
            std::cout << "  Hopping file: " << resolved.paths.hr_input.string() << std::endl;
        }
        std::cout << "  Interaction: " << to_string(cfg.lattice.interaction_type) << std::endl;
        if (resolved.kanamori) {
            std::cout << "  U=" << resolved.kanamori->u << " J=" << resolved.kanamori->j
                      << " U'=" << resolved.kanamori->u_prime << std::endl;
        }
        std::cout << "  Bands: " << count_string(resolved.n_bands) << std::endl;
        std::cout << "  Symmetries:";
        if (resolved.symmetries.empty()) {
            std::cout << " none";
        }
        for (const auto symmetry : resolved.symmetries) {
            std::cout << " " << to_string(symmetry);
        }
        std::cout << std::endl;
        std::cout << "  k-grid: " << mesh_string(resolved.k_grid.n) << " (" << resolved.k_grid.n_tot
                  << " points, " << resolved.k_grid.n_irr << " irreducible)" << std::endl;
        std::cout << "  q-grid: " << mesh_string(resolved.q_grid.n) << " (" << resolved.q_grid.n_tot
                  << " points, " << resolved.q_grid.n_irr << " irreducible)" << std::endl;

        std::cout << "\nSelf-consistency:" << std::endl;
        std::cout << "  Mixing: " << to_string(cfg.self_consistency.mixing_strategy) << " ("
                  << cfg.self_consistency.mixing << ")" << std::endl;
        std::cout << "  Max iterations: " << cfg.self_consistency.max_iter << std::endl;
        std::cout << "  Epsilon: " << std::scientific << std::setprecision(2)
                  << cfg.self_consistency.epsilon << std::defaultfloat << std::endl;

        std::cout << "\nPost-processing:" << std::endl;
        std::cout << "  Lambda correction: "
                  << (cfg.lambda_correction.perform_lambda_correction ? to_string(cfg.lambda_correction.type) : "off")
                  << std::endl;
        std::cout << "  Eliashberg: " << (cfg.eliashberg.perform_eliashberg ? "on" : "off");
        if (resolved.pairing_box) {
            std::cout << " (pp box niw=" << resolved.pairing_box->niw_core << " niv="
                      << resolved.pairing_box->niv_core << ")";
        }
        std::cout << std::endl;
        std::cout << "  Polynomial fit: " << (cfg.poly_fitting.do_poly_fitting ? "on" : "off")
                  << " (n_fit=" << count_string(resolved.n_fit) << ", o_fit=" << cfg.poly_fitting.o_fit << ")"
                  << std::endl;

        std::cout << "\nPaths:" << std::endl;
        std::cout << "  1p data: " << resolved.paths.file_1p.string() << std::endl;
        std::cout << "  2p data: " << resolved.paths.file_2p.string() << std::endl;
        std::cout << "  Output: " << resolved.paths.output.string() << std::endl;
        if (verbose) {
            std::cout << "  Plots: " << resolved.paths.plots.string() << std::endl;
            std::cout << "  Eliashberg: " << resolved.paths.eliashberg.string() << std::endl;
            if (!resolved.paths.previous_sc.empty()) {
                std::cout << "  Previous run: " << resolved.paths.previous_sc.string() << std::endl;
            }
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_resolve(const std::string& config_file, const std::string& output_file,
                const ContextOptions& ctx_opts, bool quiet) {
    try {
        auto config = load_config(config_file, true, quiet);
        if (!config) {
            return 1;
        }

        const ConfigResolver resolver(make_context(ctx_opts));
        const auto resolved = resolver.resolve(*config);
        if (!quiet) {
            print_diagnostics(resolved.warnings, "Warning");
        }
        if (!resolved.ok()) {
            print_diagnostics(resolved.errors, "Error");
            return 2;
        }

        const std::string document = write_yaml(resolved);
        if (!output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing resolved configuration to: " << output_file << std::endl;
            }
            write_text_file(output_file, document);
        } else {
            std::cout << document;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

void add_context_options(CLI::App* cmd, ContextOptions& opts) {
    cmd->add_option("--base-dir", opts.base_dir, "Folder relative paths are taken from")
        ->check(CLI::ExistingDirectory);
    cmd->add_option("--niw-available", opts.niw_available, "Bosonic frequencies in the two-particle data");
    cmd->add_option("--niv-available", opts.niv_available, "Fermionic frequencies in the two-particle data");
    cmd->add_option("--n-bands", opts.n_bands, "Number of bands of the DMFT input");
    cmd->add_flag("--inspect-inputs", opts.inspect_inputs, "Read hopping/interaction file headers");
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"dgaconf - DGA configuration checker"};
    app.set_version_flag("-V,--version", std::string("dgaconf ") + DGACONF_VERSION_STRING);

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate a DGA configuration file");
    std::string validate_file;
    bool strict = true;
    bool check_paths = false;
    std::string validate_base_dir = ".";
    validate_cmd->add_option("config", validate_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->add_flag("--strict,!--lenient", strict, "Treat unknown fields as errors (default)");
    validate_cmd->add_flag("--check-paths", check_paths, "Require referenced input files to exist");
    validate_cmd->add_option("--base-dir", validate_base_dir, "Folder relative paths are taken from")
        ->check(CLI::ExistingDirectory);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, strict, check_paths, validate_base_dir, verbose, quiet));
    });

    // Info command
    auto* info_cmd = app.add_subcommand("info", "Show the resolved configuration");
    std::string info_file;
    ContextOptions info_ctx;
    info_cmd->add_option("config", info_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    add_context_options(info_cmd, info_ctx);
    info_cmd->callback([&]() {
        std::exit(cmd_info(info_file, info_ctx, verbose, quiet));
    });

    // Resolve command
    auto* resolve_cmd = app.add_subcommand("resolve", "Write the resolved configuration as YAML");
    std::string resolve_file;
    std::string output_file;
    ContextOptions resolve_ctx;
    resolve_cmd->add_option("config", resolve_file, "Configuration file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    resolve_cmd->add_option("-o,--output", output_file, "Output file (YAML), stdout if omitted");
    add_context_options(resolve_cmd, resolve_ctx);
    resolve_cmd->callback([&]() {
        std::exit(cmd_resolve(resolve_file, output_file, resolve_ctx, quiet));
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
