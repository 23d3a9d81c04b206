// =============================================================================
// dgaconf - Python Bindings
// =============================================================================
// Configuration sections, YAML parser, validation, resolution against the
// DMFT input, k-grid reduction and YAML output.
// =============================================================================

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <pybind11/eigen.h>

#include "dgaconf/v1/core.hpp"

namespace py = pybind11;
using namespace dgaconf::v1;

// =============================================================================
// Module Definition
// =============================================================================

void init_config_types(py::module_& m) {
    py::enum_<LatticeType>(m, "LatticeType", "Source of the kinetic Hamiltonian")
        .value("FromWannier90", LatticeType::FromWannier90)
        .value("FromWannierHK", LatticeType::FromWannierHK)
        .value("TTpTpp", LatticeType::TTpTpp)
        .export_values();

    py::enum_<InteractionType>(m, "InteractionType", "Source of the interaction")
        .value("LocalFromDmft", InteractionType::LocalFromDmft)
        .value("KanamoriFromDmft", InteractionType::KanamoriFromDmft)
        .value("Kanamori", InteractionType::Kanamori)
        .value("Custom", InteractionType::Custom)
        .export_values();

    py::enum_<MixingStrategy>(m, "MixingStrategy", "Self-consistency mixing")
        .value("Linear", MixingStrategy::Linear)
        .value("Pulay", MixingStrategy::Pulay)
        .export_values();

    py::enum_<DmftInputType>(m, "DmftInputType")
        .value("W2dyn", DmftInputType::W2dyn)
        .export_values();

    py::enum_<LambdaCorrectionType>(m, "LambdaCorrectionType")
        .value("Sp", LambdaCorrectionType::Sp)
        .value("Spch", LambdaCorrectionType::Spch)
        .export_values();

    py::enum_<GapSymmetry>(m, "GapSymmetry", "Initial guess of the Eliashberg gap")
        .value("PWaveX", GapSymmetry::PWaveX)
        .value("PWaveY", GapSymmetry::PWaveY)
        .value("DWave", GapSymmetry::DWave)
        .value("Random", GapSymmetry::Random)
        .export_values();

    py::enum_<KnownSymmetry>(m, "KnownSymmetry", "Brillouin-zone symmetry operation")
        .value("XInv", KnownSymmetry::XInv)
        .value("YInv", KnownSymmetry::YInv)
        .value("ZInv", KnownSymmetry::ZInv)
        .value("XYSym", KnownSymmetry::XYSym)
        .value("XYInv", KnownSymmetry::XYInv)
        .export_values();

    py::class_<BoxSizes>(m, "BoxSizes")
        .def(py::init<>())
        .def_readwrite("niw_core", &BoxSizes::niw_core, "Bosonic frequencies, -1: all")
        .def_readwrite("niv_core", &BoxSizes::niv_core, "Fermionic frequencies, -1: all")
        .def_readwrite("niv_shell", &BoxSizes::niv_shell, "Asymptotic shell size");

    py::class_<LatticeConfig>(m, "LatticeConfig")
        .def(py::init<>())
        .def_readwrite("symmetries", &LatticeConfig::symmetries)
        .def_readwrite("type", &LatticeConfig::type)
        .def_readwrite("hr_input", &LatticeConfig::hr_input, "Path or [t, tp, tpp]")
        .def_readwrite("interaction_type", &LatticeConfig::interaction_type)
        .def_readwrite("interaction_input", &LatticeConfig::interaction_input, "Path or [n_bands, U, J, (U')]")
        .def_readwrite("nk", &LatticeConfig::nk)
        .def_readwrite("nq", &LatticeConfig::nq, "None: same as nk");

    py::class_<SelfConsistencyConfig>(m, "SelfConsistencyConfig")
        .def(py::init<>())
        .def_readwrite("max_iter", &SelfConsistencyConfig::max_iter)
        .def_readwrite("save_iter", &SelfConsistencyConfig::save_iter)
        .def_readwrite("epsilon", &SelfConsistencyConfig::epsilon)
        .def_readwrite("mixing", &SelfConsistencyConfig::mixing)
        .def_readwrite("mixing_strategy", &SelfConsistencyConfig::mixing_strategy)
        .def_readwrite("mixing_history_length", &SelfConsistencyConfig::mixing_history_length)
        .def_readwrite("previous_sc_path", &SelfConsistencyConfig::previous_sc_path);

    py::class_<DmftInputConfig>(m, "DmftInputConfig")
        .def(py::init<>())
        .def_readwrite("type", &DmftInputConfig::type)
        .def_readwrite("input_path", &DmftInputConfig::input_path)
        .def_readwrite("fname_1p", &DmftInputConfig::fname_1p)
        .def_readwrite("fname_2p", &DmftInputConfig::fname_2p)
        .def_readwrite("do_sym_v_vp", &DmftInputConfig::do_sym_v_vp);

    py::class_<LambdaCorrectionConfig>(m, "LambdaCorrectionConfig")
        .def(py::init<>())
        .def_readwrite("perform_lambda_correction", &LambdaCorrectionConfig::perform_lambda_correction)
        .def_readwrite("type", &LambdaCorrectionConfig::type);

    py::class_<EliashbergConfig>(m, "EliashbergConfig")
        .def(py::init<>())
        .def_readwrite("perform_eliashberg", &EliashbergConfig::perform_eliashberg)
        .def_readwrite("save_pairing_vertex", &EliashbergConfig::save_pairing_vertex)
        .def_readwrite("save_fq", &EliashbergConfig::save_fq)
        .def_readwrite("n_eig", &EliashbergConfig::n_eig)
        .def_readwrite("epsilon", &EliashbergConfig::epsilon)
        .def_readwrite("symmetry", &EliashbergConfig::symmetry)
        .def_readwrite("include_local_part", &EliashbergConfig::include_local_part)
        .def_readwrite("subfolder_name", &EliashbergConfig::subfolder_name);

    py::class_<PolyFittingConfig>(m, "PolyFittingConfig")
        .def(py::init<>())
        .def_readwrite("do_poly_fitting", &PolyFittingConfig::do_poly_fitting)
        .def_readwrite("n_fit", &PolyFittingConfig::n_fit, "-1: niv_core + 40")
        .def_readwrite("o_fit", &PolyFittingConfig::o_fit);

    py::class_<OutputConfig>(m, "OutputConfig")
        .def(py::init<>())
        .def_readwrite("output_path", &OutputConfig::output_path)
        .def_readwrite("do_plotting", &OutputConfig::do_plotting)
        .def_readwrite("save_quantities", &OutputConfig::save_quantities)
        .def_readwrite("plotting_subfolder_name", &OutputConfig::plotting_subfolder_name);

    py::class_<DgaConfig>(m, "DgaConfig", "Complete DGA configuration")
        .def(py::init<>())
        .def_readwrite("box", &DgaConfig::box)
        .def_readwrite("lattice", &DgaConfig::lattice)
        .def_readwrite("self_consistency", &DgaConfig::self_consistency)
        .def_readwrite("dmft", &DgaConfig::dmft)
        .def_readwrite("lambda_correction", &DgaConfig::lambda_correction)
        .def_readwrite("eliashberg", &DgaConfig::eliashberg)
        .def_readwrite("poly_fitting", &DgaConfig::poly_fitting)
        .def_readwrite("output", &DgaConfig::output)
        .def("effective_nq", &DgaConfig::effective_nq)
        .def("to_yaml", [](const DgaConfig& config) { return write_yaml(config); });
}

void init_parser(py::module_& m) {
    py::class_<parser::YamlParserOptions>(m, "YamlParserOptions")
        .def(py::init<>())
        .def_readwrite("strict", &parser::YamlParserOptions::strict, "Unknown fields are errors");

    py::class_<parser::YamlParser>(m, "YamlParser", "YAML configuration parser")
        .def(py::init<parser::YamlParserOptions>(), py::arg("options") = parser::YamlParserOptions{})
        .def("load", &parser::YamlParser::load, py::arg("path"))
        .def("load_string", &parser::YamlParser::load_string, py::arg("content"))
        .def_property_readonly("errors", &parser::YamlParser::errors)
        .def_property_readonly("warnings", &parser::YamlParser::warnings)
        .def("has_errors", &parser::YamlParser::has_errors);
}

void init_validation(py::module_& m) {
    py::class_<ValidationOptions>(m, "ValidationOptions")
        .def(py::init<>())
        .def_readwrite("check_paths", &ValidationOptions::check_paths)
        .def_readwrite("base_directory", &ValidationOptions::base_directory)
        .def_readwrite("n_bands", &ValidationOptions::n_bands);

    py::class_<ValidationReport>(m, "ValidationReport")
        .def_readonly("errors", &ValidationReport::errors)
        .def_readonly("warnings", &ValidationReport::warnings)
        .def("ok", &ValidationReport::ok);

    m.def("validate_config", &validate_config, py::arg("config"), py::arg("options") = ValidationOptions{},
          "Cross-field and range checks of a configuration");
    m.def("configured_band_count", &configured_band_count, py::arg("config"));
    m.def("kanamori_band_count", &kanamori_band_count, py::arg("lattice"));
}

void init_resolution(py::module_& m) {
    py::class_<AvailableFrequencies>(m, "AvailableFrequencies")
        .def(py::init<>())
        .def(py::init([](int niw, int niv) { return AvailableFrequencies{niw, niv}; }),
             py::arg("niw"), py::arg("niv"))
        .def_readwrite("niw", &AvailableFrequencies::niw)
        .def_readwrite("niv", &AvailableFrequencies::niv);

    py::class_<FrequencyBox>(m, "FrequencyBox")
        .def(py::init<>())
        .def_readwrite("niw_core", &FrequencyBox::niw_core)
        .def_readwrite("niv_core", &FrequencyBox::niv_core)
        .def_readwrite("niv_shell", &FrequencyBox::niv_shell)
        .def("niv_full", &FrequencyBox::niv_full)
        .def("pp_channel_box", &FrequencyBox::pp_channel_box)
        .def("ph_bar_channel_box", &FrequencyBox::ph_bar_channel_box);

    py::class_<KanamoriParameters>(m, "KanamoriParameters")
        .def_readonly("n_bands", &KanamoriParameters::n_bands)
        .def_readonly("u", &KanamoriParameters::u)
        .def_readonly("j", &KanamoriParameters::j)
        .def_readonly("u_prime", &KanamoriParameters::u_prime);

    py::class_<GridSummary>(m, "GridSummary")
        .def_readonly("n", &GridSummary::n)
        .def_readonly("n_tot", &GridSummary::n_tot)
        .def_readonly("n_irr", &GridSummary::n_irr);

    py::class_<ResolvedPaths>(m, "ResolvedPaths")
        .def_readonly("hr_input", &ResolvedPaths::hr_input)
        .def_readonly("interaction_input", &ResolvedPaths::interaction_input)
        .def_readonly("input_path", &ResolvedPaths::input_path)
        .def_readonly("file_1p", &ResolvedPaths::file_1p)
        .def_readonly("file_2p", &ResolvedPaths::file_2p)
        .def_readonly("previous_sc", &ResolvedPaths::previous_sc)
        .def_readonly("output", &ResolvedPaths::output)
        .def_readonly("eliashberg", &ResolvedPaths::eliashberg)
        .def_readonly("plots", &ResolvedPaths::plots);

    py::class_<ResolvedConfig>(m, "ResolvedConfig")
        .def_readonly("config", &ResolvedConfig::config)
        .def_readonly("box", &ResolvedConfig::box)
        .def_readonly("n_fit", &ResolvedConfig::n_fit)
        .def_readonly("n_bands", &ResolvedConfig::n_bands)
        .def_readonly("symmetries", &ResolvedConfig::symmetries)
        .def_readonly("k_grid", &ResolvedConfig::k_grid)
        .def_readonly("q_grid", &ResolvedConfig::q_grid)
        .def_readonly("hopping", &ResolvedConfig::hopping)
        .def_readonly("kanamori", &ResolvedConfig::kanamori)
        .def_readonly("pairing_box", &ResolvedConfig::pairing_box)
        .def_readonly("paths", &ResolvedConfig::paths)
        .def_readonly("errors", &ResolvedConfig::errors)
        .def_readonly("warnings", &ResolvedConfig::warnings)
        .def("ok", &ResolvedConfig::ok)
        .def("to_yaml", [](const ResolvedConfig& resolved) { return write_yaml(resolved); });

    py::class_<ResolveContext>(m, "ResolveContext")
        .def(py::init<>())
        .def_readwrite("available", &ResolveContext::available)
        .def_readwrite("n_bands", &ResolveContext::n_bands)
        .def_readwrite("base_directory", &ResolveContext::base_directory)
        .def_readwrite("inspect_inputs", &ResolveContext::inspect_inputs);

    py::class_<ConfigResolver>(m, "ConfigResolver")
        .def(py::init<ResolveContext>(), py::arg("context") = ResolveContext{})
        .def("resolve", &ConfigResolver::resolve, py::arg("config"));

    m.def("write_yaml", py::overload_cast<const DgaConfig&>(&write_yaml), py::arg("config"));
    m.def("write_yaml", py::overload_cast<const ResolvedConfig&>(&write_yaml), py::arg("resolved"));
    m.def("write_text_file", &write_text_file, py::arg("path"), py::arg("content"));
}

void init_lattice(py::module_& m) {
    m.def("symmetry_preset", &symmetry_preset, py::arg("name"));

    py::class_<KGrid>(m, "KGrid", "Uniform k-mesh with its irreducible reduction")
        .def(py::init<MeshSize, std::vector<KnownSymmetry>>(), py::arg("nk"),
             py::arg("symmetries") = std::vector<KnownSymmetry>{})
        .def_property_readonly("nk", &KGrid::nk)
        .def_property_readonly("nk_tot", &KGrid::nk_tot)
        .def_property_readonly("nk_irr", &KGrid::nk_irr)
        .def_property_readonly("irrk_ind", &KGrid::irrk_ind)
        .def_property_readonly("irrk_inv", &KGrid::irrk_inv)
        .def_property_readonly("irrk_count", &KGrid::irrk_count)
        .def("k_point", &KGrid::k_point, py::arg("index"))
        .def("map_irrk2fbz", &KGrid::map_irrk2fbz)
        .def("map_fbz2irrk", &KGrid::map_fbz2irrk)
        .def("k_mean_irrk", &KGrid::k_mean_irrk);

    m.def("bosonic_frequencies", &bosonic_frequencies, py::arg("niw"), py::arg("beta"), py::arg("shift") = 0,
          py::arg("only_positive") = false);
    m.def("fermionic_frequencies", &fermionic_frequencies, py::arg("niv"), py::arg("beta"), py::arg("shift") = 0,
          py::arg("only_positive") = false);
}

PYBIND11_MODULE(_dgaconf, m) {
    m.doc() = "dgaconf - DGA configuration front end (C++ extension)";
    m.attr("__version__") = DGACONF_VERSION_STRING;
    init_config_types(m);
    init_parser(m);
    init_validation(m);
    init_resolution(m);
    init_lattice(m);
}
