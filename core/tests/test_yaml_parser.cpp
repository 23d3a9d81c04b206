#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dgaconf/v1/diagnostics.hpp"
#include "dgaconf/v1/parser/yaml_parser.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace dgaconf::v1;
using Catch::Approx;

namespace {

std::string join(const std::vector<std::string>& messages) {
    std::string joined;
    for (const auto& msg : messages) {
        joined += msg;
        joined.push_back('\n');
    }
    return joined;
}

}  // namespace

TEST_CASE("YAML empty document yields defaults", "[yaml][defaults]") {
    parser::YamlParser parser;
    const DgaConfig config = parser.load_string("");

    REQUIRE_FALSE(parser.has_errors());
    CHECK(parser.warnings().empty());

    CHECK(config.box.niw_core == -1);
    CHECK(config.box.niv_core == -1);
    CHECK(config.box.niv_shell == 0);

    CHECK(std::get<std::string>(config.lattice.symmetries) == "two_dimensional_square");
    CHECK(config.lattice.type == LatticeType::TTpTpp);
    CHECK(config.lattice.interaction_type == InteractionType::LocalFromDmft);
    CHECK(config.lattice.nk == MeshSize{16, 16, 1});
    CHECK_FALSE(config.lattice.nq.has_value());
    CHECK(config.effective_nq() == MeshSize{16, 16, 1});

    CHECK(config.self_consistency.max_iter == 20);
    CHECK(config.self_consistency.save_iter);
    CHECK(config.self_consistency.epsilon == Approx(1e-4));
    CHECK(config.self_consistency.mixing == Approx(0.3));
    CHECK(config.self_consistency.mixing_strategy == MixingStrategy::Linear);
    CHECK(config.self_consistency.mixing_history_length == 2);
    CHECK(config.self_consistency.previous_sc_path.empty());

    CHECK(config.dmft.type == DmftInputType::W2dyn);
    CHECK(config.dmft.input_path == "./");
    CHECK(config.dmft.fname_1p == "1p-data.hdf5");
    CHECK(config.dmft.fname_2p == "g4iw_sym.hdf5");
    CHECK(config.dmft.do_sym_v_vp);

    CHECK_FALSE(config.lambda_correction.perform_lambda_correction);
    CHECK(config.lambda_correction.type == LambdaCorrectionType::Sp);

    CHECK_FALSE(config.eliashberg.perform_eliashberg);
    CHECK(config.eliashberg.n_eig == 4);
    CHECK(config.eliashberg.epsilon == Approx(1e-12));
    CHECK(config.eliashberg.symmetry == GapSymmetry::Random);
    CHECK(config.eliashberg.subfolder_name == "Eliashberg");

    CHECK_FALSE(config.poly_fitting.do_poly_fitting);
    CHECK(config.poly_fitting.n_fit == -1);
    CHECK(config.poly_fitting.o_fit == 8);

    CHECK(config.output.output_path.empty());
    CHECK(config.output.do_plotting);
    CHECK(config.output.save_quantities);
    CHECK(config.output.plotting_subfolder_name == "Plots");
}

TEST_CASE("YAML parses a complete configuration", "[yaml]") {
    const std::string yaml = R"(
box_sizes:
  niw_core: 30
  niv_core: 40
  niv_shell: 100
lattice:
  symmetries: [x-inv, y-inv]
  type: t_tp_tpp
  hr_input: [1.0, -0.25, 0.12]
  interaction_type: kanamori
  interaction_input: [3, 2.0, 0.5]
  nk: [24, 24, 1]
  nq: [12, 12, 1]
self_consistency:
  max_iter: 50
  save_iter: false
  epsilon: 1e-5
  mixing: 0.5
  mixing_strategy: pulay
  mixing_history_length: 4
  previous_sc_path: ./old_run
dmft_input:
  type: w2dyn
  input_path: /data/run1
  fname_1p: one.hdf5
  fname_2p: two.hdf5
  do_sym_v_vp: False
lambda_correction:
  perform_lambda_correction: yes
  type: spch
eliashberg:
  perform_eliashberg: true
  save_pairing_vertex: true
  save_fq: true
  n_eig: 6
  epsilon: 1e-10
  symmetry: d-wave
  include_local_part: true
  subfolder_name: Gap
poly_fitting:
  do_poly_fitting: true
  n_fit: 60
  o_fit: 6
output:
  output_path: /scratch/out
  do_plotting: false
  save_quantities: false
  plotting_subfolder_name: Figures
)";

    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());

    CHECK(config.box.niw_core == 30);
    CHECK(config.box.niv_core == 40);
    CHECK(config.box.niv_shell == 100);

    const auto& symmetries = std::get<std::vector<std::string>>(config.lattice.symmetries);
    REQUIRE(symmetries.size() == 2);
    CHECK(symmetries[0] == "x-inv");
    CHECK(symmetries[1] == "y-inv");

    const auto& hr = std::get<std::vector<Real>>(config.lattice.hr_input);
    REQUIRE(hr.size() == 3);
    CHECK(hr[0] == Approx(1.0));
    CHECK(hr[1] == Approx(-0.25));
    CHECK(hr[2] == Approx(0.12));

    CHECK(config.lattice.interaction_type == InteractionType::Kanamori);
    CHECK(std::get<std::vector<Real>>(config.lattice.interaction_input).size() == 3);
    CHECK(config.lattice.nk == MeshSize{24, 24, 1});
    REQUIRE(config.lattice.nq.has_value());
    CHECK(*config.lattice.nq == MeshSize{12, 12, 1});

    CHECK(config.self_consistency.max_iter == 50);
    CHECK_FALSE(config.self_consistency.save_iter);
    CHECK(config.self_consistency.epsilon == Approx(1e-5));
    CHECK(config.self_consistency.mixing_strategy == MixingStrategy::Pulay);
    CHECK(config.self_consistency.mixing_history_length == 4);
    CHECK(config.self_consistency.previous_sc_path == "./old_run");

    CHECK(config.dmft.input_path == "/data/run1");
    CHECK_FALSE(config.dmft.do_sym_v_vp);

    CHECK(config.lambda_correction.perform_lambda_correction);
    CHECK(config.lambda_correction.type == LambdaCorrectionType::Spch);

    CHECK(config.eliashberg.perform_eliashberg);
    CHECK(config.eliashberg.n_eig == 6);
    CHECK(config.eliashberg.epsilon == Approx(1e-10));
    CHECK(config.eliashberg.symmetry == GapSymmetry::DWave);
    CHECK(config.eliashberg.subfolder_name == "Gap");

    CHECK(config.poly_fitting.n_fit == 60);
    CHECK(config.poly_fitting.o_fit == 6);

    CHECK(config.output.output_path == "/scratch/out");
    CHECK_FALSE(config.output.do_plotting);
    CHECK(config.output.plotting_subfolder_name == "Figures");
}

TEST_CASE("YAML partial sections keep remaining defaults", "[yaml][defaults]") {
    const std::string yaml = R"(
self_consistency:
  max_iter: 5
lattice:
  nk: [8, 8, 4]
)";

    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    CHECK(config.self_consistency.max_iter == 5);
    CHECK(config.self_consistency.mixing == Approx(0.3));
    CHECK(config.lattice.nk == MeshSize{8, 8, 4});
    CHECK(config.effective_nq() == MeshSize{8, 8, 4});
}

TEST_CASE("YAML explicit null keeps the default", "[yaml][defaults]") {
    const std::string yaml = R"(
box_sizes:
  niv_shell:
output:
  output_path: ~
lattice:
  symmetries:
)";

    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    CHECK(config.box.niv_shell == 0);
    CHECK(config.output.output_path.empty());
    // An empty symmetries entry switches the reduction off
    CHECK(std::get<std::string>(config.lattice.symmetries) == "none");
}

TEST_CASE("YAML box aliases niw and niv", "[yaml][box]") {
    parser::YamlParser parser;
    const DgaConfig config = parser.load_string("box_sizes:\n  niw: 10\n  niv: 20\n");
    REQUIRE(parser.errors().empty());
    CHECK(config.box.niw_core == 10);
    CHECK(config.box.niv_core == 20);

    parser::YamlParser dup_parser;
    (void)dup_parser.load_string("box_sizes:\n  niw: 10\n  niw_core: 12\n");
    REQUIRE(dup_parser.has_errors());
    CHECK(has_diag_code(dup_parser.errors(), diag::kDuplicateField));
}

TEST_CASE("YAML unknown fields are errors in strict mode", "[yaml][strict]") {
    const std::string yaml = R"(
lattice:
  nk: [4, 4, 1]
  hopping: 1.0
extra_section:
  a: 1
)";

    parser::YamlParser parser;
    (void)parser.load_string(yaml);
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kUnknownField));
    const std::string joined = join(parser.errors());
    CHECK(joined.find("lattice.hopping") != std::string::npos);
    CHECK(joined.find("root.extra_section") != std::string::npos);
}

TEST_CASE("YAML unknown fields are warnings in lenient mode", "[yaml][strict]") {
    parser::YamlParserOptions options;
    options.strict = false;
    parser::YamlParser parser(options);
    const DgaConfig config = parser.load_string("eliashberg:\n  n_eig: 2\n  legacy_flag: true\n");

    REQUIRE(parser.errors().empty());
    REQUIRE(parser.warnings().size() == 1);
    CHECK(has_diag_code(parser.warnings(), diag::kUnknownFieldWarning));
    CHECK(parser.warnings().front().find("eliashberg.legacy_flag") != std::string::npos);
    CHECK(config.eliashberg.n_eig == 2);
}

TEST_CASE("YAML type mismatches name the key path", "[yaml][errors]") {
    const std::string yaml = R"(
box_sizes:
  niw_core: many
self_consistency:
  save_iter: maybe
  mixing: [0.1]
lattice:
  nk: [4, 4]
)";

    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kTypeMismatch));

    const std::string joined = join(parser.errors());
    CHECK(joined.find("box_sizes.niw_core") != std::string::npos);
    CHECK(joined.find("self_consistency.save_iter") != std::string::npos);
    CHECK(joined.find("self_consistency.mixing") != std::string::npos);
    CHECK(joined.find("lattice.nk") != std::string::npos);

    // Failed fields keep their defaults
    CHECK(config.box.niw_core == -1);
    CHECK(config.lattice.nk == MeshSize{16, 16, 1});
}

TEST_CASE("YAML section that is not a map is a type mismatch", "[yaml][errors]") {
    parser::YamlParser parser;
    (void)parser.load_string("lattice: [1, 2, 3]\n");
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kTypeMismatch));
    CHECK(parser.errors().front().find("'lattice'") != std::string::npos);
}

TEST_CASE("YAML invalid enum values list the choices", "[yaml][errors]") {
    const std::string yaml = R"(
lattice:
  type: honeycomb
self_consistency:
  mixing_strategy: anderson
eliashberg:
  symmetry: s-wave
)";

    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.errors().size() == 3);
    CHECK(has_diag_code(parser.errors(), diag::kEnumInvalid));

    const std::string joined = join(parser.errors());
    CHECK(joined.find("honeycomb") != std::string::npos);
    CHECK(joined.find("t_tp_tpp") != std::string::npos);
    CHECK(joined.find("pulay") != std::string::npos);
    CHECK(joined.find("d-wave") != std::string::npos);
    CHECK(config.lattice.type == LatticeType::TTpTpp);
}

TEST_CASE("YAML enum spelling is case and dash tolerant", "[yaml][enum]") {
    const std::string yaml = R"(
lattice:
  type: From_WannierHK
  hr_input: model.hk
  interaction_type: Kanamori-From-DMFT
eliashberg:
  symmetry: P_WAVE_X
)";

    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    CHECK(config.lattice.type == LatticeType::FromWannierHK);
    CHECK(std::get<std::string>(config.lattice.hr_input) == "model.hk");
    CHECK(config.lattice.interaction_type == InteractionType::KanamoriFromDmft);
    CHECK(config.eliashberg.symmetry == GapSymmetry::PWaveX);
}

TEST_CASE("YAML empty interaction_type means local_from_dmft", "[yaml][enum]") {
    parser::YamlParser parser;
    const DgaConfig config = parser.load_string("lattice:\n  interaction_type: ''\n");
    REQUIRE(parser.errors().empty());
    CHECK(config.lattice.interaction_type == InteractionType::LocalFromDmft);
}

TEST_CASE("YAML scientific notation and integers parse as floats", "[yaml]") {
    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(
        "self_consistency:\n  epsilon: 1e-4\n  mixing: 1\neliashberg:\n  epsilon: 2.5E-9\n");
    REQUIRE(parser.errors().empty());
    CHECK(config.self_consistency.epsilon == Approx(1e-4));
    CHECK(config.self_consistency.mixing == Approx(1.0));
    CHECK(config.eliashberg.epsilon == Approx(2.5e-9));
}

TEST_CASE("YAML numeric list entries must be numbers", "[yaml][errors]") {
    parser::YamlParser parser;
    const DgaConfig config = parser.load_string("lattice:\n  hr_input: [1.0, t, 0.1]\n");
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kTypeMismatch));
    CHECK(parser.errors().front().find("lattice.hr_input[1]") != std::string::npos);
    CHECK(std::get<std::string>(config.lattice.hr_input).empty());
}

TEST_CASE("YAML syntax errors and non-map roots are reported", "[yaml][errors]") {
    parser::YamlParser parser;
    (void)parser.load_string("lattice: [1, 2\n");
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kYamlSyntax));

    (void)parser.load_string("- a\n- b\n");
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kTypeMismatch));
    CHECK_FALSE(has_diag_code(parser.errors(), diag::kYamlSyntax));
}

TEST_CASE("YAML non-scalar keys are type mismatches", "[yaml][errors]") {
    parser::YamlParser parser;
    DgaConfig config;
    REQUIRE_NOTHROW(config = parser.load_string("? [a, b]\n: 1\n"));
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kTypeMismatch));
    CHECK(join(parser.errors()).find("expected scalar key") != std::string::npos);

    REQUIRE_NOTHROW(config = parser.load_string("lattice:\n  ? {x: 1}\n  : 2\n  nk: [8, 8, 1]\n"));
    REQUIRE(parser.has_errors());
    CHECK(join(parser.errors()).find("'lattice'") != std::string::npos);
    CHECK(config.lattice.nk == MeshSize{8, 8, 1});
}

TEST_CASE("YAML load reads files and reports missing ones", "[yaml][io]") {
    const auto dir = std::filesystem::temp_directory_path() / "dgaconf_yaml_parser_test";
    std::filesystem::create_directories(dir);
    const auto path = dir / "dga_config.yaml";
    {
        std::ofstream out(path);
        out << "box_sizes:\n  niw_core: 7\n";
    }

    parser::YamlParser parser;
    const DgaConfig config = parser.load(path);
    REQUIRE(parser.errors().empty());
    CHECK(config.box.niw_core == 7);

    (void)parser.load(dir / "missing.yaml");
    REQUIRE(parser.has_errors());
    CHECK(has_diag_code(parser.errors(), diag::kFileUnreadable));

    std::filesystem::remove_all(dir);
}
