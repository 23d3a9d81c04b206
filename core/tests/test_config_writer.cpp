#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dgaconf/v1/config_writer.hpp"
#include "dgaconf/v1/diagnostics.hpp"
#include "dgaconf/v1/parser/yaml_parser.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace dgaconf::v1;
using Catch::Approx;

namespace {

DgaConfig make_kanamori_config() {
    DgaConfig config;
    config.box = {30, 40, 10};
    config.lattice.symmetries = std::vector<std::string>{"x-inv", "y-inv"};
    config.lattice.type = LatticeType::FromWannier90;
    config.lattice.hr_input = std::string("wannier_hr.dat");
    config.lattice.interaction_type = InteractionType::Kanamori;
    config.lattice.interaction_input = std::vector<Real>{2.0, 3.5, 0.4};
    config.lattice.nk = {12, 12, 1};
    config.lattice.nq = MeshSize{6, 6, 1};
    config.self_consistency.max_iter = 50;
    config.self_consistency.mixing = 0.15;
    config.self_consistency.mixing_strategy = MixingStrategy::Pulay;
    config.self_consistency.mixing_history_length = 5;
    config.self_consistency.previous_sc_path = "runs/previous";
    config.dmft.input_path = "dmft";
    config.dmft.do_sym_v_vp = false;
    config.lambda_correction.type = LambdaCorrectionType::Spch;
    config.eliashberg.perform_eliashberg = true;
    config.eliashberg.n_eig = 6;
    config.eliashberg.symmetry = GapSymmetry::DWave;
    config.poly_fitting.do_poly_fitting = true;
    config.poly_fitting.n_fit = 60;
    config.poly_fitting.o_fit = 6;
    config.output.output_path = "out";
    config.output.do_plotting = false;
    return config;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

TEST_CASE("Written configuration loads back unchanged", "[writer]") {
    const DgaConfig original = make_kanamori_config();
    const std::string yaml = write_yaml(original);

    parser::YamlParser parser;
    const DgaConfig loaded = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    CHECK(parser.warnings().empty());

    CHECK(loaded.box.niw_core == 30);
    CHECK(loaded.box.niv_core == 40);
    CHECK(loaded.box.niv_shell == 10);

    REQUIRE(std::holds_alternative<std::vector<std::string>>(loaded.lattice.symmetries));
    CHECK(std::get<std::vector<std::string>>(loaded.lattice.symmetries) ==
          std::vector<std::string>{"x-inv", "y-inv"});
    CHECK(loaded.lattice.type == LatticeType::FromWannier90);
    REQUIRE(is_path(loaded.lattice.hr_input));
    CHECK(std::get<std::string>(loaded.lattice.hr_input) == "wannier_hr.dat");
    CHECK(loaded.lattice.interaction_type == InteractionType::Kanamori);
    REQUIRE(is_numeric_list(loaded.lattice.interaction_input));
    const auto& kanamori = std::get<std::vector<Real>>(loaded.lattice.interaction_input);
    REQUIRE(kanamori.size() == 3);
    CHECK(kanamori[1] == Approx(3.5));
    CHECK(loaded.lattice.nk == MeshSize{12, 12, 1});
    REQUIRE(loaded.lattice.nq.has_value());
    CHECK(*loaded.lattice.nq == MeshSize{6, 6, 1});

    CHECK(loaded.self_consistency.max_iter == 50);
    CHECK(loaded.self_consistency.epsilon == Approx(1e-4));
    CHECK(loaded.self_consistency.mixing == Approx(0.15));
    CHECK(loaded.self_consistency.mixing_strategy == MixingStrategy::Pulay);
    CHECK(loaded.self_consistency.mixing_history_length == 5);
    CHECK(loaded.self_consistency.previous_sc_path == "runs/previous");

    CHECK(loaded.dmft.type == DmftInputType::W2dyn);
    CHECK(loaded.dmft.input_path == "dmft");
    CHECK(loaded.dmft.fname_1p == "1p-data.hdf5");
    CHECK_FALSE(loaded.dmft.do_sym_v_vp);

    CHECK_FALSE(loaded.lambda_correction.perform_lambda_correction);
    CHECK(loaded.lambda_correction.type == LambdaCorrectionType::Spch);

    CHECK(loaded.eliashberg.perform_eliashberg);
    CHECK(loaded.eliashberg.n_eig == 6);
    CHECK(loaded.eliashberg.epsilon == Approx(1e-12));
    CHECK(loaded.eliashberg.symmetry == GapSymmetry::DWave);
    CHECK(loaded.eliashberg.subfolder_name == "Eliashberg");

    CHECK(loaded.poly_fitting.do_poly_fitting);
    CHECK(loaded.poly_fitting.n_fit == 60);
    CHECK(loaded.poly_fitting.o_fit == 6);

    CHECK(loaded.output.output_path == "out");
    CHECK_FALSE(loaded.output.do_plotting);
    CHECK(loaded.output.save_quantities);
    CHECK(loaded.output.plotting_subfolder_name == "Plots");
}

TEST_CASE("Defaults are written out explicitly", "[writer]") {
    const std::string yaml = write_yaml(DgaConfig{});

    CHECK(yaml.find("symmetries: two_dimensional_square") != std::string::npos);
    CHECK(yaml.find("type: t_tp_tpp") != std::string::npos);
    CHECK(yaml.find("nk: [16, 16, 1]") != std::string::npos);
    CHECK(yaml.find("nq:") == std::string::npos);
    CHECK(yaml.find("niw_core: -1") != std::string::npos);

    parser::YamlParser parser;
    const DgaConfig loaded = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    CHECK_FALSE(loaded.lattice.nq.has_value());
    CHECK(loaded.box.niv_core == kUnset);
    REQUIRE(is_path(loaded.lattice.hr_input));
    CHECK(std::get<std::string>(loaded.lattice.hr_input).empty());
    CHECK(loaded.self_consistency.previous_sc_path.empty());
}

TEST_CASE("Resolved configuration carries a derived section", "[writer][resolution]") {
    parser::YamlParser parser;
    const DgaConfig config = parser.load_string(R"(
lattice:
  type: t_tp_tpp
  hr_input: [1.0, -0.2, 0.1]
  nk: [4, 4, 1]
eliashberg:
  perform_eliashberg: true
)");
    REQUIRE(parser.errors().empty());

    ResolveContext ctx;
    ctx.available.niw = 30;
    ctx.available.niv = 40;
    ctx.base_directory = std::filesystem::temp_directory_path();
    const auto resolved = ConfigResolver(ctx).resolve(config);
    REQUIRE(resolved.ok());

    const std::string yaml = write_yaml(resolved);
    CHECK(yaml.find("derived:") != std::string::npos);
    CHECK(yaml.find("n_bands: 1") != std::string::npos);
    CHECK(yaml.find("n_irr: 6") != std::string::npos);
    CHECK(yaml.find("pairing_box:") != std::string::npos);
    CHECK(yaml.find("hopping: [") != std::string::npos);

    SECTION("strict loading rejects the extra section") {
        parser::YamlParser strict;
        (void)strict.load_string(yaml);
        CHECK(has_diag_code(strict.errors(), diag::kUnknownField));
    }
    SECTION("lenient loading keeps the resolved values") {
        parser::YamlParser lenient(parser::YamlParserOptions{false});
        const DgaConfig loaded = lenient.load_string(yaml);
        REQUIRE(lenient.errors().empty());
        CHECK(has_diag_code(lenient.warnings(), diag::kUnknownFieldWarning));
        CHECK(loaded.box.niw_core == 30);
        CHECK(loaded.box.niv_core == 40);
        REQUIRE(loaded.lattice.nq.has_value());
        CHECK(*loaded.lattice.nq == MeshSize{4, 4, 1});
        CHECK(loaded.output.output_path == resolved.paths.output.string());
    }
}

TEST_CASE("Text files are written with their folders", "[writer][io]") {
    const auto root = std::filesystem::temp_directory_path() / "dgaconf_writer_test";
    std::filesystem::remove_all(root);

    const auto target = root / "nested" / "folder" / "config.yaml";
    write_text_file(target, "box_sizes:\n  niv_shell: 4\n");
    REQUIRE(std::filesystem::is_regular_file(target));
    CHECK(read_file(target) == "box_sizes:\n  niv_shell: 4\n");

    // A regular file in place of the parent folder
    const auto blocked = target / "child.yaml";
    CHECK_THROWS_AS(write_text_file(blocked, "x: 1\n"), std::runtime_error);

    std::filesystem::remove_all(root);
}
