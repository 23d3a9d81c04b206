#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "dgaconf/v1/diagnostics.hpp"
#include "dgaconf/v1/parser/yaml_parser.hpp"
#include "dgaconf/v1/resolution.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace dgaconf::v1;
using Catch::Approx;

namespace {

DgaConfig parse(const std::string& yaml) {
    parser::YamlParser parser;
    DgaConfig config = parser.load_string(yaml);
    REQUIRE(parser.errors().empty());
    return config;
}

const std::string kSingleBand = R"(
lattice:
  type: t_tp_tpp
  hr_input: [1.0, -0.2, 0.1]
  nk: [4, 4, 1]
dmft_input:
  input_path: dmft
)";

ResolveContext make_context(int niw, int niv) {
    ResolveContext ctx;
    ctx.available.niw = niw;
    ctx.available.niv = niv;
    return ctx;
}

std::filesystem::path make_temp_dir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

}  // namespace

TEST_CASE("Resolution replaces -1 box sizes by the available frequencies", "[resolution][box]") {
    const auto config = parse(kSingleBand + "box_sizes:\n  niv_shell: 20\n");
    const auto resolved = ConfigResolver(make_context(60, 80)).resolve(config);

    REQUIRE(resolved.ok());
    CHECK(resolved.box.niw_core == 60);
    CHECK(resolved.box.niv_core == 80);
    CHECK(resolved.box.niv_shell == 20);
    CHECK(resolved.box.niv_full() == 100);
    CHECK(resolved.config.box.niw_core == 60);
    CHECK(resolved.config.box.niv_core == 80);
    CHECK_FALSE(has_diag_code(resolved.warnings, diag::kBoxClamped));
}

TEST_CASE("Resolution clamps boxes larger than the input", "[resolution][box]") {
    const auto config = parse(kSingleBand + "box_sizes:\n  niw_core: 100\n  niv_core: 20\n");
    const auto resolved = ConfigResolver(make_context(60, 80)).resolve(config);

    REQUIRE(resolved.ok());
    CHECK(resolved.box.niw_core == 60);
    CHECK(resolved.box.niv_core == 20);
    REQUIRE(has_diag_code(resolved.warnings, diag::kBoxClamped));
    CHECK(resolved.warnings.size() == 1);
}

TEST_CASE("Resolution keeps -1 when availability is unknown", "[resolution][box]") {
    const auto config = parse(kSingleBand);
    const auto resolved = ConfigResolver().resolve(config);

    REQUIRE(resolved.ok());
    CHECK(resolved.box.niw_core == -1);
    CHECK(resolved.box.niv_core == -1);
    CHECK(resolved.n_fit == -1);
    CHECK(has_diag_code(resolved.warnings, diag::kBoxUnresolved));
    CHECK_FALSE(resolved.pairing_box.has_value());
}

TEST_CASE("Resolution derives n_fit from niv_core", "[resolution][fit]") {
    auto config = parse(kSingleBand + "poly_fitting:\n  do_poly_fitting: true\n");
    auto resolved = ConfigResolver(make_context(30, 50)).resolve(config);
    REQUIRE(resolved.ok());
    CHECK(resolved.n_fit == 90);
    CHECK(resolved.config.poly_fitting.n_fit == 90);

    config.poly_fitting.n_fit = 64;
    resolved = ConfigResolver(make_context(30, 50)).resolve(config);
    REQUIRE(resolved.ok());
    CHECK(resolved.n_fit == 64);

    config.poly_fitting.n_fit = -1;
    config.poly_fitting.o_fit = 50;
    resolved = ConfigResolver(make_context(30, 5)).resolve(config);
    CHECK(has_diag_code(resolved.errors, diag::kFitWindow));
}

TEST_CASE("Resolution reports k and q grid sizes", "[resolution][lattice]") {
    const auto config = parse(kSingleBand);
    const auto resolved = ConfigResolver(make_context(10, 10)).resolve(config);

    REQUIRE(resolved.ok());
    REQUIRE(resolved.symmetries.size() == 3);
    CHECK(resolved.symmetries[2] == KnownSymmetry::XYSym);
    CHECK(resolved.k_grid.n == MeshSize{4, 4, 1});
    CHECK(resolved.k_grid.n_tot == 16);
    CHECK(resolved.k_grid.n_irr == 6);
    // nq falls back to nk
    CHECK(resolved.q_grid.n == MeshSize{4, 4, 1});
    REQUIRE(resolved.config.lattice.nq.has_value());
    CHECK(*resolved.config.lattice.nq == MeshSize{4, 4, 1});

    REQUIRE(resolved.hopping.has_value());
    CHECK((*resolved.hopping)[0] == Approx(1.0));
    CHECK((*resolved.hopping)[1] == Approx(-0.2));
    CHECK((*resolved.hopping)[2] == Approx(0.1));
    CHECK(resolved.n_bands == 1);
}

TEST_CASE("Resolution fills in U' = U - 2J", "[resolution][kanamori]") {
    const auto config = parse(R"(
lattice:
  type: from_wannier90
  hr_input: wannier_hr.dat
  interaction_type: kanamori
  interaction_input: [3, 2.0, 0.4]
  nk: [2, 2, 1]
)");
    const auto resolved = ConfigResolver(make_context(10, 10)).resolve(config);

    REQUIRE(resolved.ok());
    REQUIRE(resolved.kanamori.has_value());
    CHECK(resolved.kanamori->n_bands == 3);
    CHECK(resolved.kanamori->u == Approx(2.0));
    CHECK(resolved.kanamori->j == Approx(0.4));
    CHECK(resolved.kanamori->u_prime == Approx(1.2));
    CHECK(resolved.n_bands == 3);

    const auto& params = std::get<std::vector<Real>>(resolved.config.lattice.interaction_input);
    REQUIRE(params.size() == 4);
    CHECK(params[3] == Approx(1.2));
}

TEST_CASE("Resolution keeps an explicit U'", "[resolution][kanamori]") {
    const auto config = parse(R"(
lattice:
  type: from_wannier90
  hr_input: wannier_hr.dat
  interaction_type: kanamori
  interaction_input: [2, 2.0, 0.4, 1.5]
)");
    const auto resolved = ConfigResolver(make_context(10, 10)).resolve(config);
    REQUIRE(resolved.kanamori.has_value());
    CHECK(resolved.kanamori->u_prime == Approx(1.5));
}

TEST_CASE("Resolution reports disagreeing band counts", "[resolution][bands]") {
    const auto config = parse(R"(
lattice:
  type: from_wannier90
  hr_input: wannier_hr.dat
  interaction_type: kanamori
  interaction_input: [3, 2.0, 0.4]
)");
    ResolveContext ctx = make_context(10, 10);
    ctx.n_bands = 2;
    const auto resolved = ConfigResolver(ctx).resolve(config);
    CHECK(has_diag_code(resolved.errors, diag::kBandsMismatch));
    CHECK(resolved.n_bands == 3);
}

TEST_CASE("Resolution warns when the band count is unknown", "[resolution][bands]") {
    const auto config = parse("lattice:\n  type: from_wannier90\n  hr_input: wannier_hr.dat\n");
    auto resolved = ConfigResolver(make_context(10, 10)).resolve(config);
    REQUIRE(resolved.ok());
    CHECK(resolved.n_bands == -1);
    CHECK(has_diag_code(resolved.warnings, diag::kBandsUnknown));

    ResolveContext ctx = make_context(10, 10);
    ctx.n_bands = 5;
    resolved = ConfigResolver(ctx).resolve(config);
    REQUIRE(resolved.ok());
    CHECK(resolved.n_bands == 5);
}

TEST_CASE("Resolution reads the band count from input files", "[resolution][bands][io]") {
    const auto dir = make_temp_dir("dgaconf_resolution_inspect");
    {
        std::ofstream hr(dir / "wannier_hr.dat");
        hr << "written on 01Jan2024\n2\n1\n1\n";
        hr << "1 0 0 1 1 -1.0 0.0\n1 0 0 1 2 0.0 0.0\n1 0 0 2 1 0.0 0.0\n1 0 0 2 2 -1.0 0.0\n";
    }

    const auto config = parse(R"(
lattice:
  type: from_wannier90
  hr_input: wannier_hr.dat
lambda_correction:
  perform_lambda_correction: true
)");

    ResolveContext ctx = make_context(10, 10);
    ctx.base_directory = dir;

    // Without inspection the band count is unknown and lambda passes
    auto resolved = ConfigResolver(ctx).resolve(config);
    CHECK(resolved.ok());

    ctx.inspect_inputs = true;
    resolved = ConfigResolver(ctx).resolve(config);
    CHECK(resolved.n_bands == 2);
    CHECK(has_diag_code(resolved.errors, diag::kLambdaMultiOrbital));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Resolution reports unreadable input files", "[resolution][io]") {
    const auto dir = make_temp_dir("dgaconf_resolution_unreadable");
    {
        std::ofstream(dir / "broken.hk") << "this is not an hk file\n";
    }

    const auto config = parse("lattice:\n  type: from_wannierHK\n  hr_input: broken.hk\n");
    ResolveContext ctx = make_context(10, 10);
    ctx.base_directory = dir;
    ctx.inspect_inputs = true;

    auto resolved = ConfigResolver(ctx).resolve(config);
    CHECK(has_diag_code(resolved.errors, diag::kInputUnreadable));

    const auto missing = parse("lattice:\n  type: from_wannier90\n  hr_input: missing_hr.dat\n");
    resolved = ConfigResolver(ctx).resolve(missing);
    CHECK(has_diag_code(resolved.errors, diag::kInputUnreadable));

    std::filesystem::remove_all(dir);
}

TEST_CASE("Resolution makes paths absolute", "[resolution][paths]") {
    const auto dir = make_temp_dir("dgaconf_resolution_paths");
    ResolveContext ctx = make_context(10, 10);
    ctx.base_directory = dir;

    SECTION("output falls back to the DMFT input folder") {
        const auto config = parse(kSingleBand);
        const auto resolved = ConfigResolver(ctx).resolve(config);
        REQUIRE(resolved.ok());

        const auto input = (dir / "dmft").lexically_normal();
        CHECK(resolved.paths.input_path == input);
        CHECK(resolved.paths.file_1p == input / "1p-data.hdf5");
        CHECK(resolved.paths.file_2p == input / "g4iw_sym.hdf5");
        CHECK(resolved.paths.output == input);
        CHECK(resolved.paths.plots == input / "Plots");
        CHECK(resolved.paths.eliashberg == input / "Eliashberg");
        CHECK(resolved.paths.hr_input.empty());
        CHECK(resolved.paths.previous_sc.empty());
        CHECK(resolved.config.output.output_path == input.string());
    }

    SECTION("explicit output and absolute paths") {
        const auto config = parse(kSingleBand + R"(
output:
  output_path: results/../out
  plotting_subfolder_name: Figures
self_consistency:
  previous_sc_path: /data/previous
)");
        const auto resolved = ConfigResolver(ctx).resolve(config);
        REQUIRE(resolved.ok());
        CHECK(resolved.paths.output == (dir / "out").lexically_normal());
        CHECK(resolved.paths.plots == (dir / "out" / "Figures").lexically_normal());
        CHECK(resolved.paths.previous_sc == std::filesystem::path("/data/previous"));
    }

    SECTION("default input folder is the base directory itself") {
        const auto config = parse("lattice:\n  hr_input: [1.0, 0.0, 0.0]\n");
        const auto resolved = ConfigResolver(ctx).resolve(config);
        REQUIRE(resolved.ok());
        CHECK(resolved.paths.input_path == dir.lexically_normal());
        CHECK(resolved.paths.plots == (dir / "Plots").lexically_normal());
    }

    std::filesystem::remove_all(dir);
}

TEST_CASE("Resolution derives the Eliashberg pairing box", "[resolution][eliashberg]") {
    const auto config = parse(kSingleBand + "eliashberg:\n  perform_eliashberg: true\n");

    auto resolved = ConfigResolver(make_context(30, 40)).resolve(config);
    REQUIRE(resolved.pairing_box.has_value());
    CHECK(resolved.pairing_box->niw_core == 10);
    CHECK(resolved.pairing_box->niv_core == 10);

    resolved = ConfigResolver(make_context(60, 20)).resolve(config);
    REQUIRE(resolved.pairing_box.has_value());
    CHECK(resolved.pairing_box->niw_core == 20);
    CHECK(resolved.pairing_box->niv_core == 6);
}

TEST_CASE("Resolution stops at validation errors", "[resolution]") {
    const auto resolved = ConfigResolver(make_context(10, 10)).resolve(DgaConfig{});
    REQUIRE_FALSE(resolved.ok());
    CHECK(has_diag_code(resolved.errors, diag::kHoppingInput));
    CHECK(resolved.k_grid.n_tot == 0);
    CHECK(resolved.paths.output.empty());
}

TEST_CASE("Resolution reports oversized inputs instead of throwing", "[resolution]") {
    SECTION("Kanamori band count beyond int") {
        const auto config = parse(R"(
lattice:
  type: from_wannier90
  hr_input: wannier_hr.dat
  interaction_type: kanamori
  interaction_input: [3000000000, 2.0, 0.5]
)");
        ResolvedConfig resolved;
        REQUIRE_NOTHROW(resolved = ConfigResolver(make_context(10, 10)).resolve(config));
        REQUIRE_FALSE(resolved.ok());
        CHECK(has_diag_code(resolved.errors, diag::kKanamoriInput));
        CHECK_FALSE(resolved.kanamori.has_value());
    }
    SECTION("k-mesh beyond the supported point count") {
        const auto config = parse(R"(
lattice:
  type: t_tp_tpp
  hr_input: [1.0, -0.2, 0.1]
  nk: [4, 4, 1]
  nq: [65536, 65536, 1]
)");
        ResolvedConfig resolved;
        REQUIRE_NOTHROW(resolved = ConfigResolver(make_context(10, 10)).resolve(config));
        REQUIRE_FALSE(resolved.ok());
        CHECK(has_diag_code(resolved.errors, diag::kRange));
        CHECK(resolved.q_grid.n_tot == 0);
    }
}
