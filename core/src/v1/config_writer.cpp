#include "dgaconf/v1/config_writer.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <variant>

namespace dgaconf::v1 {

namespace {

template <typename T>
YAML::Node flow_sequence(const T& values) {
    YAML::Node node(YAML::NodeType::Sequence);
    for (const auto& value : values) {
        node.push_back(value);
    }
    node.SetStyle(YAML::EmitterStyle::Flow);
    return node;
}

YAML::Node lattice_input_node(const LatticeInput& input) {
    if (const auto* path = std::get_if<std::string>(&input)) {
        return YAML::Node(*path);
    }
    return flow_sequence(std::get<std::vector<Real>>(input));
}

YAML::Node box_node(const FrequencyBox& box) {
    YAML::Node node;
    node["niw_core"] = box.niw_core;
    node["niv_core"] = box.niv_core;
    node["niv_shell"] = box.niv_shell;
    return node;
}

YAML::Node grid_node(const GridSummary& grid) {
    YAML::Node node;
    node["n"] = flow_sequence(grid.n);
    node["n_tot"] = grid.n_tot;
    node["n_irr"] = grid.n_irr;
    return node;
}

YAML::Node config_node(const DgaConfig& config) {
    YAML::Node root;

    YAML::Node box = root["box_sizes"];
    box["niw_core"] = config.box.niw_core;
    box["niv_core"] = config.box.niv_core;
    box["niv_shell"] = config.box.niv_shell;

    YAML::Node lattice = root["lattice"];
    if (const auto* preset = std::get_if<std::string>(&config.lattice.symmetries)) {
        lattice["symmetries"] = *preset;
    } else {
        lattice["symmetries"] = flow_sequence(std::get<std::vector<std::string>>(config.lattice.symmetries));
    }
    lattice["type"] = to_string(config.lattice.type);
    lattice["hr_input"] = lattice_input_node(config.lattice.hr_input);
    lattice["interaction_type"] = to_string(config.lattice.interaction_type);
    lattice["interaction_input"] = lattice_input_node(config.lattice.interaction_input);
    lattice["nk"] = flow_sequence(config.lattice.nk);
    if (config.lattice.nq) {
        lattice["nq"] = flow_sequence(*config.lattice.nq);
    }

    const auto& sc_cfg = config.self_consistency;
    YAML::Node sc = root["self_consistency"];
    sc["max_iter"] = sc_cfg.max_iter;
    sc["save_iter"] = sc_cfg.save_iter;
    sc["epsilon"] = sc_cfg.epsilon;
    sc["mixing"] = sc_cfg.mixing;
    sc["mixing_strategy"] = to_string(sc_cfg.mixing_strategy);
    sc["mixing_history_length"] = sc_cfg.mixing_history_length;
    sc["previous_sc_path"] = sc_cfg.previous_sc_path;

    YAML::Node dmft = root["dmft_input"];
    dmft["type"] = to_string(config.dmft.type);
    dmft["input_path"] = config.dmft.input_path;
    dmft["fname_1p"] = config.dmft.fname_1p;
    dmft["fname_2p"] = config.dmft.fname_2p;
    dmft["do_sym_v_vp"] = config.dmft.do_sym_v_vp;

    YAML::Node lc = root["lambda_correction"];
    lc["perform_lambda_correction"] = config.lambda_correction.perform_lambda_correction;
    lc["type"] = to_string(config.lambda_correction.type);

    const auto& el_cfg = config.eliashberg;
    YAML::Node el = root["eliashberg"];
    el["perform_eliashberg"] = el_cfg.perform_eliashberg;
    el["save_pairing_vertex"] = el_cfg.save_pairing_vertex;
    el["save_fq"] = el_cfg.save_fq;
    el["n_eig"] = el_cfg.n_eig;
    el["epsilon"] = el_cfg.epsilon;
    el["symmetry"] = to_string(el_cfg.symmetry);
    el["include_local_part"] = el_cfg.include_local_part;
    el["subfolder_name"] = el_cfg.subfolder_name;

    YAML::Node pf = root["poly_fitting"];
    pf["do_poly_fitting"] = config.poly_fitting.do_poly_fitting;
    pf["n_fit"] = config.poly_fitting.n_fit;
    pf["o_fit"] = config.poly_fitting.o_fit;

    YAML::Node output = root["output"];
    output["output_path"] = config.output.output_path;
    output["do_plotting"] = config.output.do_plotting;
    output["save_quantities"] = config.output.save_quantities;
    output["plotting_subfolder_name"] = config.output.plotting_subfolder_name;

    return root;
}

std::string emit(const YAML::Node& root) {
    YAML::Emitter out;
    out << root;
    if (!out.good()) {
        throw std::runtime_error("YAML emitter error: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

}  // namespace

std::string write_yaml(const DgaConfig& config) {
    return emit(config_node(config));
}

std::string write_yaml(const ResolvedConfig& resolved) {
    YAML::Node root = config_node(resolved.config);

    YAML::Node derived = root["derived"];
    derived["n_bands"] = resolved.n_bands;
    derived["niv_full"] = resolved.box.niv_full();
    derived["n_fit"] = resolved.n_fit;

    std::vector<std::string> symmetries;
    for (const auto symmetry : resolved.symmetries) {
        symmetries.emplace_back(to_string(symmetry));
    }
    derived["symmetries"] = flow_sequence(symmetries);
    derived["k_grid"] = grid_node(resolved.k_grid);
    derived["q_grid"] = grid_node(resolved.q_grid);

    if (resolved.hopping) {
        derived["hopping"] = flow_sequence(*resolved.hopping);
    }
    if (resolved.kanamori) {
        YAML::Node kanamori = derived["kanamori"];
        kanamori["n_bands"] = resolved.kanamori->n_bands;
        kanamori["U"] = resolved.kanamori->u;
        kanamori["J"] = resolved.kanamori->j;
        kanamori["U_prime"] = resolved.kanamori->u_prime;
    }
    if (resolved.pairing_box) {
        derived["pairing_box"] = box_node(*resolved.pairing_box);
    }

    const auto& paths = resolved.paths;
    YAML::Node path_node = derived["paths"];
    const std::pair<const char*, const std::filesystem::path*> entries[] = {
        {"hr_input", &paths.hr_input},       {"interaction_input", &paths.interaction_input},
        {"input_path", &paths.input_path},   {"file_1p", &paths.file_1p},
        {"file_2p", &paths.file_2p},         {"previous_sc", &paths.previous_sc},
        {"output", &paths.output},           {"eliashberg", &paths.eliashberg},
        {"plots", &paths.plots}};
    for (const auto& [key, path] : entries) {
        if (!path->empty()) {
            path_node[key] = path->string();
        }
    }

    return emit(root);
}

void write_text_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Cannot create folder " + path.parent_path().string() + ": " + ec.message());
        }
    }
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open " + path.string() + " for writing");
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed writing " + path.string());
    }
}

}  // namespace dgaconf::v1
