#include "dgaconf/v1/parser/yaml_parser.hpp"
#include "dgaconf/v1/diagnostics.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <unordered_set>

namespace dgaconf::v1::parser {

namespace {

using Diagnostics = std::vector<std::string>;

const std::unordered_set<std::string>& root_keys() {
    static const std::unordered_set<std::string> keys = {
        "box_sizes", "lattice", "self_consistency", "dmft_input",
        "lambda_correction", "eliashberg", "poly_fitting", "output"};
    return keys;
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(Diagnostics& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(errors,
               diag::kTypeMismatch,
               "Type mismatch at '" + path + "' (expected " + expected +
                   ", got " + yaml_node_class(received) + ")");
}

// Absent and explicit null both mean "keep the default"
bool is_unset(const YAML::Node& node) {
    return !node || node.IsNull();
}

template <typename T>
std::optional<T> parse_scalar(const YAML::Node& node,
                              const std::string& path,
                              const char* expected,
                              Diagnostics& errors) {
    if (is_unset(node)) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, expected, node);
        return std::nullopt;
    }
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node, const std::string& path, Diagnostics& errors) {
    return parse_scalar<bool>(node, path, "boolean", errors);
}

std::optional<int> parse_int_scalar(const YAML::Node& node, const std::string& path, Diagnostics& errors) {
    return parse_scalar<int>(node, path, "integer", errors);
}

std::optional<Real> parse_real_scalar(const YAML::Node& node, const std::string& path, Diagnostics& errors) {
    return parse_scalar<Real>(node, path, "number", errors);
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               Diagnostics& errors) {
    return parse_scalar<std::string>(node, path, "string", errors);
}

template <typename T>
void assign_if(const std::optional<T>& value, T& target) {
    if (value) {
        target = *value;
    }
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   Diagnostics& errors,
                   Diagnostics& warnings,
                   bool strict) {
    if (!node || !node.IsMap()) return;
    for (const auto& it : node) {
        if (!it.first.IsScalar()) {
            push_error(errors, diag::kTypeMismatch,
                       "Type mismatch at '" + context + "' (expected scalar key, got " +
                           yaml_node_class(it.first) + ")");
            continue;
        }
        const std::string key = it.first.Scalar();
        if (allowed.find(key) != allowed.end()) {
            continue;
        }
        if (strict) {
            push_error(errors, diag::kUnknownField, "Unknown field at '" + context + "." + key + "'");
        } else {
            push_warning(warnings, diag::kUnknownFieldWarning,
                         "Ignoring unknown field at '" + context + "." + key + "'");
        }
    }
}

template <typename Enum>
void parse_enum_field(const YAML::Node& node,
                      const std::string& path,
                      std::optional<Enum> (*parse)(std::string_view),
                      const char* choices,
                      Enum& target,
                      Diagnostics& errors) {
    const auto raw = parse_string_scalar(node, path, errors);
    if (!raw) {
        return;
    }
    if (const auto value = parse(*raw)) {
        target = *value;
        return;
    }
    push_error(errors, diag::kEnumInvalid,
               "Invalid " + path + ": '" + *raw + "' (expected one of " + choices + ")");
}

std::optional<std::vector<Real>> parse_number_list(const YAML::Node& node,
                                                   const std::string& path,
                                                   Diagnostics& errors) {
    std::vector<Real> values;
    values.reserve(node.size());
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto value = parse_real_scalar(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) {
            if (is_unset(node[i])) {
                push_type_mismatch_error(errors, path + "[" + std::to_string(i) + "]", "number", node[i]);
            }
            return std::nullopt;
        }
        values.push_back(*value);
    }
    return values;
}

// Path (scalar) or literal numeric list (sequence)
void parse_lattice_input(const YAML::Node& node,
                         const std::string& path,
                         LatticeInput& target,
                         Diagnostics& errors) {
    if (is_unset(node)) {
        return;
    }
    if (node.IsSequence()) {
        if (auto values = parse_number_list(node, path, errors)) {
            target = std::move(*values);
        }
        return;
    }
    if (const auto raw = parse_string_scalar(node, path, errors)) {
        target = *raw;
    }
}

std::optional<MeshSize> parse_mesh(const YAML::Node& node, const std::string& path, Diagnostics& errors) {
    if (is_unset(node)) {
        return std::nullopt;
    }
    if (!node.IsSequence() || node.size() != 3) {
        push_type_mismatch_error(errors, path, "sequence of 3 integers", node);
        return std::nullopt;
    }
    MeshSize mesh{};
    for (std::size_t i = 0; i < 3; ++i) {
        const auto value = parse_int_scalar(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) {
            if (is_unset(node[i])) {
                push_type_mismatch_error(errors, path + "[" + std::to_string(i) + "]", "integer", node[i]);
            }
            return std::nullopt;
        }
        mesh[i] = *value;
    }
    return mesh;
}

// Section node that must be a map when present
bool open_section(const YAML::Node& node, const std::string& name, Diagnostics& errors) {
    if (is_unset(node)) {
        return false;
    }
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, name, "map", node);
        return false;
    }
    return true;
}

void parse_box_sizes(const YAML::Node& box, BoxSizes& out, Diagnostics& errors) {
    auto aliased = [&](const char* canonical, const char* alias, int& target) {
        const bool has_canonical = static_cast<bool>(box[canonical]);
        const bool has_alias = static_cast<bool>(box[alias]);
        if (has_canonical && has_alias) {
            push_error(errors, diag::kDuplicateField,
                       std::string("Both 'box_sizes.") + canonical + "' and its alias 'box_sizes." +
                           alias + "' are set");
            return;
        }
        const char* key = has_alias ? alias : canonical;
        assign_if(parse_int_scalar(box[key], std::string("box_sizes.") + key, errors), target);
    };

    aliased("niw_core", "niw", out.niw_core);
    aliased("niv_core", "niv", out.niv_core);
    assign_if(parse_int_scalar(box["niv_shell"], "box_sizes.niv_shell", errors), out.niv_shell);
}

void parse_lattice(const YAML::Node& lattice, LatticeConfig& out, Diagnostics& errors) {
    const YAML::Node symmetries = lattice["symmetries"];
    if (!is_unset(symmetries)) {
        if (symmetries.IsSequence()) {
            std::vector<std::string> names;
            bool ok = true;
            for (std::size_t i = 0; i < symmetries.size(); ++i) {
                const auto name = parse_string_scalar(
                    symmetries[i], "lattice.symmetries[" + std::to_string(i) + "]", errors);
                if (!name) {
                    ok = false;
                    break;
                }
                names.push_back(*name);
            }
            if (ok) {
                out.symmetries = std::move(names);
            }
        } else if (const auto preset = parse_string_scalar(symmetries, "lattice.symmetries", errors)) {
            out.symmetries = *preset;
        }
    } else if (symmetries && symmetries.IsNull()) {
        // explicit empty entry: no symmetry reduction
        out.symmetries = std::string("none");
    }

    parse_enum_field(lattice["type"], "lattice.type", &parse_lattice_type,
                     "'from_wannier90', 'from_wannierHK', 't_tp_tpp'", out.type, errors);
    parse_lattice_input(lattice["hr_input"], "lattice.hr_input", out.hr_input, errors);

    parse_enum_field(lattice["interaction_type"], "lattice.interaction_type", &parse_interaction_type,
                     "'local_from_dmft', 'kanamori_from_dmft', 'kanamori', 'custom'",
                     out.interaction_type, errors);
    parse_lattice_input(lattice["interaction_input"], "lattice.interaction_input", out.interaction_input,
                        errors);

    assign_if(parse_mesh(lattice["nk"], "lattice.nk", errors), out.nk);
    if (const auto nq = parse_mesh(lattice["nq"], "lattice.nq", errors)) {
        out.nq = *nq;
    }
}

void parse_self_consistency(const YAML::Node& sc, SelfConsistencyConfig& out, Diagnostics& errors) {
    assign_if(parse_int_scalar(sc["max_iter"], "self_consistency.max_iter", errors), out.max_iter);
    assign_if(parse_bool_scalar(sc["save_iter"], "self_consistency.save_iter", errors), out.save_iter);
    assign_if(parse_real_scalar(sc["epsilon"], "self_consistency.epsilon", errors), out.epsilon);
    assign_if(parse_real_scalar(sc["mixing"], "self_consistency.mixing", errors), out.mixing);
    parse_enum_field(sc["mixing_strategy"], "self_consistency.mixing_strategy", &parse_mixing_strategy,
                     "'linear', 'pulay'", out.mixing_strategy, errors);
    assign_if(parse_int_scalar(sc["mixing_history_length"], "self_consistency.mixing_history_length", errors),
              out.mixing_history_length);
    assign_if(parse_string_scalar(sc["previous_sc_path"], "self_consistency.previous_sc_path", errors),
              out.previous_sc_path);
}

void parse_dmft_input(const YAML::Node& dmft, DmftInputConfig& out, Diagnostics& errors) {
    parse_enum_field(dmft["type"], "dmft_input.type", &parse_dmft_input_type, "'w2dyn'", out.type, errors);
    assign_if(parse_string_scalar(dmft["input_path"], "dmft_input.input_path", errors), out.input_path);
    assign_if(parse_string_scalar(dmft["fname_1p"], "dmft_input.fname_1p", errors), out.fname_1p);
    assign_if(parse_string_scalar(dmft["fname_2p"], "dmft_input.fname_2p", errors), out.fname_2p);
    assign_if(parse_bool_scalar(dmft["do_sym_v_vp"], "dmft_input.do_sym_v_vp", errors), out.do_sym_v_vp);
}

void parse_lambda_correction(const YAML::Node& lc, LambdaCorrectionConfig& out, Diagnostics& errors) {
    assign_if(parse_bool_scalar(lc["perform_lambda_correction"], "lambda_correction.perform_lambda_correction",
                                errors),
              out.perform_lambda_correction);
    parse_enum_field(lc["type"], "lambda_correction.type", &parse_lambda_correction_type, "'sp', 'spch'",
                     out.type, errors);
}

void parse_eliashberg(const YAML::Node& el, EliashbergConfig& out, Diagnostics& errors) {
    assign_if(parse_bool_scalar(el["perform_eliashberg"], "eliashberg.perform_eliashberg", errors),
              out.perform_eliashberg);
    assign_if(parse_bool_scalar(el["save_pairing_vertex"], "eliashberg.save_pairing_vertex", errors),
              out.save_pairing_vertex);
    assign_if(parse_bool_scalar(el["save_fq"], "eliashberg.save_fq", errors), out.save_fq);
    assign_if(parse_int_scalar(el["n_eig"], "eliashberg.n_eig", errors), out.n_eig);
    assign_if(parse_real_scalar(el["epsilon"], "eliashberg.epsilon", errors), out.epsilon);
    parse_enum_field(el["symmetry"], "eliashberg.symmetry", &parse_gap_symmetry,
                     "'p-wave-x', 'p-wave-y', 'd-wave', 'random'", out.symmetry, errors);
    assign_if(parse_bool_scalar(el["include_local_part"], "eliashberg.include_local_part", errors),
              out.include_local_part);
    assign_if(parse_string_scalar(el["subfolder_name"], "eliashberg.subfolder_name", errors),
              out.subfolder_name);
}

void parse_poly_fitting(const YAML::Node& pf, PolyFittingConfig& out, Diagnostics& errors) {
    assign_if(parse_bool_scalar(pf["do_poly_fitting"], "poly_fitting.do_poly_fitting", errors),
              out.do_poly_fitting);
    assign_if(parse_int_scalar(pf["n_fit"], "poly_fitting.n_fit", errors), out.n_fit);
    assign_if(parse_int_scalar(pf["o_fit"], "poly_fitting.o_fit", errors), out.o_fit);
}

void parse_output(const YAML::Node& output, OutputConfig& out, Diagnostics& errors) {
    assign_if(parse_string_scalar(output["output_path"], "output.output_path", errors), out.output_path);
    assign_if(parse_bool_scalar(output["do_plotting"], "output.do_plotting", errors), out.do_plotting);
    assign_if(parse_bool_scalar(output["save_quantities"], "output.save_quantities", errors),
              out.save_quantities);
    assign_if(parse_string_scalar(output["plotting_subfolder_name"], "output.plotting_subfolder_name", errors),
              out.plotting_subfolder_name);
}

}  // namespace

YamlParser::YamlParser(YamlParserOptions options)
    : options_(options) {}

DgaConfig YamlParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        push_error(errors_, diag::kFileUnreadable, "Cannot open file: " + path.string());
        return DgaConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

DgaConfig YamlParser::load_string(const std::string& content) {
    DgaConfig config;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, config);
    return config;
}

void YamlParser::parse_yaml(const std::string& content, DgaConfig& config) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        push_error(errors_, diag::kYamlSyntax, std::string("YAML parse error: ") + e.what());
        return;
    }

    // Empty document: everything at its default
    if (is_unset(root)) {
        return;
    }
    if (!root.IsMap()) {
        push_type_mismatch_error(errors_, "root", "map", root);
        return;
    }

    validate_keys(root, root_keys(), "root", errors_, warnings_, options_.strict);

    const YAML::Node box = root["box_sizes"];
    if (open_section(box, "box_sizes", errors_)) {
        validate_keys(box, {"niw_core", "niw", "niv_core", "niv", "niv_shell"},
                      "box_sizes", errors_, warnings_, options_.strict);
        parse_box_sizes(box, config.box, errors_);
    }

    const YAML::Node lattice = root["lattice"];
    if (open_section(lattice, "lattice", errors_)) {
        validate_keys(lattice, {"symmetries", "type", "hr_input", "interaction_type", "interaction_input",
                                "nk", "nq"},
                      "lattice", errors_, warnings_, options_.strict);
        parse_lattice(lattice, config.lattice, errors_);
    }

    const YAML::Node sc = root["self_consistency"];
    if (open_section(sc, "self_consistency", errors_)) {
        validate_keys(sc, {"max_iter", "save_iter", "epsilon", "mixing", "mixing_strategy",
                           "mixing_history_length", "previous_sc_path"},
                      "self_consistency", errors_, warnings_, options_.strict);
        parse_self_consistency(sc, config.self_consistency, errors_);
    }

    const YAML::Node dmft = root["dmft_input"];
    if (open_section(dmft, "dmft_input", errors_)) {
        validate_keys(dmft, {"type", "input_path", "fname_1p", "fname_2p", "do_sym_v_vp"},
                      "dmft_input", errors_, warnings_, options_.strict);
        parse_dmft_input(dmft, config.dmft, errors_);
    }

    const YAML::Node lc = root["lambda_correction"];
    if (open_section(lc, "lambda_correction", errors_)) {
        validate_keys(lc, {"perform_lambda_correction", "type"},
                      "lambda_correction", errors_, warnings_, options_.strict);
        parse_lambda_correction(lc, config.lambda_correction, errors_);
    }

    const YAML::Node eliashberg = root["eliashberg"];
    if (open_section(eliashberg, "eliashberg", errors_)) {
        validate_keys(eliashberg, {"perform_eliashberg", "save_pairing_vertex", "save_fq", "n_eig", "epsilon",
                                   "symmetry", "include_local_part", "subfolder_name"},
                      "eliashberg", errors_, warnings_, options_.strict);
        parse_eliashberg(eliashberg, config.eliashberg, errors_);
    }

    const YAML::Node pf = root["poly_fitting"];
    if (open_section(pf, "poly_fitting", errors_)) {
        validate_keys(pf, {"do_poly_fitting", "n_fit", "o_fit"},
                      "poly_fitting", errors_, warnings_, options_.strict);
        parse_poly_fitting(pf, config.poly_fitting, errors_);
    }

    const YAML::Node output = root["output"];
    if (open_section(output, "output", errors_)) {
        validate_keys(output, {"output_path", "do_plotting", "save_quantities", "plotting_subfolder_name"},
                      "output", errors_, warnings_, options_.strict);
        parse_output(output, config.output, errors_);
    }
}

}  // namespace dgaconf::v1::parser
