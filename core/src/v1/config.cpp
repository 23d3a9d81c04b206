#include "dgaconf/v1/config.hpp"
#include "dgaconf/v1/diagnostics.hpp"

#include <algorithm>
#include <cctype>

namespace dgaconf::v1 {

namespace {

// Lower-case, '-' folded into '_'
std::string normalize_enum(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c == '-') {
            out.push_back('_');
        } else if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

}  // namespace

std::string with_diag_code(std::string_view code, std::string_view message) {
    std::string out;
    out.reserve(code.size() + message.size() + 3);
    out.append("[").append(code).append("] ").append(message);
    return out;
}

void push_error(std::vector<std::string>& errors, std::string_view code, std::string_view message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, std::string_view code, std::string_view message) {
    warnings.push_back(with_diag_code(code, message));
}

bool has_diag_code(const std::vector<std::string>& messages, std::string_view code) {
    const std::string tag = "[" + std::string(code) + "]";
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& msg) {
        return msg.find(tag) != std::string::npos;
    });
}

const char* to_string(LatticeType type) noexcept {
    switch (type) {
        case LatticeType::FromWannier90: return "from_wannier90";
        case LatticeType::FromWannierHK: return "from_wannierHK";
        case LatticeType::TTpTpp: return "t_tp_tpp";
        default: return "unknown";
    }
}

const char* to_string(InteractionType type) noexcept {
    switch (type) {
        case InteractionType::LocalFromDmft: return "local_from_dmft";
        case InteractionType::KanamoriFromDmft: return "kanamori_from_dmft";
        case InteractionType::Kanamori: return "kanamori";
        case InteractionType::Custom: return "custom";
        default: return "unknown";
    }
}

const char* to_string(MixingStrategy strategy) noexcept {
    switch (strategy) {
        case MixingStrategy::Linear: return "linear";
        case MixingStrategy::Pulay: return "pulay";
        default: return "unknown";
    }
}

const char* to_string(DmftInputType type) noexcept {
    switch (type) {
        case DmftInputType::W2dyn: return "w2dyn";
        default: return "unknown";
    }
}

const char* to_string(LambdaCorrectionType type) noexcept {
    switch (type) {
        case LambdaCorrectionType::Sp: return "sp";
        case LambdaCorrectionType::Spch: return "spch";
        default: return "unknown";
    }
}

const char* to_string(GapSymmetry symmetry) noexcept {
    switch (symmetry) {
        case GapSymmetry::PWaveX: return "p-wave-x";
        case GapSymmetry::PWaveY: return "p-wave-y";
        case GapSymmetry::DWave: return "d-wave";
        case GapSymmetry::Random: return "random";
        default: return "unknown";
    }
}

std::optional<LatticeType> parse_lattice_type(std::string_view raw) {
    const std::string key = normalize_enum(raw);
    if (key == "from_wannier90") return LatticeType::FromWannier90;
    if (key == "from_wannierhk") return LatticeType::FromWannierHK;
    if (key == "t_tp_tpp") return LatticeType::TTpTpp;
    return std::nullopt;
}

std::optional<InteractionType> parse_interaction_type(std::string_view raw) {
    const std::string key = normalize_enum(raw);
    if (key.empty() || key == "local_from_dmft") return InteractionType::LocalFromDmft;
    if (key == "kanamori_from_dmft") return InteractionType::KanamoriFromDmft;
    if (key == "kanamori") return InteractionType::Kanamori;
    if (key == "custom") return InteractionType::Custom;
    return std::nullopt;
}

std::optional<MixingStrategy> parse_mixing_strategy(std::string_view raw) {
    const std::string key = normalize_enum(raw);
    if (key == "linear") return MixingStrategy::Linear;
    if (key == "pulay") return MixingStrategy::Pulay;
    return std::nullopt;
}

std::optional<DmftInputType> parse_dmft_input_type(std::string_view raw) {
    const std::string key = normalize_enum(raw);
    if (key == "w2dyn") return DmftInputType::W2dyn;
    return std::nullopt;
}

std::optional<LambdaCorrectionType> parse_lambda_correction_type(std::string_view raw) {
    const std::string key = normalize_enum(raw);
    if (key == "sp") return LambdaCorrectionType::Sp;
    if (key == "spch") return LambdaCorrectionType::Spch;
    return std::nullopt;
}

std::optional<GapSymmetry> parse_gap_symmetry(std::string_view raw) {
    const std::string key = normalize_enum(raw);
    if (key == "p_wave_x") return GapSymmetry::PWaveX;
    if (key == "p_wave_y") return GapSymmetry::PWaveY;
    if (key == "d_wave") return GapSymmetry::DWave;
    if (key == "random") return GapSymmetry::Random;
    return std::nullopt;
}

std::filesystem::path resolve_path(const std::filesystem::path& base, const std::filesystem::path& path) {
    if (path.empty()) {
        return {};
    }
    const std::filesystem::path joined = path.is_absolute() ? path : base / path;
    auto normal = std::filesystem::absolute(joined).lexically_normal();
    // "dir/" and "dir/." name the folder itself
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

}  // namespace dgaconf::v1
