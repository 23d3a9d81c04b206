#include "dgaconf/v1/brillouin_zone.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <numbers>
#include <stdexcept>

namespace dgaconf::v1 {

namespace {

std::string normalize_symmetry_name(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (unsigned char c : raw) {
        if (c == '_') {
            out.push_back('-');
        } else if (!std::isspace(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

}  // namespace

const char* to_string(KnownSymmetry symmetry) noexcept {
    switch (symmetry) {
        case KnownSymmetry::XInv: return "x-inv";
        case KnownSymmetry::YInv: return "y-inv";
        case KnownSymmetry::ZInv: return "z-inv";
        case KnownSymmetry::XYSym: return "x-y-sym";
        case KnownSymmetry::XYInv: return "x-y-inv";
        default: return "unknown";
    }
}

std::optional<KnownSymmetry> parse_known_symmetry(std::string_view raw) {
    const std::string key = normalize_symmetry_name(raw);
    if (key == "x-inv") return KnownSymmetry::XInv;
    if (key == "y-inv") return KnownSymmetry::YInv;
    if (key == "z-inv") return KnownSymmetry::ZInv;
    if (key == "x-y-sym") return KnownSymmetry::XYSym;
    if (key == "x-y-inv") return KnownSymmetry::XYInv;
    return std::nullopt;
}

std::optional<std::vector<KnownSymmetry>> symmetry_preset(std::string_view name) {
    using enum KnownSymmetry;
    const std::string key = normalize_symmetry_name(name);
    if (key.empty() || key == "none") {
        return std::vector<KnownSymmetry>{};
    }
    if (key == "two-dimensional-square") {
        return std::vector<KnownSymmetry>{XInv, YInv, XYSym};
    }
    if (key == "two-dimensional-nematic" || key == "quasi-one-dimensional-square") {
        return std::vector<KnownSymmetry>{XInv, YInv};
    }
    if (key == "quasi-two-dimensional-square" || key == "quasi-two-dimensional-square-symmetries") {
        return std::vector<KnownSymmetry>{XInv, YInv, ZInv, XYSym};
    }
    if (key == "simultaneous-x-y-inversion") {
        return std::vector<KnownSymmetry>{XYInv};
    }
    return std::nullopt;
}

std::optional<std::vector<KnownSymmetry>> expand_symmetries(
    const std::variant<std::string, std::vector<std::string>>& field,
    std::string& offending) {
    if (const auto* preset = std::get_if<std::string>(&field)) {
        auto group = symmetry_preset(*preset);
        if (!group) {
            offending = *preset;
        }
        return group;
    }

    std::vector<KnownSymmetry> group;
    for (const auto& name : std::get<std::vector<std::string>>(field)) {
        const auto symmetry = parse_known_symmetry(name);
        if (!symmetry) {
            offending = name;
            return std::nullopt;
        }
        group.push_back(*symmetry);
    }
    return group;
}

KGrid::KGrid(MeshSize nk, std::vector<KnownSymmetry> symmetries)
    : nk_(nk), symmetries_(std::move(symmetries)) {
    if (std::any_of(nk_.begin(), nk_.end(), [](int n) { return n <= 0; })) {
        throw std::invalid_argument("KGrid: mesh size must be positive in every direction");
    }
    if (mesh_point_count(nk_) > kMaxMeshPoints) {
        throw std::invalid_argument("KGrid: mesh holds more than " + std::to_string(kMaxMeshPoints) + " points");
    }
    for (int dim = 0; dim < 3; ++dim) {
        auto& axis = axes_[dim];
        axis.resize(static_cast<std::size_t>(nk_[dim]));
        for (int i = 0; i < nk_[dim]; ++i) {
            axis[i] = 2.0 * std::numbers::pi * static_cast<Real>(i) / static_cast<Real>(nk_[dim]);
        }
    }

    fbz2irrk_.resize(static_cast<std::size_t>(nk_tot()));
    for (int i = 0; i < nk_tot(); ++i) {
        fbz2irrk_[i] = i;
    }
    for (const auto symmetry : symmetries_) {
        apply_symmetry(symmetry);
    }
    build_irreducible_maps();
}

const std::vector<Real>& KGrid::axis(int dim) const {
    if (dim < 0 || dim > 2) {
        throw std::out_of_range("KGrid::axis: dimension must be 0, 1 or 2");
    }
    return axes_[dim];
}

int KGrid::linear_index(int ix, int iy, int iz) const {
    return (ix * nk_[1] + iy) * nk_[2] + iz;
}

std::array<int, 3> KGrid::mesh_index(int linear) const {
    if (linear < 0 || linear >= nk_tot()) {
        throw std::out_of_range("KGrid: linear index " + std::to_string(linear) + " outside [0, " +
                                std::to_string(nk_tot()) + ")");
    }
    const int iz = linear % nk_[2];
    const int iy = (linear / nk_[2]) % nk_[1];
    const int ix = linear / (nk_[1] * nk_[2]);
    return {ix, iy, iz};
}

std::array<Real, 3> KGrid::k_point(int linear) const {
    const auto idx = mesh_index(linear);
    return {axes_[0][idx[0]], axes_[1][idx[1]], axes_[2][idx[2]]};
}

Vector KGrid::map_irrk2fbz(const Vector& irreducible) const {
    if (irreducible.size() != nk_irr()) {
        throw std::invalid_argument("KGrid::map_irrk2fbz: size does not match the irreducible mesh");
    }
    Vector full(nk_tot());
    for (int k = 0; k < nk_tot(); ++k) {
        full[k] = irreducible[irrk_inv_[k]];
    }
    return full;
}

Vector KGrid::map_fbz2irrk(const Vector& full) const {
    if (full.size() != nk_tot()) {
        throw std::invalid_argument("KGrid::map_fbz2irrk: size does not match the full mesh");
    }
    Vector irreducible(nk_irr());
    for (int i = 0; i < nk_irr(); ++i) {
        irreducible[i] = full[irrk_ind_[i]];
    }
    return irreducible;
}

Real KGrid::k_mean_irrk(const Vector& irreducible) const {
    if (irreducible.size() != nk_irr()) {
        throw std::invalid_argument("KGrid::k_mean_irrk: size does not match the irreducible mesh");
    }
    Real sum = 0.0;
    for (int i = 0; i < nk_irr(); ++i) {
        sum += static_cast<Real>(irrk_count_[i]) * irreducible[i];
    }
    return sum / static_cast<Real>(nk_tot());
}

void KGrid::apply_symmetry(KnownSymmetry symmetry) {
    switch (symmetry) {
        case KnownSymmetry::XInv: apply_inversion(0); break;
        case KnownSymmetry::YInv: apply_inversion(1); break;
        case KnownSymmetry::ZInv: apply_inversion(2); break;
        case KnownSymmetry::XYSym: apply_xy_swap(); break;
        case KnownSymmetry::XYInv: apply_xy_inversion(); break;
    }
}

// Upper half of the axis takes the label of its mirror image i -> n - i.
// The sources all lie in the lower half, so the update can run in place.
void KGrid::apply_inversion(int dim) {
    const int n = nk_[dim];
    const int half = n / 2;
    for (int k = 0; k < nk_tot(); ++k) {
        auto idx = mesh_index(k);
        if (idx[dim] <= half) {
            continue;
        }
        idx[dim] = n - idx[dim];
        fbz2irrk_[k] = fbz2irrk_[linear_index(idx[0], idx[1], idx[2])];
    }
}

// Only meaningful on square meshes; left untouched otherwise.
void KGrid::apply_xy_swap() {
    if (nk_[0] != nk_[1]) {
        return;
    }
    const std::vector<int> previous = fbz2irrk_;
    for (int k = 0; k < nk_tot(); ++k) {
        const auto idx = mesh_index(k);
        const int swapped = previous[linear_index(idx[1], idx[0], idx[2])];
        fbz2irrk_[k] = std::min(previous[k], swapped);
    }
}

void KGrid::apply_xy_inversion() {
    const int half = nk_[0] / 2;
    for (int k = 0; k < nk_tot(); ++k) {
        const auto idx = mesh_index(k);
        if (idx[0] <= half || idx[1] == 0) {
            continue;
        }
        fbz2irrk_[k] = fbz2irrk_[linear_index(nk_[0] - idx[0], nk_[1] - idx[1], idx[2])];
    }
}

void KGrid::build_irreducible_maps() {
    // Sorted unique labels, as numpy.unique orders them
    std::map<int, int> label_to_irr;
    for (int k = 0; k < nk_tot(); ++k) {
        label_to_irr.emplace(fbz2irrk_[k], 0);
    }
    int next = 0;
    for (auto& [label, irr] : label_to_irr) {
        irr = next++;
    }

    irrk_ind_.assign(static_cast<std::size_t>(next), -1);
    irrk_count_.assign(static_cast<std::size_t>(next), 0);
    irrk_inv_.resize(static_cast<std::size_t>(nk_tot()));
    for (int k = 0; k < nk_tot(); ++k) {
        const int irr = label_to_irr.at(fbz2irrk_[k]);
        irrk_inv_[k] = irr;
        ++irrk_count_[irr];
        if (irrk_ind_[irr] < 0) {
            irrk_ind_[irr] = k;
        }
    }
}

}  // namespace dgaconf::v1
