#pragma once

#include "dgaconf/v1/types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace dgaconf::v1 {

enum class KnownSymmetry {
    XInv,    // k_x -> -k_x
    YInv,    // k_y -> -k_y
    ZInv,    // k_z -> -k_z
    XYSym,   // k_x <-> k_y
    XYInv    // (k_x, k_y) -> (-k_x, -k_y)
};

[[nodiscard]] const char* to_string(KnownSymmetry symmetry) noexcept;
[[nodiscard]] std::optional<KnownSymmetry> parse_known_symmetry(std::string_view raw);

/// Symmetry group of a named lattice preset. "none" and "" give the empty
/// group; unknown names give std::nullopt.
[[nodiscard]] std::optional<std::vector<KnownSymmetry>> symmetry_preset(std::string_view name);

/// Expand the `lattice.symmetries` field (preset name or explicit list).
/// On failure returns std::nullopt and stores the offending entry.
[[nodiscard]] std::optional<std::vector<KnownSymmetry>> expand_symmetries(
    const std::variant<std::string, std::vector<std::string>>& field,
    std::string& offending);

/// Largest number of points a k- or q-mesh may hold
inline constexpr int kMaxMeshPoints = 1 << 24;

/// nx * ny * nz without int overflow
[[nodiscard]] inline std::int64_t mesh_point_count(const MeshSize& mesh) {
    return static_cast<std::int64_t>(mesh[0]) * mesh[1] * mesh[2];
}

/// Uniform k-mesh on [0, 2pi)^3 with its reduction to the irreducible
/// Brillouin zone. Linear indices run x-major: (ix * ny + iy) * nz + iz.
class KGrid {
public:
    /// Throws std::invalid_argument for non-positive sizes or more than
    /// kMaxMeshPoints points.
    explicit KGrid(MeshSize nk, std::vector<KnownSymmetry> symmetries = {});

    [[nodiscard]] const MeshSize& nk() const { return nk_; }
    [[nodiscard]] int nk_tot() const { return nk_[0] * nk_[1] * nk_[2]; }
    [[nodiscard]] int nk_irr() const { return static_cast<int>(irrk_ind_.size()); }
    [[nodiscard]] const std::vector<KnownSymmetry>& symmetries() const { return symmetries_; }

    /// Axis values 2*pi*i/n for dimension 0, 1 or 2
    [[nodiscard]] const std::vector<Real>& axis(int dim) const;

    [[nodiscard]] int linear_index(int ix, int iy, int iz) const;
    // Both throw std::out_of_range unless 0 <= linear < nk_tot()
    [[nodiscard]] std::array<int, 3> mesh_index(int linear) const;
    [[nodiscard]] std::array<Real, 3> k_point(int linear) const;

    // Full BZ point -> representative label after applying the symmetries
    [[nodiscard]] const std::vector<int>& fbz2irrk() const { return fbz2irrk_; }
    // First full-BZ index of every irreducible point
    [[nodiscard]] const std::vector<int>& irrk_ind() const { return irrk_ind_; }
    // Full-BZ index -> irreducible index
    [[nodiscard]] const std::vector<int>& irrk_inv() const { return irrk_inv_; }
    // Multiplicity of every irreducible point
    [[nodiscard]] const std::vector<int>& irrk_count() const { return irrk_count_; }

    [[nodiscard]] Vector map_irrk2fbz(const Vector& irreducible) const;
    [[nodiscard]] Vector map_fbz2irrk(const Vector& full) const;

    /// Brillouin-zone average of data given on the irreducible points
    [[nodiscard]] Real k_mean_irrk(const Vector& irreducible) const;

private:
    MeshSize nk_;
    std::vector<KnownSymmetry> symmetries_;
    std::array<std::vector<Real>, 3> axes_;
    std::vector<int> fbz2irrk_;
    std::vector<int> irrk_ind_;
    std::vector<int> irrk_inv_;
    std::vector<int> irrk_count_;

    void apply_symmetry(KnownSymmetry symmetry);
    void apply_inversion(int dim);
    void apply_xy_swap();
    void apply_xy_inversion();
    void build_irreducible_maps();
};

}  // namespace dgaconf::v1
