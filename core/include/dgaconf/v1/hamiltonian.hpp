#pragma once

#include "dgaconf/v1/brillouin_zone.hpp"
#include "dgaconf/v1/types.hpp"

#include <array>
#include <filesystem>
#include <optional>
#include <vector>

namespace dgaconf::v1 {

/// One line of a wannier_hr.dat file: <0 | H | R> between orbitals (1-based)
struct HoppingElement {
    HoppingElement(LatticeVector r_lat, std::array<int, 2> orbs, Real value);

    LatticeVector r_lat;
    std::array<int, 2> orbs;
    Real value;
};

/// One entry U_{abcd}(R) of the interaction, orbitals 1-based
struct InteractionElement {
    InteractionElement(LatticeVector r_lat, std::array<int, 4> orbs, Real value);

    LatticeVector r_lat;
    std::array<int, 4> orbs;
    Real value;
};

/// Momentum-independent interaction U_{abcd}, stored as an n^2 x n^2 matrix
/// with compound indices (a b) and (c d). Orbital indices are 0-based.
class LocalInteraction {
public:
    LocalInteraction() = default;
    explicit LocalInteraction(int n_bands);

    [[nodiscard]] int n_bands() const { return n_bands_; }
    [[nodiscard]] const Matrix& matrix() const { return matrix_; }

    [[nodiscard]] Real operator()(int a, int b, int c, int d) const;
    Real& operator()(int a, int b, int c, int d);

    /// U_{abcd} == U_{badc}
    [[nodiscard]] bool has_swapping_symmetry(Real tol = 1e-12) const;

private:
    int n_bands_ = 0;
    Matrix matrix_;
};

struct KanamoriParameters {
    int n_bands = 1;
    Real u = 0.0;
    Real j = 0.0;
    Real u_prime = 0.0;  // U' (sometimes called V)
};

/// Build Kanamori parameters, filling in U' = U - 2J when absent
[[nodiscard]] KanamoriParameters make_kanamori_parameters(int n_bands, Real u, Real j,
                                                          std::optional<Real> u_prime = std::nullopt);

/// H(k) as read from a wannier90 .hk file
struct HkData {
    int n_bands = 0;
    std::vector<std::array<Real, 3>> k_points;
    std::vector<ComplexMatrix> hk;
    bool hermitian = true;
    bool truncated = false;  // file held more k-points than announced
};

/// Header of a real-space file (wannier_hr.dat or custom interaction file)
struct RealSpaceHeader {
    int n_bands = 0;
    int n_r = 0;
};

/// Kinetic (hopping) and interaction parts of the lattice Hamiltonian.
class Hamiltonian {
public:
    Hamiltonian() = default;

    Hamiltonian& add_kinetic_term(const std::vector<HoppingElement>& elements);
    Hamiltonian& add_interaction_term(const std::vector<InteractionElement>& elements);

    /// Square lattice with nearest (t), next-nearest (tp) and
    /// next-next-nearest (tpp) neighbour hopping
    Hamiltonian& kinetic_one_band_2d_t_tp_tpp(Real t, Real tp, Real tpp);

    Hamiltonian& single_band_interaction(Real u);
    /// Only U_{0000} = u, every other element zero
    Hamiltonian& single_band_interaction_as_multiband(Real u, int n_bands);
    Hamiltonian& kanamori_interaction(const KanamoriParameters& params);

    Hamiltonian& read_hr_w2k(const std::filesystem::path& path);
    Hamiltonian& read_umatrix(const std::filesystem::path& path);
    Hamiltonian& set_hk(HkData data);

    [[nodiscard]] static HkData read_hk_w2k(const std::filesystem::path& path);
    [[nodiscard]] static RealSpaceHeader read_real_space_header(const std::filesystem::path& path);

    [[nodiscard]] bool has_kinetic_term() const { return !er_.empty() || !hk_.empty(); }
    [[nodiscard]] bool has_interaction_term() const { return local_interaction_.n_bands() > 0; }

    /// Band count of the kinetic term (or of the interaction if no hopping is set)
    [[nodiscard]] int n_bands() const;

    [[nodiscard]] const std::vector<LatticeVector>& r_grid() const { return r_grid_; }
    [[nodiscard]] const std::vector<ComplexMatrix>& er() const { return er_; }

    /// H(k) on every point of the mesh, in the grid's linear order
    [[nodiscard]] std::vector<ComplexMatrix> ek(const KGrid& grid) const;

    [[nodiscard]] const LocalInteraction& local_interaction() const { return local_interaction_; }
    [[nodiscard]] const std::vector<InteractionElement>& nonlocal_interaction() const {
        return nonlocal_interaction_;
    }

private:
    std::vector<LatticeVector> r_grid_;
    std::vector<Real> r_weights_;
    std::vector<ComplexMatrix> er_;
    std::vector<ComplexMatrix> hk_;

    LocalInteraction local_interaction_;
    std::vector<InteractionElement> nonlocal_interaction_;
};

}  // namespace dgaconf::v1
