#pragma once

#include <Eigen/Core>

#include <array>
#include <complex>
#include <cstddef>

namespace dgaconf::v1 {

using Real = double;
using Complex = std::complex<Real>;
using Index = Eigen::Index;

using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
using ComplexMatrix = Eigen::MatrixXcd;

// Points per direction of a Brillouin-zone mesh (x, y, z)
using MeshSize = std::array<int, 3>;

// Relative lattice vector in units of the lattice constants
using LatticeVector = std::array<int, 3>;

// Sentinel for "derive from context"
inline constexpr int kUnset = -1;

}  // namespace dgaconf::v1
