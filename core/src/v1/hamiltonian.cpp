#include "dgaconf/v1/hamiltonian.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <map>
#include <numeric>
#include <sstream>
#include <stdexcept>
#include <string>

namespace dgaconf::v1 {

namespace {

constexpr LatticeVector kOrigin{0, 0, 0};

std::ifstream open_input(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }
    return file;
}

// Whitespace separated tokens of one line, '#' starts a comment
std::vector<std::string> split_line(const std::string& line) {
    std::istringstream in(line.substr(0, line.find('#')));
    std::vector<std::string> tokens;
    std::string token;
    while (in >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::vector<std::string> next_tokens(std::istream& in, const std::filesystem::path& path) {
    std::string line;
    while (std::getline(in, line)) {
        auto tokens = split_line(line);
        if (!tokens.empty()) {
            return tokens;
        }
    }
    throw std::runtime_error("Unexpected end of file: " + path.string());
}

int to_int(const std::string& token, const std::filesystem::path& path) {
    std::size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(token, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used != token.size()) {
        throw std::runtime_error("Expected an integer, got '" + token + "' in " + path.string());
    }
    return value;
}

std::vector<Real> read_numbers(std::istream& in) {
    std::vector<Real> values;
    Real value = 0.0;
    while (in >> value) {
        values.push_back(value);
    }
    return values;
}

int read_header_count(std::istream& in, const std::filesystem::path& path, const char* what) {
    const auto tokens = next_tokens(in, path);
    const int count = to_int(tokens.front(), path);
    if (count <= 0) {
        throw std::runtime_error(std::string("Non-positive ") + what + " in " + path.string());
    }
    return count;
}

// Everything after "<n_bands>\n<n_r>\n<n_r weights>" as a flat number list
std::vector<Real> read_real_space_body(std::istream& in, const std::filesystem::path& path,
                                       RealSpaceHeader& header, std::vector<Real>& weights) {
    header.n_bands = read_header_count(in, path, "band count");
    header.n_r = read_header_count(in, path, "lattice vector count");
    auto numbers = read_numbers(in);
    if (numbers.size() < static_cast<std::size_t>(header.n_r)) {
        throw std::runtime_error("Missing degeneracy weights in " + path.string());
    }
    weights.assign(numbers.begin(), numbers.begin() + header.n_r);
    numbers.erase(numbers.begin(), numbers.begin() + header.n_r);
    return numbers;
}

LatticeVector lattice_vector_at(const std::vector<Real>& row) {
    return {static_cast<int>(std::lround(row[0])), static_cast<int>(std::lround(row[1])),
            static_cast<int>(std::lround(row[2]))};
}

}  // namespace

HoppingElement::HoppingElement(LatticeVector r, std::array<int, 2> o, Real v)
    : r_lat(r), orbs(o), value(v) {
    if (orbs[0] <= 0 || orbs[1] <= 0) {
        throw std::invalid_argument("HoppingElement: orbital indices must be greater than 0");
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("HoppingElement: value must be a finite number");
    }
}

InteractionElement::InteractionElement(LatticeVector r, std::array<int, 4> o, Real v)
    : r_lat(r), orbs(o), value(v) {
    if (std::any_of(orbs.begin(), orbs.end(), [](int orb) { return orb <= 0; })) {
        throw std::invalid_argument("InteractionElement: orbital indices must be greater than 0");
    }
    if (!std::isfinite(value)) {
        throw std::invalid_argument("InteractionElement: value must be a finite number");
    }
}

LocalInteraction::LocalInteraction(int n_bands)
    : n_bands_(n_bands), matrix_(Matrix::Zero(n_bands * n_bands, n_bands * n_bands)) {}

Real LocalInteraction::operator()(int a, int b, int c, int d) const {
    return matrix_(a * n_bands_ + b, c * n_bands_ + d);
}

Real& LocalInteraction::operator()(int a, int b, int c, int d) {
    return matrix_(a * n_bands_ + b, c * n_bands_ + d);
}

bool LocalInteraction::has_swapping_symmetry(Real tol) const {
    for (int a = 0; a < n_bands_; ++a) {
        for (int b = 0; b < n_bands_; ++b) {
            for (int c = 0; c < n_bands_; ++c) {
                for (int d = 0; d < n_bands_; ++d) {
                    if (std::abs((*this)(a, b, c, d) - (*this)(b, a, d, c)) > tol) {
                        return false;
                    }
                }
            }
        }
    }
    return true;
}

KanamoriParameters make_kanamori_parameters(int n_bands, Real u, Real j, std::optional<Real> u_prime) {
    if (n_bands <= 0) {
        throw std::invalid_argument("Kanamori interaction needs at least one band");
    }
    KanamoriParameters params;
    params.n_bands = n_bands;
    params.u = u;
    params.j = j;
    params.u_prime = u_prime.value_or(u - 2.0 * j);
    return params;
}

Hamiltonian& Hamiltonian::add_kinetic_term(const std::vector<HoppingElement>& elements) {
    if (elements.empty()) {
        throw std::invalid_argument("Hamiltonian: empty hopping list");
    }
    if (std::any_of(elements.begin(), elements.end(),
                    [](const HoppingElement& el) { return el.r_lat == kOrigin; })) {
        throw std::invalid_argument("Hamiltonian: local hopping is not allowed");
    }

    std::map<LatticeVector, std::size_t> r_to_index;
    int n_orbs = 0;
    for (const auto& el : elements) {
        r_to_index.emplace(el.r_lat, 0);
        n_orbs = std::max({n_orbs, el.orbs[0], el.orbs[1]});
    }
    std::size_t next = 0;
    r_grid_.clear();
    for (auto& [r, index] : r_to_index) {
        index = next++;
        r_grid_.push_back(r);
    }

    r_weights_.assign(r_grid_.size(), 1.0);
    er_.assign(r_grid_.size(), ComplexMatrix::Zero(n_orbs, n_orbs));
    hk_.clear();
    for (const auto& el : elements) {
        er_[r_to_index.at(el.r_lat)](el.orbs[0] - 1, el.orbs[1] - 1) = el.value;
    }
    return *this;
}

Hamiltonian& Hamiltonian::add_interaction_term(const std::vector<InteractionElement>& elements) {
    if (elements.empty()) {
        throw std::invalid_argument("Hamiltonian: empty interaction list");
    }
    int n_orbs = 0;
    for (const auto& el : elements) {
        n_orbs = std::max(n_orbs, *std::max_element(el.orbs.begin(), el.orbs.end()));
    }

    local_interaction_ = LocalInteraction(n_orbs);
    nonlocal_interaction_.clear();
    for (const auto& el : elements) {
        if (el.r_lat == kOrigin) {
            local_interaction_(el.orbs[0] - 1, el.orbs[1] - 1, el.orbs[2] - 1, el.orbs[3] - 1) = el.value;
        } else {
            nonlocal_interaction_.push_back(el);
        }
    }
    return *this;
}

Hamiltonian& Hamiltonian::kinetic_one_band_2d_t_tp_tpp(Real t, Real tp, Real tpp) {
    const std::array<int, 2> orbs{1, 1};
    return add_kinetic_term({
        HoppingElement({1, 0, 0}, orbs, -t),
        HoppingElement({0, 1, 0}, orbs, -t),
        HoppingElement({-1, 0, 0}, orbs, -t),
        HoppingElement({0, -1, 0}, orbs, -t),
        HoppingElement({1, 1, 0}, orbs, -tp),
        HoppingElement({1, -1, 0}, orbs, -tp),
        HoppingElement({-1, 1, 0}, orbs, -tp),
        HoppingElement({-1, -1, 0}, orbs, -tp),
        HoppingElement({2, 0, 0}, orbs, -tpp),
        HoppingElement({0, 2, 0}, orbs, -tpp),
        HoppingElement({-2, 0, 0}, orbs, -tpp),
        HoppingElement({0, -2, 0}, orbs, -tpp),
    });
}

Hamiltonian& Hamiltonian::single_band_interaction(Real u) {
    return single_band_interaction_as_multiband(u, 1);
}

Hamiltonian& Hamiltonian::single_band_interaction_as_multiband(Real u, int n_bands) {
    if (n_bands <= 0) {
        throw std::invalid_argument("Hamiltonian: band count must be positive");
    }
    std::vector<InteractionElement> elements;
    elements.reserve(static_cast<std::size_t>(n_bands * n_bands * n_bands * n_bands));
    for (int a = 1; a <= n_bands; ++a) {
        for (int b = 1; b <= n_bands; ++b) {
            for (int c = 1; c <= n_bands; ++c) {
                for (int d = 1; d <= n_bands; ++d) {
                    const bool first = (a == 1 && b == 1 && c == 1 && d == 1);
                    elements.emplace_back(kOrigin, std::array<int, 4>{a, b, c, d}, first ? u : 0.0);
                }
            }
        }
    }
    return add_interaction_term(elements);
}

Hamiltonian& Hamiltonian::kanamori_interaction(const KanamoriParameters& params) {
    const int n = params.n_bands;
    std::vector<InteractionElement> elements;
    for (int a = 0; a < n; ++a) {
        for (int b = 0; b < n; ++b) {
            for (int c = 0; c < n; ++c) {
                for (int d = 0; d < n; ++d) {
                    const std::array<int, 4> bands{a + 1, b + 1, c + 1, d + 1};
                    if (a == b && b == c && c == d) {
                        elements.emplace_back(kOrigin, bands, params.u);  // U_llll
                    } else if ((a == d && b == c) || (a == c && b == d)) {
                        elements.emplace_back(kOrigin, bands, params.j);  // U_lmml, U_lmlm
                    } else if (a == b && c == d) {
                        elements.emplace_back(kOrigin, bands, params.u_prime);  // U_llmm
                    }
                }
            }
        }
    }
    return add_interaction_term(elements);
}

Hamiltonian& Hamiltonian::read_hr_w2k(const std::filesystem::path& path) {
    auto file = open_input(path);
    std::string banner;
    std::getline(file, banner);

    RealSpaceHeader header;
    std::vector<Real> weights;
    const auto body = read_real_space_body(file, path, header, weights);

    constexpr std::size_t kColumns = 7;  // rx ry rz o1 o2 re im
    const std::size_t n_block = static_cast<std::size_t>(header.n_bands * header.n_bands);
    const std::size_t expected = static_cast<std::size_t>(header.n_r) * n_block * kColumns;
    if (body.size() != expected) {
        throw std::runtime_error("Malformed hr file " + path.string() + ": expected " +
                                 std::to_string(expected) + " values after the header, found " +
                                 std::to_string(body.size()));
    }

    r_grid_.assign(static_cast<std::size_t>(header.n_r), kOrigin);
    r_weights_ = weights;
    er_.assign(static_cast<std::size_t>(header.n_r), ComplexMatrix::Zero(header.n_bands, header.n_bands));
    hk_.clear();

    for (std::size_t row = 0; row < body.size() / kColumns; ++row) {
        const std::vector<Real> line(body.begin() + static_cast<std::ptrdiff_t>(row * kColumns),
                                     body.begin() + static_cast<std::ptrdiff_t>((row + 1) * kColumns));
        const std::size_t ir = row / n_block;
        const int o1 = static_cast<int>(std::lround(line[3]));
        const int o2 = static_cast<int>(std::lround(line[4]));
        if (o1 < 1 || o1 > header.n_bands || o2 < 1 || o2 > header.n_bands) {
            throw std::runtime_error("Orbital index out of range in " + path.string() + " (row " +
                                     std::to_string(row + 1) + ")");
        }
        r_grid_[ir] = lattice_vector_at(line);
        er_[ir](o1 - 1, o2 - 1) = Complex(line[5], line[6]);
    }
    return *this;
}

Hamiltonian& Hamiltonian::read_umatrix(const std::filesystem::path& path) {
    auto file = open_input(path);
    RealSpaceHeader header;
    std::vector<Real> weights;
    const auto body = read_real_space_body(file, path, header, weights);

    constexpr std::size_t kColumns = 9;  // rx ry rz o1 o2 o3 o4 re im
    if (body.empty() || body.size() % kColumns != 0) {
        throw std::runtime_error("Malformed interaction file " + path.string() +
                                 ": entries must have 9 columns");
    }

    std::vector<InteractionElement> elements;
    elements.reserve(body.size() / kColumns);
    for (std::size_t row = 0; row < body.size() / kColumns; ++row) {
        const auto* line = body.data() + row * kColumns;
        const std::array<int, 4> orbs{
            static_cast<int>(std::lround(line[3])), static_cast<int>(std::lround(line[4])),
            static_cast<int>(std::lround(line[5])), static_cast<int>(std::lround(line[6]))};
        if (std::any_of(orbs.begin(), orbs.end(), [&](int o) { return o > header.n_bands; })) {
            throw std::runtime_error("Orbital index out of range in " + path.string() + " (row " +
                                     std::to_string(row + 1) + ")");
        }
        const LatticeVector r{static_cast<int>(std::lround(line[0])), static_cast<int>(std::lround(line[1])),
                              static_cast<int>(std::lround(line[2]))};
        // Imaginary part is ignored, the interaction is taken to be real
        elements.emplace_back(r, orbs, line[7]);
    }
    return add_interaction_term(elements);
}

HkData Hamiltonian::read_hk_w2k(const std::filesystem::path& path) {
    auto file = open_input(path);
    HkData data;

    auto header = next_tokens(file, path);
    int n_kpoints = 0;
    if (header.front() == "VERSION") {
        const auto counts = next_tokens(file, path);
        if (counts.size() < 2) {
            throw std::runtime_error("Malformed VERSION header in " + path.string());
        }
        n_kpoints = to_int(counts[0], path);
        const int n_atoms = to_int(counts[1], path);
        for (int atom = 0; atom < n_atoms; ++atom) {
            const auto line = next_tokens(file, path);
            if (line.size() < 2) {
                throw std::runtime_error("Malformed atom line in " + path.string());
            }
            data.n_bands += to_int(line[0], path) + to_int(line[1], path);
        }
    } else if (header.size() == 4) {
        n_kpoints = to_int(header[0], path);
        data.n_bands = to_int(header[1], path) * (to_int(header[2], path) + to_int(header[3], path));
    } else if (header.size() == 3) {
        n_kpoints = to_int(header[0], path);
        data.n_bands = to_int(header[1], path);
    } else {
        throw std::runtime_error("Unrecognised hk header in " + path.string());
    }
    if (n_kpoints <= 0 || data.n_bands <= 0) {
        throw std::runtime_error("Non-positive k-point or band count in " + path.string());
    }

    const auto numbers = read_numbers(file);
    const std::size_t per_k = 3 + 2 * static_cast<std::size_t>(data.n_bands * data.n_bands);
    if (numbers.size() % per_k != 0) {
        throw std::runtime_error("Incomplete k-point block in " + path.string());
    }
    const std::size_t in_file = numbers.size() / per_k;
    if (in_file < static_cast<std::size_t>(n_kpoints)) {
        throw std::runtime_error("hk file " + path.string() + " holds " + std::to_string(in_file) +
                                 " k-points, header announces " + std::to_string(n_kpoints));
    }
    data.truncated = in_file > static_cast<std::size_t>(n_kpoints);

    const int n = data.n_bands;
    data.k_points.reserve(static_cast<std::size_t>(n_kpoints));
    data.hk.reserve(static_cast<std::size_t>(n_kpoints));
    for (int ik = 0; ik < n_kpoints; ++ik) {
        const Real* block = numbers.data() + static_cast<std::size_t>(ik) * per_k;
        data.k_points.push_back({block[0], block[1], block[2]});
        ComplexMatrix h(n, n);
        for (int row = 0; row < n; ++row) {
            for (int col = 0; col < n; ++col) {
                const Real* entry = block + 3 + 2 * (row * n + col);
                h(row, col) = Complex(entry[0], entry[1]);
            }
        }
        if (!h.isApprox(h.adjoint(), 1e-8)) {
            data.hermitian = false;
        }
        data.hk.push_back(std::move(h));
    }
    return data;
}

RealSpaceHeader Hamiltonian::read_real_space_header(const std::filesystem::path& path) {
    auto file = open_input(path);
    auto first = next_tokens(file, path);
    RealSpaceHeader header;
    // wannier_hr.dat starts with a free-text banner, the custom format does not
    std::size_t used = 0;
    bool numeric = first.size() == 1;
    if (numeric) {
        try {
            header.n_bands = std::stoi(first.front(), &used);
        } catch (const std::logic_error&) {
            used = 0;
        }
        numeric = used == first.front().size();
    }
    if (!numeric) {
        header.n_bands = read_header_count(file, path, "band count");
    }
    header.n_r = read_header_count(file, path, "lattice vector count");
    if (header.n_bands <= 0) {
        throw std::runtime_error("Non-positive band count in " + path.string());
    }
    return header;
}

Hamiltonian& Hamiltonian::set_hk(HkData data) {
    hk_ = std::move(data.hk);
    er_.clear();
    r_grid_.clear();
    r_weights_.clear();
    return *this;
}

int Hamiltonian::n_bands() const {
    if (!er_.empty()) {
        return static_cast<int>(er_.front().rows());
    }
    if (!hk_.empty()) {
        return static_cast<int>(hk_.front().rows());
    }
    return local_interaction_.n_bands();
}

std::vector<ComplexMatrix> Hamiltonian::ek(const KGrid& grid) const {
    if (!hk_.empty()) {
        if (static_cast<int>(hk_.size()) != grid.nk_tot()) {
            throw std::invalid_argument("Hamiltonian::ek: H(k) was read on " + std::to_string(hk_.size()) +
                                        " points, mesh has " + std::to_string(grid.nk_tot()));
        }
        return hk_;
    }
    if (er_.empty()) {
        throw std::logic_error("Hamiltonian::ek: no kinetic term set");
    }

    const int n = n_bands();
    std::vector<ComplexMatrix> result(static_cast<std::size_t>(grid.nk_tot()), ComplexMatrix::Zero(n, n));
    for (int ik = 0; ik < grid.nk_tot(); ++ik) {
        const auto k = grid.k_point(ik);
        auto& hk = result[static_cast<std::size_t>(ik)];
        for (std::size_t ir = 0; ir < er_.size(); ++ir) {
            const auto& r = r_grid_[ir];
            const Real phase = r[0] * k[0] + r[1] * k[1] + r[2] * k[2];
            hk += std::polar(1.0 / r_weights_[ir], phase) * er_[ir];
        }
    }
    return result;
}

}  // namespace dgaconf::v1
