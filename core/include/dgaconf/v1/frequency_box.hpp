#pragma once

#include "dgaconf/v1/types.hpp"

#include <vector>

namespace dgaconf::v1 {

/// Integer bosonic Matsubara indices [-niw, niw] (or [0, niw])
[[nodiscard]] std::vector<int> bosonic_indices(int niw, int shift = 0, bool only_positive = false);

/// Integer fermionic Matsubara indices [-niv, niv) (or [0, niv))
[[nodiscard]] std::vector<int> fermionic_indices(int niv, int shift = 0, bool only_positive = false);

/// 2 pi n / beta for every bosonic index
[[nodiscard]] Vector bosonic_frequencies(int niw, Real beta, int shift = 0, bool only_positive = false);

/// (2n + 1) pi / beta for every fermionic index
[[nodiscard]] Vector fermionic_frequencies(int niv, Real beta, int shift = 0, bool only_positive = false);

/// Frequency counts actually present in the DMFT two-particle data.
/// kUnset when not (yet) known.
struct AvailableFrequencies {
    int niw = kUnset;
    int niv = kUnset;
};

struct FrequencyBox {
    int niw_core = kUnset;
    int niv_core = kUnset;
    int niv_shell = 0;

    [[nodiscard]] bool is_resolved() const { return niw_core >= 0 && niv_core > 0; }
    [[nodiscard]] int niv_full() const { return niv_core + niv_shell; }

    /// Box of the particle-particle channel obtained from a ph-notation
    /// vertex: w' = v + v' - w restricts both counts to a third.
    [[nodiscard]] FrequencyBox pp_channel_box() const;

    /// Box of the crossed particle-hole channel: counts are halved.
    [[nodiscard]] FrequencyBox ph_bar_channel_box() const;
};

struct FrequencyBoxResolution {
    FrequencyBox box;
    bool niw_clamped = false;
    bool niv_clamped = false;
};

/// Replace -1 by the available count and clamp requests that exceed it.
/// Unknown availability leaves the corresponding entry untouched.
[[nodiscard]] FrequencyBoxResolution resolve_frequency_box(const FrequencyBox& requested,
                                                           const AvailableFrequencies& available);

}  // namespace dgaconf::v1
