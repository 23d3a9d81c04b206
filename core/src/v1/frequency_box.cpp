#include "dgaconf/v1/frequency_box.hpp"

#include <algorithm>
#include <numbers>

namespace dgaconf::v1 {

std::vector<int> bosonic_indices(int niw, int shift, bool only_positive) {
    const int first = only_positive ? shift : -niw + shift;
    const int last = niw + shift;  // inclusive
    std::vector<int> indices;
    indices.reserve(static_cast<std::size_t>(std::max(0, last - first + 1)));
    for (int n = first; n <= last; ++n) {
        indices.push_back(n);
    }
    return indices;
}

std::vector<int> fermionic_indices(int niv, int shift, bool only_positive) {
    const int first = only_positive ? shift : -niv + shift;
    const int last = niv + shift;  // exclusive
    std::vector<int> indices;
    indices.reserve(static_cast<std::size_t>(std::max(0, last - first)));
    for (int n = first; n < last; ++n) {
        indices.push_back(n);
    }
    return indices;
}

Vector bosonic_frequencies(int niw, Real beta, int shift, bool only_positive) {
    const auto indices = bosonic_indices(niw, shift, only_positive);
    Vector w(static_cast<Index>(indices.size()));
    for (std::size_t i = 0; i < indices.size(); ++i) {
        w[static_cast<Index>(i)] = 2.0 * std::numbers::pi * indices[i] / beta;
    }
    return w;
}

Vector fermionic_frequencies(int niv, Real beta, int shift, bool only_positive) {
    const auto indices = fermionic_indices(niv, shift, only_positive);
    Vector v(static_cast<Index>(indices.size()));
    for (std::size_t i = 0; i < indices.size(); ++i) {
        v[static_cast<Index>(i)] = std::numbers::pi * (2.0 * indices[i] + 1.0) / beta;
    }
    return v;
}

FrequencyBox FrequencyBox::pp_channel_box() const {
    FrequencyBox pp;
    pp.niw_core = niw_core / 3;
    pp.niv_core = std::min(niw_core / 3, niv_core / 3);
    pp.niv_shell = 0;
    return pp;
}

FrequencyBox FrequencyBox::ph_bar_channel_box() const {
    FrequencyBox ph_bar;
    ph_bar.niw_core = niw_core / 2;
    ph_bar.niv_core = std::min(niw_core / 2, niv_core / 2);
    ph_bar.niv_shell = 0;
    return ph_bar;
}

FrequencyBoxResolution resolve_frequency_box(const FrequencyBox& requested,
                                             const AvailableFrequencies& available) {
    FrequencyBoxResolution result;
    result.box = requested;

    if (available.niw >= 0) {
        if (requested.niw_core == kUnset) {
            result.box.niw_core = available.niw;
        } else if (requested.niw_core > available.niw) {
            result.box.niw_core = available.niw;
            result.niw_clamped = true;
        }
    }
    if (available.niv > 0) {
        if (requested.niv_core == kUnset) {
            result.box.niv_core = available.niv;
        } else if (requested.niv_core > available.niv) {
            result.box.niv_core = available.niv;
            result.niv_clamped = true;
        }
    }
    return result;
}

}  // namespace dgaconf::v1
