#pragma once

// =============================================================================
// dgaconf v1 - DGA configuration front end
// =============================================================================
// Main header of the v1 API:
// - DgaConfig sections with their defaults and the YAML parser
// - Cross-field validation and resolution against the DMFT input
// - Brillouin-zone meshes, Matsubara boxes and lattice Hamiltonian terms
// - Canonical YAML output
// =============================================================================

#include "dgaconf/v1/types.hpp"
#include "dgaconf/v1/config.hpp"
#include "dgaconf/v1/diagnostics.hpp"
#include "dgaconf/v1/parser/yaml_parser.hpp"
#include "dgaconf/v1/validation.hpp"
#include "dgaconf/v1/brillouin_zone.hpp"
#include "dgaconf/v1/frequency_box.hpp"
#include "dgaconf/v1/hamiltonian.hpp"
#include "dgaconf/v1/resolution.hpp"
#include "dgaconf/v1/config_writer.hpp"

#define DGACONF_VERSION_MAJOR 1
#define DGACONF_VERSION_MINOR 0
#define DGACONF_VERSION_PATCH 0
#define DGACONF_VERSION_STRING "1.0.0"
