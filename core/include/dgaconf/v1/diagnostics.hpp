#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace dgaconf::v1 {

// Stable diagnostic codes. Messages are rendered as "[CODE] text" so callers
// and tests can match on the code alone.
namespace diag {

// Parser
inline constexpr const char* kYamlSyntax = "DGA_YAML_E_SYNTAX";
inline constexpr const char* kUnknownField = "DGA_YAML_E_UNKNOWN_FIELD";
inline constexpr const char* kUnknownFieldWarning = "DGA_YAML_W_UNKNOWN_FIELD";
inline constexpr const char* kTypeMismatch = "DGA_YAML_E_TYPE_MISMATCH";
inline constexpr const char* kEnumInvalid = "DGA_YAML_E_ENUM_INVALID";
inline constexpr const char* kDuplicateField = "DGA_YAML_E_DUPLICATE_FIELD";
inline constexpr const char* kFileUnreadable = "DGA_YAML_E_FILE_UNREADABLE";

// Validation
inline constexpr const char* kPathRequired = "DGA_CFG_E_PATH_REQUIRED";
inline constexpr const char* kPathNotFound = "DGA_CFG_E_PATH_NOT_FOUND";
inline constexpr const char* kHoppingInput = "DGA_CFG_E_HOPPING_INPUT";
inline constexpr const char* kKanamoriInput = "DGA_CFG_E_KANAMORI_INPUT";
inline constexpr const char* kSingleOrbital = "DGA_CFG_E_SINGLE_ORBITAL";
inline constexpr const char* kPulayPersistence = "DGA_CFG_E_PULAY_PERSISTENCE";
inline constexpr const char* kLambdaMultiOrbital = "DGA_CFG_E_LAMBDA_MULTIORBITAL";
inline constexpr const char* kSymmetryUnknown = "DGA_CFG_E_SYMMETRY_UNKNOWN";
inline constexpr const char* kRange = "DGA_CFG_E_RANGE";
inline constexpr const char* kMeshSymmetry = "DGA_CFG_W_MESH_SYMMETRY";
inline constexpr const char* kUnusedInput = "DGA_CFG_W_UNUSED_INPUT";
inline constexpr const char* kInactiveOption = "DGA_CFG_W_INACTIVE_OPTION";

// Resolution
inline constexpr const char* kBoxClamped = "DGA_RES_W_BOX_CLAMPED";
inline constexpr const char* kBoxUnresolved = "DGA_RES_W_BOX_UNRESOLVED";
inline constexpr const char* kBandsUnknown = "DGA_RES_W_BANDS_UNKNOWN";
inline constexpr const char* kBandsMismatch = "DGA_RES_E_BANDS_MISMATCH";
inline constexpr const char* kInputUnreadable = "DGA_RES_E_INPUT_UNREADABLE";
inline constexpr const char* kFitWindow = "DGA_RES_E_FIT_WINDOW";

}  // namespace diag

[[nodiscard]] std::string with_diag_code(std::string_view code, std::string_view message);

void push_error(std::vector<std::string>& errors, std::string_view code, std::string_view message);
void push_warning(std::vector<std::string>& warnings, std::string_view code, std::string_view message);

[[nodiscard]] bool has_diag_code(const std::vector<std::string>& messages, std::string_view code);

}  // namespace dgaconf::v1
