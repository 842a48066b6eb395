// sysml/basic/diagnostic_codes.hpp - Stable diagnostic codes
//
// Codes are part of the tool output (CLI and language server) and must not
// be renumbered.
//
#pragma once

namespace sysml::diag_codes
{

// Semantic
inline constexpr const char * k_duplicate_definition = "E001";
inline constexpr const char * k_undefined_symbol = "E002";
inline constexpr const char * k_invalid_relationship_target = "E004";
inline constexpr const char * k_circular_relationship = "E005";
inline constexpr const char * k_unresolved_import = "E012";
inline constexpr const char * k_ambiguous_simple_name = "E013";
inline constexpr const char * k_alias_cycle = "E014";

// Syntax
inline constexpr const char * k_syntax_error = "P001";
inline constexpr const char * k_unexpected_token = "P002";

// I/O
inline constexpr const char * k_read_failure = "IO001";

}  // namespace sysml::diag_codes
