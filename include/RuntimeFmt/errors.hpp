#pragma once

#include <cstdio>
#include <cstdlib>
#include <string_view>

#include <fmt/format.h>

namespace RuntimeFmt {


enum class FormatError {
    NO_ERROR,
    INVALID_SPEC
};

constexpr std::string_view error_to_string(FormatError e) {
    switch(e) {
    case FormatError::NO_ERROR: return "NO_ERROR"; break;
    case FormatError::INVALID_SPEC: return "INVALID_SPEC"; break;
    }
    return "N/A";
}

class FormatResult {
    FormatError m_error = FormatError::NO_ERROR;
public:
    constexpr FormatResult() = default;
    constexpr FormatResult(FormatError err): m_error(err) {}

    constexpr operator bool() const {
        return m_error == FormatError::NO_ERROR;
    }
    constexpr FormatError error() const {
        return m_error;
    }
};


// ============================================================================
// Resolution Errors
// ============================================================================

enum class ResolveError {
    none,
    unknown_field_name,
    field_index_out_of_range,
    negative_field_index,
    unknown_capability_token,
    capability_not_supported,
    not_an_index_value
};

constexpr std::string_view error_to_string(ResolveError e) {
    switch(e) {
    case ResolveError::none                    : return "none"; break;
    case ResolveError::unknown_field_name      : return "unknown_field_name"; break;
    case ResolveError::field_index_out_of_range: return "field_index_out_of_range"; break;
    case ResolveError::negative_field_index    : return "negative_field_index"; break;
    case ResolveError::unknown_capability_token: return "unknown_capability_token"; break;
    case ResolveError::capability_not_supported: return "capability_not_supported"; break;
    case ResolveError::not_an_index_value      : return "not_an_index_value"; break;
    }
    return "N/A";
}


namespace detail {

// Broken generator or interpreter invariants end up here. Never returns.
// RUNTIMEFMT_CONTRACT_HANDLER, if defined, must name a function visible at the
// point of inclusion taking std::string_view; abort still follows it.
[[noreturn]] inline void contract_violation(std::string_view message) {
#ifdef RUNTIMEFMT_CONTRACT_HANDLER
    RUNTIMEFMT_CONTRACT_HANDLER(message);
#else
    fmt::print(stderr, "RuntimeFmt: contract violation: {}\n", message);
    std::fflush(stderr);
#endif
    std::abort();
}

} // namespace detail

} // namespace RuntimeFmt
