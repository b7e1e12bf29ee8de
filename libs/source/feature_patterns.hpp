#pragma once

/**
 * @file feature_patterns.hpp
 * @brief Single-line classifiers for security-relevant source patterns
 *
 * All classifiers take one source line with comments already stripped and
 * look at it in isolation; adjacency rules live in the analyzer.
 */

#include <string>
#include <string_view>

namespace ossensor::source::patterns {

/// Remove a trailing // comment and blank out block-comment-only lines
[[nodiscard]] std::string strip_comment(std::string_view line);

/// Call to an allocator (malloc family, kernel allocators, array new, operator new)
[[nodiscard]] bool is_allocation_call(std::string_view code);

/// Allocation whose size multiplies a variable count (or array new with a variable extent)
[[nodiscard]] bool is_allocation_sizing(std::string_view code);

/// memcpy / memmove / bcopy / copyin / copyout / str*cpy family
[[nodiscard]] bool is_memory_copy(std::string_view code);

/// Conditional or assertion with a relational comparison or overflow test,
/// or an explicit bounds-checking helper call
[[nodiscard]] bool is_guard(std::string_view code);

/// Overflow primitive or limit constant on the line
[[nodiscard]] bool has_overflow_check(std::string_view code);

/// Reads a length/count/size field out of external input
[[nodiscard]] bool is_parsing_marker(std::string_view code);

/// Call to a privilege or entitlement test
[[nodiscard]] bool is_privilege_check(std::string_view code);

}  // namespace ossensor::source::patterns
