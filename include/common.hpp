//! # Common Definitions
//!
//! This module provides common types and constants used throughout doclink.
//! Every other component depends on it.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version string
//! - **Output Format**: Text or JSON report rendering
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions across module boundaries**: errors are returned via
//!   `Result<T, E>`; filesystem exceptions are caught where they are raised
//! - **Explicit Ownership**: values and references, no shared mutable state

#ifndef DOCLINK_COMMON_HPP
#define DOCLINK_COMMON_HPP

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>

namespace doclink {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string (e.g., "0.1.0").
constexpr const char* VERSION = "0.1.0";

// ============================================================================
// Output Format
// ============================================================================

/// Output format for the run report.
enum class OutputFormat {
    Text, ///< Human-readable text output (default)
    JSON  ///< Machine-readable JSON output for CI integration
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<MoveTable, ConfigError> table = MoveTable::load(path, root);
/// if (is_err(table)) {
///     report(unwrap_err(table));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// JSON Escaping
// ============================================================================

/// Returns `s` with JSON string special characters escaped (no quotes added).
/// Shared by the JSON log sinks and the JSON report renderer.
inline std::string json_escape(std::string_view s) {
    std::ostringstream out;
    for (char c : s) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\b':
            out << "\\b";
            break;
        case '\f':
            out << "\\f";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Other control characters as \uXXXX
                out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
            } else {
                out << c;
            }
            break;
        }
    }
    return out.str();
}

} // namespace doclink

#endif // DOCLINK_COMMON_HPP
