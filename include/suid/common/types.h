// =============================================================================
// swiss-uid - Common Type Definitions
// =============================================================================
// Core type definitions for the swiss-uid library.
//
// This module defines:
// - Digit, PackedDigits: Type aliases for the compact UID representation
// - UidPrefix: Register prefix (CHE, ADM)
// - UidFormat: Output renderings (plain, HR, MWST, debug)
// - Layout constants of the textual UID form
//
// Naming Conventions:
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef SUID_COMMON_TYPES_H
#define SUID_COMMON_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace suid {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief A single decimal digit (0-9).
using Digit = std::uint8_t;

/// @brief Eight BCD nibbles, most significant digit first.
using PackedDigits = std::uint32_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Number of payload digits (excluding the check digit).
inline constexpr std::size_t kPayloadDigits = 8;

/// @brief Number of digits including the check digit.
inline constexpr std::size_t kTotalDigits = kPayloadDigits + 1;

/// @brief Number of characters in a register prefix.
inline constexpr std::size_t kPrefixLength = 3;

/// @brief Length of the plain rendering, e.g. "CHE-109.322.551".
inline constexpr std::size_t kPlainLength = 15;

/// @brief Length of the grouped digit body, e.g. "109.322.551".
inline constexpr std::size_t kGroupedBodyLength = 11;

/// @brief Offsets of the group separators inside the grouped body.
inline constexpr std::size_t kFirstGroupDot = 3;
inline constexpr std::size_t kSecondGroupDot = 7;

/// @brief Check digit weights for the eight payload digits (eCH-0097, 2.4.2).
inline constexpr std::array<Digit, kPayloadDigits> kCheckDigitWeights = {5, 4, 3, 2, 7, 6, 5, 4};

/// @brief Checksum modulus.
inline constexpr unsigned kCheckDigitModulus = 11;

/// @brief Suffix of the commercial register (Handelsregister) rendering.
inline constexpr std::string_view kHrSuffix = "HR";

/// @brief Suffix of the VAT (Mehrwertsteuer) rendering.
inline constexpr std::string_view kMwstSuffix = "MWST";

/// @brief ASCII comparison that ignores letter case.
[[nodiscard]] bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept;

// =============================================================================
// UID Prefix
// =============================================================================

/// @brief Register prefix of a UID.
enum class UidPrefix : std::uint8_t {
    /// @brief Enterprises.
    kCHE = 0,

    /// @brief Administrative units.
    kADM = 1
};

/// @brief Upper-case textual form of a prefix.
[[nodiscard]] constexpr std::string_view prefixToString(UidPrefix prefix) noexcept {
    switch (prefix) {
        case UidPrefix::kCHE:
            return "CHE";
        case UidPrefix::kADM:
            return "ADM";
    }
    return "CHE";
}

/// @brief Parse a three-letter prefix, ignoring ASCII case.
/// @return The prefix, or std::nullopt for anything else.
[[nodiscard]] std::optional<UidPrefix> prefixFromString(std::string_view text) noexcept;

// =============================================================================
// Output Format
// =============================================================================

/// @brief Textual renderings of a validated UID.
enum class UidFormat : std::uint8_t {
    /// @brief CHE-109.322.551
    kPlain = 0,

    /// @brief CHE-109.322.551 HR
    kHr,

    /// @brief CHE-109.322.551 MWST
    kMwst,

    /// @brief CHE-109.322.55[1] (diagnostic only, not re-parseable)
    kDebug
};

/// @brief Lower-case name of a format.
[[nodiscard]] constexpr std::string_view formatToString(UidFormat format) noexcept {
    switch (format) {
        case UidFormat::kPlain:
            return "plain";
        case UidFormat::kHr:
            return "hr";
        case UidFormat::kMwst:
            return "mwst";
        case UidFormat::kDebug:
            return "debug";
    }
    return "plain";
}

/// @brief Parse a format name (case-insensitive).
/// @return The format, or std::nullopt for unknown names.
[[nodiscard]] std::optional<UidFormat> formatFromString(std::string_view name) noexcept;

}  // namespace suid

#endif  // SUID_COMMON_TYPES_H
