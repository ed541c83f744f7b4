// =============================================================================
// swiss-uid - Swiss Business Identification Number
// =============================================================================
// SwissUid is the validated, immutable value type for a Swiss UID
// (Unternehmens-Identifikationsnummer) as defined by eCH-0097.
//
// This module provides:
// - SwissUid::parse: text -> validated UID (Result, never throws)
// - SwissUid::fromString: throwing counterpart of parse
// - SwissUid::fromPayload / generate: construct from eight payload digits
// - Renderers: plain, HR, MWST and a debug form with the check digit bracketed
// - Comparison, hashing, stream insertion and std::formatter support
//
// Representation:
// - Eight payload digits packed as BCD nibbles in a uint32_t
// - Check digit and register prefix in one byte each
//
// Accepted input (prefix and suffix case-insensitive, whitespace trimmed):
//   CHE-109.322.551   CHE-109322551   CHE 109.322.551   CHE109322551
//   CHE-109.322.551 HR   CHE-109.322.551 MWST   ADM-...
// =============================================================================

#ifndef SUID_UID_SWISS_UID_H
#define SUID_UID_SWISS_UID_H

#include <array>
#include <compare>
#include <cstddef>
#include <format>
#include <functional>
#include <iosfwd>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include "suid/common/error.h"
#include "suid/common/types.h"
#include "suid/uid/checksum.h"

namespace suid {

/// @brief A validated Swiss UID.
/// @note Instances only exist in a valid state: nine digits, no leading zero,
///       and a check digit matching the payload.
class SwissUid {
public:
    /// @brief The eight payload digits.
    using Payload = std::array<Digit, kPayloadDigits>;

    /// @brief Payload followed by the check digit.
    using DigitArray = std::array<Digit, kTotalDigits>;

    // =========================================================================
    // Construction
    // =========================================================================

    /// @brief Parse and validate a textual UID.
    /// @param text e.g. "CHE-109.322.551", "CHE109322551 MWST".
    /// @return The UID, or an Error with one of kInvalidPrefix, kMalformedDigits,
    ///         kInvalidSuffix, kLeadingZero, kNoValidCheckDigit,
    ///         kCheckDigitMismatch. The first failing step wins.
    [[nodiscard]] static Result<SwissUid> parse(std::string_view text);

    /// @brief Parse and validate a textual UID.
    /// @throws FormatError for structural rejections.
    /// @throws ChecksumError for check digit rejections.
    [[nodiscard]] static SwissUid fromString(std::string_view text);

    /// @brief Build a UID from its payload, computing the check digit.
    /// @return kMalformedDigits, kLeadingZero or kNoValidCheckDigit on failure.
    [[nodiscard]] static Result<SwissUid> fromPayload(std::span<const Digit> payload,
                                                      UidPrefix prefix = UidPrefix::kCHE);

    /// @brief Generate a random valid UID.
    template <std::uniform_random_bit_generator Rng>
    [[nodiscard]] static SwissUid generate(Rng& rng, UidPrefix prefix = UidPrefix::kCHE);

    /// @brief Check whether text parses to a valid UID.
    [[nodiscard]] static bool isValid(std::string_view text);

    // =========================================================================
    // Accessors
    // =========================================================================

    [[nodiscard]] UidPrefix prefix() const noexcept { return prefix_; }

    /// @brief The check digit stored at construction.
    [[nodiscard]] Digit checkDigit() const noexcept { return checkDigit_; }

    /// @brief The payload nibbles, first digit most significant.
    [[nodiscard]] PackedDigits packedPayload() const noexcept { return payload_; }

    [[nodiscard]] Payload payload() const noexcept;

    [[nodiscard]] DigitArray digits() const noexcept;

    // =========================================================================
    // Rendering
    // =========================================================================

    /// @brief Canonical form, e.g. "CHE-109.322.551".
    [[nodiscard]] std::string toString() const;

    /// @brief Commercial register form, e.g. "CHE-109.322.551 HR".
    [[nodiscard]] std::string toStringHr() const;

    /// @brief VAT form, e.g. "CHE-109.322.551 MWST".
    [[nodiscard]] std::string toStringMwst() const;

    /// @brief Diagnostic form, e.g. "CHE-109.322.55[1]". Not re-parseable.
    [[nodiscard]] std::string toDebugString() const;

    [[nodiscard]] std::string format(UidFormat style) const;

    // =========================================================================
    // Comparison
    // =========================================================================

    // Member order gives digit sequence first, then prefix.
    friend auto operator<=>(const SwissUid&, const SwissUid&) = default;
    friend bool operator==(const SwissUid&, const SwissUid&) = default;

private:
    SwissUid(UidPrefix prefix, PackedDigits payload, Digit checkDigit) noexcept
        : payload_(payload), checkDigit_(checkDigit), prefix_(prefix) {}

    PackedDigits payload_;
    Digit checkDigit_;
    UidPrefix prefix_;
};

static_assert(sizeof(SwissUid) <= 8, "SwissUid must stay compact");

/// @brief Writes the plain form.
std::ostream& operator<<(std::ostream& os, const SwissUid& uid);

// =============================================================================
// Template Implementation
// =============================================================================

template <std::uniform_random_bit_generator Rng>
SwissUid SwissUid::generate(Rng& rng, UidPrefix prefix) {
    std::uniform_int_distribution<int> first(1, 9);
    std::uniform_int_distribution<int> rest(0, 9);

    Payload payload{};
    payload[0] = static_cast<Digit>(first(rng));
    for (std::size_t i = 1; i < kPayloadDigits; ++i) {
        payload[i] = static_cast<Digit>(rest(rng));
    }

    if (!hasCheckDigit(payload)) {
        // Moving the digit weighted 5 by one leaves the sentinel remainder.
        payload[0] = payload[0] <= 1 ? static_cast<Digit>(payload[0] + 1)
                                     : static_cast<Digit>(payload[0] - 1);
    }
    return unwrapOrThrow(fromPayload(payload, prefix));
}

}  // namespace suid

// =============================================================================
// Standard Library Integration
// =============================================================================

/// @brief Hash over prefix and digits.
template <>
struct std::hash<suid::SwissUid> {
    std::size_t operator()(const suid::SwissUid& uid) const noexcept {
        const auto key = (static_cast<std::uint64_t>(uid.packedPayload()) << 16) |
                         (static_cast<std::uint64_t>(uid.checkDigit()) << 8) |
                         static_cast<std::uint64_t>(uid.prefix());
        return std::hash<std::uint64_t>{}(key);
    }
};

/// @brief std::format support: {} plain, {:h} HR, {:m} MWST, {:d} debug.
template <>
struct std::formatter<suid::SwissUid> {
    suid::UidFormat style = suid::UidFormat::kPlain;

    constexpr auto parse(std::format_parse_context& ctx) {
        auto it = ctx.begin();
        if (it == ctx.end() || *it == '}') {
            return it;
        }
        switch (*it) {
            case 'p':
                style = suid::UidFormat::kPlain;
                break;
            case 'h':
                style = suid::UidFormat::kHr;
                break;
            case 'm':
                style = suid::UidFormat::kMwst;
                break;
            case 'd':
                style = suid::UidFormat::kDebug;
                break;
            default:
                throw std::format_error("invalid SwissUid format spec");
        }
        ++it;
        if (it != ctx.end() && *it != '}') {
            throw std::format_error("invalid SwissUid format spec");
        }
        return it;
    }

    auto format(const suid::SwissUid& uid, std::format_context& ctx) const {
        return std::format_to(ctx.out(), "{}", uid.format(style));
    }
};

#endif  // SUID_UID_SWISS_UID_H
