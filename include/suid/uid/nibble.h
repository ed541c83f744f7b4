// =============================================================================
// swiss-uid - Nibble Packing
// =============================================================================
// Packs decimal digits as 4-bit nibbles into an unsigned integer, most
// significant digit in the highest used nibble. Eight digits fit a uint32_t,
// and the packed value orders the same way as the digit sequence.
// =============================================================================

#ifndef SUID_UID_NIBBLE_H
#define SUID_UID_NIBBLE_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "suid/common/types.h"

namespace suid {

/// @brief Maximum number of nibbles a PackedDigits value holds.
inline constexpr std::size_t kMaxPackedNibbles = sizeof(PackedDigits) * 2;

/// @brief Pack up to eight digits into nibbles, first digit most significant.
/// @note Values above 15 are masked to their low nibble; extra digits are ignored.
[[nodiscard]] constexpr PackedDigits packNibbles(std::span<const Digit> digits) noexcept {
    PackedDigits packed = 0;
    std::size_t count = 0;
    for (Digit d : digits) {
        if (count == kMaxPackedNibbles) {
            break;
        }
        packed = (packed << 4) | static_cast<PackedDigits>(d & 0x0F);
        ++count;
    }
    return packed;
}

/// @brief Unpack the low N nibbles, most significant first.
template <std::size_t N>
[[nodiscard]] constexpr std::array<Digit, N> unpackNibbles(PackedDigits packed) noexcept {
    static_assert(N <= kMaxPackedNibbles, "PackedDigits holds at most 8 nibbles");
    std::array<Digit, N> digits{};
    for (std::size_t i = 0; i < N; ++i) {
        const auto shift = static_cast<unsigned>((N - 1 - i) * 4);
        digits[i] = static_cast<Digit>((packed >> shift) & 0x0F);
    }
    return digits;
}

}  // namespace suid

#endif  // SUID_UID_NIBBLE_H
