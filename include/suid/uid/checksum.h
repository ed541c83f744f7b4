// =============================================================================
// swiss-uid - UID Check Digit
// =============================================================================
// Weighted modulo-11 check digit over the eight payload digits of a UID.
//
// Algorithm (eCH-0097, section 2.4.2):
//   sum    = sum(digit[i] * weight[i]), weights 5 4 3 2 7 6 5 4
//   result = 11 - (sum mod 11)
//   result 11 -> check digit 0
//   result 10 -> no valid check digit exists for the payload
//   otherwise -> check digit is result
// =============================================================================

#ifndef SUID_UID_CHECKSUM_H
#define SUID_UID_CHECKSUM_H

#include <cstdint>
#include <span>

#include "suid/common/error.h"
#include "suid/common/types.h"

namespace suid {

/// @brief Result value of 11 - remainder that has no check digit.
inline constexpr unsigned kCheckDigitSentinel = 10;

/// @brief Weighted sum of the payload digits.
/// @pre digits.size() == kPayloadDigits and every digit is in [0,9].
[[nodiscard]] constexpr unsigned weightedSum(std::span<const Digit, kPayloadDigits> digits) noexcept {
    unsigned sum = 0;
    for (std::size_t i = 0; i < kPayloadDigits; ++i) {
        sum += static_cast<unsigned>(digits[i]) * kCheckDigitWeights[i];
    }
    return sum;
}

/// @brief Compute the check digit of an eight digit payload.
/// @param payload The payload digits, most significant first.
/// @return The check digit, kMalformedDigits if the payload is not eight
///         digits in [0,9], or kNoValidCheckDigit for sentinel payloads.
[[nodiscard]] Result<Digit> computeCheckDigit(std::span<const Digit> payload);

/// @brief Check whether a payload has a valid check digit at all.
[[nodiscard]] bool hasCheckDigit(std::span<const Digit> payload) noexcept;

}  // namespace suid

#endif  // SUID_UID_CHECKSUM_H
