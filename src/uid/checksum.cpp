// =============================================================================
// swiss-uid - UID Check Digit Implementation
// =============================================================================

#include "suid/uid/checksum.h"

#include <algorithm>
#include <format>

namespace suid {

Result<Digit> computeCheckDigit(std::span<const Digit> payload) {
    if (payload.size() != kPayloadDigits) {
        return makeError<Digit>(
            ErrorCode::kMalformedDigits,
            std::format("UID payload must have {} digits, got {}", kPayloadDigits,
                        payload.size()));
    }
    if (std::ranges::any_of(payload, [](Digit d) { return d > 9; })) {
        return makeError<Digit>(ErrorCode::kMalformedDigits,
                                "UID payload digits must be in [0,9]");
    }

    const unsigned sum = weightedSum(payload.first<kPayloadDigits>());
    const unsigned result = kCheckDigitModulus - (sum % kCheckDigitModulus);

    if (result == kCheckDigitModulus) {
        return Digit{0};
    }
    if (result == kCheckDigitSentinel) {
        return makeError<Digit>(
            ErrorCode::kNoValidCheckDigit,
            std::format("payload remainder {} has no check digit, the payload is prohibited",
                        sum % kCheckDigitModulus));
    }
    return static_cast<Digit>(result);
}

bool hasCheckDigit(std::span<const Digit> payload) noexcept {
    if (payload.size() != kPayloadDigits) {
        return false;
    }
    if (std::ranges::any_of(payload, [](Digit d) { return d > 9; })) {
        return false;
    }
    const unsigned sum = weightedSum(payload.first<kPayloadDigits>());
    return kCheckDigitModulus - (sum % kCheckDigitModulus) != kCheckDigitSentinel;
}

}  // namespace suid
