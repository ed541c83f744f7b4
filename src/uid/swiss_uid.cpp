// =============================================================================
// swiss-uid - Swiss Business Identification Number Implementation
// =============================================================================
// Parsing is a linear validate-and-fail pipeline:
//   1. trim surrounding whitespace
//   2. prefix (CHE/ADM) and optional '-' or ' ' separator
//   3. nine digits, grouped "DDD.DDD.DDD" or contiguous
//   4. optional " HR" / " MWST" suffix
//   5. leading zero
//   6. check digit computable
//   7. check digit matches
// =============================================================================

#include "suid/uid/swiss_uid.h"

#include <algorithm>
#include <cctype>
#include <ostream>

#include "suid/uid/checksum.h"
#include "suid/uid/nibble.h"

namespace suid {

namespace {

[[nodiscard]] bool isAsciiDigit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool isAsciiSpace(char c) noexcept {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && isAsciiSpace(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && isAsciiSpace(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

/// @brief Extract the nine digits of a grouped or contiguous body.
[[nodiscard]] Result<SwissUid::DigitArray> extractDigits(std::string_view body,
                                                         std::string_view input) {
    SwissUid::DigitArray digits{};
    std::size_t count = 0;

    if (body.size() == kGroupedBodyLength) {
        for (std::size_t i = 0; i < body.size(); ++i) {
            const char c = body[i];
            if (i == kFirstGroupDot || i == kSecondGroupDot) {
                if (c != '.') {
                    return makeError<SwissUid::DigitArray>(
                        ErrorCode::kMalformedDigits,
                        std::format("expected '.' at column {} of '{}'", i, input));
                }
                continue;
            }
            if (!isAsciiDigit(c)) {
                return makeError<SwissUid::DigitArray>(
                    ErrorCode::kMalformedDigits,
                    std::format("non-digit '{}' in '{}'", c, input));
            }
            digits[count++] = static_cast<Digit>(c - '0');
        }
        return digits;
    }

    if (body.size() == kTotalDigits) {
        for (const char c : body) {
            if (!isAsciiDigit(c)) {
                return makeError<SwissUid::DigitArray>(
                    ErrorCode::kMalformedDigits,
                    std::format("non-digit '{}' in '{}'", c, input));
            }
            digits[count++] = static_cast<Digit>(c - '0');
        }
        return digits;
    }

    return makeError<SwissUid::DigitArray>(
        ErrorCode::kMalformedDigits,
        std::format("UID must have 9 digits as 'DDD.DDD.DDD' or 'DDDDDDDDD': '{}'", input));
}

[[nodiscard]] std::string render(UidPrefix prefix, PackedDigits payload, Digit checkDigit,
                                 bool bracketCheckDigit) {
    // BCD nibbles print as decimal digits in hex notation.
    const auto first = payload >> 20;
    const auto second = (payload >> 8) & 0x0FFFu;
    const auto third = payload & 0x00FFu;
    if (bracketCheckDigit) {
        return std::format("{}-{:03x}.{:03x}.{:02x}[{}]", prefixToString(prefix), first, second,
                           third, static_cast<unsigned>(checkDigit));
    }
    return std::format("{}-{:03x}.{:03x}.{:02x}{}", prefixToString(prefix), first, second, third,
                       static_cast<unsigned>(checkDigit));
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

Result<SwissUid> SwissUid::parse(std::string_view text) {
    std::string_view rest = trim(text);

    if (rest.size() < kPrefixLength) {
        return makeError<SwissUid>(ErrorCode::kInvalidPrefix,
                                   std::format("prefix must be 'CHE' or 'ADM': '{}'", text));
    }
    const auto prefix = prefixFromString(rest.substr(0, kPrefixLength));
    if (!prefix) {
        return makeError<SwissUid>(ErrorCode::kInvalidPrefix,
                                   std::format("prefix must be 'CHE' or 'ADM': '{}'", text));
    }
    rest.remove_prefix(kPrefixLength);
    if (!rest.empty() && (rest.front() == '-' || rest.front() == ' ')) {
        rest.remove_prefix(1);
    }

    const auto space = rest.find(' ');
    const std::string_view body = rest.substr(0, space);

    auto digits = extractDigits(body, text);
    if (!digits) {
        return std::unexpected(std::move(digits.error()));
    }

    if (space != std::string_view::npos) {
        const std::string_view suffix = rest.substr(space + 1);
        if (!equalsIgnoreCase(suffix, kHrSuffix) && !equalsIgnoreCase(suffix, kMwstSuffix)) {
            return makeError<SwissUid>(
                ErrorCode::kInvalidSuffix,
                std::format("suffix must be 'HR' or 'MWST', got '{}'", suffix));
        }
    }

    const std::span<const Digit> payload(digits->data(), kPayloadDigits);
    const Digit supplied = (*digits)[kPayloadDigits];

    if (payload.front() == 0) {
        return makeError<SwissUid>(ErrorCode::kLeadingZero,
                                   std::format("leading zero is not allowed: '{}'", text));
    }

    const PackedDigits packed = packNibbles(payload);
    auto computed = computeCheckDigit(payload);
    if (!computed) {
        return makeError<SwissUid>(
            ErrorCode::kNoValidCheckDigit,
            std::format("'{}' is prohibited from use", render(*prefix, packed, supplied, true)));
    }
    if (*computed != supplied) {
        return makeError<SwissUid>(
            ErrorCode::kCheckDigitMismatch,
            std::format("'{}' should have the check digit [{}]",
                        render(*prefix, packed, supplied, true),
                        static_cast<unsigned>(*computed)));
    }

    return SwissUid{*prefix, packed, supplied};
}

SwissUid SwissUid::fromString(std::string_view text) {
    auto result = parse(text);
    if (!result) {
        const Error& error = result.error();
        ErrorContext context{std::string(text)};
        if (isChecksumError(error.code())) {
            throw ChecksumError(error.code(), error.message(), std::move(context));
        }
        throw FormatError(error.code(), error.message(), std::move(context));
    }
    return *result;
}

Result<SwissUid> SwissUid::fromPayload(std::span<const Digit> payload, UidPrefix prefix) {
    auto checkDigit = computeCheckDigit(payload);
    if (!checkDigit && checkDigit.error().code() == ErrorCode::kMalformedDigits) {
        return std::unexpected(std::move(checkDigit.error()));
    }
    // Same precedence as parse: leading zero before the sentinel.
    if (payload.front() == 0) {
        return makeError<SwissUid>(ErrorCode::kLeadingZero, "leading zero is not allowed");
    }
    if (!checkDigit) {
        return std::unexpected(std::move(checkDigit.error()));
    }
    return SwissUid{prefix, packNibbles(payload), *checkDigit};
}

bool SwissUid::isValid(std::string_view text) {
    return parse(text).has_value();
}

// =============================================================================
// Accessors
// =============================================================================

SwissUid::Payload SwissUid::payload() const noexcept {
    return unpackNibbles<kPayloadDigits>(payload_);
}

SwissUid::DigitArray SwissUid::digits() const noexcept {
    DigitArray all{};
    const Payload head = payload();
    std::ranges::copy(head, all.begin());
    all[kPayloadDigits] = checkDigit_;
    return all;
}

// =============================================================================
// Rendering
// =============================================================================

std::string SwissUid::toString() const {
    return render(prefix_, payload_, checkDigit_, false);
}

std::string SwissUid::toStringHr() const {
    return std::format("{} {}", toString(), kHrSuffix);
}

std::string SwissUid::toStringMwst() const {
    return std::format("{} {}", toString(), kMwstSuffix);
}

std::string SwissUid::toDebugString() const {
    return render(prefix_, payload_, checkDigit_, true);
}

std::string SwissUid::format(UidFormat style) const {
    switch (style) {
        case UidFormat::kPlain:
            return toString();
        case UidFormat::kHr:
            return toStringHr();
        case UidFormat::kMwst:
            return toStringMwst();
        case UidFormat::kDebug:
            return toDebugString();
    }
    return toString();
}

std::ostream& operator<<(std::ostream& os, const SwissUid& uid) {
    return os << uid.toString();
}

}  // namespace suid
