// =============================================================================
// swiss-uid - Common Type Definitions Implementation
// =============================================================================

#include "suid/common/types.h"

#include <algorithm>
#include <cctype>

namespace suid {

bool equalsIgnoreCase(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, [](unsigned char a, unsigned char b) {
        return std::toupper(a) == std::toupper(b);
    });
}

std::optional<UidPrefix> prefixFromString(std::string_view text) noexcept {
    if (equalsIgnoreCase(text, "CHE")) {
        return UidPrefix::kCHE;
    }
    if (equalsIgnoreCase(text, "ADM")) {
        return UidPrefix::kADM;
    }
    return std::nullopt;
}

std::optional<UidFormat> formatFromString(std::string_view name) noexcept {
    for (auto format : {UidFormat::kPlain, UidFormat::kHr, UidFormat::kMwst, UidFormat::kDebug}) {
        if (equalsIgnoreCase(name, formatToString(format))) {
            return format;
        }
    }
    return std::nullopt;
}

}  // namespace suid
