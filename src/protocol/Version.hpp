#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

#include "../core/Error.hpp"

namespace Hyprview::Version {
    struct SVersion {
        uint32_t    major = 0;
        uint32_t    minor = 0;
        uint32_t    patch = 0;

        std::string toString() const;
        bool        operator==(const SVersion&) const = default;
    };

    enum eCompatibility : uint8_t {
        COMPATIBILITY_OK = 0,
        // the producer predates version reporting
        COMPATIBILITY_LEGACY,
        COMPATIBILITY_MAJOR_MISMATCH,
        // pre-1.0, every minor bump breaks the protocol
        COMPATIBILITY_MINOR_MISMATCH,
    };

    // strict major.minor.patch, unsigned decimal segments only
    std::expected<SVersion, std::string> parse(std::string_view str);

    eCompatibility                       compare(const SVersion& ours, const SVersion& theirs);

    // parse errors come back as VIEWER_ERROR_INVALID_RESPONSE, skew as VIEWER_ERROR_VERSION_MISMATCH
    std::expected<void, SViewerError> checkCompatibility(std::string_view ours, std::string_view theirs);
};
