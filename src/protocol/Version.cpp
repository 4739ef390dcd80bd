#include "Version.hpp"
#include "Protocol.hpp"

#include <charconv>
#include <format>
#include <ranges>
#include <vector>

using namespace Hyprview;
using namespace Hyprview::Version;

constexpr const char* VIEWER_BINARY = Protocol::VIEWER_BINARY_NAME;

std::string SVersion::toString() const {
    return std::format("{}.{}.{}", major, minor, patch);
}

static std::expected<uint32_t, std::string> parseSegment(std::string_view segment, const char* name, std::string_view full) {
    uint32_t value = 0;

    if (segment.empty())
        return std::unexpected(std::format("Invalid {} version in \"{}\": empty segment", name, full));

    const auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (ec != std::errc() || ptr != segment.data() + segment.size())
        return std::unexpected(std::format("Invalid {} version in \"{}\": {}", name, full, segment));

    return value;
}

std::expected<SVersion, std::string> Version::parse(std::string_view str) {
    std::vector<std::string_view> parts;
    for (const auto& s : std::views::split(str, '.')) {
        parts.emplace_back(std::string_view{s});
    }

    if (parts.size() != 3)
        return std::unexpected(std::format("Invalid version format: \"{}\", expected major.minor.patch", str));

    SVersion   version;

    const auto MAJOR = parseSegment(parts[0], "major", str);
    if (!MAJOR)
        return std::unexpected(MAJOR.error());
    const auto MINOR = parseSegment(parts[1], "minor", str);
    if (!MINOR)
        return std::unexpected(MINOR.error());
    const auto PATCH = parseSegment(parts[2], "patch", str);
    if (!PATCH)
        return std::unexpected(PATCH.error());

    version.major = *MAJOR;
    version.minor = *MINOR;
    version.patch = *PATCH;

    return version;
}

eCompatibility Version::compare(const SVersion& ours, const SVersion& theirs) {
    if (theirs.major == 0 && theirs.minor == 0)
        return COMPATIBILITY_LEGACY;

    if (ours.major != theirs.major)
        return COMPATIBILITY_MAJOR_MISMATCH;

    if (ours.major == 0 && ours.minor != theirs.minor)
        return COMPATIBILITY_MINOR_MISMATCH;

    return COMPATIBILITY_OK;
}

static std::string suggestionFor(eCompatibility compat, const SVersion& ours, const SVersion& theirs) {
    switch (compat) {
        case COMPATIBILITY_LEGACY: return std::format("Your {} binary is outdated and doesn't report its version.\nPlease update it to {}.{}.x.", VIEWER_BINARY, ours.major, ours.minor);
        case COMPATIBILITY_MAJOR_MISMATCH:
            if (ours.major > theirs.major)
                return std::format("Your {} binary is too old.\nPlease update it to {}.{}.x.", VIEWER_BINARY, ours.major, ours.minor);
            return std::format("Your {} binary is too new.\nEither downgrade the viewer or update hyprview to {}.{}.x.", VIEWER_BINARY, theirs.major, theirs.minor);
        case COMPATIBILITY_MINOR_MISMATCH:
            if (ours.minor > theirs.minor)
                return std::format("Your {} binary is too old for this pre-1.0 library.\nPlease update it to 0.{}.x.", VIEWER_BINARY, ours.minor);
            return std::format("Your {} binary is too new for this pre-1.0 library.\nEither downgrade the viewer or update hyprview to 0.{}.x.", VIEWER_BINARY, theirs.minor);
        case COMPATIBILITY_OK: break;
    }

    return "";
}

std::expected<void, SViewerError> Version::checkCompatibility(std::string_view ours, std::string_view theirs) {
    const auto OURS = parse(ours);
    if (!OURS)
        return viewerError(VIEWER_ERROR_INVALID_RESPONSE, "library version: {}", OURS.error());

    const auto THEIRS = parse(theirs);
    if (!THEIRS)
        return viewerError(VIEWER_ERROR_INVALID_RESPONSE, "viewer version: {}", THEIRS.error());

    const auto COMPAT = compare(*OURS, *THEIRS);
    if (COMPAT == COMPATIBILITY_OK)
        return {};

    return viewerError(VIEWER_ERROR_VERSION_MISMATCH, "library {}, viewer {}\n{}", ours, theirs, suggestionFor(COMPAT, *OURS, *THEIRS));
}
