#include "Protocol.hpp"

#include <array>
#include <format>

#include <glaze/glaze.hpp>

using namespace Hyprview::Protocol;

// clang-format off
template <>
struct glz::meta<SInlineHtml> {
    using T                     = SInlineHtml;
    static constexpr auto value = glz::object("html", &T::html, "base_dir", &T::baseDir);
};

template <>
struct glz::meta<SLocalFile> {
    using T                     = SLocalFile;
    static constexpr auto value = glz::object("path", &T::path);
};

template <>
struct glz::meta<SAppDir> {
    using T                     = SAppDir;
    static constexpr auto value = glz::object("root", &T::root, "entry", &T::entry);
};

template <>
struct glz::meta<SRemoteUrl> {
    using T                     = SRemoteUrl;
    static constexpr auto value = glz::object("url", &T::url);
};

template <>
struct glz::meta<ViewerContent> {
    static constexpr std::string_view tag = "type";
    static constexpr auto             ids = std::array{"inline_html", "local_file", "app_dir", "remote_url"};
};

template <>
struct glz::meta<SToolbarButton> {
    using T                     = SToolbarButton;
    static constexpr auto value = glz::object("id", &T::id, "label", &T::label, "icon", &T::icon);
};

template <>
struct glz::meta<SToolbarOptions> {
    using T                     = SToolbarOptions;
    static constexpr auto value = glz::object(
        "show", &T::show,
        "title_text", &T::titleText,
        "background_color", &T::backgroundColor,
        "text_color", &T::textColor,
        "buttons", &T::buttons
    );
};

template <>
struct glz::meta<SWindowOptions> {
    using T                     = SWindowOptions;
    static constexpr auto value = glz::object(
        "title", &T::title,
        "width", &T::width,
        "height", &T::height,
        "x", &T::x,
        "y", &T::y,
        "resizable", &T::resizable,
        "maximised", &T::maximised,
        "fullscreen", &T::fullscreen,
        "decorations", &T::decorations,
        "transparent", &T::transparent,
        "always_on_top", &T::alwaysOnTop,
        "theme", &T::theme,
        "background_color", &T::backgroundColor,
        "toolbar", &T::toolbar
    );
};

template <>
struct glz::meta<SBehaviourOptions> {
    using T                     = SBehaviourOptions;
    static constexpr auto value = glz::object(
        "allow_external_navigation", &T::allowExternalNavigation,
        "allowed_domains", &T::allowedDomains,
        "enable_devtools", &T::enableDevtools,
        "allow_remote_content", &T::allowRemoteContent,
        "allow_notifications", &T::allowNotifications
    );
};

template <>
struct glz::meta<SEnvironmentOptions> {
    using T                     = SEnvironmentOptions;
    static constexpr auto value = glz::object("working_dir", &T::workingDir, "timeout_seconds", &T::timeoutSeconds);
};

template <>
struct glz::meta<SDialogOptions> {
    using T                     = SDialogOptions;
    static constexpr auto value = glz::object("allow_file_dialogs", &T::allowFileDialogs, "allow_message_dialogs", &T::allowMessageDialogs);
};

template <>
struct glz::meta<SViewerRequest> {
    using T                     = SViewerRequest;
    static constexpr auto value = glz::object(
        "id", &T::id,
        "content", &T::content,
        "window", &T::window,
        "behaviour", &T::behaviour,
        "environment", &T::environment,
        "dialog", &T::dialog,
        "command_path", &T::commandPath
    );
};

template <>
struct glz::meta<SExitClosedByUser> {
    static constexpr auto value = glz::object();
};

template <>
struct glz::meta<SExitTimedOut> {
    static constexpr auto value = glz::object();
};

template <>
struct glz::meta<SExitError> {
    using T                     = SExitError;
    static constexpr auto value = glz::object("message", &T::message);
};

template <>
struct glz::meta<ViewerExitReason> {
    static constexpr std::string_view tag = "reason";
    static constexpr auto             ids = std::array{"closed_by_user", "timed_out", "error"};
};

template <>
struct glz::meta<SViewerExitStatus> {
    using T                     = SViewerExitStatus;
    static constexpr auto value = glz::object("id", &T::id, "reason", &T::reason, "viewer_version", &T::viewerVersion);
};

template <>
struct glz::meta<SRefreshCommand> {
    using T                     = SRefreshCommand;
    static constexpr auto value = glz::object("seq", &T::seq, "content", &T::content);
};

template <>
struct glz::meta<ViewerCommand> {
    static constexpr std::string_view tag = "type";
    static constexpr auto             ids = std::array{"refresh"};
};

template <>
struct glz::meta<SViewerCommandResponse> {
    using T                     = SViewerCommandResponse;
    static constexpr auto value = glz::object("seq", &T::seq, "success", &T::success, "error", &T::error);
};
// clang-format on

// nulls are written out so an unset optional doesn't come back as its default
static constexpr glz::opts WRITE_OPTS  = {.skip_null_members = false};
static constexpr glz::opts PRETTY_OPTS = {.skip_null_members = false, .prettify = true};
static constexpr glz::opts READ_OPTS   = {.error_on_unknown_keys = false};

template <glz::opts OPTS, typename T>
static std::expected<std::string, std::string> encode(const T& value) {
    std::string buffer;
    const auto  ec = glz::write<OPTS>(value, buffer);
    if (ec)
        return std::unexpected(glz::format_error(ec, buffer));

    return buffer;
}

template <typename T>
static std::expected<T, std::string> decode(const std::string& json) {
    T          value{};
    const auto ec = glz::read<READ_OPTS>(value, json);
    if (ec)
        return std::unexpected(glz::format_error(ec, json));

    return value;
}

std::expected<std::string, std::string> Hyprview::Protocol::encodeRequest(const SViewerRequest& request) {
    return encode<PRETTY_OPTS>(request);
}

std::expected<SViewerRequest, std::string> Hyprview::Protocol::decodeRequest(const std::string& json) {
    return decode<SViewerRequest>(json);
}

std::expected<std::string, std::string> Hyprview::Protocol::encodeExitStatus(const SViewerExitStatus& status) {
    return encode<PRETTY_OPTS>(status);
}

std::expected<SViewerExitStatus, std::string> Hyprview::Protocol::decodeExitStatus(const std::string& json) {
    return decode<SViewerExitStatus>(json);
}

std::expected<std::string, std::string> Hyprview::Protocol::encodeCommand(const ViewerCommand& command) {
    return encode<WRITE_OPTS>(command);
}

std::expected<ViewerCommand, std::string> Hyprview::Protocol::decodeCommand(const std::string& json) {
    return decode<ViewerCommand>(json);
}

std::expected<std::string, std::string> Hyprview::Protocol::encodeCommandResponse(const SViewerCommandResponse& response) {
    return encode<WRITE_OPTS>(response);
}

std::expected<SViewerCommandResponse, std::string> Hyprview::Protocol::decodeCommandResponse(const std::string& json) {
    return decode<SViewerCommandResponse>(json);
}

std::string_view Hyprview::Protocol::contentTypeName(const ViewerContent& content) {
    return glz::meta<ViewerContent>::ids[content.index()];
}

std::string_view Hyprview::Protocol::exitReasonName(const ViewerExitReason& reason) {
    return glz::meta<ViewerExitReason>::ids[reason.index()];
}

std::string Hyprview::Protocol::exitReasonToString(const ViewerExitReason& reason) {
    if (const auto ERR = std::get_if<SExitError>(&reason))
        return std::format("error ({})", ERR->message);

    return std::string{exitReasonName(reason)};
}

bool Hyprview::Protocol::isErrorReason(const ViewerExitReason& reason) {
    return std::holds_alternative<SExitError>(reason);
}
