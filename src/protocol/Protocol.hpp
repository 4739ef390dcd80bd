#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#ifndef HYPRVIEW_VERSION
#define HYPRVIEW_VERSION "0.0.0"
#endif

// Wire types shared by the launcher and the viewer process. Everything in here
// crosses the process boundary as JSON, keys are snake_case on the wire.
namespace Hyprview::Protocol {
    inline constexpr const char* PROTOCOL_VERSION   = HYPRVIEW_VERSION;
    inline constexpr const char* VIEWER_BINARY_NAME = "hyprview-viewer";

    struct SInlineHtml {
        std::string                html;
        // resolves relative asset paths in the markup
        std::optional<std::string> baseDir;

        bool                       operator==(const SInlineHtml&) const = default;
    };

    struct SLocalFile {
        std::string path;

        bool        operator==(const SLocalFile&) const = default;
    };

    struct SAppDir {
        std::string                root;
        // relative to root, the viewer falls back to index.html
        std::optional<std::string> entry;

        bool                       operator==(const SAppDir&) const = default;
    };

    struct SRemoteUrl {
        std::string url;

        bool        operator==(const SRemoteUrl&) const = default;
    };

    using ViewerContent = std::variant<SInlineHtml, SLocalFile, SAppDir, SRemoteUrl>;

    struct SToolbarButton {
        std::string                id;
        std::string                label;
        std::optional<std::string> icon;

        bool                       operator==(const SToolbarButton&) const = default;
    };

    struct SToolbarOptions {
        bool                        show = false;
        std::optional<std::string>  titleText;
        std::optional<std::string>  backgroundColor;
        std::optional<std::string>  textColor;
        std::vector<SToolbarButton> buttons;

        bool                        operator==(const SToolbarOptions&) const = default;
    };

    struct SWindowOptions {
        std::optional<std::string> title  = "Hyprview";
        std::optional<uint32_t>    width  = 1024;
        std::optional<uint32_t>    height = 768;
        std::optional<int32_t>     x;
        std::optional<int32_t>     y;
        bool                       resizable   = true;
        bool                       maximised   = false;
        bool                       fullscreen  = false;
        bool                       decorations = true;
        bool                       transparent = false;
        bool                       alwaysOnTop = false;
        // "light", "dark" or "system"
        std::optional<std::string> theme;
        std::optional<std::string> backgroundColor;
        SToolbarOptions            toolbar;

        bool                       operator==(const SWindowOptions&) const = default;
    };

    struct SBehaviourOptions {
        bool                                    allowExternalNavigation = false;
        // only consulted when allowExternalNavigation is set
        std::optional<std::vector<std::string>> allowedDomains;
        bool                                    enableDevtools     = false;
        bool                                    allowRemoteContent = false;
        bool                                    allowNotifications = false;

        bool                                    operator==(const SBehaviourOptions&) const = default;
    };

    struct SEnvironmentOptions {
        std::optional<std::string> workingDir;
        // the viewer closes itself and reports timed_out after this
        std::optional<uint64_t>    timeoutSeconds;

        bool                       operator==(const SEnvironmentOptions&) const = default;
    };

    struct SDialogOptions {
        bool allowFileDialogs    = false;
        bool allowMessageDialogs = false;

        bool operator==(const SDialogOptions&) const = default;
    };

    struct SViewerRequest {
        std::string                id;
        ViewerContent              content;
        SWindowOptions             window;
        SBehaviourOptions          behaviour;
        SEnvironmentOptions        environment;
        SDialogOptions             dialog;
        // set when the caller wants to push refresh commands
        std::optional<std::string> commandPath;

        bool                       operator==(const SViewerRequest&) const = default;
    };

    struct SExitClosedByUser {
        bool operator==(const SExitClosedByUser&) const = default;
    };

    struct SExitTimedOut {
        bool operator==(const SExitTimedOut&) const = default;
    };

    struct SExitError {
        std::string message;

        bool        operator==(const SExitError&) const = default;
    };

    using ViewerExitReason = std::variant<SExitClosedByUser, SExitTimedOut, SExitError>;

    struct SViewerExitStatus {
        std::string      id;
        ViewerExitReason reason;
        // viewers that predate version reporting leave it out
        std::string      viewerVersion = "0.0.0";

        bool             operator==(const SViewerExitStatus&) const = default;
    };

    struct SRefreshCommand {
        uint64_t      seq = 0;
        ViewerContent content;

        bool          operator==(const SRefreshCommand&) const = default;
    };

    using ViewerCommand = std::variant<SRefreshCommand>;

    struct SViewerCommandResponse {
        uint64_t                   seq     = 0;
        bool                       success = false;
        std::optional<std::string> error;

        bool                       operator==(const SViewerCommandResponse&) const = default;
    };

    // encoders fail only on programming errors, decoders return a readable parse error
    std::expected<std::string, std::string>            encodeRequest(const SViewerRequest& request);
    std::expected<SViewerRequest, std::string>         decodeRequest(const std::string& json);
    std::expected<std::string, std::string>            encodeExitStatus(const SViewerExitStatus& status);
    std::expected<SViewerExitStatus, std::string>      decodeExitStatus(const std::string& json);
    std::expected<std::string, std::string>            encodeCommand(const ViewerCommand& command);
    std::expected<ViewerCommand, std::string>          decodeCommand(const std::string& json);
    std::expected<std::string, std::string>            encodeCommandResponse(const SViewerCommandResponse& response);
    std::expected<SViewerCommandResponse, std::string> decodeCommandResponse(const std::string& json);

    std::string_view                                   contentTypeName(const ViewerContent& content);
    std::string_view                                   exitReasonName(const ViewerExitReason& reason);
    std::string                                        exitReasonToString(const ViewerExitReason& reason);
    bool                                               isErrorReason(const ViewerExitReason& reason);
};
