#include <gtest/gtest.h>
#include <protocol/Protocol.hpp>

using namespace Hyprview::Protocol;

TEST(ProtocolSerialization, RequestSurvivesRoundTrip) {
    SViewerRequest request{
        .id          = "8c1f2a8e-5f0e-4b8e-9d43-2f4c9f0b6a11",
        .content     = SAppDir{.root = "/srv/app", .entry = "main.html"},
        .environment = {.workingDir = "/srv", .timeoutSeconds = 30},
        .commandPath = "/tmp/hyprview_x/commands.json",
    };
    request.window.title       = std::nullopt;
    request.window.width       = 640;
    request.window.x           = -20;
    request.window.transparent = true;
    request.window.toolbar     = {.show = true, .titleText = "Preview", .buttons = {{.id = "save", .label = "Save", .icon = "document-save"}}};
    request.behaviour          = {.allowExternalNavigation = true, .allowedDomains = std::vector<std::string>{"example.org"}, .enableDevtools = true};
    request.dialog             = {.allowFileDialogs = true};

    const auto JSON = encodeRequest(request);
    ASSERT_TRUE(JSON.has_value()) << JSON.error();

    const auto DECODED = decodeRequest(*JSON);
    ASSERT_TRUE(DECODED.has_value()) << DECODED.error();

    EXPECT_EQ(*DECODED, request);
    // an unset title must not come back as the default
    EXPECT_FALSE(DECODED->window.title.has_value());
}

TEST(ProtocolSerialization, EveryContentKindSurvivesRoundTrip) {
    const std::vector<ViewerContent> CONTENTS = {
        SInlineHtml{.html = "<h1>hi</h1>", .baseDir = "/home/user"},
        SInlineHtml{.html = "<p>\"quoted\" \\ and unicode ✓</p>"},
        SLocalFile{.path = "/tmp/page.html"},
        SAppDir{.root = "/srv/app"},
        SRemoteUrl{.url = "https://example.org/?q=1&r=2"},
    };

    for (const auto& content : CONTENTS) {
        const auto JSON = encodeCommand(SRefreshCommand{.seq = 4, .content = content});
        ASSERT_TRUE(JSON.has_value()) << JSON.error();

        const auto DECODED = decodeCommand(*JSON);
        ASSERT_TRUE(DECODED.has_value()) << DECODED.error();
        EXPECT_EQ(std::get<SRefreshCommand>(*DECODED).content, content) << contentTypeName(content);
    }
}

TEST(ProtocolSerialization, ExitStatusSurvivesRoundTrip) {
    for (const ViewerExitReason& reason : {ViewerExitReason{SExitClosedByUser{}}, ViewerExitReason{SExitTimedOut{}}, ViewerExitReason{SExitError{.message = "boom"}}}) {
        const SViewerExitStatus STATUS{.id = "abc", .reason = reason, .viewerVersion = "0.1.0"};

        const auto              JSON = encodeExitStatus(STATUS);
        ASSERT_TRUE(JSON.has_value()) << JSON.error();

        const auto DECODED = decodeExitStatus(*JSON);
        ASSERT_TRUE(DECODED.has_value()) << DECODED.error();
        EXPECT_EQ(*DECODED, STATUS);
    }
}

TEST(ProtocolSerialization, CommandResponseSurvivesRoundTrip) {
    const SViewerCommandResponse OK{.seq = 1, .success = true};
    const SViewerCommandResponse FAILED{.seq = 2, .success = false, .error = "no such file"};

    for (const auto& response : {OK, FAILED}) {
        const auto JSON = encodeCommandResponse(response);
        ASSERT_TRUE(JSON.has_value()) << JSON.error();

        const auto DECODED = decodeCommandResponse(*JSON);
        ASSERT_TRUE(DECODED.has_value()) << DECODED.error();
        EXPECT_EQ(*DECODED, response);
    }
}

TEST(ProtocolSerialization, ReadsViewerWrittenExitStatus) {
    const auto STATUS = decodeExitStatus(R"({"id":"abc","reason":{"reason":"error","message":"webview crashed"},"viewer_version":"0.1.0"})");
    ASSERT_TRUE(STATUS.has_value()) << STATUS.error();

    EXPECT_EQ(STATUS->id, "abc");
    EXPECT_EQ(STATUS->viewerVersion, "0.1.0");
    ASSERT_TRUE(isErrorReason(STATUS->reason));
    EXPECT_EQ(std::get<SExitError>(STATUS->reason).message, "webview crashed");
    EXPECT_EQ(exitReasonToString(STATUS->reason), "error (webview crashed)");
}

TEST(ProtocolSerialization, UnversionedExitStatusReadsAsLegacy) {
    const auto STATUS = decodeExitStatus(R"({"id":"abc","reason":{"reason":"closed_by_user"}})");
    ASSERT_TRUE(STATUS.has_value()) << STATUS.error();

    EXPECT_EQ(STATUS->viewerVersion, "0.0.0");
    EXPECT_TRUE(std::holds_alternative<SExitClosedByUser>(STATUS->reason));
}

TEST(ProtocolSerialization, UnknownKeysAreIgnored) {
    const auto RESPONSE = decodeCommandResponse(R"({"seq":3,"success":true,"took_ms":12,"extra":{"nested":[1,2]}})");
    ASSERT_TRUE(RESPONSE.has_value()) << RESPONSE.error();

    EXPECT_EQ(RESPONSE->seq, 3u);
    EXPECT_TRUE(RESPONSE->success);
    EXPECT_FALSE(RESPONSE->error.has_value());
}

TEST(ProtocolSerialization, MissingKeysKeepDefaults) {
    const auto REQUEST = decodeRequest(R"({"id":"abc","content":{"type":"local_file","path":"/tmp/a.html"}})");
    ASSERT_TRUE(REQUEST.has_value()) << REQUEST.error();

    EXPECT_EQ(REQUEST->window, SWindowOptions{});
    EXPECT_EQ(REQUEST->behaviour, SBehaviourOptions{});
    EXPECT_FALSE(REQUEST->commandPath.has_value());
    EXPECT_EQ(contentTypeName(REQUEST->content), "local_file");
}

TEST(ProtocolSerialization, RejectsMalformedInput) {
    EXPECT_FALSE(decodeExitStatus("").has_value());
    EXPECT_FALSE(decodeExitStatus("{\"id\": \"abc\"").has_value());
    EXPECT_FALSE(decodeExitStatus(R"({"id":"abc","reason":{"reason":"exploded"},"viewer_version":"0.1.0"})").has_value());
    EXPECT_FALSE(decodeCommandResponse(R"({"seq":"one","success":true})").has_value());
}
