#include <gtest/gtest.h>
#include <core/ResultReader.hpp>
#include <core/WorkingArea.hpp>
#include <helpers/Uuid.hpp>
#include <helpers/fs/FsUtils.hpp>
#include <helpers/time/Timer.hpp>

#include <format>
#include <thread>

using namespace Hyprview;
using namespace std::chrono_literals;

class CoreResultReader : public ::testing::Test {
  protected:
    void SetUp() override {
        m_id   = Uuid::generate();
        auto a = CWorkingArea::create(m_id);
        ASSERT_TRUE(a.has_value()) << a.error().toString();
        m_area = std::move(*a);
    }

    void writeStatus(const Protocol::ViewerExitReason& reason, const std::string& id, const std::string& version = Protocol::PROTOCOL_VERSION) {
        const auto JSON = Protocol::encodeExitStatus({.id = id, .reason = reason, .viewerVersion = version});
        ASSERT_TRUE(JSON.has_value());
        ASSERT_TRUE(FsUtils::writeAtomically(m_area->resultPath(), *JSON, ".result.tmp").has_value());
    }

    std::string      m_id;
    UP<CWorkingArea> m_area;

    SRetryPolicy     m_fast = {.maxAttempts = 4, .initialDelay = 1ms, .maxDelay = 4ms};
};

TEST_F(CoreResultReader, ReadsValidStatus) {
    writeStatus(Protocol::SExitTimedOut{}, m_id);

    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, m_fast);
    ASSERT_TRUE(STATUS.has_value()) << STATUS.error().toString();
    EXPECT_TRUE(std::holds_alternative<Protocol::SExitTimedOut>(STATUS->reason));
    EXPECT_EQ(STATUS->id, m_id);
}

TEST_F(CoreResultReader, WaitsForLateWriter) {
    std::thread writer([this] {
        std::this_thread::sleep_for(50ms);
        writeStatus(Protocol::SExitClosedByUser{}, m_id);
    });

    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, {.maxAttempts = 10, .initialDelay = 10ms, .maxDelay = 1000ms});
    writer.join();

    ASSERT_TRUE(STATUS.has_value()) << STATUS.error().toString();
    EXPECT_TRUE(std::holds_alternative<Protocol::SExitClosedByUser>(STATUS->reason));
}

TEST_F(CoreResultReader, GivesUpAfterPolicy) {
    CTimer     timer;
    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, m_fast);

    ASSERT_FALSE(STATUS.has_value());
    EXPECT_EQ(STATUS.error().type, VIEWER_ERROR_RESULT_READ_FAILED);
    EXPECT_NE(STATUS.error().message.find("after 4 attempts"), std::string::npos);
    EXPECT_NE(STATUS.error().message.find(m_area->resultPath().string()), std::string::npos);
    // 1 + 2 + 4, never slept after the last attempt
    EXPECT_LT(timer.elapsed(), 500ms);
}

TEST_F(CoreResultReader, GarbageIsNotRetried) {
    ASSERT_TRUE(FsUtils::writeToFile(m_area->resultPath(), std::string(500, 'a')).has_value());

    CTimer     timer;
    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, {.maxAttempts = 10, .initialDelay = 1000ms, .maxDelay = 1000ms});
    ASSERT_FALSE(STATUS.has_value());
    EXPECT_EQ(STATUS.error().type, VIEWER_ERROR_INVALID_RESPONSE);
    // a preview, not the whole file
    EXPECT_NE(STATUS.error().message.find(std::string(200, 'a') + "..."), std::string::npos);
    EXPECT_LT(timer.elapsed(), 500ms);
}

TEST_F(CoreResultReader, EmptyFileIsStillBeingWritten) {
    ASSERT_TRUE(FsUtils::writeToFile(m_area->resultPath(), "").has_value());

    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, m_fast);
    ASSERT_FALSE(STATUS.has_value());
    EXPECT_EQ(STATUS.error().type, VIEWER_ERROR_RESULT_READ_FAILED);
}

TEST_F(CoreResultReader, RejectsForeignId) {
    writeStatus(Protocol::SExitClosedByUser{}, "someone-else");

    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, m_fast);
    ASSERT_FALSE(STATUS.has_value());
    EXPECT_EQ(STATUS.error().type, VIEWER_ERROR_INVALID_RESPONSE);
    EXPECT_NE(STATUS.error().message.find("someone-else"), std::string::npos);
}

TEST_F(CoreResultReader, RejectsIncompatibleViewer) {
    writeStatus(Protocol::SExitClosedByUser{}, m_id, "0.0.0");

    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, m_fast);
    ASSERT_FALSE(STATUS.has_value());
    EXPECT_EQ(STATUS.error().type, VIEWER_ERROR_VERSION_MISMATCH);
}

TEST_F(CoreResultReader, UnversionedViewerIsLegacyMismatch) {
    const auto JSON = std::format(R"({{"id":"{}","reason":{{"reason":"closed_by_user"}}}})", m_id);
    ASSERT_TRUE(FsUtils::writeToFile(m_area->resultPath(), JSON).has_value());

    const auto STATUS = readExitStatus(m_area->resultPath(), m_id, m_fast);
    ASSERT_FALSE(STATUS.has_value());
    EXPECT_EQ(STATUS.error().type, VIEWER_ERROR_VERSION_MISMATCH);
    EXPECT_NE(STATUS.error().message.find("0.0.0"), std::string::npos);
}

TEST_F(CoreResultReader, NonZeroExitReconciliation) {
    writeStatus(Protocol::SExitClosedByUser{}, m_id);
    const auto CRASHED = collectExitStatus(3, m_area->resultPath(), m_id, m_fast);
    ASSERT_FALSE(CRASHED.has_value());
    EXPECT_EQ(CRASHED.error().type, VIEWER_ERROR_PROCESS_FAILED);
    EXPECT_NE(CRASHED.error().message.find("code 3"), std::string::npos);

    writeStatus(Protocol::SExitError{.message = "nope"}, m_id);
    const auto REPORTED = collectExitStatus(1, m_area->resultPath(), m_id, m_fast);
    ASSERT_TRUE(REPORTED.has_value()) << REPORTED.error().toString();
    EXPECT_TRUE(Protocol::isErrorReason(REPORTED->reason));

    std::filesystem::remove(m_area->resultPath());
    const auto MISSING = collectExitStatus(-6, m_area->resultPath(), m_id, m_fast);
    ASSERT_FALSE(MISSING.has_value());
    EXPECT_EQ(MISSING.error().type, VIEWER_ERROR_RESULT_READ_FAILED);
    EXPECT_NE(MISSING.error().message.find("code -6"), std::string::npos);
}
