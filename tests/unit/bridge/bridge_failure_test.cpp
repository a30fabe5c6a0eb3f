#include <gtest/gtest.h>

#include <gmcp/bridge/bridge_failure.h>

using namespace gmcp::bridge;

TEST(BridgeFailure, PrefixRoundTripsEveryKind) {
    for (auto kind : {BridgeFailureKind::Refused, BridgeFailureKind::ConnectTimeout,
                      BridgeFailureKind::HelloTimeout, BridgeFailureKind::AuthRejected,
                      BridgeFailureKind::RequestTimeout, BridgeFailureKind::ResetOrBrokenPipe,
                      BridgeFailureKind::Eof, BridgeFailureKind::ProjectMismatch,
                      BridgeFailureKind::Other}) {
        auto msg = formatBridgeFailure(kind, "detail text");
        auto parsed = parseBridgeFailureKind(msg);
        ASSERT_TRUE(parsed.has_value()) << msg;
        EXPECT_EQ(*parsed, kind);
        EXPECT_EQ(stripBridgeFailurePrefix(msg), "detail text");
    }
}

TEST(BridgeFailure, UnprefixedOrUnknownMessagesAreUnclassified) {
    EXPECT_FALSE(parseBridgeFailureKind("connection refused").has_value());
    EXPECT_FALSE(parseBridgeFailureKind("[bridge:weird] x").has_value());
    EXPECT_FALSE(parseBridgeFailureKind("[bridge:] x").has_value());
    EXPECT_EQ(stripBridgeFailurePrefix("plain"), "plain");
}

TEST(BridgeFailure, OnlyNothingListeningMarksALockStale) {
    EXPECT_TRUE(isStaleLockSignal(BridgeFailureKind::Refused));
    EXPECT_TRUE(isStaleLockSignal(BridgeFailureKind::ConnectTimeout));
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::HelloTimeout));
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::AuthRejected));
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::ResetOrBrokenPipe));
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::Eof));
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::ProjectMismatch));
    EXPECT_FALSE(isStaleLockSignal(BridgeFailureKind::Other));
}
