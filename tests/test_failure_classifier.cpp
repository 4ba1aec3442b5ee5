/**
 * @file test_failure_classifier.cpp
 * @brief Ping report parsing and failure classification, no network involved.
 */

#include <gtest/gtest.h>

#include <cerrno>

#include "FailureClassifier.hpp"

namespace {

    PingOutput finished(int exit_code, std::string out, std::string err = "") {
        PingOutput o;
        o.spawned = true;
        o.exit_code = exit_code;
        o.stdout_text = std::move(out);
        o.stderr_text = std::move(err);
        return o;
    }

    const char* bsd_lost =
        "PING 10.0.0.9 (10.0.0.9): 56 data bytes\n"
        "\n"
        "--- 10.0.0.9 ping statistics ---\n"
        "1 packets transmitted, 0 packets received, 100.0% packet loss\n";

    const char* iputils_lost =
        "PING 10.0.0.9 (10.0.0.9) 56(84) bytes of data.\n"
        "\n"
        "--- 10.0.0.9 ping statistics ---\n"
        "1 packets transmitted, 0 received, 100% packet loss, time 0ms\n";

    const char* iputils_ok =
        "PING 10.0.0.1 (10.0.0.1) 56(84) bytes of data.\n"
        "64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time=0.412 ms\n"
        "\n"
        "--- 10.0.0.1 ping statistics ---\n"
        "1 packets transmitted, 1 received, 0% packet loss, time 0ms\n"
        "rtt min/avg/max/mdev = 0.412/0.412/0.412/0.000 ms\n";
}

TEST(PingReport, ParsesTransmittedAndLoss) {
    auto report = parse_ping_report(iputils_ok);

    ASSERT_TRUE(report.transmitted);
    EXPECT_EQ(*report.transmitted, 1u);
    ASSERT_TRUE(report.loss_percent);
    EXPECT_DOUBLE_EQ(*report.loss_percent, 0.0);
}

TEST(PingReport, ParsesFractionalLoss) {
    auto report = parse_ping_report(bsd_lost);

    ASSERT_TRUE(report.loss_percent);
    EXPECT_DOUBLE_EQ(*report.loss_percent, 100.0);
}

TEST(PingReport, EmptyTextHasNothing) {
    auto report = parse_ping_report("");

    EXPECT_FALSE(report.transmitted);
    EXPECT_FALSE(report.loss_percent);
}

TEST(EvaluatePing, FullLossIsHostUnreachable) {
    auto result = evaluate_ping(finished(2, bsd_lost));

    EXPECT_FALSE(result.reachable);
    ASSERT_TRUE(result.failure_reason);
    EXPECT_EQ(*result.failure_reason, FailureKind::HostUnreachable);
    EXPECT_NE(result.raw_detail.find("100.0% packet loss"), std::string::npos);
}

TEST(EvaluatePing, IputilsFullLossIsHostUnreachable) {
    auto result = evaluate_ping(finished(1, iputils_lost));

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::HostUnreachable);
}

TEST(EvaluatePing, OnePacketWithoutLossPhraseIsReachable) {
    auto result = evaluate_ping(finished(0, "PING 10.0.0.1\n1 packets transmitted, 1 packets received\n"));

    EXPECT_TRUE(result.reachable);
    EXPECT_FALSE(result.failure_reason);
}

TEST(EvaluatePing, NormalReplyIsReachable) {
    auto result = evaluate_ping(finished(0, iputils_ok));

    EXPECT_TRUE(result.reachable);
    EXPECT_FALSE(result.failure_reason);
    EXPECT_NE(result.raw_detail.find("time=0.412 ms"), std::string::npos);
}

TEST(EvaluatePing, AnythingOnStderrFails) {
    auto result = evaluate_ping(finished(0, iputils_ok, "ping: warning: something odd\n"));

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::Unknown);
}

TEST(EvaluatePing, MoreThanOnePacketFails) {
    auto result = evaluate_ping(finished(0, "2 packets transmitted, 2 received, 0% packet loss\n"));

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::Unknown);
}

TEST(EvaluatePing, MissingToolIsProbeToolUnavailable) {
    PingOutput o;
    o.spawned = false;
    o.spawn_errno = ENOENT;

    auto result = evaluate_ping(o);

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::ProbeToolUnavailable);
    EXPECT_NE(result.raw_detail.find("command not found"), std::string::npos);
}

TEST(EvaluatePing, ShellExit127IsProbeToolUnavailable) {
    auto result = evaluate_ping(finished(127, "", "sh: 1: ping: not found\n"));

    EXPECT_EQ(result.failure_reason, FailureKind::ProbeToolUnavailable);
}

TEST(EvaluatePing, ResolutionFailureIsInvalidAddress) {
    auto result = evaluate_ping(finished(2, "", "ping: nosuchhost.invalid: Name or service not known\n"));

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::InvalidAddress);
    EXPECT_EQ(result.raw_detail, "ping: nosuchhost.invalid: Name or service not known");
}

TEST(EvaluatePing, KilledAfterDeadlineIsUnknown) {
    PingOutput o;
    o.spawned = true;
    o.timed_out = true;

    auto result = evaluate_ping(o);

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::Unknown);
}

TEST(EvaluatePing, OtherExitIsUnknown) {
    auto result = evaluate_ping(finished(2, ""));

    EXPECT_FALSE(result.reachable);
    EXPECT_EQ(result.failure_reason, FailureKind::Unknown);
    EXPECT_EQ(result.raw_detail, "ping exited with status 2");
}

TEST(ClassifyFailure, LossWinsOverEverythingElse) {
    EXPECT_EQ(classify_failure("command not found", iputils_lost), FailureKind::HostUnreachable);
    EXPECT_EQ(classify_failure("Name or service not known", bsd_lost), FailureKind::HostUnreachable);
}

TEST(ClassifyFailure, ToolBeforeAddress) {
    EXPECT_EQ(classify_failure("command not found; Name or service not known", ""), FailureKind::ProbeToolUnavailable);
}

TEST(ClassifyFailure, ResolutionPhrases) {
    EXPECT_EQ(classify_failure("ping: cannot resolve foo: Unknown host", ""), FailureKind::InvalidAddress);
    EXPECT_EQ(classify_failure("ping: foo: Temporary failure in name resolution", ""), FailureKind::InvalidAddress);
}

TEST(ClassifyFailure, FallsBackToUnknown) {
    EXPECT_EQ(classify_failure("", ""), FailureKind::Unknown);
    EXPECT_EQ(classify_failure("sendmsg: Network is unreachable", ""), FailureKind::Unknown);
}

TEST(TroubleshootingMessage, EachKindHasItsOwnText) {
    EXPECT_NE(troubleshooting_message(FailureKind::HostUnreachable).find("powered on"), std::string_view::npos);
    EXPECT_NE(troubleshooting_message(FailureKind::ProbeToolUnavailable).find("system configuration"), std::string_view::npos);
    EXPECT_EQ(troubleshooting_message(FailureKind::InvalidAddress), "Invalid address format");
    EXPECT_EQ(troubleshooting_message(FailureKind::Unknown), "Connection failed. Check network connectivity.");
}
