#include <gtest/gtest.h>

#include "Core/Error.hpp"

namespace {

using CAB::AudioError;
using CAB::AudioUnitError;
using CAB::ComponentError;
using CAB::ErrorKind;
using CAB::Result;

Result<int> FailWithStatus(CAB::Host::Status status) {
    if (status != CAB::Host::kNoErr) {
        return CAB_ERROR_STATUS(status, "host call failed");
    }
    return 7;
}

Result<int> Chain(CAB::Host::Status status) {
    const int value = CAB_TRY(FailWithStatus(status));
    return value * 2;
}

TEST(ErrorTests, TryPropagatesValue) {
    auto result = Chain(CAB::Host::kNoErr);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 14);
}

TEST(ErrorTests, TryPropagatesClassifiedError) {
    auto result = Chain(static_cast<CAB::Host::Status>(AudioUnitError::kUninitialized));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::kUnit);
    EXPECT_EQ(result.error().AsUnitError(), AudioUnitError::kUninitialized);
    EXPECT_FALSE(result.error().AsAudioError().has_value());
    EXPECT_TRUE(result.error().IsRecoverable());
    EXPECT_STREQ(result.error().message, "host call failed");
}

TEST(ErrorTests, UnknownStatusKeepsRawCode) {
    auto result = FailWithStatus(424242);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, ErrorKind::kUnknownStatus);
    EXPECT_EQ(result.error().status, 424242);
    EXPECT_STREQ(result.error().Describe(), "host call failed");
}

TEST(ErrorTests, ToResultAndToStatusRoundTrip) {
    EXPECT_TRUE(CAB::ToResult(CAB::Host::kNoErr, "ok").has_value());

    auto failed = CAB::ToResult(static_cast<CAB::Host::Status>(AudioError::kMemFull), "alloc");
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().AsAudioError(), AudioError::kMemFull);
    EXPECT_EQ(CAB::ToStatus(failed), static_cast<CAB::Host::Status>(AudioError::kMemFull));
}

TEST(ErrorTests, NonStatusErrorsMapToParamForHost) {
    Result<void> misuse = CAB_ERROR_FATAL("misuse");
    ASSERT_FALSE(misuse.has_value());
    EXPECT_TRUE(misuse.error().IsFatal());
    EXPECT_EQ(misuse.error().kind, ErrorKind::kOther);
    EXPECT_EQ(CAB::ToStatus(misuse), static_cast<CAB::Host::Status>(AudioError::kParam));
}

TEST(ErrorTests, ComponentErrorsCarryTheirOwnCode) {
    Result<void> missing = CAB_ERROR_COMPONENT(ComponentError::kNoComponentFound, "lookup");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, ErrorKind::kComponent);
    EXPECT_EQ(missing.error().AsComponentError(), ComponentError::kNoComponentFound);
    EXPECT_STREQ(missing.error().Describe(), CAB::Describe(ComponentError::kNoComponentFound));
}

} // namespace
