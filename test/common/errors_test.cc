#include <gtest/gtest.h>
#include "../../src/common/errors.h"
#include "../../src/common/types.h"

using namespace Sluice;

TEST(ErrorsTest, KindSurvivesAsPayload) {
    absl::Status exhausted = MakeError(ErrorKind::kPoolExhausted, "no instance");
    absl::Status limited = MakeError(ErrorKind::kResourceLimitExceeded, "growth denied");
    EXPECT_EQ(exhausted.code(), absl::StatusCode::kResourceExhausted);
    EXPECT_EQ(limited.code(), absl::StatusCode::kResourceExhausted);
    EXPECT_TRUE(IsKind(exhausted, ErrorKind::kPoolExhausted));
    EXPECT_TRUE(IsKind(limited, ErrorKind::kResourceLimitExceeded));
    EXPECT_EQ(exhausted.message(), "no instance");
}

TEST(ErrorsTest, UntaggedAndOkStatuses) {
    EXPECT_EQ(GetErrorKind(absl::OkStatus()), ErrorKind::kNone);
    EXPECT_EQ(GetErrorKind(absl::InternalError("x")), ErrorKind::kEngineError);
    EXPECT_TRUE(MakeError(ErrorKind::kNone, "ignored").ok());
}

TEST(ErrorsTest, TransientKinds) {
    EXPECT_TRUE(IsTransient(ErrorKind::kCircuitOpen));
    EXPECT_TRUE(IsTransient(ErrorKind::kPoolExhausted));
    EXPECT_TRUE(IsTransient(ErrorKind::kExtractionTimeout));
    EXPECT_TRUE(IsTransient(ErrorKind::kEngineError));
    EXPECT_FALSE(IsTransient(ErrorKind::kAllModesExhausted));
    EXPECT_FALSE(IsTransient(ErrorKind::kDeadlineExpired));
    EXPECT_FALSE(IsTransient(ErrorKind::kInvalidConfig));
}

TEST(TypesTest, DecisionOrderAndNames) {
    EXPECT_EQ(NextStricter(Decision::kRaw), Decision::kProbesFirst);
    EXPECT_EQ(NextStricter(Decision::kProbesFirst), Decision::kHeadless);
    EXPECT_FALSE(NextStricter(Decision::kHeadless).has_value());

    for (Decision decision : {Decision::kRaw, Decision::kProbesFirst, Decision::kHeadless}) {
        EXPECT_EQ(ParseDecision(ToString(decision)), decision);
    }
    EXPECT_EQ(ParseDecision("HEADLESS"), Decision::kHeadless);
    EXPECT_FALSE(ParseDecision("browser").has_value());
}
