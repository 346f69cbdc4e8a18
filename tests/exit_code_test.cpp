#include <qgate/protocol_adapters.h>
#include <qgate/refactor_orchestrator.h>

#include <gtest/gtest.h>

namespace qgate {
namespace {

RefactorOutcome OutcomeWith(RefactorStatus status) {
  RefactorOutcome outcome;
  outcome.status = status;
  return outcome;
}

TEST(RefactorExitCodeTest, SuccessfulAndCancelledRunsExitZero) {
  for (const bool ci_mode : {false, true}) {
    EXPECT_EQ(RefactorExitCode(OutcomeWith(RefactorStatus::kComplete), ci_mode), 0);
    EXPECT_EQ(RefactorExitCode(OutcomeWith(RefactorStatus::kCancelled), ci_mode),
              0);
  }
}

TEST(RefactorExitCodeTest, UnmetGatesFailOnlyInCiMode) {
  for (const auto status : {RefactorStatus::kBudgetExhausted,
                            RefactorStatus::kBuildBroken,
                            RefactorStatus::kNoProgress}) {
    EXPECT_EQ(RefactorExitCode(OutcomeWith(status), false), 0)
        << RefactorStatusName(status);
    EXPECT_EQ(RefactorExitCode(OutcomeWith(status), true), 1)
        << RefactorStatusName(status);
  }
}

TEST(CliExitCodeTest, ClientErrorsExitOneAndServerErrorsExitTwo) {
  const CliAdapter adapter;

  EXPECT_EQ(adapter.Encode(JsonResponse({{"status", "Complete"}})).exit_code, 0);
  EXPECT_EQ(adapter.Encode(ErrorResponse(404, "No route", "NOT_FOUND")).exit_code,
            1);
  EXPECT_EQ(adapter.Encode(ErrorResponse(500, "boom", "INTERNAL_ERROR")).exit_code,
            2);
}

} // namespace
} // namespace qgate
