#include <string>

#include <gtest/gtest.h>

#include "stiffrk/integrator_status.h"

using namespace stiffrk;

TEST (IntegratorStatusName, StableNames)
{
  EXPECT_EQ(std::string(GetIntegratorStatusName(SUCCESS)), "SUCCESS");
  EXPECT_EQ(std::string(GetIntegratorStatusName(STOPPED_BY_USER)),
            "STOPPED_BY_USER");
  EXPECT_EQ(std::string(GetIntegratorStatusName(JACOBIAN_EVALUATION_ERROR)),
            "JACOBIAN_EVALUATION_ERROR");
  EXPECT_EQ(std::string(GetIntegratorStatusName(STEP_SIZE_TOO_SMALL)),
            "STEP_SIZE_TOO_SMALL");
  EXPECT_EQ(std::string(GetIntegratorStatusName(NOT_CONFIGURED)),
            "NOT_CONFIGURED");
}

TEST (IntegratorStatusName, EveryStatusHasADistinctName)
{
  for(int j=0; j<NUM_INTEGRATOR_STATUS; ++j) {
    const std::string name_j =
      GetIntegratorStatusName(static_cast<IntegratorStatus>(j));
    EXPECT_NE(name_j, "UNKNOWN");
    for(int k=j+1; k<NUM_INTEGRATOR_STATUS; ++k) {
      EXPECT_NE(name_j,
                std::string(GetIntegratorStatusName(
                  static_cast<IntegratorStatus>(k))));
    }
  }
  EXPECT_EQ(std::string(GetIntegratorStatusName(NUM_INTEGRATOR_STATUS)),
            "UNKNOWN");
}

TEST (IntegratorStatusCheck, OnlyAbnormalEndsAreFatal)
{
  EXPECT_FALSE(IsFatalStatus(SUCCESS));
  EXPECT_FALSE(IsFatalStatus(STOPPED_BY_USER));
  EXPECT_TRUE(IsFatalStatus(RHS_EVALUATION_ERROR));
  EXPECT_TRUE(IsFatalStatus(DEADLINE_EXCEEDED));

  EXPECT_FALSE(CheckIntegratorStatus("success", SUCCESS));
  EXPECT_FALSE(CheckIntegratorStatus("stopped", STOPPED_BY_USER));
  EXPECT_TRUE(CheckIntegratorStatus("singular", SINGULAR_MATRIX));
}

TEST (IntegratorStatusCheck, BackendStatusMapping)
{
  EXPECT_EQ(ToIntegratorStatus(LINEAR_SOLVER_SUCCESS), SUCCESS);
  EXPECT_EQ(ToIntegratorStatus(LINEAR_SOLVER_SINGULAR), SINGULAR_MATRIX);
  EXPECT_EQ(ToIntegratorStatus(LINEAR_SOLVER_FACTOR_FAILED),
            FACTORIZATION_ERROR);
  EXPECT_EQ(ToIntegratorStatus(LINEAR_SOLVER_SOLVE_FAILED),
            LINEAR_SOLVE_ERROR);
  EXPECT_EQ(ToIntegratorStatus(LINEAR_SOLVER_INVALID_HANDLE),
            LINEAR_SOLVE_ERROR);
}


int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
