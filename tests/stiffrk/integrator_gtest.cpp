#include <math.h>
#include <stdio.h>
#include <string.h>

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "interfaces/lapack_manager/lapack_linear_solver.h"
#include "samples/sample_problems.h"
#include "stiffrk/integrator.h"
#include "stiffrk/integrator_options.h"
#include "stiffrk/nvector_utilities.h"
#include "stiffrk/trajectory.h"
#include "utilities/file_utilities.h"

using namespace stiffrk;

static IntegratorConfig MakeConfig(const double rel_tol,
                                   const double abs_tol,
                                   const double h_init)
{
  IntegratorOptions options;
  options.SetDoubleOption("rel_tol", rel_tol);
  options.SetDoubleOption("abs_tol", abs_tol);
  options.SetDoubleOption("h_init", h_init);
  IntegratorConfig config;
  EXPECT_EQ(options.GetConfig(&config), SUCCESS);
  return config;
}

static void ExpectCountersConsistent(const Statistics &stats)
{
  EXPECT_EQ(stats.num_steps,
            stats.num_accepted_steps + stats.num_rejected_steps);
  EXPECT_GE(stats.num_function_evaluations, 1);
}

// Records the step size and the factorization count after every step.
struct StepLog
{
  const Integrator *integrator;
  std::vector<double> h;
  std::vector<int> num_factorizations;
  std::vector<int> num_jacobians;
};

static int RecordStep(const int num_accepted,
                      const double x,
                      const double h,
                      N_Vector y,
                      void *user_data)
{
  StepLog *log = static_cast<StepLog *>(user_data);
  log->h.push_back(h);
  log->num_factorizations.push_back(
    log->integrator->statistics().num_factorizations);
  log->num_jacobians.push_back(
    log->integrator->statistics().num_jacobian_evaluations);
  return 0;
}

static int StopAfterThree(const int num_accepted,
                          const double x,
                          const double h,
                          N_Vector y,
                          void *user_data)
{
  return (num_accepted >= 3) ? 1 : 0;
}

// Dense backend whose real factorizations number first_singular through
// first_singular + num_singular - 1 (counting from 1) report a singular
// matrix.
class SingularDenseSolver : public LapackLinearSolver
{
 public:
  SingularDenseSolver(const int first_singular, const int num_singular)
    : first_singular_(first_singular),
      num_singular_(num_singular),
      num_calls_(0)
  {}
  int num_calls() const {return num_calls_;}

 protected:
  LinearSolverStatus FactorRealMatrix(const CompressedColumnPattern &pattern,
                                      const bool pattern_changed,
                                      const std::vector<double> &values)
  {
    ++num_calls_;
    if(num_calls_ >= first_singular_ &&
       num_calls_ < first_singular_ + num_singular_) {
      return LINEAR_SOLVER_SINGULAR;
    }
    return LapackLinearSolver::FactorRealMatrix(pattern,
                                                pattern_changed,
                                                values);
  }

 private:
  int first_singular_;
  int num_singular_;
  int num_calls_;
};

class IntegratorTest : public ::testing::Test
{
 protected:
  N_Vector NewState(const int n)
  {
    N_Vector v = context_.NewVector(n);
    N_VConst(0.0, v);
    vectors_.push_back(v);
    return v;
  }
  void TearDown()
  {
    for(size_t j=0; j<vectors_.size(); ++j) {
      N_VDestroy(vectors_[j]);
    }
  }
  NVectorContext context_;
  std::vector<N_Vector> vectors_;
};

TEST_F (IntegratorTest, NotConfigured)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_FALSE(integrator.configured());
  EXPECT_EQ(integrator.Run(&x, 1.0, y, &trajectory), NOT_CONFIGURED);
  EXPECT_EQ(x, 0.0);
  EXPECT_EQ(integrator.Sample(0.0, y), STALE_INTERPOLANT);
}

TEST_F (IntegratorTest, InvalidInput)
{
  samples::RobertsonProblem problem(false);
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-10, 1.0e-6);
  config.rel_tol.assign(2, 1.0e-6);
  EXPECT_EQ(integrator.Configure(config), INVALID_INPUT);
  EXPECT_FALSE(integrator.configured());

  config.rel_tol.assign(3, 1.0e-6);
  config.linear_solver = "magic";
  EXPECT_EQ(integrator.Configure(config), INVALID_INPUT);

  config.linear_solver = "dense";
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(3);
  problem.GetInitialState(y);
  NV_Ith_S(y,1) = nan("");
  double x = 0.0;
  EXPECT_EQ(integrator.Run(&x, 1.0, y, NULL), INVALID_INPUT);

  N_Vector wrong_size = NewState(2);
  EXPECT_EQ(integrator.Run(&x, 1.0, wrong_size, NULL), INVALID_INPUT);
}

TEST_F (IntegratorTest, ZeroSpan)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  ASSERT_EQ(integrator.Configure(MakeConfig(1.0e-6, 1.0e-6, 1.0e-3)),
            SUCCESS);
  N_Vector y = NewState(1);
  double x = 0.5;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 0.5, y, &trajectory), SUCCESS);
  EXPECT_EQ(x, 0.5);
  EXPECT_EQ(trajectory.num_steps(), 1);
  EXPECT_EQ(integrator.statistics().num_steps, 0);
}

TEST_F (IntegratorTest, AccuracyImprovesWithTolerance)
{
  samples::HairerWannerProblem problem;
  const double tolerances[3] = {1.0e-4, 1.0e-6, 1.0e-8};
  double errors[3];
  int accepted[3];
  for(int j=0; j<3; ++j) {
    Integrator integrator(&problem);
    ASSERT_EQ(integrator.Configure(MakeConfig(tolerances[j],
                                              tolerances[j],
                                              1.0e-4)), SUCCESS);
    N_Vector y = NewState(1);
    double x = 0.0;
    ASSERT_EQ(integrator.Run(&x, 1.5, y, NULL), SUCCESS);
    EXPECT_EQ(x, 1.5);
    errors[j] = fabs(NV_Ith_S(y,0) - problem.ExactSolution(1.5));
    accepted[j] = integrator.statistics().num_accepted_steps;
    EXPECT_LT(errors[j], 100.0*tolerances[j]) << "tol " << tolerances[j];
    ExpectCountersConsistent(integrator.statistics());
  }
  EXPECT_LT(errors[2], errors[0]);
  EXPECT_LT(accepted[0], accepted[1]);
  EXPECT_LT(accepted[1], accepted[2]);
}

TEST_F (IntegratorTest, LinearDecayErrorShrinksWithTolerance)
{
  samples::LinearDecayProblem problem(50.0, true);
  const double tolerances[3] = {1.0e-4, 1.0e-6, 1.0e-8};
  double max_errors[3];
  for(int j=0; j<3; ++j) {
    Integrator integrator(&problem);
    ASSERT_EQ(integrator.Configure(MakeConfig(tolerances[j],
                                              tolerances[j],
                                              1.0e-4)), SUCCESS);
    N_Vector y = NewState(1);
    NV_Ith_S(y,0) = 1.0;
    double x = 0.0;
    Trajectory trajectory;
    ASSERT_EQ(integrator.Run(&x, 1.0, y, &trajectory), SUCCESS);
    max_errors[j] = 0.0;
    for(int k=0; k<trajectory.num_steps(); ++k) {
      const double error =
        fabs(trajectory.step_state(k)[0] -
             problem.ExactSolution(trajectory.step_x(k), 1.0));
      max_errors[j] = std::max(max_errors[j], error);
    }
    EXPECT_LT(max_errors[j], 100.0*tolerances[j]) << "tol " << tolerances[j];
  }
  EXPECT_LT(max_errors[1], max_errors[0]);
  EXPECT_LT(max_errors[2], max_errors[1]);

  // Steps sized by the order 3 embedded estimate against the transformed
  // tolerance 0.1*rtol^(2/3) give a global error of the order 5 solution
  // near rtol^(5/6); a lower order solution drops below one half.
  const double rate = log(max_errors[0]/max_errors[2]) /
                      log(tolerances[0]/tolerances[2]);
  EXPECT_GT(rate, 0.5);
}

TEST_F (IntegratorTest, LargeFirstStepIsRejected)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  ASSERT_EQ(integrator.Configure(MakeConfig(1.0e-6, 1.0e-6, 1.0)),
            SUCCESS);
  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  ASSERT_EQ(integrator.Run(&x, 1.5, y, &trajectory), SUCCESS);
  const Statistics &stats = integrator.statistics();
  EXPECT_GE(stats.num_rejected_steps, 1);
  ExpectCountersConsistent(stats);
  EXPECT_EQ(trajectory.num_steps(), stats.num_accepted_steps + 1);
  EXPECT_NEAR(NV_Ith_S(y,0), problem.ExactSolution(1.5), 1.0e-4);
}

TEST_F (IntegratorTest, TooManyRejections)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0);
  config.max_consecutive_rejections = 1;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 1.5, y, &trajectory), TOO_MANY_REJECTIONS);
  EXPECT_EQ(x, 0.0);
  EXPECT_EQ(trajectory.num_steps(), 1);
  EXPECT_EQ(integrator.statistics().num_rejected_steps, 1);
}

TEST_F (IntegratorTest, StepSizeTooSmall)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0);
  config.h_min = 0.5;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(1);
  double x = 0.0;
  EXPECT_EQ(integrator.Run(&x, 1.5, y, NULL), STEP_SIZE_TOO_SMALL);
  EXPECT_EQ(x, 0.0);
}

TEST_F (IntegratorTest, MaxStepsExceeded)
{
  samples::VanDerPolProblem problem(1.0e-3, true);
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-6);
  config.max_steps = 5;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(2);
  NV_Ith_S(y,0) = 2.0;
  double x = 0.0;
  EXPECT_EQ(integrator.Run(&x, 2.0, y, NULL), MAX_STEPS_EXCEEDED);
  EXPECT_EQ(integrator.statistics().num_steps, 5);
  EXPECT_GT(x, 0.0);
  EXPECT_LT(x, 2.0);
}

TEST_F (IntegratorTest, DeadlineExceeded)
{
  samples::VanDerPolProblem problem(1.0e-3, true);
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-6);
  config.max_wall_time = 1.0e-9;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(2);
  NV_Ith_S(y,0) = 2.0;
  double x = 0.0;
  EXPECT_EQ(integrator.Run(&x, 2.0, y, NULL), DEADLINE_EXCEEDED);
  EXPECT_LT(x, 2.0);
}

TEST_F (IntegratorTest, NonFiniteJacobianKeepsPartialTrajectory)
{
  samples::HairerWannerProblem base;
  samples::NanJacobianProblem problem(&base, 0.5);
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-4);
  config.max_jacobian_age = 1;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 1.5, y, &trajectory),
            JACOBIAN_EVALUATION_ERROR);
  EXPECT_GE(x, 0.5);
  EXPECT_LT(x, 1.5);
  ASSERT_GE(trajectory.num_steps(), 2);
  EXPECT_EQ(trajectory.step_x(trajectory.num_steps()-1), x);
  EXPECT_EQ(trajectory.step_state(trajectory.num_steps()-1)[0],
            NV_Ith_S(y,0));
  EXPECT_NEAR(NV_Ith_S(y,0), base.ExactSolution(x), 1.0e-4);
}

TEST_F (IntegratorTest, RunsAreReproducible)
{
  samples::VanDerPolProblem problem(1.0e-3, true);
  Integrator integrator(&problem);
  ASSERT_EQ(integrator.Configure(MakeConfig(1.0e-5, 1.0e-5, 1.0e-6)),
            SUCCESS);

  Trajectory first, second;
  N_Vector y = NewState(2);
  NV_Ith_S(y,0) = 2.0;
  double x = 0.0;
  ASSERT_EQ(integrator.Run(&x, 1.0, y, &first), SUCCESS);
  const Statistics stats = integrator.statistics();

  N_VConst(0.0, y);
  NV_Ith_S(y,0) = 2.0;
  x = 0.0;
  ASSERT_EQ(integrator.Run(&x, 1.0, y, &second), SUCCESS);
  EXPECT_TRUE(first == second);
  EXPECT_EQ(stats.num_steps, integrator.statistics().num_steps);
  EXPECT_EQ(stats.num_function_evaluations,
            integrator.statistics().num_function_evaluations);
  EXPECT_EQ(stats.num_jacobian_evaluations,
            integrator.statistics().num_jacobian_evaluations);
  EXPECT_EQ(stats.num_factorizations,
            integrator.statistics().num_factorizations);
  EXPECT_EQ(stats.num_newton_iterations,
            integrator.statistics().num_newton_iterations);
}

TEST_F (IntegratorTest, FactorizationReusedAtConstantStep)
{
  samples::LinearDecayProblem problem(1.0, true);
  Integrator integrator(&problem);
  // 1/64 is exact in binary, so the last step is exactly 1/64 as well
  IntegratorConfig config = MakeConfig(1.0e-4, 1.0e-4, 0.015625);
  config.h_max = 0.015625;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);

  StepLog log;
  log.integrator = &integrator;
  integrator.SetStepOutputFcn(RecordStep, &log);

  N_Vector y = NewState(1);
  NV_Ith_S(y,0) = 1.0;
  double x = 0.0;
  ASSERT_EQ(integrator.Run(&x, 1.0, y, NULL), SUCCESS);
  EXPECT_EQ(x, 1.0);

  const Statistics &stats = integrator.statistics();
  EXPECT_EQ(stats.num_accepted_steps, 64);
  EXPECT_EQ(stats.num_rejected_steps, 0);
  EXPECT_EQ(stats.num_jacobian_evaluations, 1);
  EXPECT_EQ(stats.num_factorizations, 1);
  ASSERT_EQ((int)log.h.size(), 64);
  for(size_t j=1; j<log.h.size(); ++j) {
    EXPECT_EQ(log.h[j], log.h[0]);
    EXPECT_EQ(log.num_factorizations[j], log.num_factorizations[0]);
    EXPECT_EQ(log.num_jacobians[j], log.num_jacobians[0]);
  }
  EXPECT_NEAR(NV_Ith_S(y,0), problem.ExactSolution(1.0, 1.0), 1.0e-6);
}

TEST_F (IntegratorTest, BackwardIntegration)
{
  samples::LinearDecayProblem problem(1.0, false);
  Integrator integrator(&problem);
  ASSERT_EQ(integrator.Configure(MakeConfig(1.0e-8, 1.0e-8, 1.0e-3)),
            SUCCESS);
  N_Vector y = NewState(1);
  NV_Ith_S(y,0) = exp(-1.0);
  double x = 1.0;
  Trajectory trajectory;
  ASSERT_EQ(integrator.Run(&x, 0.0, y, &trajectory), SUCCESS);
  EXPECT_EQ(x, 0.0);
  EXPECT_NEAR(NV_Ith_S(y,0), 1.0, 1.0e-6);
  for(int j=1; j<trajectory.num_steps(); ++j) {
    EXPECT_LT(trajectory.step_x(j), trajectory.step_x(j-1));
    EXPECT_LT(trajectory.step_h(j), 0.0);
  }
}

TEST_F (IntegratorTest, StoppedByUser)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  ASSERT_EQ(integrator.Configure(MakeConfig(1.0e-6, 1.0e-6, 1.0e-4)),
            SUCCESS);
  integrator.SetStepOutputFcn(StopAfterThree, NULL);
  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 1.5, y, &trajectory), STOPPED_BY_USER);
  EXPECT_EQ(integrator.statistics().num_accepted_steps, 3);
  EXPECT_EQ(trajectory.num_steps(), 4);
  EXPECT_EQ(trajectory.step_x(3), x);
  EXPECT_LT(x, 1.5);
}

TEST_F (IntegratorTest, DenseOutputGrid)
{
  samples::HairerWannerProblem problem;
  Integrator integrator(&problem);
  IntegratorConfig config = MakeConfig(1.0e-7, 1.0e-7, 1.0e-4);
  config.dense_output_step = 0.1;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);
  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  ASSERT_EQ(integrator.Run(&x, 1.0, y, &trajectory), SUCCESS);

  ASSERT_EQ(trajectory.num_dense_points(), 10);
  for(int j=0; j<trajectory.num_dense_points(); ++j) {
    EXPECT_NEAR(trajectory.dense_x(j), 0.1*(j+1), 1.0e-14);
    EXPECT_NEAR(trajectory.dense_state(j)[0],
                problem.ExactSolution(trajectory.dense_x(j)),
                1.0e-5);
  }
  EXPECT_EQ(trajectory.dense_x(9), 1.0);
  EXPECT_NEAR(trajectory.dense_state(9)[0], NV_Ith_S(y,0), 1.0e-12);

  // the interpolant of the last accepted step stays available
  N_Vector y_sample = NewState(1);
  EXPECT_EQ(integrator.Sample(1.0, y_sample), SUCCESS);
  EXPECT_NEAR(NV_Ith_S(y_sample,0), NV_Ith_S(y,0), 1.0e-12);
  EXPECT_EQ(integrator.Sample(0.0, y_sample), STALE_INTERPOLANT);
}

TEST_F (IntegratorTest, RobertsonDaeConservesMass)
{
  samples::RobertsonProblem dae(true);
  samples::RobertsonProblem ode(false);
  const double x_end = 40.0;

  Integrator dae_integrator(&dae);
  ASSERT_EQ(dae_integrator.Configure(MakeConfig(1.0e-6, 1.0e-10, 1.0e-6)),
            SUCCESS);
  N_Vector y_dae = NewState(3);
  dae.GetInitialState(y_dae);
  double x = 0.0;
  Trajectory trajectory;
  ASSERT_EQ(dae_integrator.Run(&x, x_end, y_dae, &trajectory), SUCCESS);
  for(int j=0; j<trajectory.num_steps(); ++j) {
    const double *state = trajectory.step_state(j);
    EXPECT_NEAR(state[0] + state[1] + state[2], 1.0, 1.0e-8);
  }

  Integrator ode_integrator(&ode);
  ASSERT_EQ(ode_integrator.Configure(MakeConfig(1.0e-6, 1.0e-10, 1.0e-6)),
            SUCCESS);
  N_Vector y_ode = NewState(3);
  ode.GetInitialState(y_ode);
  x = 0.0;
  ASSERT_EQ(ode_integrator.Run(&x, x_end, y_ode, NULL), SUCCESS);

  EXPECT_NEAR(NV_Ith_S(y_dae,0), 0.7158271, 1.0e-4);
  EXPECT_NEAR(NV_Ith_S(y_dae,1), 9.1855e-6, 1.0e-7);
  EXPECT_NEAR(NV_Ith_S(y_dae,0), NV_Ith_S(y_ode,0), 1.0e-5);
  EXPECT_NEAR(NV_Ith_S(y_dae,1), NV_Ith_S(y_ode,1), 1.0e-8);
  EXPECT_NEAR(NV_Ith_S(y_dae,2), NV_Ith_S(y_ode,2), 1.0e-5);
}

TEST_F (IntegratorTest, SingularMatrixRetriedWithSmallerStep)
{
  samples::HairerWannerProblem problem;
  SingularDenseSolver backend(1, 1);
  Integrator integrator(&problem);
  integrator.SetLinearSolverBackend(&backend);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-3);
  config.max_singular_retries = 1;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);

  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 1.0, y, &trajectory), SUCCESS);
  EXPECT_EQ(x, 1.0);
  EXPECT_GT(backend.num_calls(), 1);

  const Statistics &stats = integrator.statistics();
  EXPECT_GE(stats.num_rejected_steps, 1);
  ExpectCountersConsistent(stats);
  // the retry halves the first trial step
  ASSERT_GE(trajectory.num_steps(), 2);
  EXPECT_LE(trajectory.step_h(1), 0.5*1.0e-3*(1.0 + 1.0e-12));
}

TEST_F (IntegratorTest, SingularMatrixWithoutRetriesIsFatal)
{
  samples::HairerWannerProblem problem;
  SingularDenseSolver backend(4, 1000000);
  Integrator integrator(&problem);
  integrator.SetLinearSolverBackend(&backend);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-6);
  config.max_singular_retries = 0;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);

  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 1.0, y, &trajectory), SINGULAR_MATRIX);
  EXPECT_EQ(backend.num_calls(), 4);

  // the partial trajectory ends at the returned state
  const Statistics &stats = integrator.statistics();
  EXPECT_GE(stats.num_accepted_steps, 1);
  ASSERT_EQ(trajectory.num_steps(), 1 + stats.num_accepted_steps);
  const int last = trajectory.num_steps() - 1;
  EXPECT_EQ(trajectory.step_x(last), x);
  EXPECT_EQ(trajectory.step_state(last)[0], NV_Ith_S(y,0));
  EXPECT_LT(x, 1.0);
}

TEST_F (IntegratorTest, SingularMatrixAfterLastRetryIsFatal)
{
  samples::HairerWannerProblem problem;
  SingularDenseSolver backend(1, 1000000);
  Integrator integrator(&problem);
  integrator.SetLinearSolverBackend(&backend);
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-3);
  config.max_singular_retries = 1;
  ASSERT_EQ(integrator.Configure(config), SUCCESS);

  N_Vector y = NewState(1);
  double x = 0.0;
  Trajectory trajectory;
  EXPECT_EQ(integrator.Run(&x, 1.0, y, &trajectory), SINGULAR_MATRIX);
  EXPECT_EQ(x, 0.0);
  EXPECT_EQ(backend.num_calls(), 2);
  EXPECT_EQ(integrator.statistics().num_rejected_steps, 1);
  EXPECT_EQ(integrator.statistics().num_accepted_steps, 0);
  EXPECT_EQ(trajectory.num_steps(), 1);
}

TEST_F (IntegratorTest, SparseBackendMatchesDense)
{
  samples::BrusselatorProblem problem(8, 0.02);
  const int n = problem.GetNumStates();
  IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-4);

  Integrator dense_integrator(&problem);
  ASSERT_EQ(dense_integrator.Configure(config), SUCCESS);
  N_Vector y_dense = NewState(n);
  problem.GetInitialState(y_dense);
  double x = 0.0;
  ASSERT_EQ(dense_integrator.Run(&x, 1.0, y_dense, NULL), SUCCESS);

  config.linear_solver = "sparse";
  Integrator sparse_integrator(&problem);
  ASSERT_EQ(sparse_integrator.Configure(config), SUCCESS);
  N_Vector y_sparse = NewState(n);
  problem.GetInitialState(y_sparse);
  x = 0.0;
  ASSERT_EQ(sparse_integrator.Run(&x, 1.0, y_sparse, NULL), SUCCESS);
  EXPECT_EQ(x, 1.0);

  for(int j=0; j<n; ++j) {
    EXPECT_NEAR(NV_Ith_S(y_sparse,j), NV_Ith_S(y_dense,j), 1.0e-4)
      << "component " << j;
  }
}

TEST_F (IntegratorTest, LogsStepsAndStatistics)
{
  const std::string log_name = "integrator_gtest.log";
  remove(log_name.c_str());
  {
    utilities::Logger logger(log_name);
    samples::HairerWannerProblem problem;
    Integrator integrator(&problem);
    IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-6, 1.0e-4);
    config.verbosity = 2;
    ASSERT_EQ(integrator.Configure(config), SUCCESS);
    integrator.SetLogger(&logger);
    N_Vector y = NewState(1);
    double x = 0.0;
    ASSERT_EQ(integrator.Run(&x, 1.0, y, NULL), SUCCESS);
  }
  FILE *fptr = fopen(log_name.c_str(), "r");
  ASSERT_TRUE(fptr != NULL);
  char line[1024];
  int num_step_lines = 0;
  bool found_finish = false;
  while(fgets(line, sizeof(line), fptr) != NULL) {
    if(strncmp(line, "# step", 6) == 0) {
      ++num_step_lines;
    }
    if(strstr(line, "finished with status SUCCESS") != NULL) {
      found_finish = true;
    }
  }
  fclose(fptr);
  EXPECT_GT(num_step_lines, 0);
  EXPECT_TRUE(found_finish);
}

TEST_F (IntegratorTest, ConfigureErrorsGoToLogger)
{
  const std::string log_name = "integrator_configure_gtest.log";
  remove(log_name.c_str());
  {
    utilities::Logger logger(log_name);
    samples::RobertsonProblem problem(false);
    Integrator integrator(&problem);
    integrator.SetLogger(&logger);
    IntegratorConfig config = MakeConfig(1.0e-6, 1.0e-10, 1.0e-6);
    config.abs_tol.assign(2, 1.0e-10);
    EXPECT_EQ(integrator.Configure(config), INVALID_INPUT);

    config.abs_tol.assign(1, 1.0e-10);
    config.linear_solver = "magic";
    EXPECT_EQ(integrator.Configure(config), INVALID_INPUT);
    EXPECT_FALSE(integrator.configured());
  }
  FILE *fptr = fopen(log_name.c_str(), "r");
  ASSERT_TRUE(fptr != NULL);
  char line[1024];
  int num_configure_errors = 0;
  bool found_solver_name = false;
  while(fgets(line, sizeof(line), fptr) != NULL) {
    if(strstr(line, "# ERROR: In Integrator::Configure") != NULL) {
      ++num_configure_errors;
    }
    if(strstr(line, "linear solver type magic not recognized") != NULL) {
      found_solver_name = true;
    }
  }
  fclose(fptr);
  EXPECT_EQ(num_configure_errors, 1);
  EXPECT_TRUE(found_solver_name);
}


int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
