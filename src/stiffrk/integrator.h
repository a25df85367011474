#ifndef STIFFRK_INTEGRATOR_H_
#define STIFFRK_INTEGRATOR_H_

#include "sundials/sundials_nvector.h"

#include "utilities/file_utilities.h"

#include "dense_output.h"
#include "error_estimator.h"
#include "error_norm.h"
#include "integrator_options.h"
#include "integrator_status.h"
#include "iteration_matrix_builder.h"
#include "jacobian_manager.h"
#include "linear_solver_backend.h"
#include "newton_solver.h"
#include "nvector_utilities.h"
#include "ode_problem.h"
#include "radau_coefficients.h"
#include "sparse_matrix.h"
#include "statistics.h"
#include "step_controller.h"
#include "trajectory.h"

namespace stiffrk
{

// Called after every accepted step with the number of accepted steps so
// far. A nonzero return value stops the run with STOPPED_BY_USER.
typedef int (*StepOutputFcn)(const int num_accepted,
                             const double x,
                             const double h,
                             N_Vector y,
                             void *user_data);

// Adaptive Radau IIA (order 5) integrator for M*y' = f(x,y).
//
// Usage:
//   Integrator integrator(&problem);
//   integrator.Configure(config);      // from IntegratorOptions::GetConfig
//   integrator.Run(&x, x_end, y, &trajectory);
//
// Run advances (x, y) in place to x_end, or to the last accepted point when
// it fails. After a run Sample(x, y) evaluates the interpolant of the last
// accepted step.
class Integrator
{
 public:
  explicit Integrator(OdeProblem *problem);
  ~Integrator();

  // Copies the configuration and allocates the work space. Returns
  // INVALID_INPUT for inconsistent tolerances, an unknown linear solver or
  // a mass matrix that can not be evaluated.
  IntegratorStatus Configure(const IntegratorConfig &config);

  // Replaces the backend named in the configuration. The backend is not
  // owned and must outlive the integrator.
  void SetLinearSolverBackend(LinearSolverBackend *backend);

  // Optional, not owned. Without a logger the integrator is silent.
  void SetLogger(const utilities::Logger *logger) {logger_ = logger;}

  void SetStepOutputFcn(StepOutputFcn fcn, void *user_data)
  {
    step_output_fcn_ = fcn;
    step_output_data_ = user_data;
  }

  // trajectory may be NULL.
  IntegratorStatus Run(double *x,
                       const double x_end,
                       N_Vector y,
                       Trajectory *trajectory);

  IntegratorStatus Sample(const double x, N_Vector y) const;

  const Statistics& statistics() const {return stats_;}
  const IntegratorConfig& config() const {return config_;}
  bool configured() const {return configured_;}

 private:
  Integrator(const Integrator &);
  Integrator& operator=(const Integrator &);

  void FreeWorkspace();
  IntegratorStatus RecordRejection(int *consecutive_rejections);
  void AddDenseOutput(const double x0,
                      const double x_end,
                      const bool last,
                      Trajectory *trajectory);
  IntegratorStatus Finish(const IntegratorStatus status,
                          const double x,
                          const double h);

  OdeProblem *problem_;
  int num_states_;
  IntegratorConfig config_;
  bool configured_;

  NVectorContext nvector_context_;
  RadauCoefficients coefficients_;
  ErrorNorm error_norm_;
  StepController controller_;
  Statistics stats_;
  SparseMatrix mass_;

  LinearSolverBackend *backend_;
  LinearSolverBackend *owned_backend_;
  JacobianManager *jacobian_manager_;
  IterationMatrixBuilder *builder_;
  NewtonSolver *newton_;
  ErrorEstimator *estimator_;
  DenseOutput *dense_output_;

  N_Vector fy_;
  N_Vector dense_y_;
  int next_dense_index_;

  const utilities::Logger *logger_;
  StepOutputFcn step_output_fcn_;
  void *step_output_data_;
};

} // namespace stiffrk

#endif
