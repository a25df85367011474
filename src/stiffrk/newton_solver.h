#ifndef STIFFRK_NEWTON_SOLVER_H_
#define STIFFRK_NEWTON_SOLVER_H_

#include "sundials/sundials_nvector.h"

#include "dense_output.h"
#include "error_norm.h"
#include "integrator_status.h"
#include "iteration_matrix_builder.h"
#include "jacobian_manager.h"
#include "ode_problem.h"
#include "radau_coefficients.h"
#include "statistics.h"

namespace stiffrk
{

// Result of one simplified Newton attempt.
struct NewtonIterationRecord
{
  int iterations;
  double correction_norm;  // weighted norm of the last correction
  // Contraction rate estimate theta. Measured from the second iteration on;
  // an attempt that stops after one iteration reports the initial_rate
  // passed to Iterate, so a one-iteration convergence never triggers a
  // Jacobian refresh.
  double rate;
  NewtonVerdict verdict;
  double step_factor;      // suggested h ratio for NEWTON_STALLED
  IntegratorStatus status; // non-SUCCESS only for unrecoverable failures
};

// Simplified Newton iteration for the three stage collocation system, run
// in the variables W = TI*Z that decouple it into one real and one complex
// linear system per iteration. The factored iteration matrices are never
// updated inside an attempt.
class NewtonSolver
{
 public:
  NewtonSolver(const RadauCoefficients &coefficients,
               OdeProblem *problem,
               IterationMatrixBuilder *builder,
               const ErrorNorm *error_norm,
               N_Vector template_vector);
  ~NewtonSolver();

  // Resets the convergence history of a run.
  void Reset();

  // Starting values: extrapolated from the interpolant when it is valid,
  // zero otherwise.
  void InitializeStages(const DenseOutput *dense_output, const double h);

  // Stopping tolerance kappa for the scaled correction norm.
  static double NewtonTolerance(const double min_transformed_rtol);

  NewtonIterationRecord Iterate(const double x,
                                N_Vector y,
                                const double h,
                                const int max_iterations,
                                const double newton_tolerance,
                                const double initial_rate,
                                Statistics *stats);

  // Stage increments Z_k = Y_k - y of the last attempt.
  N_Vector* stages() {return z_;}

 private:
  NewtonSolver(const NewtonSolver &);
  NewtonSolver& operator=(const NewtonSolver &);

  void Transform(const double m[3][3], N_Vector in[3], N_Vector out[3]);

  const RadauCoefficients &coefficients_;
  OdeProblem *problem_;
  IterationMatrixBuilder *builder_;
  const ErrorNorm *error_norm_;

  N_Vector z_[3];     // stage increments
  N_Vector w_[3];     // transformed increments TI*Z
  N_Vector tmp_[3];
  N_Vector mass_f_[3];
  N_Vector stage_y_;
  N_Vector inverse_weights_;

  double faccon_;
};

} // namespace stiffrk

#endif
