#ifndef STIFFRK_ERROR_ESTIMATOR_H_
#define STIFFRK_ERROR_ESTIMATOR_H_

#include "sundials/sundials_nvector.h"

#include "error_norm.h"
#include "integrator_status.h"
#include "iteration_matrix_builder.h"
#include "ode_problem.h"
#include "radau_coefficients.h"
#include "statistics.h"

namespace stiffrk
{

struct ErrorEstimate
{
  double norm;             // scaled error, never below 1e-10
  bool accept_suggested;   // norm <= 1
  IntegratorStatus status; // non-SUCCESS for unrecoverable failures only
};

// Embedded error estimate of the Radau IIA step
//
//   err = E1^{-1} (M*(dd0*Z1 + dd1*Z2 + dd2*Z3) + h*f(x, y))
//
// E1 is the real iteration matrix of the step, so the estimate costs one
// extra real solve. When the first estimate is larger than one on the first
// step or right after a rejection the estimate is stabilized once:
//
//   err = E1^{-1} (M*(dd0*Z1 + dd1*Z2 + dd2*Z3) + h*f(x, y + err))
//
// A non-finite norm is returned unchanged so the caller can treat it like a
// Newton divergence.
class ErrorEstimator
{
 public:
  ErrorEstimator(const RadauCoefficients &coefficients,
                 OdeProblem *problem,
                 IterationMatrixBuilder *builder,
                 const ErrorNorm *error_norm,
                 N_Vector template_vector);
  ~ErrorEstimator();

  ErrorEstimate Estimate(const double x,
                         N_Vector y,
                         N_Vector fy,
                         const double h,
                         N_Vector z[3],
                         const bool allow_correction,
                         Statistics *stats);

  // Error vector of the last estimate.
  N_Vector error() const {return err_;}

 private:
  ErrorEstimator(const ErrorEstimator &);
  ErrorEstimator& operator=(const ErrorEstimator &);

  double ScaledNorm(N_Vector y);

  const RadauCoefficients &coefficients_;
  OdeProblem *problem_;
  IterationMatrixBuilder *builder_;
  const ErrorNorm *error_norm_;

  N_Vector err_;
  N_Vector mass_dz_;
  N_Vector work_;
  N_Vector y_new_;
  N_Vector inverse_weights_;
};

} // namespace stiffrk

#endif
