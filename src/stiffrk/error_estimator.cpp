#include <math.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "nvector_utilities.h"
#include "error_estimator.h"

namespace stiffrk
{

ErrorEstimator::ErrorEstimator(const RadauCoefficients &coefficients,
                               OdeProblem *problem,
                               IterationMatrixBuilder *builder,
                               const ErrorNorm *error_norm,
                               N_Vector template_vector)
  : coefficients_(coefficients),
    problem_(problem),
    builder_(builder),
    error_norm_(error_norm)
{
  err_ = NewZeroVector(template_vector);
  mass_dz_ = NewZeroVector(template_vector);
  work_ = NewZeroVector(template_vector);
  y_new_ = NewZeroVector(template_vector);
  inverse_weights_ = NewZeroVector(template_vector);
}

ErrorEstimator::~ErrorEstimator()
{
  N_VDestroy(err_);
  N_VDestroy(mass_dz_);
  N_VDestroy(work_);
  N_VDestroy(y_new_);
  N_VDestroy(inverse_weights_);
}

double ErrorEstimator::ScaledNorm(N_Vector y)
{
  error_norm_->ComputeInverseWeights(y, y_new_, inverse_weights_);
  const double norm = error_norm_->WrmsNorm(err_, inverse_weights_);
  if(!std::isfinite(norm)) {
    return norm;
  }
  return std::max(norm, 1.0e-10);
}

ErrorEstimate ErrorEstimator::Estimate(const double x,
                                       N_Vector y,
                                       N_Vector fy,
                                       const double h,
                                       N_Vector z[3],
                                       const bool allow_correction,
                                       Statistics *stats)
{
  ErrorEstimate estimate;
  estimate.norm = std::numeric_limits<double>::quiet_NaN();
  estimate.accept_suggested = false;
  estimate.status = SUCCESS;

  const double *dd = coefficients_.dd;
  N_VLinearSum(1.0, y, 1.0, z[2], y_new_);

  N_VLinearSum(dd[0], z[0], dd[1], z[1], work_);
  N_VLinearSum(1.0, work_, dd[2], z[2], work_);
  builder_->ApplyMassMatrix(NV_DATA_S(work_), NV_DATA_S(mass_dz_));

  N_VLinearSum(1.0, mass_dz_, h, fy, err_);
  IntegratorStatus flag = builder_->SolveReal(NV_DATA_S(err_), stats);
  ++stats->num_linear_solves;
  if(flag != SUCCESS) {
    estimate.status = flag;
    return estimate;
  }
  estimate.norm = ScaledNorm(y);
  if(!std::isfinite(estimate.norm) || estimate.norm <= 1.0 ||
     !allow_correction) {
    estimate.accept_suggested = (estimate.norm <= 1.0);
    return estimate;
  }

  // --- stabilized estimate
  N_VLinearSum(1.0, y, 1.0, err_, work_);
  const int rhs_flag = problem_->GetDerivative(x, work_, err_);
  ++stats->num_function_evaluations;
  if(rhs_flag < 0) {
    estimate.status = RHS_EVALUATION_ERROR;
    return estimate;
  }
  if(rhs_flag > 0 || !NVectorIsFinite(err_)) {
    estimate.norm = std::numeric_limits<double>::quiet_NaN();
    return estimate;
  }
  N_VLinearSum(1.0, mass_dz_, h, err_, err_);
  flag = builder_->SolveReal(NV_DATA_S(err_), stats);
  ++stats->num_linear_solves;
  if(flag != SUCCESS) {
    estimate.status = flag;
    return estimate;
  }
  estimate.norm = ScaledNorm(y);
  estimate.accept_suggested = (estimate.norm <= 1.0);
  return estimate;
}

} // namespace stiffrk
