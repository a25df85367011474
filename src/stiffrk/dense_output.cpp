#include <math.h>

#include <cmath>

#include "nvector_utilities.h"
#include "dense_output.h"

namespace stiffrk
{

DenseOutput::DenseOutput(const RadauCoefficients &coefficients,
                         N_Vector template_vector)
  : coefficients_(coefficients),
    x_new_(0.0),
    h_(0.0),
    valid_(false)
{
  for(int k=0; k<4; ++k) {
    cont_[k] = NewZeroVector(template_vector);
  }
  work_ = NewZeroVector(template_vector);
}

DenseOutput::~DenseOutput()
{
  for(int k=0; k<4; ++k) {
    N_VDestroy(cont_[k]);
  }
  N_VDestroy(work_);
}

void DenseOutput::Update(const double x_prev,
                         const double h,
                         N_Vector y_new,
                         N_Vector z[3])
{
  const double c1 = coefficients_.c1;
  const double c2 = coefficients_.c2;
  const double c1m1 = coefficients_.c1m1;
  const double c2m1 = coefficients_.c2m1;
  const double c1mc2 = coefficients_.c1mc2;

  N_VScale(1.0, y_new, cont_[0]);
  N_VLinearSum(1.0, z[1], -1.0, z[2], cont_[1]);
  N_VScale(1.0 / c2m1, cont_[1], cont_[1]);
  N_VLinearSum(1.0 / c1mc2, z[0], -1.0 / c1mc2, z[1], cont_[2]);  // ak
  N_VScale(1.0 / c1, z[0], work_);
  N_VLinearSum(1.0 / c2, cont_[2], -1.0 / c2, work_, work_);      // acont3
  N_VLinearSum(1.0 / c1m1, cont_[2], -1.0 / c1m1, cont_[1], cont_[2]);
  N_VLinearSum(1.0, cont_[2], -1.0, work_, cont_[3]);

  x_new_ = x_prev + h;
  h_ = h;
  valid_ = true;
}

void DenseOutput::EvaluateScaled(const double s, N_Vector y_out) const
{
  const double c1m1 = coefficients_.c1m1;
  const double c2m1 = coefficients_.c2m1;
  N_VLinearSum(1.0, cont_[2], s - c1m1, cont_[3], y_out);
  N_VLinearSum(1.0, cont_[1], s - c2m1, y_out, y_out);
  N_VLinearSum(1.0, cont_[0], s, y_out, y_out);
}

IntegratorStatus DenseOutput::Evaluate(const double x, N_Vector y_out) const
{
  if(!valid_ || h_ == 0.0) {
    return STALE_INTERPOLANT;
  }
  const double s = (x - x_new_)/h_;
  const double fuzz = 1.0e-10;
  if(s < -1.0 - fuzz || s > fuzz || std::isnan(s)) {
    return STALE_INTERPOLANT;
  }
  EvaluateScaled(s, y_out);
  return SUCCESS;
}

bool DenseOutput::PredictStages(const double h_new, N_Vector z[3]) const
{
  if(!valid_ || h_ == 0.0) {
    return false;
  }
  const double c1m1 = coefficients_.c1m1;
  const double c2m1 = coefficients_.c2m1;
  const double hquot = h_new/h_;
  const double ckq[3] = {coefficients_.c1*hquot,
                         coefficients_.c2*hquot,
                         hquot};
  // z_k = u(ckq) - u(0), u(0) = cont0
  for(int k=0; k<3; ++k) {
    N_VLinearSum(1.0, cont_[2], (ckq[k] - c1m1), cont_[3], z[k]);
    N_VLinearSum(1.0, cont_[1], (ckq[k] - c2m1), z[k], z[k]);
    N_VScale(ckq[k], z[k], z[k]);
  }
  return true;
}

} // namespace stiffrk
