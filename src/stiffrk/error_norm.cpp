#include <math.h>

#include "nvector_utilities.h"
#include "error_norm.h"

namespace stiffrk
{

ErrorNorm::ErrorNorm()
  : rtol1_(NULL),
    atol1_(NULL),
    work_(NULL),
    min_rtol1_(0.0)
{
}

ErrorNorm::~ErrorNorm()
{
  if(rtol1_ != NULL) {N_VDestroy(rtol1_);}
  if(atol1_ != NULL) {N_VDestroy(atol1_);}
  if(work_ != NULL)  {N_VDestroy(work_);}
}

int ErrorNorm::Initialize(const std::vector<double> &rtol,
                          const std::vector<double> &atol,
                          N_Vector template_vector)
{
  const int n = NV_LENGTH_S(template_vector);
  if(rtol.size() == 0 || atol.size() == 0) {
    return 1;
  }
  if((rtol.size() != 1 && (int)rtol.size() != n) ||
     (atol.size() != 1 && (int)atol.size() != n)) {
    return 1;
  }

  if(rtol1_ == NULL || NV_LENGTH_S(rtol1_) != n) {
    if(rtol1_ != NULL) {N_VDestroy(rtol1_);}
    if(atol1_ != NULL) {N_VDestroy(atol1_);}
    if(work_ != NULL)  {N_VDestroy(work_);}
    rtol1_ = NewZeroVector(template_vector);
    atol1_ = NewZeroVector(template_vector);
    work_  = NewZeroVector(template_vector);
  }

  const double expm = 2.0/3.0;
  double *rtol1 = NV_DATA_S(rtol1_);
  double *atol1 = NV_DATA_S(atol1_);
  min_rtol1_ = 1.0e300;
  for(int j=0; j<n; ++j) {
    const double r = (rtol.size() == 1) ? rtol[0] : rtol[j];
    const double a = (atol.size() == 1) ? atol[0] : atol[j];
    if(!(r > 0.0) || !(a > 0.0)) {
      return 1;
    }
    const double quot = a/r;
    rtol1[j] = 0.1*pow(r, expm);
    atol1[j] = rtol1[j]*quot;
    if(rtol1[j] < min_rtol1_) {
      min_rtol1_ = rtol1[j];
    }
  }
  return 0;
}

void ErrorNorm::ComputeInverseWeights(N_Vector y,
                                      N_Vector inverse_weights) const
{
  N_VAbs(y, inverse_weights);
  N_VProd(rtol1_, inverse_weights, inverse_weights);
  N_VLinearSum(1.0, inverse_weights, 1.0, atol1_, inverse_weights);
  N_VInv(inverse_weights, inverse_weights);  // N.B. we work with inverse weights
}

void ErrorNorm::ComputeInverseWeights(N_Vector y,
                                      N_Vector y_new,
                                      N_Vector inverse_weights) const
{
  const int n = NV_LENGTH_S(y);
  const double *y_data = NV_DATA_S(y);
  const double *y_new_data = NV_DATA_S(y_new);
  double *w_data = NV_DATA_S(work_);
  for(int j=0; j<n; ++j) {
    w_data[j] = fabs(y_data[j]) > fabs(y_new_data[j]) ?
      fabs(y_data[j]) : fabs(y_new_data[j]);
  }
  N_VProd(rtol1_, work_, inverse_weights);
  N_VLinearSum(1.0, inverse_weights, 1.0, atol1_, inverse_weights);
  N_VInv(inverse_weights, inverse_weights);
}

double ErrorNorm::WrmsNorm(N_Vector v, N_Vector inverse_weights) const
{
  return N_VWrmsNorm(v, inverse_weights);
}

} // namespace stiffrk
