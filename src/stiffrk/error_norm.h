#ifndef STIFFRK_ERROR_NORM_H_
#define STIFFRK_ERROR_NORM_H_

#include <vector>

#include "sundials/sundials_nvector.h"

namespace stiffrk
{

// Weighted root mean square norm used by the Newton iteration and the error
// estimate. The user tolerances are transformed as in the classic RADAU5
// code:
//
//   rtol' = 0.1*rtol^(2/3),   atol' = rtol'*atol/rtol
//
// and the weights are w_i = atol'_i + rtol'_i*max(|y_i|, |y_new_i|). The
// class stores inverse weights so that N_VWrmsNorm can be used directly.
class ErrorNorm
{
 public:
  ErrorNorm();
  ~ErrorNorm();

  // Returns 0 on success, 1 if the sizes do not match or a tolerance is
  // not positive. A single element tolerance vector applies to every
  // component.
  int Initialize(const std::vector<double> &rtol,
                 const std::vector<double> &atol,
                 N_Vector template_vector);

  void ComputeInverseWeights(N_Vector y, N_Vector inverse_weights) const;
  void ComputeInverseWeights(N_Vector y,
                             N_Vector y_new,
                             N_Vector inverse_weights) const;

  double WrmsNorm(N_Vector v, N_Vector inverse_weights) const;

  // Smallest transformed relative tolerance, used for the Newton stopping
  // criterion.
  double min_transformed_rtol() const {return min_rtol1_;}

 private:
  ErrorNorm(const ErrorNorm &);
  ErrorNorm& operator=(const ErrorNorm &);

  N_Vector rtol1_;
  N_Vector atol1_;
  N_Vector work_;
  double min_rtol1_;
};

} // namespace stiffrk

#endif
