#ifndef STIFFRK_RADAU_COEFFICIENTS_H_
#define STIFFRK_RADAU_COEFFICIENTS_H_

namespace stiffrk
{

// Constants of the three stage Radau IIA method (order 5). The collocation
// system is transformed with T and TI = T^{-1} into one real eigenvalue
// system (gamma = u1) and one complex conjugate pair (alpha +/- i beta).
struct RadauCoefficients
{
  RadauCoefficients();

  double c1;     // nodes, c3 = 1
  double c2;
  double c1m1;   // c1 - 1
  double c2m1;   // c2 - 1
  double c1mc2;  // c1 - c2
  double dd[3];  // embedded error estimate weights
  double u1;     // real eigenvalue of A^{-1}
  double alpha;  // complex eigenvalue alpha + i beta of A^{-1}
  double beta;
  double t[3][3];
  double ti[3][3];
};

} // namespace stiffrk

#endif
