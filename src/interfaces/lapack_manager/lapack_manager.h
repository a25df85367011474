#ifndef STIFFRK_LAPACK_MANAGER_H_
#define STIFFRK_LAPACK_MANAGER_H_

#include <vector>

namespace stiffrk
{

// Dense LU factorization of a square column major matrix with LAPACK
// dgetrf/dgetrs. Return flags are the LAPACK info values: 0 on success,
// i > 0 if U(i,i) is exactly zero, < 0 for an illegal argument.
class LapackManager
{
 public:
  LapackManager();
  virtual ~LapackManager();

  int factor(const int n, const std::vector<double>& matrix);
  int factor(const int n, const double* matrix);
  int solve(const int n, double* rhs_soln);  // in place

 private:
  std::vector<int> ipiv_;
  std::vector<double> lu_;
  bool factored_;
  int last_factor_n_;
};

} // namespace stiffrk

#endif
