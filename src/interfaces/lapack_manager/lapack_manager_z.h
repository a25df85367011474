#ifndef STIFFRK_LAPACK_MANAGER_Z_H_
#define STIFFRK_LAPACK_MANAGER_Z_H_

#include <complex>
#include <vector>

namespace stiffrk
{

// Complex counterpart of LapackManager using zgetrf/zgetrs.
class LapackManagerZ
{
 public:
  LapackManagerZ();
  virtual ~LapackManagerZ();

  int factor(const int n, const std::vector<std::complex<double> > &matrix);
  int factor(const int n, const std::complex<double> *matrix);
  int solve(const int n, std::complex<double> *rhs_soln);  // in place

 private:
  std::vector<int> ipiv_;
  std::vector<std::complex<double> > lu_;
  bool factored_;
  int last_factor_n_;
};

} // namespace stiffrk

#endif
