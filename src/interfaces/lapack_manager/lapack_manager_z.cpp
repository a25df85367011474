#include "lapack_manager_z.h"

extern "C" void zgetrf_(const int *, const int *, std::complex<double> *,
                        const int *, int *, int *);

extern "C" void zgetrs_(const char *, const int *, const int *,
                        std::complex<double> *, const int *, int *,
                        std::complex<double> *, const int *, int *);

namespace stiffrk
{

LapackManagerZ::LapackManagerZ()
    : factored_(false), last_factor_n_(-1) {}

LapackManagerZ::~LapackManagerZ() {}

int LapackManagerZ::factor(const int n,
                           const std::vector<std::complex<double> > &matrix) {
  if ((int)matrix.size() != n * n) {
    return -1;
  }
  return this->factor(n, &(matrix[0]));
}

int LapackManagerZ::factor(const int n, const std::complex<double> *matrix) {
  factored_ = false;
  if (n <= 0) {
    return -1;
  }
  lu_.assign(matrix, matrix + n * n);
  ipiv_.resize(n);
  int lda = n;
  int flag = 0;
  zgetrf_(&n, &n, &(lu_[0]), &lda, &(ipiv_[0]), &flag);
  if (flag == 0) {
    factored_ = true;
    last_factor_n_ = n;
  }
  return flag;
}

int LapackManagerZ::solve(const int n, std::complex<double> *rhs_soln) {
  if (!factored_ || n != last_factor_n_) {
    return -1;
  }
  int lda = n;
  int ldb = n;
  int nrhs = 1;
  const char trans = 'N';
  int flag = 0;
  zgetrs_(&trans, &n, &nrhs, &(lu_[0]), &lda, &(ipiv_[0]), rhs_soln, &ldb,
          &flag);
  return flag;
}

} // namespace stiffrk
