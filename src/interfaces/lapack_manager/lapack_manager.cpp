#include "lapack_manager.h"

extern "C"
void dgetrf_(const int*, const int*, double*, const int*, int*, int *);

extern "C"
void dgetrs_(const char* ,const int* ,const int*, double*, const int*, int*, double*, const int*, int*);

namespace stiffrk
{

LapackManager::LapackManager() :
  factored_(false),
  last_factor_n_(-1)
{
}

LapackManager::~LapackManager()
{
}

int LapackManager::factor(const int n, const std::vector<double>& matrix)
{
  if((int)matrix.size() != n*n) {
    return -1;
  }
  return this->factor(n, &(matrix[0]));
}

int LapackManager::factor(const int n, const double* matrix)
{
  factored_ = false;
  if(n <= 0) {
    return -1;
  }
  lu_.assign(matrix, matrix+n*n);
  ipiv_.resize(n);
  int lda = n;
  int flag = 0;
  dgetrf_(&n, &n, &(lu_[0]), &lda, &(ipiv_[0]), &flag);
  if(flag == 0) {
    factored_ = true;
    last_factor_n_ = n;
  }
  return flag;
}

int LapackManager::solve(const int n, double* rhs_soln)
{
  if(!factored_ || n != last_factor_n_) {
    return -1;
  }
  int lda = n;
  int ldb = n;
  int nrhs = 1;
  const char trans = 'N';
  int flag = 0;
  dgetrs_(&trans, &n, &nrhs, &(lu_[0]), &lda, &(ipiv_[0]), rhs_soln, &ldb, &flag);
  return flag;
}

} // namespace stiffrk
