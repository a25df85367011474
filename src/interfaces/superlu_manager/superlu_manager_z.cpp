#include "superlu_manager_z.h"

namespace stiffrk
{

SuperLUManagerZ::SuperLUManagerZ() :
  m_factored(false),
  m_usable(false),
  m_last_factor_n(-1),
  m_last_factor_nnz(-1)
{
  zCreate_CompCol_Matrix(&m_M, 1, 1, 1, NULL, NULL, NULL, SLU_NC,SLU_Z,SLU_GE);
  zCreate_Dense_Matrix(&m_B,1,1,NULL,1,SLU_DN,SLU_Z,SLU_GE);
  zCreate_Dense_Matrix(&m_X,1,1,NULL,1,SLU_DN,SLU_Z,SLU_GE);

  set_default_options(&m_options);
  m_options.ColPerm = MY_PERMC;
  m_options.RowPerm = LargeDiag_MC64;
  m_options.Equil   = YES;
  m_options.PrintStat = NO;
  StatInit(&m_stats);
}

SuperLUManagerZ::~SuperLUManagerZ()
{
  free_factors();
  Destroy_SuperMatrix_Store(&m_M);
  Destroy_SuperMatrix_Store(&m_B);
  Destroy_SuperMatrix_Store(&m_X);
  StatFree(&m_stats);
}

void SuperLUManagerZ::free_factors()
{
  if(m_factored) {
    Destroy_SuperNode_Matrix(&m_L);
    Destroy_CompCol_Matrix(&m_U);
  }
  m_factored = false;
  m_usable = false;
}

void SuperLUManagerZ::setup_memory(int n)
{
  doublecomplex zero;
  zero.r = zero.i = 0.0;

  m_M.nrow = m_M.ncol = n;
  m_B.nrow = m_X.nrow = n;
  ((DNformat *)m_B.Store)->lda = n;
  ((DNformat *)m_X.Store)->lda = n;

  m_rowPermutation.assign(n,0);
  m_colPermutation.assign(n,0);
  m_colElimTree.assign(n,0);
  m_R.assign(n,1.0);
  m_C.assign(n,1.0);
  m_rhs.assign(n,zero);
  m_soln.assign(n,zero);
}

int SuperLUManagerZ::run_driver(const fact_t fact, const int num_rhs)
{
  double pivot_growth, rcond;
  double ferr[1], berr[1];
  int info = 0;

  m_options.Fact = fact;
  m_B.ncol = m_X.ncol = num_rhs;
  zgssvx(&m_options, &m_M,
         &m_colPermutation[0], &m_rowPermutation[0], &m_colElimTree[0],
         m_equed, &m_R[0], &m_C[0], &m_L, &m_U, NULL, 0,
         &m_B, &m_X, &pivot_growth, &rcond, ferr, berr,
#if SUPERLU_MAJOR_VERSION > 4
         &m_Glu,
#endif
         &m_mem_usage, &m_stats, &info);

  if(info == m_last_factor_n+1) {
    info = 0;
  }
  return info;
}

int SuperLUManagerZ::finish_factor(int info)
{
  m_factored = (0 <= info && info <= m_last_factor_n);
  m_usable = (info == 0);
  return info;
}

void SuperLUManagerZ::copy_values(
    const std::vector<std::complex<double> >& values)
{
  m_values.resize(values.size());
  for(size_t j=0; j<values.size(); ++j) {
    m_values[j].r = values[j].real();
    m_values[j].i = values[j].imag();
  }
}

int SuperLUManagerZ::factor(const int n,
                            const std::vector<int>& row_indexes,
                            const std::vector<int>& column_sums,
                            const std::vector<std::complex<double> >& values)
{
  const int nnz = (int)row_indexes.size();
  if(n <= 0 || (int)column_sums.size() != n+1 || (int)values.size() != nnz) {
    return 1;
  }
  free_factors();
  if(n != m_last_factor_n) {
    setup_memory(n);
  }
  m_last_factor_n = n;
  m_last_factor_nnz = nnz;

  m_row_indexes = row_indexes;
  m_column_sums = column_sums;
  copy_values(values);
  NCformat *store = (NCformat *)m_M.Store;
  store->nnz    = nnz;
  store->nzval  = &m_values[0];
  store->rowind = &m_row_indexes[0];
  store->colptr = &m_column_sums[0];

  get_perm_c(MMD_AT_PLUS_A, &m_M, &m_colPermutation[0]);
  return finish_factor(run_driver(DOFACT, 0));
}

int SuperLUManagerZ::refactor(const std::vector<std::complex<double> >& values)
{
  if(m_last_factor_n <= 0 || (int)values.size() != m_last_factor_nnz) {
    return 1;
  }
  free_factors();
  copy_values(values);
  ((NCformat *)m_M.Store)->nzval = &m_values[0];

  int info = finish_factor(run_driver(SamePattern, 0));
  if(info == 0) {
    for(int j=0; j<m_last_factor_n; ++j) {
      if(m_rowPermutation[j] < 0) {
        m_usable = false;
        return 1;
      }
    }
  }
  return info;
}

int SuperLUManagerZ::solve(const int n, std::complex<double>* rhs_soln)
{
  if(!m_usable || n != m_last_factor_n) {
    return 1;
  }
  for(int j=0; j<n; ++j) {
    m_rhs[j].r = rhs_soln[j].real();
    m_rhs[j].i = rhs_soln[j].imag();
  }
  ((DNformat *)m_B.Store)->nzval = &m_rhs[0];
  ((DNformat *)m_X.Store)->nzval = &m_soln[0];

  const int info = run_driver(FACTORED, 1);
  if(info == 0) {
    for(int j=0; j<n; ++j) {
      rhs_soln[j] = std::complex<double>(m_soln[j].r, m_soln[j].i);
    }
  }
  return info;
}

} // namespace stiffrk
