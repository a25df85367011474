#ifndef STIFFRK_SUPERLU_MANAGER_Z_H_
#define STIFFRK_SUPERLU_MANAGER_Z_H_

#include <complex>
#include <vector>
#include "slu_zdefs.h"

namespace stiffrk
{

// Complex counterpart of SuperLUManager using zgssvx. Values are copied into
// SuperLU doublecomplex storage.
class SuperLUManagerZ
{
 public:
  SuperLUManagerZ();
  virtual ~SuperLUManagerZ();

  int factor(const int n,
             const std::vector<int>& row_indexes,
             const std::vector<int>& column_sums,
             const std::vector<std::complex<double> >& values);
  // Reuses the column ordering and elimination tree of the last factor()
  // call. The pattern must be unchanged.
  int refactor(const std::vector<std::complex<double> >& values);
  int solve(const int n, std::complex<double>* rhs_soln);  // in place

 private:
  void setup_memory(int n);
  // One call of the expert driver with the given Fact mode. Factors when
  // num_rhs is 0, otherwise solves m_B into m_X.
  int run_driver(const fact_t fact, const int num_rhs);
  int finish_factor(int info);
  void free_factors();
  void copy_values(const std::vector<std::complex<double> >& values);

  SuperMatrix m_M;
  SuperMatrix m_L;
  SuperMatrix m_U;
  SuperMatrix m_B;
  SuperMatrix m_X;
  superlu_options_t m_options;
  SuperLUStat_t m_stats;
  mem_usage_t m_mem_usage;
  char m_equed[1];
  std::vector<double> m_R;
  std::vector<double> m_C;
  std::vector<int> m_rowPermutation;
  std::vector<int> m_colPermutation;
  std::vector<int> m_colElimTree; // etree

  std::vector<int> m_row_indexes;
  std::vector<int> m_column_sums;
  std::vector<doublecomplex> m_values;
  std::vector<doublecomplex> m_rhs;
  std::vector<doublecomplex> m_soln;

  bool m_factored;  // L and U are allocated
  bool m_usable;    // L and U hold a nonsingular factorization
  int m_last_factor_n;
  int m_last_factor_nnz;
#if SUPERLU_MAJOR_VERSION > 4
  GlobalLU_t m_Glu;
#endif
};

} // namespace stiffrk

#endif
