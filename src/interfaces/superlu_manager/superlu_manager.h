#ifndef STIFFRK_SUPERLU_MANAGER_H_
#define STIFFRK_SUPERLU_MANAGER_H_

#include <vector>
#include "slu_ddefs.h"

namespace stiffrk
{

// Sparse LU factorization of a square compressed column matrix with the
// SuperLU expert driver dgssvx. The manager keeps its own copy of the matrix
// because equilibration scales the values in place.
//
// Return flags are the dgssvx info values: 0 on success (a reciprocal
// condition estimate below machine precision is not treated as a failure),
// 1..n if U is exactly singular and larger values for memory failures. A
// value of 1 is also returned for size mismatches and failed
// refactorizations.
class SuperLUManager
{
 public:
  SuperLUManager();
  virtual ~SuperLUManager();

  int factor(const int n,
             const std::vector<int>& row_indexes,
             const std::vector<int>& column_sums,
             const std::vector<double>& values);
  // Reuses the column ordering and elimination tree of the last factor()
  // call. The pattern must be unchanged.
  int refactor(const std::vector<double>& values);
  int solve(const int n, double* rhs_soln);  // in place

 private:
  void setup_memory(int n);
  // One call of the expert driver with the given Fact mode. Factors when
  // num_rhs is 0, otherwise solves m_B into m_X.
  int run_driver(const fact_t fact, const int num_rhs);
  int finish_factor(int info);
  void free_factors();

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
  std::vector<double> m_values;
  std::vector<double> m_rhs;

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
