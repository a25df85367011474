#include "lapack_linear_solver.h"

namespace stiffrk
{

static LinearSolverStatus FactorFlagToStatus(const int flag)
{
  if(flag == 0) {
    return LINEAR_SOLVER_SUCCESS;
  } else if(flag > 0) {
    return LINEAR_SOLVER_SINGULAR;
  }
  return LINEAR_SOLVER_FACTOR_FAILED;
}

LinearSolverStatus LapackLinearSolver::FactorRealMatrix(
    const CompressedColumnPattern &pattern,
    const bool pattern_changed,
    const std::vector<double> &values)
{
  const int num_vars = pattern.num_rows;
  dense_matrix_.assign(num_vars*num_vars, 0.0);
  for(int j=0; j < num_vars; ++j) {
    for(int k = pattern.column_sums[j]; k < pattern.column_sums[j+1]; ++k) {
      dense_matrix_[j*num_vars + pattern.row_indexes[k]] = values[k];
    }
  }
  return FactorFlagToStatus(lpm_.factor(num_vars, dense_matrix_));
}

LinearSolverStatus LapackLinearSolver::FactorComplexMatrix(
    const CompressedColumnPattern &pattern,
    const bool pattern_changed,
    const std::vector<std::complex<double> > &values)
{
  const int num_vars = pattern.num_rows;
  dense_matrix_z_.assign(num_vars*num_vars, std::complex<double>(0.0, 0.0));
  for(int j=0; j < num_vars; ++j) {
    for(int k = pattern.column_sums[j]; k < pattern.column_sums[j+1]; ++k) {
      dense_matrix_z_[j*num_vars + pattern.row_indexes[k]] = values[k];
    }
  }
  return FactorFlagToStatus(lpmz_.factor(num_vars, dense_matrix_z_));
}

LinearSolverStatus LapackLinearSolver::SolveRealSystem(const int n, double x[])
{
  if(lpm_.solve(n, x) != 0) {
    return LINEAR_SOLVER_SOLVE_FAILED;
  }
  return LINEAR_SOLVER_SUCCESS;
}

LinearSolverStatus LapackLinearSolver::SolveComplexSystem(
    const int n,
    std::complex<double> x[])
{
  if(lpmz_.solve(n, x) != 0) {
    return LINEAR_SOLVER_SOLVE_FAILED;
  }
  return LINEAR_SOLVER_SUCCESS;
}

} // namespace stiffrk
