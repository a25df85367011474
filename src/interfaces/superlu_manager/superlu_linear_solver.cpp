#include "superlu_linear_solver.h"

namespace stiffrk
{

static LinearSolverStatus FactorFlagToStatus(const int n, const int flag)
{
  if(flag == 0) {
    return LINEAR_SOLVER_SUCCESS;
  } else if(flag > 0 && flag <= n) {
    return LINEAR_SOLVER_SINGULAR;
  }
  return LINEAR_SOLVER_FACTOR_FAILED;
}

LinearSolverStatus SuperLULinearSolver::FactorRealMatrix(
    const CompressedColumnPattern &pattern,
    const bool pattern_changed,
    const std::vector<double> &values)
{
  //try refactor and fall back to full factor on fail
  int flag = 1;
  if(!pattern_changed) {
    flag = slum_.refactor(values);
  }
  if(flag != 0) {
    flag = slum_.factor(pattern.num_rows,
                        pattern.row_indexes,
                        pattern.column_sums,
                        values);
  }
  return FactorFlagToStatus(pattern.num_rows, flag);
}

LinearSolverStatus SuperLULinearSolver::FactorComplexMatrix(
    const CompressedColumnPattern &pattern,
    const bool pattern_changed,
    const std::vector<std::complex<double> > &values)
{
  int flag = 1;
  if(!pattern_changed) {
    flag = slumz_.refactor(values);
  }
  if(flag != 0) {
    flag = slumz_.factor(pattern.num_rows,
                         pattern.row_indexes,
                         pattern.column_sums,
                         values);
  }
  return FactorFlagToStatus(pattern.num_rows, flag);
}

LinearSolverStatus SuperLULinearSolver::SolveRealSystem(const int n,
                                                        double x[])
{
  if(slum_.solve(n, x) != 0) {
    return LINEAR_SOLVER_SOLVE_FAILED;
  }
  return LINEAR_SOLVER_SUCCESS;
}

LinearSolverStatus SuperLULinearSolver::SolveComplexSystem(
    const int n,
    std::complex<double> x[])
{
  if(slumz_.solve(n, x) != 0) {
    return LINEAR_SOLVER_SOLVE_FAILED;
  }
  return LINEAR_SOLVER_SUCCESS;
}

} // namespace stiffrk
