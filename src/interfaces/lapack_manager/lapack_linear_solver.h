#ifndef STIFFRK_LAPACK_LINEAR_SOLVER_H_
#define STIFFRK_LAPACK_LINEAR_SOLVER_H_

#include <complex>
#include <vector>

#include "stiffrk/linear_solver_backend.h"

#include "lapack_manager.h"
#include "lapack_manager_z.h"

namespace stiffrk
{

// Dense LU backend. The compressed column iteration matrices are expanded
// to column major dense storage and factored with LAPACK.
class LapackLinearSolver : public LinearSolverBackend
{
 public:
  LapackLinearSolver() {};
  ~LapackLinearSolver() {};

  const char * GetName() const {return "dense";}

 protected:
  LinearSolverStatus FactorRealMatrix(const CompressedColumnPattern &pattern,
                                      const bool pattern_changed,
                                      const std::vector<double> &values);
  LinearSolverStatus FactorComplexMatrix(
      const CompressedColumnPattern &pattern,
      const bool pattern_changed,
      const std::vector<std::complex<double> > &values);
  LinearSolverStatus SolveRealSystem(const int n, double x[]);
  LinearSolverStatus SolveComplexSystem(const int n, std::complex<double> x[]);

 private:
  LapackManager lpm_;
  LapackManagerZ lpmz_;
  std::vector<double> dense_matrix_;
  std::vector<std::complex<double> > dense_matrix_z_;
};

} // namespace stiffrk

#endif
