#ifndef STIFFRK_SUPERLU_LINEAR_SOLVER_H_
#define STIFFRK_SUPERLU_LINEAR_SOLVER_H_

#include <complex>
#include <vector>

#include "stiffrk/linear_solver_backend.h"

#include "superlu_manager.h"
#include "superlu_manager_z.h"

namespace stiffrk
{

// Sparse direct backend. A refactorization that reuses the previous column
// ordering is tried first when the pattern is unchanged; a full
// factorization is the fall back.
class SuperLULinearSolver : public LinearSolverBackend
{
 public:
  SuperLULinearSolver() {};
  ~SuperLULinearSolver() {};

  const char * GetName() const {return "sparse";}

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
  SuperLUManager slum_;
  SuperLUManagerZ slumz_;
};

} // namespace stiffrk

#endif
