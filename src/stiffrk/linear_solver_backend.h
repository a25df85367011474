#ifndef STIFFRK_LINEAR_SOLVER_BACKEND_H_
#define STIFFRK_LINEAR_SOLVER_BACKEND_H_

#include <complex>
#include <vector>

#include "integrator_status.h"
#include "sparse_matrix.h"

namespace stiffrk
{

// Token returned by a factorization. A handle only solves with the
// factorization that produced it; a new factorization of the same kind
// invalidates all earlier handles of that kind.
struct FactorizationHandle
{
  FactorizationHandle() : id(-1) {}
  bool valid() const {return id >= 0;}
  int id;
};

// Factorize/solve capability for the real and complex iteration matrices.
// Matrices are passed in compressed column form; pattern_changed signals
// that the sparsity pattern differs from the previous call of the same kind
// so that symbolic information cannot be reused.
//
// All calls are synchronous. Concrete backends implement the protected
// virtual functions; the public functions manage the handles.
class LinearSolverBackend
{
 public:
  LinearSolverBackend();
  virtual ~LinearSolverBackend() {};

  LinearSolverStatus FactorReal(const CompressedColumnPattern &pattern,
                                const bool pattern_changed,
                                const std::vector<double> &values,
                                FactorizationHandle *handle);

  LinearSolverStatus FactorComplex(
      const CompressedColumnPattern &pattern,
      const bool pattern_changed,
      const std::vector<std::complex<double> > &values,
      FactorizationHandle *handle);

  // x holds the right hand side on entry and the solution on return.
  LinearSolverStatus SolveReal(const FactorizationHandle &handle,
                               const int n,
                               double x[]);
  LinearSolverStatus SolveComplex(const FactorizationHandle &handle,
                                  const int n,
                                  std::complex<double> x[]);

  virtual const char * GetName() const = 0;

 protected:
  virtual LinearSolverStatus FactorRealMatrix(
      const CompressedColumnPattern &pattern,
      const bool pattern_changed,
      const std::vector<double> &values) = 0;
  virtual LinearSolverStatus FactorComplexMatrix(
      const CompressedColumnPattern &pattern,
      const bool pattern_changed,
      const std::vector<std::complex<double> > &values) = 0;
  virtual LinearSolverStatus SolveRealSystem(const int n, double x[]) = 0;
  virtual LinearSolverStatus SolveComplexSystem(const int n,
                                                std::complex<double> x[]) = 0;

 private:
  int next_id_;
  int real_id_;
  int complex_id_;
};

} // namespace stiffrk

#endif
