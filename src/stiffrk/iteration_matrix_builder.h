#ifndef STIFFRK_ITERATION_MATRIX_BUILDER_H_
#define STIFFRK_ITERATION_MATRIX_BUILDER_H_

#include <complex>
#include <vector>

#include "integrator_status.h"
#include "linear_solver_backend.h"
#include "radau_coefficients.h"
#include "sparse_matrix.h"
#include "statistics.h"

namespace stiffrk
{

// Assembles and factors the two iteration matrices of the transformed Radau
// IIA system
//
//   E1 = u1*M - h*J               (real)
//   E2 = (alpha + i*beta)*M - h*J (complex, one of the conjugate pair)
//
// on the union sparsity pattern of J, M and the diagonal. The
// factorizations are cached and reused as long as the Jacobian id is the
// same and h is within a relative tolerance of the factored step size.
class IterationMatrixBuilder
{
 public:
  IterationMatrixBuilder(const RadauCoefficients &coefficients,
                         const int num_states);
  ~IterationMatrixBuilder() {};

  void SetBackend(LinearSolverBackend *backend);

  // NULL means the identity. The matrix must outlive the builder's use.
  void SetMassMatrix(const SparseMatrix *mass);

  // Factors E1 and E2 unless the cached factorizations match (jacobian_id,
  // h). refactored is set to true when new factorizations were computed.
  IntegratorStatus BuildAndFactorize(const SparseMatrix &jacobian,
                                     const int jacobian_id,
                                     const double h,
                                     const double h_relative_tolerance,
                                     Statistics *stats,
                                     bool *refactored);

  bool IsCurrent(const int jacobian_id,
                 const double h,
                 const double h_relative_tolerance) const;

  void Invalidate();

  // In place solves with the cached factorizations.
  IntegratorStatus SolveReal(double x[], Statistics *stats);
  IntegratorStatus SolveComplex(double x_real[],
                                double x_imag[],
                                Statistics *stats);

  // out = M*v
  void ApplyMassMatrix(const double v[], double out[]) const;

  double factored_h() const {return factored_h_;}
  const CompressedColumnPattern& pattern() const {return pattern_;}
  const std::vector<double>& real_values() const {return real_values_;}
  const std::vector<std::complex<double> >& complex_values() const
  {return complex_values_;}

 private:
  IterationMatrixBuilder(const IterationMatrixBuilder &);
  IterationMatrixBuilder& operator=(const IterationMatrixBuilder &);

  bool UpdatePattern(const SparseMatrix &jacobian);

  const RadauCoefficients &coefficients_;
  int num_states_;
  LinearSolverBackend *backend_;
  const SparseMatrix *mass_;

  CompressedColumnPattern pattern_;
  std::vector<std::vector<int> > maps_;  // jacobian, mass
  std::vector<int> diagonal_;
  std::vector<int> last_rows_;
  std::vector<int> last_cols_;
  bool pattern_valid_;

  std::vector<double> mass_values_;
  std::vector<double> real_values_;
  std::vector<std::complex<double> > complex_values_;
  std::vector<std::complex<double> > complex_work_;

  FactorizationHandle real_handle_;
  FactorizationHandle complex_handle_;
  int factored_jacobian_id_;
  double factored_h_;
};

} // namespace stiffrk

#endif
