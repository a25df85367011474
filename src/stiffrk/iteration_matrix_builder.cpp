#include <math.h>

#include "iteration_matrix_builder.h"

namespace stiffrk
{

IterationMatrixBuilder::IterationMatrixBuilder(
    const RadauCoefficients &coefficients,
    const int num_states)
  : coefficients_(coefficients),
    num_states_(num_states),
    backend_(NULL),
    mass_(NULL),
    pattern_valid_(false),
    factored_jacobian_id_(-1),
    factored_h_(0.0)
{
  complex_work_.assign(num_states, std::complex<double>(0.0, 0.0));
}

void IterationMatrixBuilder::SetBackend(LinearSolverBackend *backend)
{
  backend_ = backend;
  pattern_valid_ = false;
  Invalidate();
}

void IterationMatrixBuilder::SetMassMatrix(const SparseMatrix *mass)
{
  mass_ = mass;
  pattern_valid_ = false;
  Invalidate();
}

void IterationMatrixBuilder::Invalidate()
{
  real_handle_ = FactorizationHandle();
  complex_handle_ = FactorizationHandle();
  factored_jacobian_id_ = -1;
  factored_h_ = 0.0;
}

bool IterationMatrixBuilder::IsCurrent(const int jacobian_id,
                                       const double h,
                                       const double h_relative_tolerance) const
{
  if(!real_handle_.valid() || !complex_handle_.valid()) {
    return false;
  }
  if(jacobian_id != factored_jacobian_id_) {
    return false;
  }
  return (fabs(h - factored_h_) <= h_relative_tolerance*fabs(factored_h_));
}

// Returns true if the pattern had to be rebuilt.
bool IterationMatrixBuilder::UpdatePattern(const SparseMatrix &jacobian)
{
  if(pattern_valid_ &&
     jacobian.rows() == last_rows_ &&
     jacobian.cols() == last_cols_) {
    return false;
  }
  std::vector<const SparseMatrix *> matrices;
  matrices.push_back(&jacobian);
  matrices.push_back(mass_);
  BuildUnionPattern(num_states_, matrices, &pattern_, &maps_);

  const int nnz = pattern_.num_nonzeros();
  diagonal_.resize(num_states_);
  for(int j=0; j<num_states_; ++j) {
    diagonal_[j] = pattern_.Find(j,j);
  }
  mass_values_.assign(nnz, 0.0);
  if(mass_ == NULL) {
    for(int j=0; j<num_states_; ++j) {
      mass_values_[diagonal_[j]] = 1.0;
    }
  } else {
    const std::vector<double> &values = mass_->values();
    for(size_t k=0; k<values.size(); ++k) {
      mass_values_[maps_[1][k]] += values[k];
    }
  }
  last_rows_ = jacobian.rows();
  last_cols_ = jacobian.cols();
  pattern_valid_ = true;
  return true;
}

IntegratorStatus IterationMatrixBuilder::BuildAndFactorize(
    const SparseMatrix &jacobian,
    const int jacobian_id,
    const double h,
    const double h_relative_tolerance,
    Statistics *stats,
    bool *refactored)
{
  *refactored = false;
  if(backend_ == NULL) {
    return NOT_CONFIGURED;
  }
  if(IsCurrent(jacobian_id, h, h_relative_tolerance)) {
    return SUCCESS;
  }
  Invalidate();

  const bool pattern_changed = UpdatePattern(jacobian);
  const int nnz = pattern_.num_nonzeros();
  const double u1 = coefficients_.u1;
  const double alpha = coefficients_.alpha;
  const double beta = coefficients_.beta;

  // E1 = u1*M - h*J, E2 = (alpha + i beta)*M - h*J
  real_values_.assign(nnz, 0.0);
  const std::vector<double> &jacobian_values = jacobian.values();
  for(size_t k=0; k<jacobian_values.size(); ++k) {
    real_values_[maps_[0][k]] -= h*jacobian_values[k];
  }
  complex_values_.resize(nnz);
  for(int k=0; k<nnz; ++k) {
    complex_values_[k] =
      std::complex<double>(alpha*mass_values_[k] + real_values_[k],
                           beta*mass_values_[k]);
    real_values_[k] += u1*mass_values_[k];
  }

  stats->factorization_timer.Start();
  LinearSolverStatus flag = backend_->FactorReal(pattern_,
                                                 pattern_changed,
                                                 real_values_,
                                                 &real_handle_);
  if(flag == LINEAR_SOLVER_SUCCESS) {
    flag = backend_->FactorComplex(pattern_,
                                   pattern_changed,
                                   complex_values_,
                                   &complex_handle_);
  }
  stats->factorization_timer.Stop();
  ++stats->num_factorizations;

  if(flag != LINEAR_SOLVER_SUCCESS) {
    Invalidate();
    return ToIntegratorStatus(flag);
  }
  factored_jacobian_id_ = jacobian_id;
  factored_h_ = h;
  *refactored = true;
  return SUCCESS;
}

IntegratorStatus IterationMatrixBuilder::SolveReal(double x[],
                                                   Statistics *stats)
{
  if(backend_ == NULL) {
    return NOT_CONFIGURED;
  }
  stats->linear_solve_timer.Start();
  LinearSolverStatus flag = backend_->SolveReal(real_handle_, num_states_, x);
  stats->linear_solve_timer.Stop();
  return ToIntegratorStatus(flag);
}

IntegratorStatus IterationMatrixBuilder::SolveComplex(double x_real[],
                                                      double x_imag[],
                                                      Statistics *stats)
{
  if(backend_ == NULL) {
    return NOT_CONFIGURED;
  }
  for(int j=0; j<num_states_; ++j) {
    complex_work_[j] = std::complex<double>(x_real[j], x_imag[j]);
  }
  stats->linear_solve_timer.Start();
  LinearSolverStatus flag = backend_->SolveComplex(complex_handle_,
                                                   num_states_,
                                                   &complex_work_[0]);
  stats->linear_solve_timer.Stop();
  for(int j=0; j<num_states_; ++j) {
    x_real[j] = complex_work_[j].real();
    x_imag[j] = complex_work_[j].imag();
  }
  return ToIntegratorStatus(flag);
}

void IterationMatrixBuilder::ApplyMassMatrix(const double v[],
                                             double out[]) const
{
  if(mass_ == NULL) {
    for(int j=0; j<num_states_; ++j) {
      out[j] = v[j];
    }
    return;
  }
  mass_->Multiply(v, out);
}

} // namespace stiffrk
