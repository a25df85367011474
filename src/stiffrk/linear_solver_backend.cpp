#include "linear_solver_backend.h"

namespace stiffrk
{

LinearSolverBackend::LinearSolverBackend()
  : next_id_(0),
    real_id_(-1),
    complex_id_(-1)
{
}

LinearSolverStatus LinearSolverBackend::FactorReal(
    const CompressedColumnPattern &pattern,
    const bool pattern_changed,
    const std::vector<double> &values,
    FactorizationHandle *handle)
{
  real_id_ = -1;
  handle->id = -1;
  if((int)values.size() != pattern.num_nonzeros()) {
    return LINEAR_SOLVER_FACTOR_FAILED;
  }
  LinearSolverStatus flag = FactorRealMatrix(pattern, pattern_changed, values);
  if(flag == LINEAR_SOLVER_SUCCESS) {
    real_id_ = next_id_++;
    handle->id = real_id_;
  }
  return flag;
}

LinearSolverStatus LinearSolverBackend::FactorComplex(
    const CompressedColumnPattern &pattern,
    const bool pattern_changed,
    const std::vector<std::complex<double> > &values,
    FactorizationHandle *handle)
{
  complex_id_ = -1;
  handle->id = -1;
  if((int)values.size() != pattern.num_nonzeros()) {
    return LINEAR_SOLVER_FACTOR_FAILED;
  }
  LinearSolverStatus flag =
    FactorComplexMatrix(pattern, pattern_changed, values);
  if(flag == LINEAR_SOLVER_SUCCESS) {
    complex_id_ = next_id_++;
    handle->id = complex_id_;
  }
  return flag;
}

LinearSolverStatus LinearSolverBackend::SolveReal(
    const FactorizationHandle &handle,
    const int n,
    double x[])
{
  if(!handle.valid() || handle.id != real_id_) {
    return LINEAR_SOLVER_INVALID_HANDLE;
  }
  return SolveRealSystem(n, x);
}

LinearSolverStatus LinearSolverBackend::SolveComplex(
    const FactorizationHandle &handle,
    const int n,
    std::complex<double> x[])
{
  if(!handle.valid() || handle.id != complex_id_) {
    return LINEAR_SOLVER_INVALID_HANDLE;
  }
  return SolveComplexSystem(n, x);
}

} // namespace stiffrk
