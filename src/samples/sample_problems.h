#ifndef STIFFRK_SAMPLE_PROBLEMS_H_
#define STIFFRK_SAMPLE_PROBLEMS_H_

#include "sundials/sundials_nvector.h"

#include "stiffrk/ode_problem.h"
#include "stiffrk/sparse_matrix.h"

namespace stiffrk
{
namespace samples
{

// y' = -lambda*y
class LinearDecayProblem : public OdeProblem
{
 public:
  LinearDecayProblem(const double lambda, const bool analytic_jacobian);
  ~LinearDecayProblem() {};

  int GetNumStates() const {return 1;}
  int GetDerivative(const double x, N_Vector y, N_Vector f);
  bool HasJacobian() const {return analytic_jacobian_;}
  int GetJacobian(const double x, N_Vector y, N_Vector fy,
                  SparseMatrix *jacobian);
  int GetJacobianNonZeros() const {return 1;}

  double ExactSolution(const double x, const double y0) const;

 private:
  double lambda_;
  bool analytic_jacobian_;
};

// Hairer-Wanner equation (1.1): y' = -50*(y - cos(x)), y(0) = 0
class HairerWannerProblem : public OdeProblem
{
 public:
  HairerWannerProblem() {};
  ~HairerWannerProblem() {};

  int GetNumStates() const {return 1;}
  int GetDerivative(const double x, N_Vector y, N_Vector f);
  bool HasJacobian() const {return true;}
  int GetJacobian(const double x, N_Vector y, N_Vector fy,
                  SparseMatrix *jacobian);
  int GetJacobianNonZeros() const {return 1;}

  // Solution with y(0) = 0.
  double ExactSolution(const double x) const;
};

// Van der Pol oscillator in the scaled form
//   y0' = y1
//   y1' = ((1 - y0^2)*y1 - y0)/epsilon
class VanDerPolProblem : public OdeProblem
{
 public:
  VanDerPolProblem(const double epsilon, const bool analytic_jacobian);
  ~VanDerPolProblem() {};

  int GetNumStates() const {return 2;}
  int GetDerivative(const double x, N_Vector y, N_Vector f);
  bool HasJacobian() const {return analytic_jacobian_;}
  int GetJacobian(const double x, N_Vector y, N_Vector fy,
                  SparseMatrix *jacobian);
  int GetJacobianNonZeros() const {return 4;}

 private:
  double epsilon_;
  bool analytic_jacobian_;
};

// Robertson chemical kinetics
//   y0' = -0.04*y0 + 1e4*y1*y2
//   y1' =  0.04*y0 - 1e4*y1*y2 - 3e7*y1^2
//   y2' =  3e7*y1^2                        (ODE form)
//    0  =  y0 + y1 + y2 - 1                (index-1 DAE form)
class RobertsonProblem : public OdeProblem
{
 public:
  explicit RobertsonProblem(const bool dae_form);
  ~RobertsonProblem() {};

  int GetNumStates() const {return 3;}
  int GetDerivative(const double x, N_Vector y, N_Vector f);
  bool HasJacobian() const {return true;}
  int GetJacobian(const double x, N_Vector y, N_Vector fy,
                  SparseMatrix *jacobian);
  int GetJacobianNonZeros() const {return 9;}
  bool HasMassMatrix() const {return dae_form_;}
  int GetMassMatrix(SparseMatrix *mass);

  // y = (1, 0, 0)
  void GetInitialState(N_Vector y) const;

 private:
  bool dae_form_;
};

// Two dimensional Brusselator on the periodic unit square discretized with
// the 5-point Laplacian on an n x n grid:
//   u' = 1 + u^2*v - 4.4*u + alpha*lap(u)
//   v' = 3.4*u - u^2*v + alpha*lap(v)
// State index 2*(i*n + j) holds u and 2*(i*n + j) + 1 holds v at grid point
// (x_i, y_j) = (i/n, j/n).
class BrusselatorProblem : public OdeProblem
{
 public:
  BrusselatorProblem(const int grid_size, const double alpha);
  ~BrusselatorProblem() {};

  int GetNumStates() const {return 2*grid_size_*grid_size_;}
  int GetDerivative(const double x, N_Vector y, N_Vector f);
  bool HasJacobian() const {return true;}
  int GetJacobian(const double x, N_Vector y, N_Vector fy,
                  SparseMatrix *jacobian);
  int GetJacobianNonZeros() const {return 12*grid_size_*grid_size_;}

  // u = 22*y*(1 - y)^1.5, v = 27*x*(1 - x)^1.5
  void GetInitialState(N_Vector y) const;

 private:
  int Index(const int i, const int j) const;
  double coupling() const;

  int grid_size_;
  double alpha_;
};

// Forwards every call to a problem with an analytic Jacobian, but puts a NaN
// in the Jacobian once x >= x_fail.
class NanJacobianProblem : public OdeProblem
{
 public:
  NanJacobianProblem(OdeProblem *base, const double x_fail);
  ~NanJacobianProblem() {};

  int GetNumStates() const {return base_->GetNumStates();}
  int GetDerivative(const double x, N_Vector y, N_Vector f)
  {return base_->GetDerivative(x, y, f);}
  bool HasJacobian() const {return true;}
  int GetJacobian(const double x, N_Vector y, N_Vector fy,
                  SparseMatrix *jacobian);
  int GetJacobianNonZeros() const {return base_->GetJacobianNonZeros();}
  bool HasMassMatrix() const {return base_->HasMassMatrix();}
  int GetMassMatrix(SparseMatrix *mass) {return base_->GetMassMatrix(mass);}

 private:
  OdeProblem *base_;
  double x_fail_;
};

} // namespace samples
} // namespace stiffrk

#endif
