#ifndef STIFFRK_ODE_PROBLEM_H_
#define STIFFRK_ODE_PROBLEM_H_

#include "sundials/sundials_nvector.h"

#include "sparse_matrix.h"

namespace stiffrk
{

// ---------------------------------------------------------------------------
// Abstract base class for the system M*y' = f(x,y). Users define a derived
// class providing at least GetNumStates and GetDerivative. The callbacks
// return an int flag following the SUNDIALS convention:
//
//    0  success
//   >0  recoverable failure (the integrator may retry with a smaller step)
//   <0  unrecoverable failure (the run stops)
//
// Without an analytic Jacobian the integrator forms one by forward divided
// differences. Without a mass matrix M is the identity.
class OdeProblem
{
 public:
  virtual ~OdeProblem() {};

  virtual int GetNumStates() const = 0;

  // f = f(x, y). y must not be modified.
  virtual int GetDerivative(const double x,
                            N_Vector y,
                            N_Vector f) = 0;

  virtual bool HasJacobian() const {return false;}

  // Appends the triplets of df/dy at (x, y) to jacobian, which is empty on
  // entry. fy holds f(x, y).
  virtual int GetJacobian(const double x,
                          N_Vector y,
                          N_Vector fy,
                          SparseMatrix *jacobian) {return -1;}

  // Expected number of Jacobian triplets, used to reserve memory.
  virtual int GetJacobianNonZeros() const {return 0;}

  virtual bool HasMassMatrix() const {return false;}

  // Appends the triplets of the constant mass matrix. Algebraic equations
  // have an empty (zero) row.
  virtual int GetMassMatrix(SparseMatrix *mass) {return -1;}
};

} // namespace stiffrk

#endif
