#ifndef STIFFRK_JACOBIAN_MANAGER_H_
#define STIFFRK_JACOBIAN_MANAGER_H_

#include "sundials/sundials_nvector.h"

#include "integrator_status.h"
#include "ode_problem.h"
#include "sparse_matrix.h"
#include "statistics.h"

namespace stiffrk
{

enum NewtonVerdict {NEWTON_CONVERGED, NEWTON_DIVERGED, NEWTON_STALLED};

// Owns the last evaluated Jacobian and decides when it is stale. Every
// successful Refresh() gives the Jacobian a new id; cached factorizations
// keyed by an older id are invalid.
//
// The Jacobian becomes stale when
//   - it was never evaluated or ForceStale() was called,
//   - the Newton contraction rate of an accepted step exceeded the reuse
//     threshold,
//   - max_age > 0 accepted steps used it,
//   - two consecutive Newton attempts diverged with it.
class JacobianManager
{
 public:
  JacobianManager(OdeProblem *problem, N_Vector template_vector);
  ~JacobianManager();

  void Reset(const int max_age, const double reuse_threshold);

  bool NeedsRefresh() const;

  // Evaluates df/dy at (x, y), analytically if the problem provides it and
  // by forward differences otherwise. fy must hold f(x, y). Fails with
  // JACOBIAN_EVALUATION_ERROR on a callback failure or non-finite entries,
  // and with RHS_EVALUATION_ERROR if a difference quotient could not be
  // formed.
  IntegratorStatus Refresh(const double x,
                           N_Vector y,
                           N_Vector fy,
                           Statistics *stats);

  void RecordAcceptedStep(const double newton_rate);
  void RecordNewtonVerdict(const NewtonVerdict verdict, const double x);

  // True if the Jacobian was evaluated at x and has not been replaced.
  bool IsCurrent(const double x) const {return valid_ && x == x_evaluated_;}

  int jacobian_id() const {return jacobian_id_;}
  const SparseMatrix& jacobian() const {return jacobian_;}

 private:
  JacobianManager(const JacobianManager &);
  JacobianManager& operator=(const JacobianManager &);

  int DividedDifferenceJacobian(const double x,
                                N_Vector y,
                                N_Vector fy,
                                Statistics *stats);

  OdeProblem *problem_;
  SparseMatrix jacobian_;
  N_Vector y_perturbed_;
  N_Vector f_perturbed_;

  bool valid_;
  bool stale_;
  int jacobian_id_;
  int age_;
  int max_age_;
  int consecutive_divergences_;
  double reuse_threshold_;
  double x_evaluated_;
};

} // namespace stiffrk

#endif
