#include <math.h>

#include <algorithm>

#include "nvector_utilities.h"
#include "jacobian_manager.h"

namespace stiffrk
{

static const double uround = 1.0e-16;

JacobianManager::JacobianManager(OdeProblem *problem,
                                 N_Vector template_vector)
  : problem_(problem),
    jacobian_(problem->GetNumStates())
{
  y_perturbed_ = NewZeroVector(template_vector);
  f_perturbed_ = NewZeroVector(template_vector);
  jacobian_.Reserve(std::max(problem->GetJacobianNonZeros(),
                             problem->GetNumStates()));
  jacobian_id_ = 0;
  Reset(0, 1.0e-3);
}

JacobianManager::~JacobianManager()
{
  N_VDestroy(y_perturbed_);
  N_VDestroy(f_perturbed_);
}

void JacobianManager::Reset(const int max_age, const double reuse_threshold)
{
  valid_ = false;
  stale_ = true;
  age_ = 0;
  max_age_ = max_age;
  reuse_threshold_ = reuse_threshold;
  consecutive_divergences_ = 0;
  x_evaluated_ = 0.0;
  // ids keep increasing across runs so that no old factorization matches
  ++jacobian_id_;
}

bool JacobianManager::NeedsRefresh() const
{
  if(!valid_ || stale_) {
    return true;
  }
  if(max_age_ > 0 && age_ >= max_age_) {
    return true;
  }
  return false;
}

IntegratorStatus JacobianManager::Refresh(const double x,
                                          N_Vector y,
                                          N_Vector fy,
                                          Statistics *stats)
{
  valid_ = false;
  jacobian_.Reset();
  stats->jacobian_timer.Start();
  ++stats->num_jacobian_evaluations;

  int flag;
  if(problem_->HasJacobian()) {
    flag = problem_->GetJacobian(x, y, fy, &jacobian_);
    if(flag != 0 || !jacobian_.IsValid()) {
      stats->jacobian_timer.Stop();
      return JACOBIAN_EVALUATION_ERROR;
    }
  } else {
    flag = DividedDifferenceJacobian(x, y, fy, stats);
    if(flag != 0) {
      stats->jacobian_timer.Stop();
      return RHS_EVALUATION_ERROR;
    }
  }
  stats->jacobian_timer.Stop();

  if(!jacobian_.AllFinite()) {
    return JACOBIAN_EVALUATION_ERROR;
  }

  valid_ = true;
  stale_ = false;
  age_ = 0;
  consecutive_divergences_ = 0;
  x_evaluated_ = x;
  ++jacobian_id_;
  return SUCCESS;
}

int JacobianManager::DividedDifferenceJacobian(const double x,
                                               N_Vector y,
                                               N_Vector fy,
                                               Statistics *stats)
{
  const int n = problem_->GetNumStates();
  N_VScale(1.0, y, y_perturbed_);
  double *yd = NV_DATA_S(y_perturbed_);
  const double *dy0d = NV_DATA_S(fy);
  const double *dy1d = NV_DATA_S(f_perturbed_);

  jacobian_.Reserve(n*n);
  for(int j = 0; j < n; ++j) {
    const double ysafe = yd[j];
    const double delta = sqrt(uround*std::max(1.0e-5, fabs(ysafe)));
    yd[j] = ysafe + delta;
    const int flag = problem_->GetDerivative(x, y_perturbed_, f_perturbed_);
    ++stats->num_function_evaluations;
    yd[j] = ysafe;
    if(flag != 0) {
      return flag;
    }
    for(int i = 0; i < n; ++i) {
      jacobian_.Put(i, j, (dy1d[i] - dy0d[i])/delta);
    }
  }
  return 0;
}

void JacobianManager::RecordAcceptedStep(const double newton_rate)
{
  ++age_;
  consecutive_divergences_ = 0;
  if(newton_rate > reuse_threshold_) {
    stale_ = true;
  }
}

void JacobianManager::RecordNewtonVerdict(const NewtonVerdict verdict,
                                          const double x)
{
  if(verdict == NEWTON_DIVERGED) {
    ++consecutive_divergences_;
    if(consecutive_divergences_ >= 2 && !IsCurrent(x)) {
      stale_ = true;
      consecutive_divergences_ = 0;
    }
  } else if(verdict == NEWTON_STALLED) {
    if(!IsCurrent(x)) {
      stale_ = true;
    }
  } else {
    consecutive_divergences_ = 0;
  }
}

} // namespace stiffrk
