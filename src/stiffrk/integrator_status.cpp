#include <stdio.h>

#include "integrator_status.h"

namespace stiffrk
{

static const char *status_names[] = {
  "SUCCESS",
  "STOPPED_BY_USER",
  "RHS_EVALUATION_ERROR",
  "JACOBIAN_EVALUATION_ERROR",
  "SINGULAR_MATRIX",
  "FACTORIZATION_ERROR",
  "LINEAR_SOLVE_ERROR",
  "STEP_SIZE_TOO_SMALL",
  "TOO_MANY_REJECTIONS",
  "DEADLINE_EXCEEDED",
  "MAX_STEPS_EXCEEDED",
  "STALE_INTERPOLANT",
  "INVALID_INPUT",
  "NOT_CONFIGURED"
};

static const char *status_descriptions[] = {
  "no error",
  "stopped by user step callback",
  "right-hand side evaluation failed",
  "Jacobian evaluation failed",
  "iteration matrix is repeatedly singular",
  "iteration matrix factorization failed",
  "linear solve failed",
  "step size too small",
  "too many consecutive step rejections",
  "wall clock deadline exceeded",
  "maximum number of steps exceeded",
  "dense output requested outside the last accepted step",
  "invalid input",
  "integrator not configured"
};

const char * GetIntegratorStatusName(const IntegratorStatus status)
{
  if(status < SUCCESS || status >= NUM_INTEGRATOR_STATUS) {
    return "UNKNOWN";
  }
  return status_names[status];
}

bool IsFatalStatus(const IntegratorStatus status)
{
  return (status != SUCCESS && status != STOPPED_BY_USER);
}

bool CheckIntegratorStatus(const char context[],
                           const IntegratorStatus status)
{
  char preface[] = "ReturnedError:";

  if(!IsFatalStatus(status)) {
    return false;
  }
  if(status < SUCCESS || status >= NUM_INTEGRATOR_STATUS) {
    printf("%s %s [%s]\n",preface,"undefined error",context);
    return true;
  }
  printf("%s %s [%s]\n",preface,status_descriptions[status],context);
  return true;
}

IntegratorStatus ToIntegratorStatus(const LinearSolverStatus status)
{
  switch(status) {

  case LINEAR_SOLVER_SUCCESS:
    return SUCCESS;

  case LINEAR_SOLVER_SINGULAR:
    return SINGULAR_MATRIX;

  case LINEAR_SOLVER_FACTOR_FAILED:
    return FACTORIZATION_ERROR;

  case LINEAR_SOLVER_SOLVE_FAILED:
  case LINEAR_SOLVER_INVALID_HANDLE:
    return LINEAR_SOLVE_ERROR;

  default:
    return LINEAR_SOLVE_ERROR;
  }
}

} // namespace stiffrk
