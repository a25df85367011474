#ifndef STIFFRK_INTEGRATOR_STATUS_H_
#define STIFFRK_INTEGRATOR_STATUS_H_

namespace stiffrk
{

// Outcome of an integration run or of a public Integrator call. Everything
// except SUCCESS and STOPPED_BY_USER terminates the run; the trajectory
// recorded up to the last accepted step is kept.
enum IntegratorStatus {SUCCESS = 0,
                       STOPPED_BY_USER,
                       RHS_EVALUATION_ERROR,
                       JACOBIAN_EVALUATION_ERROR,
                       SINGULAR_MATRIX,
                       FACTORIZATION_ERROR,
                       LINEAR_SOLVE_ERROR,
                       STEP_SIZE_TOO_SMALL,
                       TOO_MANY_REJECTIONS,
                       DEADLINE_EXCEEDED,
                       MAX_STEPS_EXCEEDED,
                       STALE_INTERPOLANT,
                       INVALID_INPUT,
                       NOT_CONFIGURED,
                       NUM_INTEGRATOR_STATUS};

// Status of a single linear-solver backend call.
enum LinearSolverStatus {LINEAR_SOLVER_SUCCESS = 0,
                         LINEAR_SOLVER_SINGULAR,
                         LINEAR_SOLVER_FACTOR_FAILED,
                         LINEAR_SOLVER_SOLVE_FAILED,
                         LINEAR_SOLVER_INVALID_HANDLE};

// Returns a stable upper case name, e.g. "STEP_SIZE_TOO_SMALL".
const char * GetIntegratorStatusName(const IntegratorStatus status);

// Returns true for the statuses that end a run abnormally.
bool IsFatalStatus(const IntegratorStatus status);

// Prints "ReturnedError: <description> [context]" to stdout and returns true
// when status is fatal; returns false without printing otherwise.
bool CheckIntegratorStatus(const char context[],
                           const IntegratorStatus status);

// Maps a backend failure onto the integrator taxonomy.
IntegratorStatus ToIntegratorStatus(const LinearSolverStatus status);

} // namespace stiffrk

#endif
