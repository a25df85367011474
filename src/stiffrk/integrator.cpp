#include <math.h>

#include <algorithm>
#include <cmath>

#include "interfaces/linear_solver_factory.h"
#include "utilities/time_utilities.h"

#include "integrator.h"

namespace stiffrk
{

static const double uround = 1.0e-16;

Integrator::Integrator(OdeProblem *problem)
  : problem_(problem),
    num_states_(problem->GetNumStates()),
    configured_(false),
    mass_(problem->GetNumStates()),
    backend_(NULL),
    owned_backend_(NULL),
    jacobian_manager_(NULL),
    builder_(NULL),
    newton_(NULL),
    estimator_(NULL),
    dense_output_(NULL),
    fy_(NULL),
    dense_y_(NULL),
    next_dense_index_(1),
    logger_(NULL),
    step_output_fcn_(NULL),
    step_output_data_(NULL)
{}

Integrator::~Integrator()
{
  FreeWorkspace();
  if(owned_backend_ != NULL) {
    delete owned_backend_;
  }
}

void Integrator::FreeWorkspace()
{
  // the solvers hold vectors cloned from fy_, free them first
  delete estimator_;
  delete newton_;
  delete dense_output_;
  delete builder_;
  delete jacobian_manager_;
  estimator_ = NULL;
  newton_ = NULL;
  dense_output_ = NULL;
  builder_ = NULL;
  jacobian_manager_ = NULL;
  if(fy_ != NULL) {
    N_VDestroy(fy_);
    fy_ = NULL;
  }
  if(dense_y_ != NULL) {
    N_VDestroy(dense_y_);
    dense_y_ = NULL;
  }
  configured_ = false;
}

IntegratorStatus Integrator::Configure(const IntegratorConfig &config)
{
  FreeWorkspace();
  config_ = config;

  if(num_states_ <= 0 || !nvector_context_.valid()) {
    return INVALID_INPUT;
  }
  fy_ = nvector_context_.NewVector(num_states_);
  if(fy_ == NULL) {
    return INVALID_INPUT;
  }
  N_VConst(0.0, fy_);
  dense_y_ = NewZeroVector(fy_);

  if(error_norm_.Initialize(config_.rel_tol, config_.abs_tol, fy_) != 0) {
    if(logger_ != NULL) {
      logger_->PrintF("# ERROR: In Integrator::Configure(...),\n"
                      "#        tolerance vectors must have size 1 or %d\n"
                      "#        and positive entries.\n",
                      num_states_);
    }
    return INVALID_INPUT;
  }

  if(backend_ == NULL || backend_ == owned_backend_) {
    if(owned_backend_ != NULL) {
      delete owned_backend_;
    }
    owned_backend_ = LinearSolverFactory::Create(config_.linear_solver,
                                                 logger_);
    backend_ = owned_backend_;
    if(backend_ == NULL) {
      return INVALID_INPUT;
    }
  }

  StepControllerParameters parameters;
  parameters.safety = config_.safety;
  parameters.fac_min = config_.fac_min;
  parameters.fac_max = config_.fac_max;
  parameters.reject_factor = config_.reject_factor;
  parameters.error_exponent = config_.error_exponent;
  parameters.predictive = config_.predictive_controller;
  parameters.step_keep_lower = config_.step_keep_lower;
  parameters.step_keep_upper = config_.step_keep_upper;
  parameters.keep_rate_threshold = config_.jacobian_reuse_threshold;
  parameters.h_max = config_.h_max;
  parameters.max_newton_iterations = config_.max_newton_iterations;
  parameters.stiffness_window = config_.stiffness_window;
  parameters.stiffness_ratio_threshold = config_.stiffness_ratio_threshold;
  controller_.SetParameters(parameters);

  jacobian_manager_ = new JacobianManager(problem_, fy_);
  builder_ = new IterationMatrixBuilder(coefficients_, num_states_);
  builder_->SetBackend(backend_);

  mass_.Reset();
  if(problem_->HasMassMatrix()) {
    const int flag = problem_->GetMassMatrix(&mass_);
    if(flag != 0 || !mass_.IsValid() || !mass_.AllFinite()) {
      if(logger_ != NULL) {
        logger_->PrintF("# ERROR: In Integrator::Configure(...),\n"
                        "#        mass matrix evaluation failed (flag = %d).\n",
                        flag);
      }
      return INVALID_INPUT;
    }
    builder_->SetMassMatrix(&mass_);
  } else {
    builder_->SetMassMatrix(NULL);
  }

  newton_ = new NewtonSolver(coefficients_,
                             problem_,
                             builder_,
                             &error_norm_,
                             fy_);
  estimator_ = new ErrorEstimator(coefficients_,
                                  problem_,
                                  builder_,
                                  &error_norm_,
                                  fy_);
  dense_output_ = new DenseOutput(coefficients_, fy_);
  configured_ = true;
  return SUCCESS;
}

void Integrator::SetLinearSolverBackend(LinearSolverBackend *backend)
{
  if(owned_backend_ != NULL) {
    delete owned_backend_;
    owned_backend_ = NULL;
  }
  backend_ = backend;
  if(builder_ != NULL) {
    builder_->SetBackend(backend_);
  }
}

IntegratorStatus Integrator::Sample(const double x, N_Vector y) const
{
  if(dense_output_ == NULL) {
    return STALE_INTERPOLANT;
  }
  return dense_output_->Evaluate(x, y);
}

IntegratorStatus Integrator::RecordRejection(int *consecutive_rejections)
{
  ++stats_.num_rejected_steps;
  ++(*consecutive_rejections);
  if(*consecutive_rejections >= config_.max_consecutive_rejections) {
    return TOO_MANY_REJECTIONS;
  }
  return SUCCESS;
}

// Interpolated values at x0 + k*dense_output_step inside the last accepted
// step, and at x_end after the last step.
void Integrator::AddDenseOutput(const double x0,
                                const double x_end,
                                const bool last,
                                Trajectory *trajectory)
{
  if(config_.dense_output_step <= 0.0 || trajectory == NULL) {
    return;
  }
  const double posneg = controller_.direction();
  const double x_new = dense_output_->x_new();
  while(true) {
    const double x_dense =
      x0 + posneg*next_dense_index_*config_.dense_output_step;
    if((x_dense - x_new)*posneg > 0.0 || (x_dense - x_end)*posneg >= 0.0) {
      break;
    }
    if(dense_output_->Evaluate(x_dense, dense_y_) == SUCCESS) {
      trajectory->AddDensePoint(x_dense, dense_y_);
    }
    ++next_dense_index_;
  }
  if(last) {
    if(dense_output_->Evaluate(x_end, dense_y_) == SUCCESS) {
      trajectory->AddDensePoint(x_end, dense_y_);
    }
  }
}

IntegratorStatus Integrator::Finish(const IntegratorStatus status,
                                    const double x,
                                    const double h)
{
  stats_.h_optimal = controller_.h_optimal();
  stats_.stiffness_ratio = controller_.stiffness_ratio();
  stats_.stiff = controller_.stiff();
  stats_.total_timer.Stop();

  if(logger_ != NULL) {
    if(IsFatalStatus(status)) {
      logger_->PrintF("# Exit of Integrator::Run at x = %.10e, h = %.6e\n"
                      "#   status %s\n",
                      x, h, GetIntegratorStatusName(status));
    }
    if(config_.verbosity >= 1) {
      logger_->PrintF("# Integrator::Run finished with status %s at x = "
                      "%.10e\n",
                      GetIntegratorStatusName(status), x);
      stats_.Print(*logger_);
    }
    logger_->FFlush();
  }
  return status;
}

IntegratorStatus Integrator::Run(double *x_in,
                                 const double x_end,
                                 N_Vector y,
                                 Trajectory *trajectory)
{
  stats_.Reset();
  stats_.total_timer.Start();
  if(trajectory != NULL) {
    trajectory->Clear(num_states_);
  }
  if(!configured_ || backend_ == NULL) {
    return Finish(NOT_CONFIGURED, *x_in, 0.0);
  }
  if(y == NULL || NV_LENGTH_S(y) != num_states_ || !NVectorIsFinite(y) ||
     !std::isfinite(*x_in) || !std::isfinite(x_end)) {
    return Finish(INVALID_INPUT, *x_in, 0.0);
  }

  const double x0 = *x_in;
  double x = x0;
  dense_output_->Invalidate();
  if(trajectory != NULL) {
    trajectory->AddStep(x, 0.0, y);
  }
  if(x_end == x0) {
    return Finish(SUCCESS, x, 0.0);
  }

  jacobian_manager_->Reset(config_.max_jacobian_age,
                           config_.jacobian_reuse_threshold);
  builder_->Invalidate();
  newton_->Reset();
  next_dense_index_ = 1;

  double h = controller_.Start(x0, x_end, config_.h_init);
  const double newton_tolerance =
    NewtonSolver::NewtonTolerance(error_norm_.min_transformed_rtol());
  const double start_time = utilities::GetHighResolutionTime();

  int flag = problem_->GetDerivative(x, y, fy_);
  ++stats_.num_function_evaluations;
  if(flag != 0 || !NVectorIsFinite(fy_)) {
    return Finish(RHS_EVALUATION_ERROR, x, h);
  }

  int consecutive_rejections = 0;
  int singular_retries = 0;
  IntegratorStatus status = SUCCESS;

  while(true) {
    if(config_.max_wall_time > 0.0 &&
       utilities::GetHighResolutionTime() - start_time > config_.max_wall_time) {
      status = DEADLINE_EXCEEDED;
      break;
    }
    if(stats_.num_steps >= config_.max_steps) {
      status = MAX_STEPS_EXCEEDED;
      break;
    }
    if(0.1*fabs(h) <= fabs(x)*uround ||
       (fabs(h) < config_.h_min && !controller_.last_step())) {
      status = STEP_SIZE_TOO_SMALL;
      break;
    }

    // --- Jacobian and iteration matrices
    if(jacobian_manager_->NeedsRefresh()) {
      status = jacobian_manager_->Refresh(x, y, fy_, &stats_);
      if(status != SUCCESS) {
        break;
      }
    }
    bool refactored;
    status = builder_->BuildAndFactorize(jacobian_manager_->jacobian(),
                                         jacobian_manager_->jacobian_id(),
                                         h,
                                         config_.h_relative_tolerance,
                                         &stats_,
                                         &refactored);
    if(status == SINGULAR_MATRIX) {
      ++singular_retries;
      if(singular_retries > config_.max_singular_retries) {
        break;
      }
      ++stats_.num_steps;
      h = controller_.RejectUnexpected(h, 0.5).h_next;
      status = RecordRejection(&consecutive_rejections);
      if(status != SUCCESS) {
        break;
      }
      continue;
    } else if(status != SUCCESS) {
      break;
    }

    // --- simplified Newton iteration
    ++stats_.num_steps;
    newton_->InitializeStages(dense_output_, h);
    NewtonIterationRecord record =
      newton_->Iterate(x,
                       y,
                       h,
                       config_.max_newton_iterations,
                       newton_tolerance,
                       config_.jacobian_reuse_threshold,
                       &stats_);
    stats_.max_newton_iterations = std::max(stats_.max_newton_iterations,
                                            record.iterations);
    if(record.status != SUCCESS) {
      status = record.status;
      break;
    }
    jacobian_manager_->RecordNewtonVerdict(record.verdict, x);
    if(record.verdict != NEWTON_CONVERGED) {
      const double factor =
        (record.verdict == NEWTON_STALLED) ? record.step_factor : 0.5;
      h = controller_.RejectUnexpected(h, factor).h_next;
      status = RecordRejection(&consecutive_rejections);
      if(status != SUCCESS) {
        break;
      }
      continue;
    }

    // --- error estimate and step size control
    N_Vector *z = newton_->stages();
    const bool allow_correction = config_.correct_error_estimate &&
      (controller_.first_step() || controller_.after_rejection());
    ErrorEstimate estimate = estimator_->Estimate(x,
                                                  y,
                                                  fy_,
                                                  h,
                                                  z,
                                                  allow_correction,
                                                  &stats_);
    if(estimate.status != SUCCESS) {
      status = estimate.status;
      break;
    }
    if(!std::isfinite(estimate.norm)) {
      h = controller_.RejectUnexpected(h, 0.5).h_next;
      status = RecordRejection(&consecutive_rejections);
      if(status != SUCCESS) {
        break;
      }
      continue;
    }

    StepDecision decision = controller_.Decide(x,
                                               h,
                                               estimate.norm,
                                               record.iterations,
                                               record.rate);
    if(!decision.accepted) {
      h = decision.h_next;
      status = RecordRejection(&consecutive_rejections);
      if(status != SUCCESS) {
        break;
      }
      continue;
    }

    // --- step is accepted
    const double x_prev = x;
    N_VLinearSum(1.0, y, 1.0, z[2], y);
    x = decision.last ? x_end : x + h;
    dense_output_->Update(x_prev, h, y, z);
    jacobian_manager_->RecordAcceptedStep(record.rate);
    consecutive_rejections = 0;
    singular_retries = 0;
    ++stats_.num_accepted_steps;
    stats_.last_newton_iterations = record.iterations;
    stats_.h_accepted = h;

    if(trajectory != NULL) {
      trajectory->AddStep(x, h, y);
    }
    AddDenseOutput(x0, x_end, decision.last, trajectory);
    if(logger_ != NULL && config_.verbosity >= 2) {
      logger_->PrintF("# step %6d  x = %.10e  h = %.6e  err = %.4e  "
                      "newton = %d\n",
                      stats_.num_accepted_steps, x, h, estimate.norm,
                      record.iterations);
    }
    if(step_output_fcn_ != NULL &&
       step_output_fcn_(stats_.num_accepted_steps, x, h, y,
                        step_output_data_) != 0) {
      status = STOPPED_BY_USER;
      break;
    }
    if(decision.last) {
      status = SUCCESS;
      break;
    }

    flag = problem_->GetDerivative(x, y, fy_);
    ++stats_.num_function_evaluations;
    if(flag != 0 || !NVectorIsFinite(fy_)) {
      status = RHS_EVALUATION_ERROR;
      break;
    }
    h = decision.h_next;
  }

  *x_in = x;
  return Finish(status, x, h);
}

} // namespace stiffrk
