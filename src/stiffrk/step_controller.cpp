#include <math.h>

#include <algorithm>

#include "step_controller.h"

namespace stiffrk
{

static const double uround = 1.0e-16;

StepControllerParameters::StepControllerParameters()
  : safety(0.9),
    fac_min(0.2),
    fac_max(8.0),
    reject_factor(0.5),
    error_exponent(0.2),
    predictive(true),
    step_keep_lower(1.0),
    step_keep_upper(1.2),
    keep_rate_threshold(1.0e-3),
    h_max(0.0),
    max_newton_iterations(7),
    stiffness_window(15),
    stiffness_ratio_threshold(0.5)
{}

StepController::StepController()
  : state_(STEP_PROBING),
    x_end_(0.0),
    posneg_(1.0),
    h_max_(0.0),
    h_optimal_(0.0),
    h_accepted_(0.0),
    err_accepted_(1.0e-2),
    num_accepted_(0),
    first_(true),
    rejected_(false),
    last_(false)
{}

double StepController::Start(const double x0,
                             const double x_end,
                             const double h_init)
{
  state_ = STEP_PROBING;
  x_end_ = x_end;
  posneg_ = (x_end - x0 >= 0.0) ? 1.0 : -1.0;
  h_max_ = fabs(x_end - x0);
  if(parameters_.h_max > 0.0) {
    h_max_ = std::min(parameters_.h_max, h_max_);
  }
  num_accepted_ = 0;
  h_accepted_ = 0.0;
  err_accepted_ = 1.0e-2;
  first_ = true;
  rejected_ = false;
  last_ = false;
  iteration_ratios_.clear();

  double h = fabs(h_init);
  if(h <= 10.0*uround) {
    h = 1.0e-6;
  }
  h = posneg_*std::min(h, h_max_);
  if((x0 + h*1.0001 - x_end)*posneg_ >= 0.0) {
    h = x_end - x0;
    last_ = true;
  }
  h_optimal_ = h;
  return h;
}

StepDecision StepController::Decide(const double x,
                                    const double h,
                                    const double err,
                                    const int newton_iterations,
                                    const double newton_rate)
{
  const StepControllerParameters &p = parameters_;
  const int nit = p.max_newton_iterations;
  const double facl = 1.0/p.fac_min;
  const double facr = 1.0/p.fac_max;

  StepDecision decision;
  decision.accepted = false;
  decision.last = false;

  // --- computation of hnew, fac_min <= hnew/h <= fac_max
  const double fac = std::min(p.safety,
    (1 + 2*nit)*p.safety/(newton_iterations + 2*nit));
  double quot = std::max(facr,
                         std::min(facl, pow(err, p.error_exponent)/fac));
  double hnew = h/quot;

  if(err <= 1.0) {
    // --- step is accepted
    state_ = STEP_ACCEPTED;
    decision.accepted = true;
    first_ = false;
    ++num_accepted_;
    RecordIterations(newton_iterations);
    if(p.predictive) {
      // --- predictive controller of Gustafsson
      if(num_accepted_ > 1) {
        double facgus = (h_accepted_/h)*
          pow(err*err/err_accepted_, p.error_exponent)/p.safety;
        facgus = std::max(facr, std::min(facl, facgus));
        quot = std::max(quot, facgus);
        hnew = h/quot;
      }
      h_accepted_ = h;
      err_accepted_ = std::max(1.0e-2, err);
    }
    if(last_) {
      decision.last = true;
      decision.h_next = h_optimal_;
      return decision;
    }
    const double x_new = x + h;
    hnew = posneg_*std::min(fabs(hnew), h_max_);
    h_optimal_ = posneg_*std::min(fabs(h), fabs(hnew));
    if(rejected_) {
      hnew = posneg_*std::min(fabs(hnew), fabs(h));
    }
    rejected_ = false;
    if((x_new + hnew/p.step_keep_lower - x_end_)*posneg_ >= 0.0) {
      decision.h_next = x_end_ - x_new;
      last_ = true;
    } else {
      const double qt = hnew/h;
      if(newton_rate <= p.keep_rate_threshold &&
         qt >= p.step_keep_lower && qt <= p.step_keep_upper) {
        decision.h_next = h;
      } else {
        decision.h_next = hnew;
      }
    }
    return decision;
  }

  // --- step is rejected
  state_ = STEP_REJECTED;
  rejected_ = true;
  last_ = false;
  if(first_) {
    decision.h_next = h*0.1;
  } else {
    decision.h_next = posneg_*std::min(fabs(hnew), p.reject_factor*fabs(h));
  }
  return decision;
}

StepDecision StepController::RejectUnexpected(const double h,
                                              const double factor)
{
  StepDecision decision;
  state_ = STEP_REJECTED;
  rejected_ = true;
  last_ = false;
  decision.accepted = false;
  decision.last = false;
  decision.h_next = h*factor;
  return decision;
}

void StepController::RecordIterations(const int newton_iterations)
{
  const int window = std::max(1, parameters_.stiffness_window);
  const int budget = std::max(1, parameters_.max_newton_iterations);
  iteration_ratios_.push_back((double)newton_iterations/(double)budget);
  while((int)iteration_ratios_.size() > window) {
    iteration_ratios_.pop_front();
  }
}

double StepController::stiffness_ratio() const
{
  if(iteration_ratios_.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for(size_t j=0; j<iteration_ratios_.size(); ++j) {
    sum += iteration_ratios_[j];
  }
  return sum/(double)iteration_ratios_.size();
}

bool StepController::stiff() const
{
  return (!iteration_ratios_.empty() &&
          stiffness_ratio() >= parameters_.stiffness_ratio_threshold);
}

} // namespace stiffrk
