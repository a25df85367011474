#ifndef STIFFRK_STEP_CONTROLLER_H_
#define STIFFRK_STEP_CONTROLLER_H_

#include <deque>

namespace stiffrk
{

enum StepControllerState {STEP_PROBING, STEP_ACCEPTED, STEP_REJECTED};

struct StepControllerParameters
{
  StepControllerParameters();

  double safety;
  double fac_min;            // smallest h_new/h
  double fac_max;            // largest h_new/h
  double reject_factor;      // largest h_new/h after an error rejection
  double error_exponent;
  bool predictive;           // Gustafsson predictive controller
  double step_keep_lower;
  double step_keep_upper;
  double keep_rate_threshold;
  double h_max;              // 0 means the span of the run
  int max_newton_iterations;
  int stiffness_window;
  double stiffness_ratio_threshold;
};

struct StepDecision
{
  bool accepted;
  bool last;       // the accepted step ends at x_end, or the next one will
  double h_next;   // signed
};

// Step size selection of the fixed order Radau IIA method. Start() puts the
// controller in STEP_PROBING; afterwards state() reports the outcome of the
// last decision (STEP_ACCEPTED or STEP_REJECTED).
//
// Accepted steps propose h*min(fac_max, max(fac_min, fac*err^(-e))) with the
// Gustafsson correction, clamp the result to h_max, keep h unchanged when
// the ratio is close to one and the Newton iteration contracted well, and
// stretch the last step onto x_end. Rejected steps shrink h by at least
// reject_factor (by 10 on the very first step).
class StepController
{
 public:
  StepController();
  ~StepController() {};

  void SetParameters(const StepControllerParameters &parameters)
  {parameters_ = parameters;}
  const StepControllerParameters& parameters() const {return parameters_;}

  // Prepares a run from x0 to x_end and returns the signed first trial step.
  double Start(const double x0, const double x_end, const double h_init);

  // Decision for an attempt of size h from x that produced the scaled error
  // err after newton_iterations iterations with contraction rate
  // newton_rate.
  StepDecision Decide(const double x,
                      const double h,
                      const double err,
                      const int newton_iterations,
                      const double newton_rate);

  // Rejection that did not come from the error test (Newton failure,
  // singular matrix, non-finite error). Returns h*factor.
  StepDecision RejectUnexpected(const double h, const double factor);

  StepControllerState state() const {return state_;}
  double direction() const {return posneg_;}
  double h_optimal() const {return h_optimal_;}
  bool first_step() const {return first_;}
  bool after_rejection() const {return rejected_;}
  bool last_step() const {return last_;}
  int num_accepted() const {return num_accepted_;}

  // Average of newton_iterations/max_newton_iterations over the last
  // stiffness_window accepted steps.
  double stiffness_ratio() const;
  bool stiff() const;

 private:
  void RecordIterations(const int newton_iterations);

  StepControllerParameters parameters_;
  StepControllerState state_;
  double x_end_;
  double posneg_;
  double h_max_;
  double h_optimal_;
  double h_accepted_;    // Gustafsson history
  double err_accepted_;
  int num_accepted_;
  bool first_;
  bool rejected_;
  bool last_;
  std::deque<double> iteration_ratios_;
};

} // namespace stiffrk

#endif
