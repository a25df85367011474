#ifndef STIFFRK_INTEGRATOR_OPTIONS_H_
#define STIFFRK_INTEGRATOR_OPTIONS_H_

#include <string>
#include <vector>

#include "integrator_status.h"
#include "optionable.h"

namespace stiffrk
{

// Immutable settings of one integration run. Produced by
// IntegratorOptions::GetConfig and copied by Integrator::Configure.
struct IntegratorConfig
{
  IntegratorConfig(); // same defaults as IntegratorOptions

  std::vector<double> rel_tol;   // size 1 or num_states
  std::vector<double> abs_tol;
  double h_init;
  double h_min;
  double h_max;
  int max_steps;
  int max_newton_iterations;
  int max_consecutive_rejections;
  int max_singular_retries;
  int max_jacobian_age;
  double jacobian_reuse_threshold;
  double step_keep_lower;
  double step_keep_upper;
  double h_relative_tolerance;
  double safety;
  double fac_min;
  double fac_max;
  double reject_factor;
  double error_exponent;
  bool predictive_controller;
  bool correct_error_estimate;
  int stiffness_window;
  double stiffness_ratio_threshold;
  double dense_output_step;
  double max_wall_time;
  int verbosity;
  std::string linear_solver;
};

// Option map with the documented defaults:
//
//   rel_tol 1e-6, abs_tol 1e-10, h_init 1e-6, h_min 0, h_max 0,
//   max_steps 100000, max_newton_iterations 7,
//   max_consecutive_rejections 50, max_singular_retries 1,
//   max_jacobian_age 0, jacobian_reuse_threshold 1e-3,
//   step_keep_lower 1.0, step_keep_upper 1.2, h_relative_tolerance 1e-3,
//   safety 0.9, fac_min 0.2, fac_max 8.0, reject_factor 0.5,
//   error_exponent 0.2, predictive_controller 1, correct_error_estimate 1,
//   stiffness_window 15, stiffness_ratio_threshold 0.5,
//   dense_output_step 0, max_wall_time 0, verbosity 0,
//   linear_solver "dense"
//
// Per component tolerances set with SetToleranceVectors replace the scalar
// rel_tol and abs_tol.
class IntegratorOptions : public Optionable
{
 public:
  IntegratorOptions();
  ~IntegratorOptions() {};

  void SetToleranceVectors(const std::vector<double> &rel_tol,
                           const std::vector<double> &abs_tol);

  // Returns INVALID_INPUT (and prints the offending option) if a value is
  // out of range or an option has the wrong type.
  IntegratorStatus GetConfig(IntegratorConfig *config) const;

 private:
  std::vector<double> rel_tol_vector_;
  std::vector<double> abs_tol_vector_;
};

} // namespace stiffrk

#endif
