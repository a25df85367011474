#include <stdio.h>

#include "integrator_options.h"

namespace stiffrk
{

static const char *int_option_names[] = {
  "max_steps",
  "max_newton_iterations",
  "max_consecutive_rejections",
  "max_singular_retries",
  "max_jacobian_age",
  "predictive_controller",
  "correct_error_estimate",
  "stiffness_window",
  "verbosity"
};
static const int num_int_options =
  sizeof(int_option_names)/sizeof(int_option_names[0]);

IntegratorConfig::IntegratorConfig()
  : rel_tol(1, 1.0e-6),
    abs_tol(1, 1.0e-10),
    h_init(1.0e-6),
    h_min(0.0),
    h_max(0.0),
    max_steps(100000),
    max_newton_iterations(7),
    max_consecutive_rejections(50),
    max_singular_retries(1),
    max_jacobian_age(0),
    jacobian_reuse_threshold(1.0e-3),
    step_keep_lower(1.0),
    step_keep_upper(1.2),
    h_relative_tolerance(1.0e-3),
    safety(0.9),
    fac_min(0.2),
    fac_max(8.0),
    reject_factor(0.5),
    error_exponent(0.2),
    predictive_controller(true),
    correct_error_estimate(true),
    stiffness_window(15),
    stiffness_ratio_threshold(0.5),
    dense_output_step(0.0),
    max_wall_time(0.0),
    verbosity(0),
    linear_solver("dense")
{}

IntegratorOptions::IntegratorOptions()
{
  double_options_["rel_tol"] = 1.0e-6;
  double_options_["abs_tol"] = 1.0e-10;
  double_options_["h_init"] = 1.0e-6;
  double_options_["h_min"] = 0.0;
  double_options_["h_max"] = 0.0;
  int_options_["max_steps"] = 100000;
  int_options_["max_newton_iterations"] = 7;
  int_options_["max_consecutive_rejections"] = 50;
  int_options_["max_singular_retries"] = 1;
  int_options_["max_jacobian_age"] = 0;
  double_options_["jacobian_reuse_threshold"] = 1.0e-3;
  double_options_["step_keep_lower"] = 1.0;
  double_options_["step_keep_upper"] = 1.2;
  double_options_["h_relative_tolerance"] = 1.0e-3;
  double_options_["safety"] = 0.9;
  double_options_["fac_min"] = 0.2;
  double_options_["fac_max"] = 8.0;
  double_options_["reject_factor"] = 0.5;
  double_options_["error_exponent"] = 0.2;
  int_options_["predictive_controller"] = 1;
  int_options_["correct_error_estimate"] = 1;
  int_options_["stiffness_window"] = 15;
  double_options_["stiffness_ratio_threshold"] = 0.5;
  double_options_["dense_output_step"] = 0.0;
  double_options_["max_wall_time"] = 0.0;
  int_options_["verbosity"] = 0;
  string_options_["linear_solver"] = "dense";
}

void IntegratorOptions::SetToleranceVectors(const std::vector<double> &rel_tol,
                                            const std::vector<double> &abs_tol)
{
  rel_tol_vector_ = rel_tol;
  abs_tol_vector_ = abs_tol;
}

static bool ReportInvalid(const char option_name[], const char reason[])
{
  printf("# ERROR: In IntegratorOptions::GetConfig(...),\n");
  printf("#        option %s %s.\n", option_name, reason);
  return true;
}

IntegratorStatus IntegratorOptions::GetConfig(IntegratorConfig *config) const
{
  bool invalid = false;

  // an integer option stored in the double map (or vice versa) is an error
  for(int j=0; j<num_int_options; ++j) {
    if(double_options_.find(int_option_names[j]) != double_options_.end()) {
      invalid = ReportInvalid(int_option_names[j], "must be an integer");
    }
  }
  for(DoubleOptions::const_iterator it = double_options_.begin();
      it != double_options_.end(); ++it) {
    if(int_options_.find(it->first) != int_options_.end()) {
      invalid = ReportInvalid(it->first.c_str(), "is set with two types");
    }
  }
  if(invalid) {
    return INVALID_INPUT;
  }

  double rel_tol, abs_tol;
  int predictive, correct;
  GetDoubleOption("rel_tol", &rel_tol);
  GetDoubleOption("abs_tol", &abs_tol);
  GetDoubleOption("h_init", &config->h_init);
  GetDoubleOption("h_min", &config->h_min);
  GetDoubleOption("h_max", &config->h_max);
  GetIntOption("max_steps", &config->max_steps);
  GetIntOption("max_newton_iterations", &config->max_newton_iterations);
  GetIntOption("max_consecutive_rejections",
               &config->max_consecutive_rejections);
  GetIntOption("max_singular_retries", &config->max_singular_retries);
  GetIntOption("max_jacobian_age", &config->max_jacobian_age);
  GetDoubleOption("jacobian_reuse_threshold",
                  &config->jacobian_reuse_threshold);
  GetDoubleOption("step_keep_lower", &config->step_keep_lower);
  GetDoubleOption("step_keep_upper", &config->step_keep_upper);
  GetDoubleOption("h_relative_tolerance", &config->h_relative_tolerance);
  GetDoubleOption("safety", &config->safety);
  GetDoubleOption("fac_min", &config->fac_min);
  GetDoubleOption("fac_max", &config->fac_max);
  GetDoubleOption("reject_factor", &config->reject_factor);
  GetDoubleOption("error_exponent", &config->error_exponent);
  GetIntOption("predictive_controller", &predictive);
  GetIntOption("correct_error_estimate", &correct);
  GetIntOption("stiffness_window", &config->stiffness_window);
  GetDoubleOption("stiffness_ratio_threshold",
                  &config->stiffness_ratio_threshold);
  GetDoubleOption("dense_output_step", &config->dense_output_step);
  GetDoubleOption("max_wall_time", &config->max_wall_time);
  GetIntOption("verbosity", &config->verbosity);
  GetStringOption("linear_solver", &config->linear_solver);
  config->predictive_controller = (predictive != 0);
  config->correct_error_estimate = (correct != 0);

  if(rel_tol_vector_.size() > 0) {
    config->rel_tol = rel_tol_vector_;
  } else {
    config->rel_tol.assign(1, rel_tol);
  }
  if(abs_tol_vector_.size() > 0) {
    config->abs_tol = abs_tol_vector_;
  } else {
    config->abs_tol.assign(1, abs_tol);
  }

  for(size_t j=0; j<config->rel_tol.size(); ++j) {
    if(!(config->rel_tol[j] > 0.0)) {
      invalid = ReportInvalid("rel_tol", "must be positive");
      break;
    }
  }
  for(size_t j=0; j<config->abs_tol.size(); ++j) {
    if(!(config->abs_tol[j] > 0.0)) {
      invalid = ReportInvalid("abs_tol", "must be positive");
      break;
    }
  }
  if(config->h_min < 0.0) {
    invalid = ReportInvalid("h_min", "must be non-negative");
  }
  if(config->h_max < 0.0) {
    invalid = ReportInvalid("h_max", "must be non-negative");
  }
  if(config->h_max > 0.0 && config->h_min > config->h_max) {
    invalid = ReportInvalid("h_min", "must not exceed h_max");
  }
  if(config->max_steps < 1) {
    invalid = ReportInvalid("max_steps", "must be at least 1");
  }
  if(config->max_newton_iterations < 1) {
    invalid = ReportInvalid("max_newton_iterations", "must be at least 1");
  }
  if(config->max_consecutive_rejections < 1) {
    invalid = ReportInvalid("max_consecutive_rejections",
                            "must be at least 1");
  }
  if(config->max_singular_retries < 0) {
    invalid = ReportInvalid("max_singular_retries", "must be non-negative");
  }
  if(config->max_jacobian_age < 0) {
    invalid = ReportInvalid("max_jacobian_age", "must be non-negative");
  }
  if(config->step_keep_lower > 1.0 || config->step_keep_lower <= 0.0) {
    invalid = ReportInvalid("step_keep_lower", "must be in (0, 1]");
  }
  if(config->step_keep_upper < 1.0) {
    invalid = ReportInvalid("step_keep_upper", "must be at least 1");
  }
  if(config->h_relative_tolerance < 0.0) {
    invalid = ReportInvalid("h_relative_tolerance", "must be non-negative");
  }
  if(config->safety <= 0.001 || config->safety >= 1.0) {
    invalid = ReportInvalid("safety", "must be in (0.001, 1)");
  }
  if(config->fac_min <= 0.0 || config->fac_min > 1.0) {
    invalid = ReportInvalid("fac_min", "must be in (0, 1]");
  }
  if(config->fac_max < 1.0) {
    invalid = ReportInvalid("fac_max", "must be at least 1");
  }
  if(config->reject_factor <= 0.0 || config->reject_factor >= 1.0) {
    invalid = ReportInvalid("reject_factor", "must be in (0, 1)");
  }
  if(config->error_exponent <= 0.0) {
    invalid = ReportInvalid("error_exponent", "must be positive");
  }
  if(config->stiffness_window < 1) {
    invalid = ReportInvalid("stiffness_window", "must be at least 1");
  }
  if(config->dense_output_step < 0.0) {
    invalid = ReportInvalid("dense_output_step", "must be non-negative");
  }
  if(config->max_wall_time < 0.0) {
    invalid = ReportInvalid("max_wall_time", "must be non-negative");
  }
  if(config->linear_solver != "dense" && config->linear_solver != "sparse") {
    invalid = ReportInvalid("linear_solver", "must be dense or sparse");
  }
  return invalid ? INVALID_INPUT : SUCCESS;
}

} // namespace stiffrk
