#ifndef STIFFRK_STATISTICS_H_
#define STIFFRK_STATISTICS_H_

#include "utilities/file_utilities.h"
#include "utilities/time_utilities.h"

namespace stiffrk
{

// Counters of one integration run. All counters are reset by
// Integrator::Run and are monotone within a run.
struct Statistics
{
  Statistics() {Reset();}
  void Reset();

  int num_function_evaluations;
  int num_jacobian_evaluations;
  int num_factorizations;       // real and complex pair counted once
  int num_linear_solves;        // real and complex pair counted once
  int num_steps;                // attempted steps
  int num_accepted_steps;
  int num_rejected_steps;
  int num_newton_iterations;    // total over the run
  int max_newton_iterations;    // largest count of a single attempt
  int last_newton_iterations;   // count of the last accepted step
  double h_accepted;            // size of the last accepted step
  double h_optimal;             // proposed size at the end of the run
  double stiffness_ratio;       // average of iterations/budget
  bool stiff;

  utilities::PhaseTimer jacobian_timer;
  utilities::PhaseTimer factorization_timer;
  utilities::PhaseTimer linear_solve_timer;
  utilities::PhaseTimer total_timer;

  void Print(const utilities::Logger &logger) const;
};

} // namespace stiffrk

#endif
