#include "statistics.h"

namespace stiffrk
{

void Statistics::Reset()
{
  num_function_evaluations = 0;
  num_jacobian_evaluations = 0;
  num_factorizations = 0;
  num_linear_solves = 0;
  num_steps = 0;
  num_accepted_steps = 0;
  num_rejected_steps = 0;
  num_newton_iterations = 0;
  max_newton_iterations = 0;
  last_newton_iterations = 0;
  h_accepted = 0.0;
  h_optimal = 0.0;
  stiffness_ratio = 0.0;
  stiff = false;
  jacobian_timer.Reset();
  factorization_timer.Reset();
  linear_solve_timer.Reset();
  total_timer.Reset();
}

void Statistics::Print(const utilities::Logger &logger) const
{
  logger.PrintF("# Number of function evaluations   = %d\n",
                num_function_evaluations);
  logger.PrintF("# Number of Jacobian evaluations   = %d\n",
                num_jacobian_evaluations);
  logger.PrintF("# Number of performed steps        = %d\n", num_steps);
  logger.PrintF("# Number of accepted steps         = %d\n",
                num_accepted_steps);
  logger.PrintF("# Number of rejected steps         = %d\n",
                num_rejected_steps);
  logger.PrintF("# Number of matrix factorizations  = %d\n",
                num_factorizations);
  logger.PrintF("# Number of linear solves          = %d\n",
                num_linear_solves);
  logger.PrintF("# Number of iterations (last step) = %d\n",
                last_newton_iterations);
  logger.PrintF("# Number of iterations (maximum)   = %d\n",
                max_newton_iterations);
  logger.PrintF("# Last accepted stepsize (h)       = %.6e\n", h_accepted);
  logger.PrintF("# Optimal stepsize (h)             = %.6e\n", h_optimal);
  logger.PrintF("# Stiffness ratio                  = %.4f%s\n",
                stiffness_ratio, stiff ? " (stiff)" : "");
  logger.PrintF("# Time spent on the Jacobian [s]   = %.6e\n",
                jacobian_timer.total());
  logger.PrintF("# Time spent on factorization [s]  = %.6e\n",
                factorization_timer.total());
  logger.PrintF("# Time spent on lin solution [s]   = %.6e\n",
                linear_solve_timer.total());
  logger.PrintF("# Total time [s]                   = %.6e\n",
                total_timer.total());
  logger.FFlush();
}

} // namespace stiffrk
