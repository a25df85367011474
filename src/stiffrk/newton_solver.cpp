#include <math.h>

#include <algorithm>
#include <cmath>

#include "nvector_utilities.h"
#include "newton_solver.h"

namespace stiffrk
{

static const double uround = 1.0e-16;

NewtonSolver::NewtonSolver(const RadauCoefficients &coefficients,
                           OdeProblem *problem,
                           IterationMatrixBuilder *builder,
                           const ErrorNorm *error_norm,
                           N_Vector template_vector)
  : coefficients_(coefficients),
    problem_(problem),
    builder_(builder),
    error_norm_(error_norm),
    faccon_(1.0)
{
  for(int k=0; k<3; ++k) {
    z_[k] = NewZeroVector(template_vector);
    w_[k] = NewZeroVector(template_vector);
    tmp_[k] = NewZeroVector(template_vector);
    mass_f_[k] = NewZeroVector(template_vector);
  }
  stage_y_ = NewZeroVector(template_vector);
  inverse_weights_ = NewZeroVector(template_vector);
}

NewtonSolver::~NewtonSolver()
{
  for(int k=0; k<3; ++k) {
    N_VDestroy(z_[k]);
    N_VDestroy(w_[k]);
    N_VDestroy(tmp_[k]);
    N_VDestroy(mass_f_[k]);
  }
  N_VDestroy(stage_y_);
  N_VDestroy(inverse_weights_);
}

void NewtonSolver::Reset()
{
  faccon_ = 1.0;
  for(int k=0; k<3; ++k) {
    N_VConst(0.0, z_[k]);
    N_VConst(0.0, w_[k]);
  }
}

double NewtonSolver::NewtonTolerance(const double min_transformed_rtol)
{
  return std::max(10.0*uround/min_transformed_rtol,
                  std::min(0.03, sqrt(min_transformed_rtol)));
}

// out = m*in, treating the three vectors as the rows of a 3 x n block
void NewtonSolver::Transform(const double m[3][3],
                             N_Vector in[3],
                             N_Vector out[3])
{
  for(int k=0; k<3; ++k) {
    N_VLinearSum(m[k][0], in[0], m[k][1], in[1], out[k]);
    N_VLinearSum(1.0, out[k], m[k][2], in[2], out[k]);
  }
}

void NewtonSolver::InitializeStages(const DenseOutput *dense_output,
                                    const double h)
{
  if(dense_output == NULL || !dense_output->PredictStages(h, z_)) {
    for(int k=0; k<3; ++k) {
      N_VConst(0.0, z_[k]);
      N_VConst(0.0, w_[k]);
    }
    return;
  }
  Transform(coefficients_.ti, z_, w_);
}

NewtonIterationRecord NewtonSolver::Iterate(const double x,
                                            N_Vector y,
                                            const double h,
                                            const int max_iterations,
                                            const double newton_tolerance,
                                            const double initial_rate,
                                            Statistics *stats)
{
  NewtonIterationRecord record;
  record.iterations = 0;
  record.correction_norm = 0.0;
  record.rate = initial_rate;
  record.verdict = NEWTON_DIVERGED;
  record.step_factor = 0.5;
  record.status = SUCCESS;

  const double u1 = coefficients_.u1;
  const double alpha = coefficients_.alpha;
  const double beta = coefficients_.beta;
  const double stage_x[3] = {x + coefficients_.c1*h,
                             x + coefficients_.c2*h,
                             x + h};
  const int nit = max_iterations;

  error_norm_->ComputeInverseWeights(y, inverse_weights_);

  faccon_ = pow(std::max(faccon_, uround), 0.8);
  double theta = fabs(initial_rate);
  double dynold = 0.0;
  double thqold = 0.0;
  int newt = 0;

  while(true) {
    if(newt >= nit) {
      record.verdict = NEWTON_DIVERGED;
      return record;
    }
    // --- compute the right-hand side at the three stages
    for(int k=0; k<3; ++k) {
      N_VLinearSum(1.0, y, 1.0, z_[k], stage_y_);
      const int flag = problem_->GetDerivative(stage_x[k], stage_y_, tmp_[k]);
      ++stats->num_function_evaluations;
      if(flag < 0) {
        record.status = RHS_EVALUATION_ERROR;
        return record;
      }
      if(flag > 0 || !NVectorIsFinite(tmp_[k])) {
        record.verdict = NEWTON_DIVERGED;
        return record;
      }
    }

    // --- transformed right-hand sides
    Transform(coefficients_.ti, tmp_, z_);
    for(int k=0; k<3; ++k) {
      builder_->ApplyMassMatrix(NV_DATA_S(w_[k]), NV_DATA_S(mass_f_[k]));
    }
    // real:    h*z0 - u1*M*w0
    // complex: h*z1 - alpha*M*w1 + beta*M*w2  +  i(h*z2 - alpha*M*w2 - beta*M*w1)
    N_VLinearSum(h, z_[0], -u1, mass_f_[0], z_[0]);
    N_VLinearSum(h, z_[1], -alpha, mass_f_[1], z_[1]);
    N_VLinearSum(1.0, z_[1], beta, mass_f_[2], z_[1]);
    N_VLinearSum(h, z_[2], -alpha, mass_f_[2], z_[2]);
    N_VLinearSum(1.0, z_[2], -beta, mass_f_[1], z_[2]);

    // --- solve the linear systems
    IntegratorStatus solve_flag = builder_->SolveReal(NV_DATA_S(z_[0]), stats);
    if(solve_flag == SUCCESS) {
      solve_flag = builder_->SolveComplex(NV_DATA_S(z_[1]),
                                          NV_DATA_S(z_[2]),
                                          stats);
    }
    ++stats->num_linear_solves;
    if(solve_flag != SUCCESS) {
      record.status = solve_flag;
      return record;
    }
    ++newt;
    ++stats->num_newton_iterations;
    record.iterations = newt;

    const double dyno1 = error_norm_->WrmsNorm(z_[0], inverse_weights_);
    const double dyno2 = error_norm_->WrmsNorm(z_[1], inverse_weights_);
    const double dyno3 = error_norm_->WrmsNorm(z_[2], inverse_weights_);
    const double dyno = sqrt((dyno1*dyno1 + dyno2*dyno2 + dyno3*dyno3)/3.0);
    record.correction_norm = dyno;
    if(!std::isfinite(dyno)) {
      record.verdict = NEWTON_DIVERGED;
      return record;
    }

    // --- bad convergence or number of iterations too large
    if(newt > 1 && newt < nit) {
      const double thq = dyno/dynold;
      if(newt == 2) {
        theta = thq;
      } else {
        theta = sqrt(thq*thqold);
      }
      thqold = thq;
      record.rate = theta;
      if(theta < 0.99) {
        faccon_ = theta/(1.0 - theta);
        const double dyth =
          faccon_*dyno*pow(theta, (nit - 1 - newt))/newton_tolerance;
        if(dyth >= 1.0) {
          const double qnewt = std::max(1.0e-4, std::min(20.0, dyth));
          record.step_factor = 0.8*pow(qnewt, (-1.0/(4.0 + nit - 1 - newt)));
          record.verdict = NEWTON_STALLED;
          return record;
        }
      } else {
        record.verdict = NEWTON_DIVERGED;
        return record;
      }
    }
    dynold = std::max(dyno, uround);

    for(int k=0; k<3; ++k) {
      N_VLinearSum(1.0, w_[k], 1.0, z_[k], w_[k]);
    }
    Transform(coefficients_.t, w_, z_);

    if(faccon_*dyno <= newton_tolerance) {
      break;
    }
  }
  record.verdict = NEWTON_CONVERGED;
  return record;
}

} // namespace stiffrk
