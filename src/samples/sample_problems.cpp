#include <math.h>

#include <limits>

#include "nvector/nvector_serial.h"

#include "sample_problems.h"

namespace stiffrk
{
namespace samples
{

LinearDecayProblem::LinearDecayProblem(const double lambda,
                                       const bool analytic_jacobian)
  : lambda_(lambda),
    analytic_jacobian_(analytic_jacobian)
{}

int LinearDecayProblem::GetDerivative(const double x, N_Vector y, N_Vector f)
{
  NV_Ith_S(f,0) = -lambda_*NV_Ith_S(y,0);
  return 0;
}

int LinearDecayProblem::GetJacobian(const double x,
                                    N_Vector y,
                                    N_Vector fy,
                                    SparseMatrix *jacobian)
{
  return jacobian->Put(0, 0, -lambda_);
}

double LinearDecayProblem::ExactSolution(const double x, const double y0) const
{
  return y0*exp(-lambda_*x);
}

int HairerWannerProblem::GetDerivative(const double x, N_Vector y, N_Vector f)
{
  NV_Ith_S(f,0) = -50.0*(NV_Ith_S(y,0) - cos(x));
  return 0;
}

int HairerWannerProblem::GetJacobian(const double x,
                                     N_Vector y,
                                     N_Vector fy,
                                     SparseMatrix *jacobian)
{
  return jacobian->Put(0, 0, -50.0);
}

double HairerWannerProblem::ExactSolution(const double x) const
{
  return (2500.0*cos(x) + 50.0*sin(x) - 2500.0*exp(-50.0*x))/2501.0;
}

VanDerPolProblem::VanDerPolProblem(const double epsilon,
                                   const bool analytic_jacobian)
  : epsilon_(epsilon),
    analytic_jacobian_(analytic_jacobian)
{}

int VanDerPolProblem::GetDerivative(const double x, N_Vector y, N_Vector f)
{
  const double y0 = NV_Ith_S(y,0);
  const double y1 = NV_Ith_S(y,1);
  NV_Ith_S(f,0) = y1;
  NV_Ith_S(f,1) = ((1.0 - y0*y0)*y1 - y0)/epsilon_;
  return 0;
}

int VanDerPolProblem::GetJacobian(const double x,
                                  N_Vector y,
                                  N_Vector fy,
                                  SparseMatrix *jacobian)
{
  const double y0 = NV_Ith_S(y,0);
  const double y1 = NV_Ith_S(y,1);
  int flag = 0;
  flag += jacobian->Put(0, 1, 1.0);
  flag += jacobian->Put(1, 0, (-2.0*y0*y1 - 1.0)/epsilon_);
  flag += jacobian->Put(1, 1, (1.0 - y0*y0)/epsilon_);
  return flag;
}

RobertsonProblem::RobertsonProblem(const bool dae_form)
  : dae_form_(dae_form)
{}

int RobertsonProblem::GetDerivative(const double x, N_Vector y, N_Vector f)
{
  const double y0 = NV_Ith_S(y,0);
  const double y1 = NV_Ith_S(y,1);
  const double y2 = NV_Ith_S(y,2);
  NV_Ith_S(f,0) = -0.04*y0 + 1.0e4*y1*y2;
  NV_Ith_S(f,1) =  0.04*y0 - 1.0e4*y1*y2 - 3.0e7*y1*y1;
  if(dae_form_) {
    NV_Ith_S(f,2) = y0 + y1 + y2 - 1.0;
  } else {
    NV_Ith_S(f,2) = 3.0e7*y1*y1;
  }
  return 0;
}

int RobertsonProblem::GetJacobian(const double x,
                                  N_Vector y,
                                  N_Vector fy,
                                  SparseMatrix *jacobian)
{
  const double y0 = NV_Ith_S(y,0);
  const double y1 = NV_Ith_S(y,1);
  const double y2 = NV_Ith_S(y,2);
  int flag = 0;
  flag += jacobian->Put(0, 0, -0.04);
  flag += jacobian->Put(0, 1, 1.0e4*y2);
  flag += jacobian->Put(0, 2, 1.0e4*y1);
  flag += jacobian->Put(1, 0, 0.04);
  flag += jacobian->Put(1, 1, -1.0e4*y2 - 6.0e7*y1);
  flag += jacobian->Put(1, 2, -1.0e4*y1);
  if(dae_form_) {
    flag += jacobian->Put(2, 0, 1.0);
    flag += jacobian->Put(2, 1, 1.0);
    flag += jacobian->Put(2, 2, 1.0);
  } else {
    flag += jacobian->Put(2, 1, 6.0e7*y1);
  }
  return flag;
}

int RobertsonProblem::GetMassMatrix(SparseMatrix *mass)
{
  if(!dae_form_) {
    return -1;
  }
  // algebraic conservation row
  int flag = 0;
  flag += mass->Put(0, 0, 1.0);
  flag += mass->Put(1, 1, 1.0);
  return flag;
}

void RobertsonProblem::GetInitialState(N_Vector y) const
{
  NV_Ith_S(y,0) = 1.0;
  NV_Ith_S(y,1) = 0.0;
  NV_Ith_S(y,2) = 0.0;
}

BrusselatorProblem::BrusselatorProblem(const int grid_size,
                                       const double alpha)
  : grid_size_(grid_size),
    alpha_(alpha)
{}

// periodic wrap of the grid indexes
int BrusselatorProblem::Index(const int i, const int j) const
{
  const int n = grid_size_;
  const int ip = ((i % n) + n) % n;
  const int jp = ((j % n) + n) % n;
  return 2*(ip*n + jp);
}

double BrusselatorProblem::coupling() const
{
  return alpha_*grid_size_*grid_size_;
}

int BrusselatorProblem::GetDerivative(const double x, N_Vector y, N_Vector f)
{
  const int n = grid_size_;
  const double c = coupling();
  const double *y_data = NV_DATA_S(y);
  double *f_data = NV_DATA_S(f);

  for(int i=0; i<n; ++i) {
    for(int j=0; j<n; ++j) {
      const int k = Index(i,j);
      const int east = Index(i+1,j);
      const int west = Index(i-1,j);
      const int north = Index(i,j+1);
      const int south = Index(i,j-1);
      const double u = y_data[k];
      const double v = y_data[k+1];
      const double lap_u = y_data[east] + y_data[west] + y_data[north] +
        y_data[south] - 4.0*u;
      const double lap_v = y_data[east+1] + y_data[west+1] +
        y_data[north+1] + y_data[south+1] - 4.0*v;
      f_data[k]   = 1.0 + u*u*v - 4.4*u + c*lap_u;
      f_data[k+1] = 3.4*u - u*u*v + c*lap_v;
    }
  }
  return 0;
}

int BrusselatorProblem::GetJacobian(const double x,
                                    N_Vector y,
                                    N_Vector fy,
                                    SparseMatrix *jacobian)
{
  const int n = grid_size_;
  const double c = coupling();
  const double *y_data = NV_DATA_S(y);
  int flag = 0;

  for(int i=0; i<n; ++i) {
    for(int j=0; j<n; ++j) {
      const int k = Index(i,j);
      const int neighbors[4] = {Index(i+1,j), Index(i-1,j),
                                Index(i,j+1), Index(i,j-1)};
      const double u = y_data[k];
      const double v = y_data[k+1];

      flag += jacobian->Put(k,   k,   2.0*u*v - 4.4 - 4.0*c);
      flag += jacobian->Put(k,   k+1, u*u);
      flag += jacobian->Put(k+1, k,   3.4 - 2.0*u*v);
      flag += jacobian->Put(k+1, k+1, -u*u - 4.0*c);
      for(int m=0; m<4; ++m) {
        flag += jacobian->Put(k,   neighbors[m],   c);
        flag += jacobian->Put(k+1, neighbors[m]+1, c);
      }
    }
  }
  return flag;
}

void BrusselatorProblem::GetInitialState(N_Vector y) const
{
  const int n = grid_size_;
  double *y_data = NV_DATA_S(y);
  for(int i=0; i<n; ++i) {
    const double xi = (double)i/(double)n;
    for(int j=0; j<n; ++j) {
      const double yj = (double)j/(double)n;
      const int k = Index(i,j);
      y_data[k]   = 22.0*yj*pow(1.0 - yj, 1.5);
      y_data[k+1] = 27.0*xi*pow(1.0 - xi, 1.5);
    }
  }
}

NanJacobianProblem::NanJacobianProblem(OdeProblem *base, const double x_fail)
  : base_(base),
    x_fail_(x_fail)
{}

int NanJacobianProblem::GetJacobian(const double x,
                                    N_Vector y,
                                    N_Vector fy,
                                    SparseMatrix *jacobian)
{
  const int flag = base_->GetJacobian(x, y, fy, jacobian);
  if(flag != 0) {
    return flag;
  }
  if(x >= x_fail_) {
    return jacobian->Put(0, 0, std::numeric_limits<double>::quiet_NaN());
  }
  return 0;
}

} // namespace samples
} // namespace stiffrk
