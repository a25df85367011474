#ifndef STIFFRK_DENSE_OUTPUT_H_
#define STIFFRK_DENSE_OUTPUT_H_

#include "sundials/sundials_nvector.h"

#include "integrator_status.h"
#include "radau_coefficients.h"

namespace stiffrk
{

// Collocation polynomial of the last accepted step in Newton form
//
//   u(s) = cont0 + s*(cont1 + (s - c2m1)*(cont2 + (s - c1m1)*cont3)),
//   s = (x - x_new)/h,  -1 <= s <= 0,
//
// which interpolates y_prev (s = -1), the two interior stage values and
// y_new (s = 0). The coefficients are replaced on every accepted step.
class DenseOutput
{
 public:
  DenseOutput(const RadauCoefficients &coefficients, N_Vector template_vector);
  ~DenseOutput();

  // z holds the three stage increments Z_k = Y_k - y_prev of the step.
  void Update(const double x_prev,
              const double h,
              N_Vector y_new,
              N_Vector z[3]);

  void Invalidate() {valid_ = false;}
  bool valid() const {return valid_;}

  // STALE_INTERPOLANT if no step was accepted yet or x lies outside
  // [x_prev, x_prev + h].
  IntegratorStatus Evaluate(const double x, N_Vector y_out) const;

  // Extrapolates the stage increments of the next step of size h_new
  // starting at x_new. Returns false (and leaves z untouched) if there is
  // no valid interpolant.
  bool PredictStages(const double h_new, N_Vector z[3]) const;

  double x_prev() const {return x_new_ - h_;}
  double x_new() const {return x_new_;}
  double h() const {return h_;}

 private:
  DenseOutput(const DenseOutput &);
  DenseOutput& operator=(const DenseOutput &);

  void EvaluateScaled(const double s, N_Vector y_out) const;

  const RadauCoefficients &coefficients_;
  N_Vector cont_[4];
  N_Vector work_;
  double x_new_;
  double h_;
  bool valid_;
};

} // namespace stiffrk

#endif
