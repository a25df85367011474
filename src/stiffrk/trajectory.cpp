#include "nvector/nvector_serial.h"

#include "trajectory.h"

namespace stiffrk
{

void Trajectory::Clear(const int num_states)
{
  num_states_ = num_states;
  step_x_.clear();
  step_h_.clear();
  step_y_.clear();
  dense_x_.clear();
  dense_y_.clear();
}

void Trajectory::AddStep(const double x, const double h, N_Vector y)
{
  const double *y_data = NV_DATA_S(y);
  step_x_.push_back(x);
  step_h_.push_back(h);
  step_y_.insert(step_y_.end(), y_data, y_data + num_states_);
}

void Trajectory::AddDensePoint(const double x, N_Vector y)
{
  const double *y_data = NV_DATA_S(y);
  dense_x_.push_back(x);
  dense_y_.insert(dense_y_.end(), y_data, y_data + num_states_);
}

// Exact comparison, used to check that repeated runs are reproducible.
bool Trajectory::operator==(const Trajectory &other) const
{
  return (num_states_ == other.num_states_ &&
          step_x_ == other.step_x_ &&
          step_h_ == other.step_h_ &&
          step_y_ == other.step_y_ &&
          dense_x_ == other.dense_x_ &&
          dense_y_ == other.dense_y_);
}

} // namespace stiffrk
