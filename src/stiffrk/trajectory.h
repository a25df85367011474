#ifndef STIFFRK_TRAJECTORY_H_
#define STIFFRK_TRAJECTORY_H_

#include <vector>

#include "sundials/sundials_nvector.h"

namespace stiffrk
{

// Solution record of one run: the accepted step points (x, h, y), starting
// with the initial point at h = 0, and separately the dense output points.
// States are stored row by row, state(j)[k] is component k of point j.
class Trajectory
{
 public:
  Trajectory() : num_states_(0) {};
  ~Trajectory() {};

  void Clear(const int num_states);

  void AddStep(const double x, const double h, N_Vector y);
  void AddDensePoint(const double x, N_Vector y);

  int num_states() const {return num_states_;}
  int num_steps() const {return (int)step_x_.size();}
  int num_dense_points() const {return (int)dense_x_.size();}

  double step_x(const int j) const {return step_x_[j];}
  double step_h(const int j) const {return step_h_[j];}
  const double * step_state(const int j) const
  {return &step_y_[j*num_states_];}

  double dense_x(const int j) const {return dense_x_[j];}
  const double * dense_state(const int j) const
  {return &dense_y_[j*num_states_];}

  const std::vector<double>& step_x() const {return step_x_;}
  const std::vector<double>& dense_x() const {return dense_x_;}

  bool operator==(const Trajectory &other) const;

 private:
  int num_states_;
  std::vector<double> step_x_;
  std::vector<double> step_h_;
  std::vector<double> step_y_;
  std::vector<double> dense_x_;
  std::vector<double> dense_y_;
};

} // namespace stiffrk

#endif
