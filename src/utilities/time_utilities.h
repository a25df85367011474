#ifndef STIFFRK_TIME_UTILITIES_H_
#define STIFFRK_TIME_UTILITIES_H_

namespace stiffrk
{
namespace utilities
{

// Wall clock time in seconds from an arbitrary origin.
double GetHighResolutionTime();

// Accumulates elapsed wall clock time between Start() and Stop() calls.
class PhaseTimer
{
 public:
  PhaseTimer() : start_(0.0), total_(0.0), running_(false) {}
  void Start();
  void Stop();
  void Reset() {total_ = 0.0; running_ = false;}
  double total() const {return total_;}

 private:
  double start_;
  double total_;
  bool running_;
};

} // namespace utilities
} // namespace stiffrk

#endif
