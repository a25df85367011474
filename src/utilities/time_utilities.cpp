#ifdef _WIN32
#include <windows.h>
#include <profileapi.h>
#else
#include <sys/time.h>
#include <cstddef>
#endif

#include "time_utilities.h"

namespace stiffrk
{
namespace utilities
{

double GetHighResolutionTime()
{
#ifndef _WIN32
  struct timeval tod;

  gettimeofday(&tod, NULL);
  double time_seconds = (double) tod.tv_sec + ((double) tod.tv_usec / 1000000.0);
#else
  static LARGE_INTEGER frequency;
  if(frequency.QuadPart == 0) {
    QueryPerformanceFrequency(&frequency);
  }

  LARGE_INTEGER counts;
  QueryPerformanceCounter(&counts);

  double time_seconds = ((double)counts.QuadPart) / frequency.QuadPart;
#endif
  return time_seconds;
}

void PhaseTimer::Start()
{
  start_ = GetHighResolutionTime();
  running_ = true;
}

void PhaseTimer::Stop()
{
  if(running_) {
    total_ += GetHighResolutionTime() - start_;
    running_ = false;
  }
}

} // namespace utilities
} // namespace stiffrk
