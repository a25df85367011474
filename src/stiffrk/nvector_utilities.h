#ifndef STIFFRK_NVECTOR_UTILITIES_H_
#define STIFFRK_NVECTOR_UTILITIES_H_

#include <vector>

#include "sundials/sundials_config.h"
#include "sundials/sundials_nvector.h"
#include "nvector/nvector_serial.h"

#if SUNDIALS_VERSION_MAJOR >= 6
#include "sundials/sundials_context.h"
#endif

namespace stiffrk
{

// Owns the SUNContext required to create vectors with SUNDIALS 6 and newer.
// With older SUNDIALS releases it only forwards to the context free
// constructors.
class NVectorContext
{
 public:
  NVectorContext();
  ~NVectorContext();

  bool valid() const {return valid_;}

  // Returns NULL on failure.
  N_Vector NewVector(const int length) const;
  N_Vector MakeVector(const int length, double *data) const;

 private:
  NVectorContext(const NVectorContext &);
  NVectorContext& operator=(const NVectorContext &);

#if SUNDIALS_VERSION_MAJOR >= 6
  SUNContext sun_context_;
#endif
  bool valid_;
};

// Clones the template and zeroes the clone.
N_Vector NewZeroVector(N_Vector template_vector);

// Returns true if every element of the serial vector is finite.
bool NVectorIsFinite(N_Vector v);

void NVectorToStdVector(N_Vector v, std::vector<double> *values);
void StdVectorToNVector(const std::vector<double> &values, N_Vector v);

} // namespace stiffrk

#endif
