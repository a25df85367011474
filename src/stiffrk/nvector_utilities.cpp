#include <math.h>

#include <cmath>

#include "nvector_utilities.h"

namespace stiffrk
{

NVectorContext::NVectorContext()
{
  valid_ = true;
#if SUNDIALS_VERSION_MAJOR >= 7
  if(SUNContext_Create(SUN_COMM_NULL, &sun_context_) != 0) {
    valid_ = false;
  }
#elif SUNDIALS_VERSION_MAJOR == 6
  if(SUNContext_Create(NULL, &sun_context_) != 0) {
    valid_ = false;
  }
#endif
}

NVectorContext::~NVectorContext()
{
#if SUNDIALS_VERSION_MAJOR >= 6
  if(valid_) {
    SUNContext_Free(&sun_context_);
  }
#endif
}

N_Vector NVectorContext::NewVector(const int length) const
{
  if(!valid_ || length <= 0) {
    return NULL;
  }
#if SUNDIALS_VERSION_MAJOR >= 6
  return N_VNew_Serial(length, sun_context_);
#else
  return N_VNew_Serial(length);
#endif
}

N_Vector NVectorContext::MakeVector(const int length, double *data) const
{
  if(!valid_ || length <= 0 || data == NULL) {
    return NULL;
  }
#if SUNDIALS_VERSION_MAJOR >= 6
  return N_VMake_Serial(length, data, sun_context_);
#else
  return N_VMake_Serial(length, data);
#endif
}

N_Vector NewZeroVector(N_Vector template_vector)
{
  N_Vector v = N_VClone(template_vector);
  if(v != NULL) {
    N_VConst(0.0, v);
  }
  return v;
}

bool NVectorIsFinite(N_Vector v)
{
  const int n = NV_LENGTH_S(v);
  const double *v_data = NV_DATA_S(v);
  for(int j=0; j<n; ++j) {
    if(!std::isfinite(v_data[j])) {
      return false;
    }
  }
  return true;
}

void NVectorToStdVector(N_Vector v, std::vector<double> *values)
{
  const int n = NV_LENGTH_S(v);
  const double *v_data = NV_DATA_S(v);
  values->assign(v_data, v_data+n);
}

void StdVectorToNVector(const std::vector<double> &values, N_Vector v)
{
  const int n = NV_LENGTH_S(v);
  double *v_data = NV_DATA_S(v);
  for(int j=0; j<n && j<(int)values.size(); ++j) {
    v_data[j] = values[j];
  }
}

} // namespace stiffrk
