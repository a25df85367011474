#ifndef STIFFRK_LINEAR_SOLVER_FACTORY_H_
#define STIFFRK_LINEAR_SOLVER_FACTORY_H_

#include <string>

#include "stiffrk/linear_solver_backend.h"
#include "utilities/file_utilities.h"

namespace stiffrk
{

class LinearSolverFactory
{
 public:
  // Returns a new backend for the given name ("dense" or "sparse"), or NULL
  // for an unknown name. The caller owns the returned object. An unknown
  // name is reported to logger when one is given.
  static LinearSolverBackend * Create(const std::string &type,
                                      const utilities::Logger *logger = NULL);
};

} // namespace stiffrk

#endif
