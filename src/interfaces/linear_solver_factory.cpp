#include "linear_solver_factory.h"
#include "lapack_manager/lapack_linear_solver.h"
#include "superlu_manager/superlu_linear_solver.h"

namespace stiffrk
{

LinearSolverBackend * LinearSolverFactory::Create(
    const std::string &type,
    const utilities::Logger *logger)
{
  if(type == "dense") {
    return new LapackLinearSolver();
  } else if(type == "sparse") {
    return new SuperLULinearSolver();
  }
  if(logger != NULL) {
    logger->PrintF("# ERROR: In LinearSolverFactory::Create(...),\n"
                   "#        linear solver type %s not recognized.\n"
                   "#        Valid types are dense and sparse.\n",
                   type.c_str());
  }
  return NULL;
}

} // namespace stiffrk
