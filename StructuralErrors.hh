////////////////////////////////////////////////////////////////////////////////
// StructuralErrors.hh
////////////////////////////////////////////////////////////////////////////////
/*! @file
//  Exception types raised by the optimizer and the structural solver.
*/
////////////////////////////////////////////////////////////////////////////////
#ifndef STRUCTURALERRORS_HH
#define STRUCTURALERRORS_HH

#include <stdexcept>
#include <string>

// Non-positive or inconsistent section/grid dimensions.
struct InvalidGeometryError : public std::runtime_error {
    InvalidGeometryError(const std::string &msg) : std::runtime_error(msg) { }
};

// The solver could not produce an equilibrium for the current topology
// (singular or non-positive-definite stiffness matrix).
struct SolverInstabilityError : public std::runtime_error {
    SolverInstabilityError(const std::string &msg) : std::runtime_error(msg) { }
};

#endif /* end of include guard: STRUCTURALERRORS_HH */
