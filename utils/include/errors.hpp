#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>


namespace affine {


/// @brief Requested discretization algorithm is not one of {default, exact, euler}
class UnknownAlgorithm : public std::invalid_argument {
  public:
    explicit UnknownAlgorithm(const std::string& algorithm)
        : std::invalid_argument("Discretization algorithm '" + algorithm + "' is not known") {}
};


/// @brief System variant is neither continuous nor discrete
class InvalidSystemClass : public std::invalid_argument {
  public:
    explicit InvalidSystemClass(const std::string& what) : std::invalid_argument(what) {}
};


/// @brief A dynamics term or set does not fit the state dimension
class ShapeMismatch : public std::invalid_argument {
  public:
    explicit ShapeMismatch(const std::string& what) : std::invalid_argument(what) {}
};


/// @brief Exact discretization requested on a non-invertible state matrix
class SingularMatrix : public std::runtime_error {
  public:
    explicit SingularMatrix(const std::string& what) : std::runtime_error(what) {}
};


}  // namespace affine


#endif  // ERRORS_HPP
