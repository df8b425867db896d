#ifndef DISCRETIZATION_HPP
#define DISCRETIZATION_HPP

#include <string>

#include <Eigen/Dense>
#include <unsupported/Eigen/MatrixFunctions>

#include "affine_system.hpp"
#include "errors.hpp"
#include "system_type.hpp"


namespace affine {


enum class DiscretizationAlgorithm {
    Default,  // exact if A is invertible, euler otherwise
    Exact,
    Euler
};


/// @brief Dynamics terms of x' = Ax + Bu + c + Dw
struct AffineTerms {
    Eigen::MatrixXd A{};
    Eigen::MatrixXd B{};
    Eigen::VectorXd c{};
    Eigen::MatrixXd D{};
};


struct DiscretizationData {
    /// @brief Discretization algorithm: "default", "exact" or "euler"
    std::string algorithm{"default"};

    /// @brief Discretization time step [s]
    double Ts{};

    /// @brief Pivot threshold of the rank test on A. Eigen's default is used if <= 0.
    double rank_threshold{0.0};

    /// @brief Print the selected algorithm and the resulting variant
    bool debug{false};
};


DiscretizationAlgorithm parseAlgorithm(const std::string& algorithm);

std::string toString(DiscretizationAlgorithm algorithm);

/**
 * @brief Exact if rank(A) == rows(A), euler otherwise.
 *
 * The rank is computed with a full pivoting LU. A pivot counts as zero if its
 * magnitude is below rank_threshold * |max pivot|; rank_threshold <= 0 uses
 * Eigen's default (number of rows * machine epsilon).
 */
DiscretizationAlgorithm selectAlgorithm(const Eigen::MatrixXd& A, double rank_threshold = 0.0);

/**
 * @brief Discretize the full set of terms A, B, c, D with time step dt.
 *
 * exact: Ad = exp(A dt), M = A^-1 (Ad - I), Bd = M B, cd = M c, Dd = M D
 * euler: Ad = I + dt A, Bd = dt B, cd = dt c, Dd = dt D
 *
 * Throws UnknownAlgorithm unless algorithm is Exact or Euler, SingularMatrix
 * if Exact is requested on a singular A. A is singular under the same
 * rank_threshold rule as in selectAlgorithm().
 */
AffineTerms discretizeKernel(
    const AffineTerms& full,
    double dt,
    DiscretizationAlgorithm algorithm,
    double rank_threshold = 0.0
);

/**
 * @brief Discretize the terms present in shape.
 *
 * Absent terms are replaced by zero stand-ins for the kernel call and are
 * returned empty.
 */
AffineTerms discretizeTerms(
    const AffineTerms& terms,
    TermShape shape,
    double dt,
    DiscretizationAlgorithm algorithm,
    double rank_threshold = 0.0
);

/**
 * @brief Discrete counterpart of a continuous system.
 *
 * The sets X, U, W are carried over by identity. With DiscretizationAlgorithm::Default
 * the algorithm is picked by selectAlgorithm().
 */
AffineSystem discretize(const AffineSystem& system, double dt, DiscretizationAlgorithm algorithm = DiscretizationAlgorithm::Default);

AffineSystem discretize(const AffineSystem& system, double dt, const std::string& algorithm);

AffineSystem discretize(const AffineSystem& system, const DiscretizationData& data);


}  // namespace affine


#endif  // DISCRETIZATION_HPP
