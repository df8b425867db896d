#ifndef AFFINE_SYSTEM_HPP
#define AFFINE_SYSTEM_HPP

#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "errors.hpp"
#include "sets.hpp"
#include "system_type.hpp"


namespace affine {


using SetPtr = std::shared_ptr<const ISet>;


/// @brief Numeric dynamics parameter of a system (A, B, c or D). c is stored as an n x 1 matrix.
struct DynamicsTerm {
    std::string name;
    Eigen::MatrixXd value;
};


/// @brief Set-valued field of a system (X, U or W)
struct StructuralField {
    std::string name;
    SetPtr set;
};


/// @brief Names of the dynamics terms of a shape, in declared order
std::vector<std::string> dynamicsTermNames(TermShape shape);

/// @brief Names of the structural fields of a variant, in declared order
std::vector<std::string> structuralFieldNames(TermShape shape, bool constrained);


/**
 * @brief Affine system x' = Ax + Bu + c + Dw (continuous) or x+ = Ax + Bu + c + Dw (discrete).
 *
 * Immutable value object. Which of B, c, D are present is fixed by the
 * TermShape of its SystemType; the sets X, U, W are present on constrained
 * variants only.
 */
class AffineSystem {
  public:
    /**
     * @brief Build a system from its terms and sets.
     *
     * @param type Variant identity
     * @param terms Dynamics terms in declared order (A first)
     * @param fields Structural fields in declared order
     */
    AffineSystem(const SystemType& type, std::vector<DynamicsTerm> terms, std::vector<StructuralField> fields = {});

    SystemType type() const { return type_; };
    std::string name() const { return typeName(type_); };
    bool isContinuous() const { return type_.domain == Domain::Continuous; };
    bool isDiscrete() const { return type_.domain == Domain::Discrete; };

    int stateDim() const { return static_cast<int>(A_.rows()); };
    int inputDim() const { return static_cast<int>(B_.cols()); };
    int noiseDim() const { return static_cast<int>(D_.cols()); };

    bool hasB() const { return affine::hasB(type_.shape); };
    bool hasC() const { return affine::hasC(type_.shape); };
    bool hasD() const { return affine::hasD(type_.shape); };
    bool hasSets() const { return type_.constrained; };

    // Getters
    const Eigen::MatrixXd& A() const { return A_; };
    const Eigen::MatrixXd& B() const;
    const Eigen::VectorXd& c() const;
    const Eigen::MatrixXd& D() const;
    SetPtr X() const;
    SetPtr U() const;
    SetPtr W() const;

    std::vector<DynamicsTerm> dynamicsTerms() const;

    std::vector<StructuralField> structuralFields() const;

  private:
    void checkDimensions() const;

    SystemType type_{};

    /// @brief State matrix (n x n)
    Eigen::MatrixXd A_{};

    /// @brief Input matrix (n x m)
    Eigen::MatrixXd B_{};

    /// @brief Affine offset (n)
    Eigen::VectorXd c_{};

    /// @brief Noise matrix (n x p)
    Eigen::MatrixXd D_{};

    SetPtr X_{};
    SetPtr U_{};
    SetPtr W_{};
};


AffineSystem makeLinearSystem(Domain domain, const Eigen::MatrixXd& A);

AffineSystem makeLinearControlSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::MatrixXd& B);

AffineSystem makeAffineSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::VectorXd& c);

AffineSystem makeAffineControlSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::MatrixXd& B, const Eigen::VectorXd& c);

AffineSystem makeConstrainedLinearSystem(Domain domain, const Eigen::MatrixXd& A, SetPtr X);

AffineSystem makeConstrainedLinearControlSystem(
    Domain domain,
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    SetPtr X,
    SetPtr U
);

AffineSystem makeConstrainedAffineSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::VectorXd& c, SetPtr X);

AffineSystem makeConstrainedAffineControlSystem(
    Domain domain,
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::VectorXd& c,
    SetPtr X,
    SetPtr U
);

AffineSystem makeNoisyLinearControlSystem(
    Domain domain,
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& D,
    SetPtr X,
    SetPtr U,
    SetPtr W
);


}  // namespace affine


#endif  // AFFINE_SYSTEM_HPP
