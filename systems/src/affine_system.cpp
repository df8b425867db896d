#include "affine_system.hpp"

#include <stdexcept>
#include <utility>


namespace affine {


std::vector<std::string> dynamicsTermNames(TermShape shape) {
    std::vector<std::string> names{"A"};
    if (hasB(shape)) {
        names.emplace_back("B");
    }
    if (hasC(shape)) {
        names.emplace_back("c");
    }
    if (hasD(shape)) {
        names.emplace_back("D");
    }
    return names;
}


std::vector<std::string> structuralFieldNames(TermShape shape, bool constrained) {
    if (!constrained) {
        return {};
    }

    std::vector<std::string> names{"X"};
    if (hasB(shape)) {
        names.emplace_back("U");
    }
    if (hasD(shape)) {
        names.emplace_back("W");
    }
    return names;
}


AffineSystem::AffineSystem(const SystemType& type, std::vector<DynamicsTerm> terms, std::vector<StructuralField> fields)
    : type_{type} {

    // Rejects unknown domains and unregistered variants
    const std::string name = typeName(type_);

    const auto term_names = dynamicsTermNames(type_.shape);
    if (terms.size() != term_names.size()) {
        std::string err_msg = name + " expects " + std::to_string(term_names.size()) + " dynamics terms, got " + std::to_string(terms.size());
        throw std::invalid_argument(err_msg);
    }

    const auto field_names = structuralFieldNames(type_.shape, type_.constrained);
    if (fields.size() != field_names.size()) {
        std::string err_msg = name + " expects " + std::to_string(field_names.size()) + " sets, got " + std::to_string(fields.size());
        throw std::invalid_argument(err_msg);
    }

    for (std::size_t i = 0; i < terms.size(); ++i) {
        if (terms[i].name != term_names[i]) {
            throw std::invalid_argument(name + ": expected term " + term_names[i] + " at position " + std::to_string(i) + ", got " + terms[i].name);
        }

        auto& value = terms[i].value;
        if (term_names[i] == "A") {
            A_ = std::move(value);
        } else if (term_names[i] == "B") {
            B_ = std::move(value);
        } else if (term_names[i] == "c") {
            if (value.cols() != 1) {
                std::string err_msg = "c must be a column vector, got (" + std::to_string(value.rows()) + ", " + std::to_string(value.cols()) + ")";
                throw ShapeMismatch(err_msg);
            }
            c_ = value.col(0);
        } else {
            D_ = std::move(value);
        }
    }

    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (fields[i].name != field_names[i]) {
            throw std::invalid_argument(name + ": expected set " + field_names[i] + " at position " + std::to_string(i) + ", got " + fields[i].name);
        }
        if (!fields[i].set) {
            throw std::invalid_argument(name + ": set " + field_names[i] + " is null");
        }

        if (field_names[i] == "X") {
            X_ = std::move(fields[i].set);
        } else if (field_names[i] == "U") {
            U_ = std::move(fields[i].set);
        } else {
            W_ = std::move(fields[i].set);
        }
    }

    // Absent input/noise matrices keep zero columns so inputDim()/noiseDim() are 0
    if (!hasB()) {
        B_.resize(A_.rows(), 0);
    }
    if (!hasD()) {
        D_.resize(A_.rows(), 0);
    }

    this->checkDimensions();
}


void AffineSystem::checkDimensions() const {
    const auto n = A_.rows();

    if (A_.cols() != n) {
        std::string err_msg = "A must be square: (" + std::to_string(A_.rows()) + ", " + std::to_string(A_.cols()) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (hasB() && B_.rows() != n) {
        std::string err_msg = "B row dimension (" + std::to_string(B_.rows()) + ") must match A row dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (hasC() && c_.size() != n) {
        std::string err_msg = "c dimension (" + std::to_string(c_.size()) + ") must match A row dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (hasD() && D_.rows() != n) {
        std::string err_msg = "D row dimension (" + std::to_string(D_.rows()) + ") must match A row dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (X_ && X_->dim() != n) {
        std::string err_msg = "X dimension (" + std::to_string(X_->dim()) + ") must match state dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (U_ && U_->dim() != B_.cols()) {
        std::string err_msg = "U dimension (" + std::to_string(U_->dim()) + ") must match input dimension (" + std::to_string(B_.cols()) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (W_ && W_->dim() != D_.cols()) {
        std::string err_msg = "W dimension (" + std::to_string(W_->dim()) + ") must match noise dimension (" + std::to_string(D_.cols()) + ")";
        throw ShapeMismatch(err_msg);
    }
}


const Eigen::MatrixXd& AffineSystem::B() const {
    if (!hasB()) {
        throw std::logic_error(name() + " has no input matrix B");
    }
    return B_;
}


const Eigen::VectorXd& AffineSystem::c() const {
    if (!hasC()) {
        throw std::logic_error(name() + " has no affine term c");
    }
    return c_;
}


const Eigen::MatrixXd& AffineSystem::D() const {
    if (!hasD()) {
        throw std::logic_error(name() + " has no noise matrix D");
    }
    return D_;
}


SetPtr AffineSystem::X() const {
    if (!X_) {
        throw std::logic_error(name() + " has no state set X");
    }
    return X_;
}


SetPtr AffineSystem::U() const {
    if (!U_) {
        throw std::logic_error(name() + " has no input set U");
    }
    return U_;
}


SetPtr AffineSystem::W() const {
    if (!W_) {
        throw std::logic_error(name() + " has no noise set W");
    }
    return W_;
}


std::vector<DynamicsTerm> AffineSystem::dynamicsTerms() const {
    std::vector<DynamicsTerm> terms{{"A", A_}};
    if (hasB()) {
        terms.push_back({"B", B_});
    }
    if (hasC()) {
        terms.push_back({"c", c_});
    }
    if (hasD()) {
        terms.push_back({"D", D_});
    }
    return terms;
}


std::vector<StructuralField> AffineSystem::structuralFields() const {
    std::vector<StructuralField> fields;
    if (X_) {
        fields.push_back({"X", X_});
    }
    if (U_) {
        fields.push_back({"U", U_});
    }
    if (W_) {
        fields.push_back({"W", W_});
    }
    return fields;
}


AffineSystem makeLinearSystem(Domain domain, const Eigen::MatrixXd& A) {
    return AffineSystem({domain, TermShape::A, false}, {{"A", A}});
}


AffineSystem makeLinearControlSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::MatrixXd& B) {
    return AffineSystem({domain, TermShape::AB, false}, {{"A", A}, {"B", B}});
}


AffineSystem makeAffineSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::VectorXd& c) {
    return AffineSystem({domain, TermShape::Ac, false}, {{"A", A}, {"c", c}});
}


AffineSystem makeAffineControlSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::MatrixXd& B, const Eigen::VectorXd& c) {
    return AffineSystem({domain, TermShape::ABc, false}, {{"A", A}, {"B", B}, {"c", c}});
}


AffineSystem makeConstrainedLinearSystem(Domain domain, const Eigen::MatrixXd& A, SetPtr X) {
    return AffineSystem({domain, TermShape::A, true}, {{"A", A}}, {{"X", std::move(X)}});
}


AffineSystem makeConstrainedLinearControlSystem(
    Domain domain,
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    SetPtr X,
    SetPtr U
) {
    return AffineSystem({domain, TermShape::AB, true}, {{"A", A}, {"B", B}}, {{"X", std::move(X)}, {"U", std::move(U)}});
}


AffineSystem makeConstrainedAffineSystem(Domain domain, const Eigen::MatrixXd& A, const Eigen::VectorXd& c, SetPtr X) {
    return AffineSystem({domain, TermShape::Ac, true}, {{"A", A}, {"c", c}}, {{"X", std::move(X)}});
}


AffineSystem makeConstrainedAffineControlSystem(
    Domain domain,
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::VectorXd& c,
    SetPtr X,
    SetPtr U
) {
    return AffineSystem(
        {domain, TermShape::ABc, true},
        {{"A", A}, {"B", B}, {"c", c}},
        {{"X", std::move(X)}, {"U", std::move(U)}}
    );
}


AffineSystem makeNoisyLinearControlSystem(
    Domain domain,
    const Eigen::MatrixXd& A,
    const Eigen::MatrixXd& B,
    const Eigen::MatrixXd& D,
    SetPtr X,
    SetPtr U,
    SetPtr W
) {
    return AffineSystem(
        {domain, TermShape::ABD, true},
        {{"A", A}, {"B", B}, {"D", D}},
        {{"X", std::move(X)}, {"U", std::move(U)}, {"W", std::move(W)}}
    );
}


}  // namespace affine
