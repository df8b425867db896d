#include "discretization.hpp"

#include <cmath>
#include <iostream>
#include <utility>
#include <vector>


namespace affine {


namespace {

bool isKnown(DiscretizationAlgorithm algorithm) {
    return algorithm == DiscretizationAlgorithm::Default
        || algorithm == DiscretizationAlgorithm::Exact
        || algorithm == DiscretizationAlgorithm::Euler;
}


void checkTimeStep(double dt) {
    if (!std::isfinite(dt) || dt < 0.0) {
        std::string err_msg = "Ts (" + std::to_string(dt) + ") must be a finite non-negative value";
        throw std::invalid_argument(err_msg);
    }
}


void checkTermDimensions(const AffineTerms& terms, TermShape shape) {
    const auto n = terms.A.rows();

    if (terms.A.cols() != n) {
        std::string err_msg = "A must be square: (" + std::to_string(terms.A.rows()) + ", " + std::to_string(terms.A.cols()) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (hasB(shape) && terms.B.rows() != n) {
        std::string err_msg = "B row dimension (" + std::to_string(terms.B.rows()) + ") must match A row dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (hasC(shape) && terms.c.size() != n) {
        std::string err_msg = "c dimension (" + std::to_string(terms.c.size()) + ") must match A row dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (hasD(shape) && terms.D.rows() != n) {
        std::string err_msg = "D row dimension (" + std::to_string(terms.D.rows()) + ") must match A row dimension (" + std::to_string(n) + ")";
        throw ShapeMismatch(err_msg);
    }
}


AffineTerms toAffineTerms(const std::vector<DynamicsTerm>& dynamics) {
    AffineTerms terms;
    for (const auto& term : dynamics) {
        if (term.name == "A") {
            terms.A = term.value;
        } else if (term.name == "B") {
            terms.B = term.value;
        } else if (term.name == "c") {
            terms.c = term.value.col(0);
        } else if (term.name == "D") {
            terms.D = term.value;
        } else {
            throw std::invalid_argument("Unknown dynamics term " + term.name);
        }
    }
    return terms;
}


std::vector<DynamicsTerm> toDynamicsTerms(const AffineTerms& terms, TermShape shape) {
    std::vector<DynamicsTerm> dynamics{{"A", terms.A}};
    if (hasB(shape)) {
        dynamics.push_back({"B", terms.B});
    }
    if (hasC(shape)) {
        dynamics.push_back({"c", terms.c});
    }
    if (hasD(shape)) {
        dynamics.push_back({"D", terms.D});
    }
    return dynamics;
}


// Rank test and inversion share this decomposition, so both agree on invertibility
Eigen::FullPivLU<Eigen::MatrixXd> decompose(const Eigen::MatrixXd& A, double rank_threshold) {
    Eigen::FullPivLU<Eigen::MatrixXd> lu(A);
    if (rank_threshold > 0.0) {
        lu.setThreshold(rank_threshold);
    }
    return lu;
}


int computeRank(const Eigen::MatrixXd& A, double rank_threshold) {
    if (A.size() == 0) {
        return 0;
    }
    return static_cast<int>(decompose(A, rank_threshold).rank());
}

}  // namespace


DiscretizationAlgorithm parseAlgorithm(const std::string& algorithm) {
    if (algorithm == "default") {
        return DiscretizationAlgorithm::Default;
    } else if (algorithm == "exact") {
        return DiscretizationAlgorithm::Exact;
    } else if (algorithm == "euler") {
        return DiscretizationAlgorithm::Euler;
    }
    throw UnknownAlgorithm(algorithm);
}


std::string toString(DiscretizationAlgorithm algorithm) {
    switch (algorithm) {
        case DiscretizationAlgorithm::Default:
            return "default";
        case DiscretizationAlgorithm::Exact:
            return "exact";
        case DiscretizationAlgorithm::Euler:
            return "euler";
    }
    throw UnknownAlgorithm(std::to_string(static_cast<int>(algorithm)));
}


DiscretizationAlgorithm selectAlgorithm(const Eigen::MatrixXd& A, double rank_threshold) {
    if (A.rows() != A.cols()) {
        std::string err_msg = "A must be square: (" + std::to_string(A.rows()) + ", " + std::to_string(A.cols()) + ")";
        throw ShapeMismatch(err_msg);
    }

    if (computeRank(A, rank_threshold) == A.rows()) {
        // A is invertible
        return DiscretizationAlgorithm::Exact;
    }
    return DiscretizationAlgorithm::Euler;
}


AffineTerms discretizeKernel(const AffineTerms& full, double dt, DiscretizationAlgorithm algorithm, double rank_threshold) {
    if (algorithm != DiscretizationAlgorithm::Exact && algorithm != DiscretizationAlgorithm::Euler) {
        throw UnknownAlgorithm(isKnown(algorithm) ? toString(algorithm) : std::to_string(static_cast<int>(algorithm)));
    }
    checkTimeStep(dt);
    checkTermDimensions(full, TermShape::ABc);
    checkTermDimensions(full, TermShape::ABD);

    const auto n = full.A.rows();
    const Eigen::MatrixXd I = Eigen::MatrixXd::Identity(n, n);

    AffineTerms discrete;

    if (algorithm == DiscretizationAlgorithm::Exact) {
        Eigen::MatrixXd M = Eigen::MatrixXd::Zero(n, n);
        discrete.A = I;

        if (n > 0) {
            const auto lu = decompose(full.A, rank_threshold);
            if (!lu.isInvertible()) {
                std::string err_msg = "Exact discretization requires an invertible A: rank " + std::to_string(lu.rank()) + " < " + std::to_string(n);
                throw SingularMatrix(err_msg);
            }

            discrete.A = (full.A * dt).exp();
            M = lu.solve(discrete.A - I);
        }

        discrete.B = M * full.B;
        discrete.c = M * full.c;
        discrete.D = M * full.D;
    } else {
        discrete.A = I + dt * full.A;
        discrete.B = dt * full.B;
        discrete.c = dt * full.c;
        discrete.D = dt * full.D;
    }

    return discrete;
}


AffineTerms discretizeTerms(
    const AffineTerms& terms,
    TermShape shape,
    double dt,
    DiscretizationAlgorithm algorithm,
    double rank_threshold
) {
    checkTermDimensions(terms, shape);

    const auto n = terms.A.rows();

    AffineTerms full;
    full.A = terms.A;
    if (hasB(shape)) {
        full.B = terms.B;
    } else {
        full.B = Eigen::MatrixXd::Zero(n, 0);
    }
    if (hasC(shape)) {
        full.c = terms.c;
    } else {
        full.c = Eigen::VectorXd::Zero(n);
    }
    if (hasD(shape)) {
        full.D = terms.D;
    } else {
        full.D = Eigen::MatrixXd::Zero(n, 0);
    }

    AffineTerms discrete = discretizeKernel(full, dt, algorithm, rank_threshold);

    if (!hasB(shape)) {
        discrete.B.resize(0, 0);
    }
    if (!hasC(shape)) {
        discrete.c.resize(0);
    }
    if (!hasD(shape)) {
        discrete.D.resize(0, 0);
    }

    return discrete;
}


namespace {

AffineSystem discretizeSystem(
    const AffineSystem& system,
    double dt,
    DiscretizationAlgorithm algorithm,
    double rank_threshold,
    bool debug
) {
    if (!system.isContinuous()) {
        throw InvalidSystemClass(system.name() + " is not a continuous system");
    }
    if (!isKnown(algorithm)) {
        throw UnknownAlgorithm(std::to_string(static_cast<int>(algorithm)));
    }
    checkTimeStep(dt);

    const auto dynamics = system.dynamicsTerms();
    const auto structural = system.structuralFields();

    if (debug) {
        std::cout << "Discretize " << system.name() << " with Ts = " << dt << std::endl;
    }

    if (algorithm == DiscretizationAlgorithm::Default) {
        algorithm = selectAlgorithm(system.A(), rank_threshold);
        if (debug) {
            std::cout << "Selected " << toString(algorithm) << " discretization" << std::endl;
        }
    }

    const TermShape shape = system.type().shape;
    const AffineTerms discrete = discretizeTerms(toAffineTerms(dynamics), shape, dt, algorithm, rank_threshold);

    const SystemType discrete_type = complementaryType(system.type());

    if (debug) {
        std::cout << "Discrete system: " << typeName(discrete_type) << std::endl;
    }

    return AffineSystem(discrete_type, toDynamicsTerms(discrete, shape), structural);
}

}  // namespace


AffineSystem discretize(const AffineSystem& system, double dt, DiscretizationAlgorithm algorithm) {
    return discretizeSystem(system, dt, algorithm, 0.0, false);
}


AffineSystem discretize(const AffineSystem& system, double dt, const std::string& algorithm) {
    return discretizeSystem(system, dt, parseAlgorithm(algorithm), 0.0, false);
}


AffineSystem discretize(const AffineSystem& system, const DiscretizationData& data) {
    return discretizeSystem(system, data.Ts, parseAlgorithm(data.algorithm), data.rank_threshold, data.debug);
}


}  // namespace affine
