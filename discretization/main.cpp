#include "discretization.hpp"
#include "inputs.hpp"

#include <iostream>
#include <iomanip>
#include <memory>

#include <Eigen/Dense>


// ────────────────────────────────────────────────────────────────
// Mass-spring-damper with disturbance force
// State:       x = [position, velocity]^T
// Control:     u = force
// Noise:       w = disturbance force
// ────────────────────────────────────────────────────────────────

struct MassSpringDamper {
    double m = 1.0;
    double k = 2.0;
    double b = 3.0;

    Eigen::MatrixXd A() const {
        return Eigen::MatrixXd{
            {0.0, 1.0},
            {-k / m, -b / m}
        };
    }

    Eigen::MatrixXd B() const {
        return Eigen::MatrixXd{
            {0.0},
            {1.0 / m}
        };
    }
};


void printSystem(const affine::AffineSystem& sys) {
    std::cout << sys.name() << std::endl;
    for (const auto& term : sys.dynamicsTerms()) {
        std::cout << term.name << " =\n" << term.value << std::endl;
    }
    for (const auto& field : sys.structuralFields()) {
        std::cout << field.name << ": set of dimension " << field.set->dim() << std::endl;
    }
}


int main() {
    using namespace affine;

    std::cout << std::fixed << std::setprecision(4);
    std::cout << "=== Continuous to discrete: mass-spring-damper ===" << std::endl;

    // ───────────────────────────────────────────────
    // 1. Create continuous system
    // ───────────────────────────────────────────────
    MassSpringDamper msd{};

    auto X = std::make_shared<Hyperrectangle>(Eigen::VectorXd::Constant(2, -10.0), Eigen::VectorXd::Constant(2, 10.0));
    auto U = std::make_shared<Hyperrectangle>(Eigen::VectorXd::Constant(1, -5.0), Eigen::VectorXd::Constant(1, 5.0));
    auto W = std::make_shared<Hyperrectangle>(Eigen::VectorXd::Constant(1, -0.1), Eigen::VectorXd::Constant(1, 0.1));

    AffineSystem sys = makeNoisyLinearControlSystem(Domain::Continuous, msd.A(), msd.B(), msd.B(), X, U, W);
    printSystem(sys);

    // ───────────────────────────────────────────────
    // 2. Discretize
    // ───────────────────────────────────────────────
    DiscretizationData data;
    data.Ts = 0.1;
    data.debug = true;

    AffineSystem sysd = discretize(sys, data);
    printSystem(sysd);

    // ───────────────────────────────────────────────
    // 3. Double integrator: A is singular, euler is selected
    // ───────────────────────────────────────────────
    Eigen::MatrixXd A_di{
        {0.0, 1.0},
        {0.0, 0.0}
    };
    AffineSystem double_integrator = makeLinearControlSystem(Domain::Continuous, A_di, msd.B());
    printSystem(discretize(double_integrator, data));

    // ───────────────────────────────────────────────
    // 4. Step the discrete system with a varying input
    // ───────────────────────────────────────────────
    VaryingInput<Eigen::VectorXd> inputs({
        Eigen::VectorXd::Constant(1, 1.0),
        Eigen::VectorXd::Constant(1, 0.5),
        Eigen::VectorXd::Constant(1, 0.0)
    });

    Eigen::VectorXd x = Eigen::VectorXd::Zero(2);
    Eigen::VectorXd w = Eigen::VectorXd::Zero(1);
    int k = 0;
    for (const auto& u : inputs.nextinput(5)) {
        x = sysd.A() * x + sysd.B() * u + sysd.D() * w;
        std::cout << "k = " << ++k << "  x = " << x.transpose() << std::endl;
    }

    return 0;
}
