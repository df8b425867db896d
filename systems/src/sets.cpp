#include "sets.hpp"

#include <string>


namespace affine {


namespace {

void checkMembershipDims(const ISet& set, const Eigen::VectorXd& x) {
    if (x.size() != set.dim()) {
        std::string err_msg = "Point dimension (" + std::to_string(x.size()) + ") must match set dimension (" + std::to_string(set.dim()) + ")";
        throw ShapeMismatch(err_msg);
    }
}

}  // namespace


Hyperrectangle::Hyperrectangle(const Eigen::VectorXd& low, const Eigen::VectorXd& high)
    : low_{low},
      high_{high} {

    if (low_.size() != high_.size()) {
        std::string err_msg = "low dimension (" + std::to_string(low_.size()) + ") must match high dimension (" + std::to_string(high_.size()) + ")";
        throw std::invalid_argument(err_msg);
    }

    if ((low_.array() > high_.array()).any()) {
        throw std::invalid_argument("low must be less than or equal to high in every coordinate");
    }
}


bool Hyperrectangle::contains(const Eigen::VectorXd& x) const {
    checkMembershipDims(*this, x);
    return (x.array() >= low_.array()).all() && (x.array() <= high_.array()).all();
}


Universe::Universe(int dim) : dim_{dim} {
    if (dim_ < 0) {
        throw std::invalid_argument("Universe dimension (" + std::to_string(dim_) + ") must be non-negative");
    }
}


bool Universe::contains(const Eigen::VectorXd& x) const {
    checkMembershipDims(*this, x);
    return true;
}


bool Singleton::contains(const Eigen::VectorXd& x) const {
    checkMembershipDims(*this, x);
    return x == element_;
}


}  // namespace affine
