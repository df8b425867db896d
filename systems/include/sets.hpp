#ifndef SETS_HPP
#define SETS_HPP

#include <Eigen/Dense>

#include "errors.hpp"


namespace affine {


/// @brief Geometric set attached to a system (state-set X, input-set U, noise-set W)
struct ISet {
    virtual ~ISet() = default;

    virtual int dim() const = 0;

    // Throws ShapeMismatch if x.size() != dim()
    virtual bool contains(const Eigen::VectorXd& x) const = 0;
};


class Hyperrectangle : public ISet {
  public:
    Hyperrectangle(const Eigen::VectorXd& low, const Eigen::VectorXd& high);

    int dim() const override { return static_cast<int>(low_.size()); };

    bool contains(const Eigen::VectorXd& x) const override;

    Eigen::VectorXd low() const { return low_; };
    Eigen::VectorXd high() const { return high_; };
    Eigen::VectorXd center() const { return 0.5 * (low_ + high_); };

  private:
    /// @brief Lower bound of each coordinate
    Eigen::VectorXd low_{};

    /// @brief Upper bound of each coordinate
    Eigen::VectorXd high_{};
};


class Universe : public ISet {
  public:
    explicit Universe(int dim);

    int dim() const override { return dim_; };

    bool contains(const Eigen::VectorXd& x) const override;

  private:
    int dim_{};
};


class Singleton : public ISet {
  public:
    explicit Singleton(const Eigen::VectorXd& element) : element_{element} {}

    int dim() const override { return static_cast<int>(element_.size()); };

    bool contains(const Eigen::VectorXd& x) const override;

    Eigen::VectorXd element() const { return element_; };

  private:
    Eigen::VectorXd element_{};
};


}  // namespace affine


#endif  // SETS_HPP
