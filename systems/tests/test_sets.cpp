#include "sets.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <Eigen/Dense>


using namespace ::testing;
using namespace affine;


TEST(SetsTest, Hyperrectangle_Contains) {
    Hyperrectangle box((Eigen::VectorXd(2) << -1, 0).finished(), (Eigen::VectorXd(2) << 1, 2).finished());

    EXPECT_EQ(box.dim(), 2);
    EXPECT_TRUE(box.contains((Eigen::VectorXd(2) << 0, 1).finished()));
    EXPECT_TRUE(box.contains((Eigen::VectorXd(2) << 1, 2).finished()));
    EXPECT_FALSE(box.contains((Eigen::VectorXd(2) << 0, 3).finished()));
    EXPECT_EQ(box.center(), (Eigen::VectorXd(2) << 0, 1).finished());
}

TEST(SetsTest, Hyperrectangle_Invalid) {
    EXPECT_THROW(Hyperrectangle(Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(3)), std::invalid_argument);
    EXPECT_THROW(Hyperrectangle(Eigen::VectorXd::Ones(2), Eigen::VectorXd::Zero(2)), std::invalid_argument);

    Hyperrectangle box(Eigen::VectorXd::Zero(2), Eigen::VectorXd::Ones(2));
    EXPECT_THROW(box.contains(Eigen::VectorXd::Zero(3)), ShapeMismatch);
}

TEST(SetsTest, Universe_Contains) {
    Universe universe(3);

    EXPECT_EQ(universe.dim(), 3);
    EXPECT_TRUE(universe.contains(Eigen::VectorXd::Constant(3, 1e12)));
    EXPECT_THROW(universe.contains(Eigen::VectorXd::Zero(2)), ShapeMismatch);
    EXPECT_THROW(Universe(-1), std::invalid_argument);
}

TEST(SetsTest, Singleton_Contains) {
    Singleton point((Eigen::VectorXd(1) << 0.5).finished());

    EXPECT_EQ(point.dim(), 1);
    EXPECT_TRUE(point.contains((Eigen::VectorXd(1) << 0.5).finished()));
    EXPECT_FALSE(point.contains((Eigen::VectorXd(1) << 0.25).finished()));
}
