#ifndef CUSTOM_TEST_MACROS_HPP
#define CUSTOM_TEST_MACROS_HPP
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <Eigen/Dense>
#include <iomanip>
#include <sstream>
#include <vector>


// ====================
// Helper macros
// ====================
template <typename DerivedA, typename DerivedB>
::testing::AssertionResult AssertMatricesNear(
    const Eigen::MatrixBase<DerivedA>& A_in,
    const Eigen::MatrixBase<DerivedB>& B_in,
    double tol,
    int precision = 4)
{
    // Vectors compare as n x 1 matrices
    const Eigen::MatrixXd A = A_in.template cast<double>();
    const Eigen::MatrixXd B = B_in.template cast<double>();

    if (A.rows() != B.rows() || A.cols() != B.cols()) {
        std::ostringstream oss;
        oss << "Size mismatch: Actual is " << A.rows() << "x" << A.cols()
            << ", Expected is " << B.rows() << "x" << B.cols();
        return ::testing::AssertionFailure() << oss.str();
    }

    const double maxErr = A.size() ? (A - B).cwiseAbs().maxCoeff() : 0.0;

    if (maxErr <= tol) {
        return ::testing::AssertionSuccess();
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision);
    oss << "Max error: " << maxErr << " (tol = " << tol << ")\n\n";
    oss << "Actual:\n" << A << "\n\n";
    oss << "Expected:\n" << B << "\n\n";

    return ::testing::AssertionFailure() << oss.str();
}

#define EXPECT_MATRIX_NEAR(A, B, tol) \
    EXPECT_TRUE(AssertMatricesNear((A), (B), (tol)))

#define ASSERT_MATRIX_NEAR(A, B, tol) \
    ASSERT_TRUE(AssertMatricesNear((A), (B), (tol)))

// Same elements, same shape
#define EXPECT_MATRIX_EQ(A, B) \
    EXPECT_TRUE(AssertMatricesNear((A), (B), 0.0))


// Ordered (name, value) lists, e.g. AffineSystem::dynamicsTerms()
template <typename Term>
::testing::AssertionResult AssertTermsNear(
    const std::vector<Term>& actual,
    const std::vector<Term>& expected,
    double tol)
{
    if (actual.size() != expected.size()) {
        return ::testing::AssertionFailure()
            << "Term count mismatch: Actual has " << actual.size() << ", Expected has " << expected.size();
    }

    for (std::size_t i = 0; i < actual.size(); ++i) {
        if (actual[i].name != expected[i].name) {
            return ::testing::AssertionFailure()
                << "Term " << i << ": Actual is " << actual[i].name << ", Expected is " << expected[i].name;
        }

        auto result = AssertMatricesNear(actual[i].value, expected[i].value, tol);
        if (!result) {
            return ::testing::AssertionFailure() << "Term " << actual[i].name << "\n" << result.message();
        }
    }

    return ::testing::AssertionSuccess();
}

#define EXPECT_TERMS_NEAR(actual, expected, tol) \
    EXPECT_TRUE(AssertTermsNear((actual), (expected), (tol)))

#define EXPECT_TERMS_EQ(actual, expected) \
    EXPECT_TRUE(AssertTermsNear((actual), (expected), 0.0))


#endif // CUSTOM_TEST_MACROS_HPP
