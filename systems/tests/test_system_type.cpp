#include "system_type.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <vector>


using namespace ::testing;
using namespace affine;


// ====================
// Test fixture
// ====================

class SystemTypeTest : public ::testing::Test {
 protected:
    void SetUp() override {
        for (auto shape : {TermShape::A, TermShape::AB, TermShape::Ac, TermShape::ABc}) {
            for (bool constrained : {false, true}) {
                continuous_types_.push_back({Domain::Continuous, shape, constrained});
            }
        }
        continuous_types_.push_back({Domain::Continuous, TermShape::ABD, true});
    }

    std::vector<SystemType> continuous_types_;
};



// ====================
// Test complementaryType
// ====================

TEST_F(SystemTypeTest, Complementary_FlipsDomainOnly) {
    for (const auto& type : continuous_types_) {
        SystemType discrete = complementaryType(type);
        EXPECT_EQ(discrete.domain, Domain::Discrete);
        EXPECT_EQ(discrete.shape, type.shape);
        EXPECT_EQ(discrete.constrained, type.constrained);
    }
}

TEST_F(SystemTypeTest, Complementary_RoundTrip) {
    for (const auto& type : continuous_types_) {
        EXPECT_EQ(complementaryType(complementaryType(type)), type);

        const std::string name = typeName(type);
        EXPECT_EQ(complementaryTypeName(complementaryTypeName(name)), name);
    }
}

TEST(SystemTypeResolverTest, Complementary_InvalidDomain) {
    SystemType type{static_cast<Domain>(7), TermShape::AB, false};

    EXPECT_THROW(complementaryType(type), InvalidSystemClass);
    EXPECT_THROW(typeName(type), InvalidSystemClass);
}



// ====================
// Test name registry
// ====================

TEST(SystemTypeResolverTest, Names_Known) {
    EXPECT_EQ(typeName({Domain::Continuous, TermShape::A, false}), "LinearContinuousSystem");
    EXPECT_EQ(typeName({Domain::Discrete, TermShape::AB, false}), "LinearControlDiscreteSystem");
    EXPECT_EQ(typeName({Domain::Continuous, TermShape::Ac, true}), "ConstrainedAffineContinuousSystem");
    EXPECT_EQ(typeName({Domain::Discrete, TermShape::ABD, true}), "NoisyConstrainedLinearControlDiscreteSystem");

    EXPECT_EQ(complementaryTypeName("AffineControlContinuousSystem"), "AffineControlDiscreteSystem");
    EXPECT_EQ(complementaryTypeName("ConstrainedLinearDiscreteSystem"), "ConstrainedLinearContinuousSystem");
}

TEST_F(SystemTypeTest, Names_RoundTrip) {
    for (const auto& type : continuous_types_) {
        EXPECT_EQ(typeFromName(typeName(type)), type);

        const SystemType discrete = complementaryType(type);
        EXPECT_EQ(typeFromName(typeName(discrete)), discrete);
    }
}

TEST(SystemTypeResolverTest, Names_Unknown) {
    EXPECT_THROW(typeFromName("LinearSystem"), InvalidSystemClass);
    EXPECT_THROW(typeFromName("BlackBoxContinuousSystem"), InvalidSystemClass);
    EXPECT_THROW(complementaryTypeName(""), InvalidSystemClass);

    // Noisy variants exist only with sets
    EXPECT_THROW(typeName({Domain::Continuous, TermShape::ABD, false}), InvalidSystemClass);
}

TEST(SystemTypeResolverTest, TermShape_Presence) {
    EXPECT_FALSE(hasB(TermShape::A));
    EXPECT_TRUE(hasB(TermShape::AB));
    EXPECT_FALSE(hasC(TermShape::AB));
    EXPECT_TRUE(hasC(TermShape::Ac));
    EXPECT_TRUE(hasC(TermShape::ABc));
    EXPECT_FALSE(hasD(TermShape::ABc));
    EXPECT_TRUE(hasD(TermShape::ABD));
    EXPECT_FALSE(hasC(TermShape::ABD));

    EXPECT_EQ(toString(TermShape::ABc), "ABc");
    EXPECT_EQ(toString(Domain::Discrete), "Discrete");
}
