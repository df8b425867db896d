#include "system_type.hpp"

#include <array>


namespace affine {


namespace {

struct RegistryEntry {
    SystemType type;
    const char* name;
};

// Every variant pair differs only in the domain marker.
const std::array<RegistryEntry, 18> kRegistry{{
    {{Domain::Continuous, TermShape::A, false}, "LinearContinuousSystem"},
    {{Domain::Discrete, TermShape::A, false}, "LinearDiscreteSystem"},
    {{Domain::Continuous, TermShape::AB, false}, "LinearControlContinuousSystem"},
    {{Domain::Discrete, TermShape::AB, false}, "LinearControlDiscreteSystem"},
    {{Domain::Continuous, TermShape::Ac, false}, "AffineContinuousSystem"},
    {{Domain::Discrete, TermShape::Ac, false}, "AffineDiscreteSystem"},
    {{Domain::Continuous, TermShape::ABc, false}, "AffineControlContinuousSystem"},
    {{Domain::Discrete, TermShape::ABc, false}, "AffineControlDiscreteSystem"},
    {{Domain::Continuous, TermShape::A, true}, "ConstrainedLinearContinuousSystem"},
    {{Domain::Discrete, TermShape::A, true}, "ConstrainedLinearDiscreteSystem"},
    {{Domain::Continuous, TermShape::AB, true}, "ConstrainedLinearControlContinuousSystem"},
    {{Domain::Discrete, TermShape::AB, true}, "ConstrainedLinearControlDiscreteSystem"},
    {{Domain::Continuous, TermShape::Ac, true}, "ConstrainedAffineContinuousSystem"},
    {{Domain::Discrete, TermShape::Ac, true}, "ConstrainedAffineDiscreteSystem"},
    {{Domain::Continuous, TermShape::ABc, true}, "ConstrainedAffineControlContinuousSystem"},
    {{Domain::Discrete, TermShape::ABc, true}, "ConstrainedAffineControlDiscreteSystem"},
    {{Domain::Continuous, TermShape::ABD, true}, "NoisyConstrainedLinearControlContinuousSystem"},
    {{Domain::Discrete, TermShape::ABD, true}, "NoisyConstrainedLinearControlDiscreteSystem"},
}};


void checkDomain(Domain domain) {
    if (domain != Domain::Continuous && domain != Domain::Discrete) {
        std::string err_msg = "System domain (" + std::to_string(static_cast<int>(domain)) + ") is neither continuous nor discrete";
        throw InvalidSystemClass(err_msg);
    }
}

}  // namespace


std::string toString(Domain domain) {
    checkDomain(domain);
    return domain == Domain::Continuous ? "Continuous" : "Discrete";
}


std::string toString(TermShape shape) {
    switch (shape) {
        case TermShape::A:
            return "A";
        case TermShape::AB:
            return "AB";
        case TermShape::Ac:
            return "Ac";
        case TermShape::ABc:
            return "ABc";
        case TermShape::ABD:
            return "ABD";
    }
    throw std::invalid_argument("Unknown term shape (" + std::to_string(static_cast<int>(shape)) + ")");
}


SystemType complementaryType(const SystemType& type) {
    checkDomain(type.domain);

    SystemType complementary = type;
    complementary.domain = (type.domain == Domain::Continuous) ? Domain::Discrete : Domain::Continuous;
    return complementary;
}


std::string typeName(const SystemType& type) {
    checkDomain(type.domain);

    for (const auto& entry : kRegistry) {
        if (entry.type == type) {
            return entry.name;
        }
    }

    std::string err_msg = "No " + toString(type.domain) + " system variant with terms " + toString(type.shape)
                        + (type.constrained ? " and sets" : " without sets");
    throw InvalidSystemClass(err_msg);
}


SystemType typeFromName(const std::string& name) {
    for (const auto& entry : kRegistry) {
        if (name == entry.name) {
            return entry.type;
        }
    }

    throw InvalidSystemClass(name + " is neither a continuous nor a discrete system variant");
}


std::string complementaryTypeName(const std::string& name) {
    return typeName(complementaryType(typeFromName(name)));
}


}  // namespace affine
