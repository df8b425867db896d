#ifndef SYSTEM_TYPE_HPP
#define SYSTEM_TYPE_HPP

#include <string>

#include "errors.hpp"


namespace affine {


enum class Domain {
    Continuous,
    Discrete
};


/// @brief Affine terms present on top of the state matrix A
enum class TermShape {
    A,
    AB,
    Ac,
    ABc,
    ABD
};


struct SystemType {
    Domain domain{Domain::Continuous};
    TermShape shape{TermShape::A};

    /// @brief True if the variant carries the sets X (and U, W)
    bool constrained{false};

    bool operator==(const SystemType& other) const = default;
};


inline bool hasB(TermShape shape) {
    return shape == TermShape::AB || shape == TermShape::ABc || shape == TermShape::ABD;
}

inline bool hasC(TermShape shape) {
    return shape == TermShape::Ac || shape == TermShape::ABc;
}

inline bool hasD(TermShape shape) {
    return shape == TermShape::ABD;
}


std::string toString(Domain domain);

std::string toString(TermShape shape);

/**
 * @brief Discrete counterpart of a continuous variant and vice versa.
 *
 * Shape and constrained flag are kept, only the domain is flipped.
 * Throws InvalidSystemClass if the domain is neither continuous nor discrete.
 */
SystemType complementaryType(const SystemType& type);

/// @brief Registered name of a variant, e.g. "ConstrainedAffineControlContinuousSystem"
std::string typeName(const SystemType& type);

/// @brief Inverse of typeName(). Throws InvalidSystemClass for unregistered names.
SystemType typeFromName(const std::string& name);

std::string complementaryTypeName(const std::string& name);


}  // namespace affine


#endif  // SYSTEM_TYPE_HPP
