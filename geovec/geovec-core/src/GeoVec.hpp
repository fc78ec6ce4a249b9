#ifndef GEOVEC_HPP
#define GEOVEC_HPP

/**
 * @file GeoVec.hpp
 * @brief Convenience header including the whole geovec core
 *
 * This header provides a single include point for the vector capability,
 * its derived operations, the dimensional markers, the array, Eigen and
 * Boost.QVM bindings and the geometry built on top of them.
 */

#include "geovec-core/src/Config.hpp"

// Capability
#include "geovec-core/src/Scalar/ScalarTraits.hpp"
#include "geovec-core/src/Vector/VectorN.hpp"

// Derived operations and markers
#include "geovec-core/src/Vector/DimensionalTraits.hpp"
#include "geovec-core/src/Vector/VecFormatter.hpp"
#include "geovec-core/src/Vector/VectorExtensions.hpp"

// Bindings
#include "geovec-core/src/Bindings/ArrayBindings.hpp"
#include "geovec-core/src/Bindings/EigenBindings.hpp"
#include "geovec-core/src/Bindings/QvmBindings.hpp"

// Geometry
#include "geovec-core/src/Geometry/BoundingRect.hpp"
#include "geovec-core/src/Geometry/Orientation.hpp"

#endif  // GEOVEC_HPP
