#ifndef __GEOMETRY_HPP__
#define __GEOMETRY_HPP__

#include <vector>

#include "interp/PilotPoint.hpp"

namespace ppk2fac {
    namespace geom {

        class PointGeom {
        public:

            /**
             * Returns the smallest distance between two distinct pilot points, or
             * infinity if there are fewer than two. If i and j are given, they
             * receive the indices of the closest pair.
             */
            static double minPairwiseDistance(const std::vector<ppk2fac::interp::PilotPoint> &points,
                    size_t *i = nullptr, size_t *j = nullptr);

            /**
             * Raises DegenerateGeometryError, naming both points, if any two pilot
             * points coincide.
             */
            static void validate(const std::vector<ppk2fac::interp::PilotPoint> &points);

        };

    } // geom
} // ppk2fac

#endif
