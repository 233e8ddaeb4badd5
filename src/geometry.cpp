#include <cmath>
#include <limits>
#include <vector>

#include "ppk2fac.h"
#include "errors.hpp"
#include "geometry.hpp"

using namespace ppk2fac;
using namespace ppk2fac::geom;
using namespace ppk2fac::interp;

double PointGeom::minPairwiseDistance(const std::vector<PilotPoint> &points, size_t *i, size_t *j) {
    double min = std::numeric_limits<double>::infinity();
    for (size_t a = 0; a < points.size(); ++a) {
        for (size_t b = a + 1; b < points.size(); ++b) {
            double d = std::sqrt(ppk_sq(points[a].x - points[b].x) + ppk_sq(points[a].y - points[b].y));
            if (d < min) {
                min = d;
                if (i) *i = a;
                if (j) *j = b;
                if (d == 0.0)
                    return d;
            }
        }
    }
    return min;
}

void PointGeom::validate(const std::vector<PilotPoint> &points) {
    size_t i = 0, j = 0;
    double d = minPairwiseDistance(points, &i, &j);
    if (d == 0.0) {
        ppk_throw(DegenerateGeometryError, "Pilot points " << points[i].id << " and " << points[j].id
                << " are both at (" << points[i].x << ", " << points[i].y << ").");
    }
    ppk_debug("Minimum pilot point separation: " << d);
}
