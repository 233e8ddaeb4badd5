#ifndef _WEIGHT_SOLVER_H_
#define _WEIGHT_SOLVER_H_

#include <vector>

#include "interp/PilotPoint.hpp"

namespace ppk2fac {

	namespace interp {

		class WeightSolver {
		public:

			/**
			 * Computes the interpolation weights for the target node from the
			 * candidate pilot points. The candidates are indices into points.
			 * The contributors written to out refer to the same indices.
			 */
			virtual void weights(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
					const GridNode &target, WeightRecord &out) = 0;

			virtual ~WeightSolver() {
			}

		};

	}
}

#endif
