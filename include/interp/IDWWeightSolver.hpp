#ifndef _IDW_WEIGHT_SOLVER_H_
#define _IDW_WEIGHT_SOLVER_H_

#include "ppk2fac.h"
#include "interp/WeightSolver.hpp"

namespace ppk2fac {

	namespace interp {

		namespace idw {

			/**
			 * Inverse-distance weighting. The nearest neighbours of a target
			 * are weighted by 1/d^exponent and the weights normalized to sum
			 * to one. A target that coincides with a pilot point takes that
			 * point's value outright.
			 */
			class IDWWeightSolver : public WeightSolver {
			private:
				double m_exponent;
				unsigned int m_neighbours;
			public:

				IDWWeightSolver(unsigned int neighbours = 3, double exponent = 2.0) {
					if(exponent <= 0.0)
						ppk_argerr("Please use an exponent larger than zero.");
					if(neighbours == 0)
						ppk_argerr("The IDW neighbour count must be at least one.");
					m_exponent = exponent;
					m_neighbours = neighbours;
				}

				void weights(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
						const GridNode &target, WeightRecord &out);

				/**
				 * Computes weights for every target against all of the pilot
				 * points. One record is appended to out per target, with the
				 * contributors ordered nearest first.
				 */
				void solve(const std::vector<PilotPoint> &points, const std::vector<GridNode> &targets,
						std::vector<WeightRecord> &out);

			};

		}
	}
}

#endif
