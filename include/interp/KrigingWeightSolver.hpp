#ifndef _KRIGING_WEIGHT_SOLVER_H_
#define _KRIGING_WEIGHT_SOLVER_H_

#include <Eigen/Core>

#include "interp/Structure.hpp"
#include "interp/WeightSolver.hpp"

namespace ppk2fac {

	namespace interp {

		namespace kriging {

			const int KRIGE_ORDINARY = 0;
			const int KRIGE_SIMPLE = 1;

			class KrigingWeightSolver : public WeightSolver {
			private:
				int m_zone;
				const Structure *m_structure;
				int m_type;
				double m_tolerance;
			public:

				/**
				 * Create a solver for nodes in the given zone. The structure must
				 * outlive the solver. Systems whose reciprocal condition number
				 * falls below tolerance are rejected as singular.
				 */
				KrigingWeightSolver(int zone, const Structure &structure, int type, double tolerance = 1e-12);

				/**
				 * Solves the kriging system for the target. Raises
				 * SingularKrigingSystemError if the system cannot be solved.
				 */
				void weights(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
						const GridNode &target, WeightRecord &out);

				/**
				 * Fills K with the covariances between the candidate pilot points.
				 */
				void covarianceMatrix(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
						Eigen::MatrixXd &K) const;

			};

		}
	}
}

#endif
