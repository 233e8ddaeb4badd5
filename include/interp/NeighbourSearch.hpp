#ifndef _NEIGHBOUR_SEARCH_H_
#define _NEIGHBOUR_SEARCH_H_

#include <memory>
#include <vector>

#include "interp/PilotPoint.hpp"

namespace ppk2fac {

	namespace interp {

		namespace detail {
			class PointIndex;
		}

		/**
		 * A spatial index over a subset of the pilot points, used to find the
		 * candidates for a node.
		 */
		class NeighbourSearch {
		private:
			const std::vector<PilotPoint> &m_points;
			std::vector<size_t> m_subset;
			std::unique_ptr<detail::PointIndex> m_index;
		public:

			/**
			 * Index the pilot points whose positions in points are listed in
			 * subset. The points must outlive the search.
			 */
			NeighbourSearch(const std::vector<PilotPoint> &points, const std::vector<size_t> &subset);

			/**
			 * Finds at most maxPoints of the nearest indexed pilot points that lie
			 * within radius of (x, y). The result holds indices into the full
			 * point list, in ascending order.
			 */
			void find(double x, double y, double radius, size_t maxPoints, std::vector<size_t> &out) const;

			size_t size() const {
				return m_subset.size();
			}

			~NeighbourSearch();

		};

	}
}

#endif
