#ifndef _PILOT_POINT_H_
#define _PILOT_POINT_H_

#include <string>
#include <vector>

namespace ppk2fac {

	namespace interp {

		// Zone of a pilot point read without a zone column. Such a point is
		// eligible for nodes in every zone.
		const int UNZONED = 0;

		class PilotPoint {
		public:
			std::string id;
			double x, y;
			int zone;
			double value;
			PilotPoint() :
				x(0), y(0),
				zone(UNZONED),
				value(0) {
			}
			PilotPoint(const std::string &id, double x, double y, int zone = UNZONED, double value = 0) :
				id(id),
				x(x), y(y),
				zone(zone),
				value(value) {
			}
			// True if this point may contribute to a node in the given zone.
			bool servesZone(int z) const {
				return zone == UNZONED || zone == z;
			}
		};

		class GridNode {
		public:
			int id;
			double x, y;
			GridNode() :
				id(0), x(0), y(0) {
			}
			GridNode(int id, double x, double y) :
				id(id), x(x), y(y) {
			}
		};

		class Contributor {
		public:
			size_t index;	// 0-based index into the pilot point list.
			double weight;
			Contributor(size_t index, double weight) :
				index(index), weight(weight) {
			}
		};

		/**
		 * The interpolation weights for one target node.
		 */
		class WeightRecord {
		public:
			int targetId;
			std::vector<Contributor> contributors;
			WeightRecord() :
				targetId(0) {
			}
			WeightRecord(int targetId) :
				targetId(targetId) {
			}
			double weightSum() const;
			// Orders the contributors by ascending pilot point index.
			void sortByIndex();
		};

	}
}

#endif
