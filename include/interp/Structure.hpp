#ifndef _STRUCTURE_H_
#define _STRUCTURE_H_

#include <string>
#include <vector>

namespace ppk2fac {

	namespace interp {

		// Variogram shape codes.
		const int VARTYPE_SPHERICAL = 1;
		const int VARTYPE_EXPONENTIAL = 2;
		const int VARTYPE_GAUSSIAN = 3;
		const int VARTYPE_POWER = 4;

		// Value-domain transforms.
		const int TRANSFORM_NONE = 0;
		const int TRANSFORM_LOG = 1;

		/**
		 * Holds the values a structure or variogram takes when its block
		 * leaves a key out.
		 */
		class StructureDefaults {
		public:
			double nugget;
			int transform;
			double maxPowerVariance;
			double contribution;
			double bearing;
			double anisotropy;
			StructureDefaults() :
				nugget(0.0),
				transform(TRANSFORM_NONE),
				maxPowerVariance(1.0),
				contribution(1.0),
				bearing(0.0),
				anisotropy(1.0) {
			}
		};

		class VariogramModel {
		public:
			std::string name;
			int vartype;
			double bearing;		// Degrees clockwise from north of the major axis.
			double a;			// Range; the exponent for power variograms.
			double anisotropy;	// Ratio of the range along the bearing to the range across it.

			VariogramModel() :
				vartype(0),
				bearing(0.0),
				a(0.0),
				anisotropy(1.0) {
			}

			/**
			 * Returns the anisotropy-adjusted distance of the separation
			 * vector (dx, dy).
			 */
			double distance(double dx, double dy) const;

			/**
			 * Returns the unit-sill correlation at the separation (dx, dy).
			 * For the power model, returns the unit variogram value instead;
			 * see Structure::covariance.
			 */
			double shape(double dx, double dy) const;
		};

		/**
		 * One nested component of a structure: a variogram model scaled by
		 * its contribution (sill).
		 */
		class StructureVariogram {
		public:
			double contribution;
			VariogramModel model;
			StructureVariogram(double contribution, const VariogramModel &model) :
				contribution(contribution),
				model(model) {
			}
		};

		class Structure {
		public:
			std::string name;
			double nugget;
			int transform;
			double maxPowerVariance;
			std::vector<StructureVariogram> variograms;

			Structure() :
				nugget(0.0),
				transform(TRANSFORM_NONE),
				maxPowerVariance(1.0) {
			}

			/**
			 * Returns the modelled covariance between two points separated by
			 * (dx, dy). The nugget is added only when the separation is zero.
			 */
			double covariance(double dx, double dy) const;

			/**
			 * Returns the covariance between the points at (x0, y0) and (x1, y1).
			 */
			double covariance(double x0, double y0, double x1, double y1) const {
				return covariance(x1 - x0, y1 - y0);
			}
		};

	}
}

#endif
