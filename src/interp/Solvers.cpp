#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include <nanoflann.hpp>

#include <Eigen/LU>

#include "ppk2fac.h"
#include "errors.hpp"
#include "interp/Structure.hpp"
#include "interp/NeighbourSearch.hpp"
#include "interp/IDWWeightSolver.hpp"
#include "interp/KrigingWeightSolver.hpp"

#define ppk_throw_singular(zone, node, x) {std::stringstream _ss; _ss << x; throw SingularKrigingSystemError(zone, node, _ss.str());}

namespace ppk2fac {

namespace interp {

	namespace detail {

		// See nanoflann examples: https://github.com/jlblancoc/nanoflann/blob/master/examples/pointcloud_kdd_radius.cpp#L119
		struct PointCloud
		{
			std::vector<PilotPoint> pts;

			// Must return the number of data points
			inline size_t kdtree_get_point_count() const { return pts.size(); }

			// Returns the distance between the vector "p1[0:size-1]" and the data point with index "idx_p2" stored in the class:
			inline double kdtree_distance(const double *p1, const size_t idx_p2, size_t /*size*/) const
			{
				const double d0 = p1[0] - pts[idx_p2].x;
				const double d1 = p1[1] - pts[idx_p2].y;
				return d0 * d0 + d1 * d1;
			}

			// Returns the dim'th component of the idx'th point in the class.
			inline double kdtree_get_pt(const size_t idx, int dim) const
			{
				return dim == 0 ? pts[idx].x : pts[idx].y;
			}

			// Use the standard bounding box computation.
			template <class BBOX>
			bool kdtree_get_bbox(BBOX& /*bb*/) const { return false; }

		};

		typedef nanoflann::KDTreeSingleIndexAdaptor<
			nanoflann::L2_Simple_Adaptor<double, PointCloud>,
			PointCloud,
			2,
			size_t
		> kd_tree;

		class PointIndex {
		public:
			PointCloud pc;
			std::unique_ptr<kd_tree> index;
		};

		/**
		 * Returns the squared distance between the point and the coordinate given by x, y.
		 */
		double _sdist(const PilotPoint &a, double x, double y) {
			return ppk_sq(a.x - x) + ppk_sq(a.y - y);
		}

		// Orders (distance, index) pairs by distance, then by index.
		bool _nearer(const std::pair<double, size_t> &a, const std::pair<double, size_t> &b) {
			return a.first < b.first || (a.first == b.first && a.second < b.second);
		}

		bool _byIndex(const Contributor &a, const Contributor &b) {
			return a.index < b.index;
		}

	} // detail

	double WeightRecord::weightSum() const {
		double sum = 0.0;
		for(const Contributor &c : contributors)
			sum += c.weight;
		return sum;
	}

	void WeightRecord::sortByIndex() {
		std::sort(contributors.begin(), contributors.end(), detail::_byIndex);
	}

	double VariogramModel::distance(double dx, double dy) const {
		if(anisotropy == 1.0)
			return std::sqrt(dx * dx + dy * dy);
		double t = ppk_rad(bearing);
		// Components along and across the major axis.
		double u = dx * std::sin(t) + dy * std::cos(t);
		double v = dx * std::cos(t) - dy * std::sin(t);
		return std::sqrt(ppk_sq(u / anisotropy) + ppk_sq(v));
	}

	double VariogramModel::shape(double dx, double dy) const {
		double h = distance(dx, dy);
		switch(vartype) {
		case VARTYPE_SPHERICAL:
		{
			double r = h / a;
			if(r >= 1.0)
				return 0.0;
			return 1.0 - 1.5 * r + 0.5 * r * r * r;
		}
		case VARTYPE_EXPONENTIAL:
			return std::exp(-h / a);
		case VARTYPE_GAUSSIAN:
			return std::exp(-ppk_sq(h / a));
		case VARTYPE_POWER:
			return std::pow(h, a);
		default:
			ppk_runerr("Unknown variogram type " << vartype << " in variogram " << name);
		}
	}

	double Structure::covariance(double dx, double dy) const {
		double cov = 0.0;
		for(const StructureVariogram &sv : variograms) {
			if(sv.model.vartype == VARTYPE_POWER) {
				cov += maxPowerVariance - sv.contribution * sv.model.shape(dx, dy);
			} else {
				cov += sv.contribution * sv.model.shape(dx, dy);
			}
		}
		if(dx == 0.0 && dy == 0.0)
			cov += nugget;
		return cov;
	}

	NeighbourSearch::NeighbourSearch(const std::vector<PilotPoint> &points, const std::vector<size_t> &subset) :
		m_points(points),
		m_subset(subset),
		m_index(new detail::PointIndex()) {

		using namespace detail;

		for(size_t i : m_subset)
			m_index->pc.pts.push_back(m_points[i]);
		if(!m_subset.empty()) {
			m_index->index.reset(new kd_tree(2, m_index->pc, nanoflann::KDTreeSingleIndexAdaptorParams(10)));
			m_index->index->buildIndex();
		}
	}

	void NeighbourSearch::find(double x, double y, double radius, size_t maxPoints, std::vector<size_t> &out) const {
		out.clear();
		const size_t num = ppk_min(maxPoints, m_subset.size());
		if(num == 0)
			return;

		std::vector<size_t> idx(num);	// Point indices
		std::vector<double> dist(num);	// Squared distance from query point.
		const double query[2] = {x, y};
		m_index->index->knnSearch(query, num, &idx[0], &dist[0]);

		const double r2 = radius * radius;
		for(size_t i = 0; i < num; ++i) {
			if(dist[i] <= r2)
				out.push_back(m_subset[idx[i]]);
		}
		std::sort(out.begin(), out.end());
	}

	NeighbourSearch::~NeighbourSearch() {
	}

	namespace kriging {

		KrigingWeightSolver::KrigingWeightSolver(int zone, const Structure &structure, int type, double tolerance) :
			m_zone(zone),
			m_structure(&structure),
			m_type(type),
			m_tolerance(tolerance) {
			if(type != KRIGE_ORDINARY && type != KRIGE_SIMPLE)
				ppk_argerr("Unknown kriging type " << type << ".");
			if(tolerance < 0.0)
				ppk_argerr("The condition tolerance must not be negative.");
			if(structure.variograms.empty())
				ppk_argerr("Structure " << structure.name << " has no variograms.");
		}

		void KrigingWeightSolver::covarianceMatrix(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
				Eigen::MatrixXd &K) const {
			const size_t n = candidates.size();
			K.resize(n, n);
			for(size_t r = 0; r < n; ++r) {
				const PilotPoint &p0 = points[candidates[r]];
				for(size_t c = r; c < n; ++c) {
					const PilotPoint &p1 = points[candidates[c]];
					double cov = m_structure->covariance(p0.x, p0.y, p1.x, p1.y);
					K(r, c) = cov;
					K(c, r) = cov;
				}
			}
		}

		void KrigingWeightSolver::weights(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
				const GridNode &target, WeightRecord &out) {
			using namespace Eigen;

			out.targetId = target.id;
			out.contributors.clear();

			const size_t n = candidates.size();
			if(n == 0)
				throw SingularKrigingSystemError(m_zone, target.id, "No pilot points for the kriging system.");

			const bool ordinary = m_type == KRIGE_ORDINARY;
			const size_t m = ordinary ? n + 1 : n;

			// Covariance matrix, bordered with 1s and a 0 for ordinary kriging.
			MatrixXd A(m, m);
			MatrixXd K;
			covarianceMatrix(points, candidates, K);
			A.topLeftCorner(n, n) = K;
			// Covariances from the candidates to the target.
			VectorXd b(m);
			for(size_t i = 0; i < n; ++i) {
				const PilotPoint &pp = points[candidates[i]];
				b(i) = m_structure->covariance(pp.x, pp.y, target.x, target.y);
			}
			if(ordinary) {
				for(size_t i = 0; i < n; ++i) {
					A(i, n) = 1.0;
					A(n, i) = 1.0;
				}
				A(n, n) = 0.0;
				b(n) = 1.0;
			}

			FullPivLU<MatrixXd> lu(A);
			if(!lu.isInvertible() || lu.rcond() < m_tolerance) {
				ppk_throw_singular(m_zone, target.id, "Singular kriging system for node " << target.id
						<< " in zone " << m_zone << " (" << n << " pilot points, rcond " << lu.rcond() << ").");
			}

			// Last row is the Lagrangian: ignore.
			VectorXd w = lu.solve(b);
			for(size_t i = 0; i < n; ++i) {
				if(!std::isfinite(w(i)))
					ppk_throw_singular(m_zone, target.id, "Non-finite kriging weight for node " << target.id
							<< " in zone " << m_zone << ".");
				out.contributors.push_back(Contributor(candidates[i], w(i)));
			}
		}

	} // kriging

	namespace idw {

		void IDWWeightSolver::weights(const std::vector<PilotPoint> &points, const std::vector<size_t> &candidates,
				const GridNode &target, WeightRecord &out) {
			using namespace detail;

			out.targetId = target.id;
			out.contributors.clear();
			if(candidates.empty())
				return;

			std::vector<std::pair<double, size_t> > dist;
			dist.reserve(candidates.size());
			for(size_t i : candidates)
				dist.push_back(std::make_pair(std::sqrt(_sdist(points[i], target.x, target.y)), i));

			const size_t num = ppk_min((size_t) m_neighbours, dist.size());
			std::partial_sort(dist.begin(), dist.begin() + num, dist.end(), _nearer);

			double t = 0.0;
			for(size_t i = 0; i < num; ++i) {
				double w = 1.0 / std::pow(dist[i].first, m_exponent);
				if(!std::isfinite(w)) {
					// The target sits on this pilot point, or so near that 1/d^p overflows; it takes the whole weight.
					out.contributors.clear();
					for(size_t j = 0; j < num; ++j)
						out.contributors.push_back(Contributor(dist[j].second, i == j ? 1.0 : 0.0));
					return;
				}
				out.contributors.push_back(Contributor(dist[i].second, w));
				t += w;
			}
			for(Contributor &c : out.contributors)
				c.weight /= t;
		}

		void IDWWeightSolver::solve(const std::vector<PilotPoint> &points, const std::vector<GridNode> &targets,
				std::vector<WeightRecord> &out) {
			std::vector<size_t> all(points.size());
			for(size_t i = 0; i < all.size(); ++i)
				all[i] = i;
			for(const GridNode &target : targets) {
				WeightRecord rec(target.id);
				weights(points, all, target, rec);
				out.push_back(std::move(rec));
			}
		}

	} // idw

} // interp

} // ppk2fac
