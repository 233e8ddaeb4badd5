#ifndef __PAR2FAC_HPP__
#define __PAR2FAC_HPP__

#include <string>
#include <vector>
#include <map>

#include "ppk2fac.h"
#include "interp/PilotPoint.hpp"
#include "interp/Structure.hpp"

namespace ppk2fac {

    namespace fac {

        // Interpolation methods.
        const int METHOD_ORDINARY = 0;
        const int METHOD_SIMPLE = 1;
        const int METHOD_IDW = 2;

        // What to do with a node whose kriging system is singular.
        const int ON_SINGULAR_SKIP = 0;
        const int ON_SINGULAR_ABORT = 1;
        const int ON_SINGULAR_IDW = 2;

        // Contains configuration information for computing interpolation factors.
        class Par2FacConfig {
        public:

            std::string pilotPointFile;
            std::string nodeFile;
            std::string structureFile;
            std::string zoneFile;
            std::string zoneStructureFile;
            std::string factorsFile;

            // The pilot point covariance listing. Not written if empty.
            std::string regularisationFile;

            // One of METHOD_ORDINARY, METHOD_SIMPLE or METHOD_IDW.
            int method;

            // Only pilot points within this distance of a node contribute to it.
            double searchRadius;

            // A node with fewer candidates than this is skipped.
            unsigned int minPilotPoints;

            // At most this many of the nearest candidates are used.
            unsigned int maxPilotPoints;

            double idwExponent;

            // One of the ON_SINGULAR_ values.
            int onSingular;

            // Kriging systems with a reciprocal condition number below this are singular.
            double tolerance;

            // The number of threads to use for computing weights.
            int threads;

            ppk2fac::interp::StructureDefaults defaults;

            Par2FacConfig() :
                method(METHOD_ORDINARY),
                searchRadius(0.0),
                minPilotPoints(1),
                maxPilotPoints(10),
                idwExponent(2.0),
                onSingular(ON_SINGULAR_SKIP),
                tolerance(1e-12),
                threads(1) {
            }

            void check() const {
                if (pilotPointFile.empty())
                    ppk_argerr("A pilot points file is required.");
                if (nodeFile.empty())
                    ppk_argerr("A node file is required.");
                if (structureFile.empty())
                    ppk_argerr("A structure file is required.");
                if (zoneFile.empty())
                    ppk_argerr("A zone file is required.");
                if (zoneStructureFile.empty())
                    ppk_argerr("A zone-structure file is required.");
                if (factorsFile.empty())
                    ppk_argerr("A factors output file is required.");
                if (method != METHOD_ORDINARY && method != METHOD_SIMPLE && method != METHOD_IDW)
                    ppk_argerr("Unknown interpolation method " << method << ".");
                if (searchRadius <= 0.0)
                    ppk_argerr("The search radius must be larger than zero. " << searchRadius << " given.");
                if (minPilotPoints < 1)
                    ppk_argerr("The minimum number of pilot points must be at least 1.");
                if (maxPilotPoints < minPilotPoints)
                    ppk_argerr("The maximum number of pilot points (" << maxPilotPoints
                            << ") is less than the minimum (" << minPilotPoints << ").");
                if (idwExponent <= 0.0)
                    ppk_argerr("The IDW exponent must be larger than zero.");
                if (onSingular != ON_SINGULAR_SKIP && onSingular != ON_SINGULAR_ABORT && onSingular != ON_SINGULAR_IDW)
                    ppk_argerr("Unknown singular system policy " << onSingular << ".");
                if (tolerance < 0.0)
                    ppk_argerr("The condition tolerance must not be negative.");
                if (threads < 1)
                    ppk_argerr("The thread count must be at least 1.");
            }
        };

        const int FAILURE_INSUFFICIENT = 0;
        const int FAILURE_SINGULAR = 1;

        // A node that could not be given weights.
        class NodeFailure {
        public:
            int node;
            int zone;
            int kind;
            std::string message;
            NodeFailure(int node, int zone, int kind, const std::string &message) :
                node(node), zone(zone), kind(kind), message(message) {
            }
        };

        class Par2FacResult {
        public:
            size_t nodes;           // Nodes in the mesh.
            size_t written;         // Nodes written with contributors.
            size_t skipped;         // Nodes written without contributors.
            size_t insufficient;    // Nodes with too few pilot points in range.
            size_t singular;        // Nodes with singular kriging systems.
            size_t idwFallbacks;    // Singular nodes given IDW weights instead.
            std::vector<NodeFailure> failures;
            Par2FacResult() :
                nodes(0), written(0), skipped(0),
                insufficient(0), singular(0), idwFallbacks(0) {
            }
        };

        class Par2Fac {
        public:

            /**
             * Reads the inputs named in the config, computes the weights for every
             * node and writes the factors file (and the regularisation file, if
             * configured). Fatal errors raise before any output is written.
             */
            Par2FacResult run(const Par2FacConfig &config);

            /**
             * Checks that every node has a zone, that the zone and node counts
             * agree and that every zone in use has a defined structure. Fills
             * zoneStructures with the structure of each zone in use. Raises
             * CoverageError.
             */
            static void validateCoverage(const std::vector<ppk2fac::interp::GridNode> &nodes,
                    const std::map<int, int> &zones,
                    const std::map<int, std::string> &zoneStructureNames,
                    const std::map<std::string, ppk2fac::interp::Structure> &structures,
                    std::map<int, const ppk2fac::interp::Structure*> &zoneStructures);

            /**
             * Computes one weight record per node, in node order. Per-node failures
             * are counted in result; a singular system raises only under
             * ON_SINGULAR_ABORT.
             */
            void computeWeights(const Par2FacConfig &config,
                    const std::vector<ppk2fac::interp::PilotPoint> &points,
                    const std::vector<ppk2fac::interp::GridNode> &nodes,
                    const std::map<int, int> &zones,
                    const std::map<int, const ppk2fac::interp::Structure*> &zoneStructures,
                    std::vector<ppk2fac::interp::WeightRecord> &records,
                    Par2FacResult &result);

            /**
             * Writes the covariances between the pilot points serving each zone.
             */
            void writeRegularisation(const std::string &regulfile, double tolerance,
                    const std::vector<ppk2fac::interp::PilotPoint> &points,
                    const std::map<int, const ppk2fac::interp::Structure*> &zoneStructures);

        };

    } // fac

} // ppk2fac

#endif
