#include <fstream>
#include <iomanip>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Core>

#include "ppk2fac.h"
#include "errors.hpp"
#include "util.hpp"
#include "geometry.hpp"
#include "readers.hpp"
#include "factors.hpp"
#include "par2fac.hpp"
#include "interp/NeighbourSearch.hpp"
#include "interp/IDWWeightSolver.hpp"
#include "interp/KrigingWeightSolver.hpp"

using namespace ppk2fac;
using namespace ppk2fac::fac;
using namespace ppk2fac::util;
using namespace ppk2fac::interp;
using namespace ppk2fac::interp::idw;
using namespace ppk2fac::interp::kriging;

namespace {

    // Per-node outcomes of the weight computation.
    const int NODE_OK = 0;
    const int NODE_INSUFFICIENT = 1;
    const int NODE_SINGULAR = 2;
    const int NODE_FALLBACK = 3;
    const int NODE_ERROR = 4;

    void eligiblePoints(const std::vector<PilotPoint> &points, int zone, std::vector<size_t> &out) {
        for (size_t i = 0; i < points.size(); ++i) {
            if (points[i].servesZone(zone))
                out.push_back(i);
        }
    }

    /**
     * Finds the candidate pilot points for the node. Raises
     * InsufficientPilotPointsError if too few are in range.
     */
    void selectCandidates(const Par2FacConfig &config, const NeighbourSearch &search, const GridNode &node,
            int zone, std::vector<size_t> &candidates) {
        search.find(node.x, node.y, config.searchRadius, config.maxPilotPoints, candidates);
        if (candidates.size() < config.minPilotPoints) {
            std::stringstream ss;
            ss << "Node " << node.id << " in zone " << zone << " has " << candidates.size()
                    << " pilot points within " << config.searchRadius << "; " << config.minPilotPoints << " required.";
            throw InsufficientPilotPointsError(node.id, candidates.size(), config.minPilotPoints, ss.str());
        }
    }

} // anon

void Par2Fac::validateCoverage(const std::vector<GridNode> &nodes, const std::map<int, int> &zones,
        const std::map<int, std::string> &zoneStructureNames, const std::map<std::string, Structure> &structures,
        std::map<int, const Structure*> &zoneStructures) {

    if (nodes.size() != zones.size())
        ppk_throw(CoverageError, "The mesh has " << nodes.size() << " nodes but " << zones.size() << " nodes are zoned.");

    for (const GridNode &node : nodes) {
        auto zit = zones.find(node.id);
        if (zit == zones.end())
            ppk_throw(CoverageError, "Node " << node.id << " has no zone.");
        int zone = zit->second;
        if (zoneStructures.find(zone) != zoneStructures.end())
            continue;
        auto nit = zoneStructureNames.find(zone);
        if (nit == zoneStructureNames.end())
            ppk_throw(CoverageError, "Zone " << zone << " (node " << node.id << ") has no structure.");
        auto sit = structures.find(Util::lower(nit->second));
        if (sit == structures.end())
            ppk_throw(CoverageError, "Zone " << zone << " uses undefined structure " << nit->second << ".");
        zoneStructures[zone] = &(sit->second);
    }
}

void Par2Fac::computeWeights(const Par2FacConfig &config, const std::vector<PilotPoint> &points,
        const std::vector<GridNode> &nodes, const std::map<int, int> &zones,
        const std::map<int, const Structure*> &zoneStructures,
        std::vector<WeightRecord> &records, Par2FacResult &result) {

    config.check();

    // Build a search index and a solver for each zone.
    std::map<int, std::unique_ptr<NeighbourSearch> > searches;
    std::map<int, std::unique_ptr<WeightSolver> > solvers;
    for (const auto &it : zoneStructures) {
        std::vector<size_t> eligible;
        eligiblePoints(points, it.first, eligible);
        ppk_debug("Zone " << it.first << ": structure " << it.second->name << ", " << eligible.size() << " pilot points");
        searches[it.first].reset(new NeighbourSearch(points, eligible));
        if (config.method == METHOD_IDW) {
            solvers[it.first].reset(new IDWWeightSolver(config.maxPilotPoints, config.idwExponent));
        } else {
            int type = config.method == METHOD_SIMPLE ? KRIGE_SIMPLE : KRIGE_ORDINARY;
            solvers[it.first].reset(new KrigingWeightSolver(it.first, *(it.second), type, config.tolerance));
        }
    }
    IDWWeightSolver fallback(config.maxPilotPoints, config.idwExponent);

    const int count = (int) nodes.size();
    records.assign(nodes.size(), WeightRecord());
    std::vector<int> outcomes(nodes.size(), NODE_OK);
    std::vector<std::string> messages(nodes.size());
    std::vector<int> nodeZones(nodes.size(), 0);
    const bool progress = ppk__loglevel >= PPK_LOG_DEBUG;

    #pragma omp parallel for num_threads(config.threads) schedule(dynamic, 64)
    for (int i = 0; i < count; ++i) {
        const GridNode &node = nodes[i];
        WeightRecord &rec = records[i];
        rec.targetId = node.id;
        std::vector<size_t> candidates;
        try {
            int zone = zones.at(node.id);
            nodeZones[i] = zone;
            selectCandidates(config, *searches.at(zone), node, zone, candidates);
            try {
                solvers.at(zone)->weights(points, candidates, node, rec);
            } catch (const SingularKrigingSystemError &ex) {
                messages[i] = ex.what();
                if (config.onSingular == ON_SINGULAR_IDW) {
                    fallback.weights(points, candidates, node, rec);
                    outcomes[i] = NODE_FALLBACK;
                } else {
                    rec.contributors.clear();
                    outcomes[i] = NODE_SINGULAR;
                }
            }
        } catch (const InsufficientPilotPointsError &ex) {
            rec.contributors.clear();
            outcomes[i] = NODE_INSUFFICIENT;
            messages[i] = ex.what();
        } catch (const std::exception &ex) {
            rec.contributors.clear();
            outcomes[i] = NODE_ERROR;
            messages[i] = ex.what();
        }
        if (progress && i % 1000 == 0)
            Util::status(i, count, "Computing weights");
    }
    if (progress)
        Util::status(count, count, "Computing weights", true);

    // Collect the outcomes in node order.
    for (size_t i = 0; i < nodes.size(); ++i) {
        const GridNode &node = nodes[i];
        switch (outcomes[i]) {
        case NODE_ERROR:
            ppk_runerr("Failed to compute weights for node " << node.id << ": " << messages[i]);
        case NODE_SINGULAR:
            if (config.onSingular == ON_SINGULAR_ABORT)
                throw SingularKrigingSystemError(nodeZones[i], node.id, messages[i]);
            ++result.singular;
            result.failures.push_back(NodeFailure(node.id, nodeZones[i], FAILURE_SINGULAR, messages[i]));
            ppk_debug(messages[i]);
            break;
        case NODE_FALLBACK:
            ++result.singular;
            ++result.idwFallbacks;
            ppk_debug(messages[i] << " Using IDW weights.");
            break;
        case NODE_INSUFFICIENT:
            ++result.insufficient;
            result.failures.push_back(NodeFailure(node.id, nodeZones[i], FAILURE_INSUFFICIENT, messages[i]));
            ppk_debug(messages[i]);
            break;
        default:
            break;
        }
    }
    result.nodes = nodes.size();
}

void Par2Fac::writeRegularisation(const std::string &regulfile, double tolerance,
        const std::vector<PilotPoint> &points, const std::map<int, const Structure*> &zoneStructures) {

    std::ofstream out(regulfile.c_str(), std::ios::out | std::ios::trunc);
    if (!out)
        ppk_runerr("Could not open " << regulfile << " for writing.");

    for (const auto &it : zoneStructures) {
        std::vector<size_t> eligible;
        eligiblePoints(points, it.first, eligible);
        KrigingWeightSolver solver(it.first, *(it.second), KRIGE_ORDINARY, tolerance);
        Eigen::MatrixXd K;
        solver.covarianceMatrix(points, eligible, K);
        out << "ZONE " << it.first << " STRUCTURE " << it.second->name << " POINTS " << eligible.size() << "\n";
        for (size_t r = 0; r < eligible.size(); ++r) {
            for (size_t c = r; c < eligible.size(); ++c) {
                out << std::setw(12) << points[eligible[r]].id << " " << std::setw(12) << points[eligible[c]].id << " "
                        << std::scientific << std::setprecision(9) << K(r, c) << "\n";
            }
        }
    }
    out.close();
    if (out.fail())
        ppk_runerr("Failed to write " << regulfile << ".");
    ppk_debug("Wrote pilot point covariances for " << zoneStructures.size() << " zones to " << regulfile);
}

Par2FacResult Par2Fac::run(const Par2FacConfig &config) {

    config.check();

    Par2FacResult result;

    std::vector<PilotPoint> points;
    io::readPilotPoints(config.pilotPointFile, points);

    geom::PointGeom::validate(points);

    std::vector<GridNode> nodes;
    io::readNodes(config.nodeFile, nodes);

    std::map<std::string, Structure> structures;
    io::readStructures(config.structureFile, config.defaults, structures);

    std::map<int, int> zones;
    io::readZones(config.zoneFile, zones);

    std::map<int, std::string> zoneStructureNames;
    io::readZoneStructures(config.zoneStructureFile, zoneStructureNames);

    std::map<int, const Structure*> zoneStructures;
    validateCoverage(nodes, zones, zoneStructureNames, structures, zoneStructures);

    factors::FactorTable table;
    table.pilotPointFile = config.pilotPointFile;
    table.pilotPointCount = points.size();
    computeWeights(config, points, nodes, zones, zoneStructures, table.records, result);

    result.written = factors::writeFactors(config.factorsFile, table);
    result.skipped = result.nodes - result.written;

    if (!config.regularisationFile.empty())
        writeRegularisation(config.regularisationFile, config.tolerance, points, zoneStructures);

    if (result.skipped > 0) {
        ppk_warn(result.skipped << " of " << result.nodes << " nodes have no factors ("
                << result.insufficient << " with too few pilot points in range, "
                << (result.singular - result.idwFallbacks) << " with singular kriging systems).");
    }
    if (result.idwFallbacks > 0)
        ppk_warn(result.idwFallbacks << " nodes with singular kriging systems were given IDW weights.");
    ppk_debug("Wrote factors for " << result.written << " of " << result.nodes << " nodes to " << config.factorsFile);

    return result;
}
