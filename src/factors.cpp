#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <boost/algorithm/string/trim.hpp>

#include "ppk2fac.h"
#include "errors.hpp"
#include "util.hpp"
#include "readers.hpp"
#include "factors.hpp"

using namespace ppk2fac;
using namespace ppk2fac::util;
using namespace ppk2fac::interp;
using namespace ppk2fac::factors;

namespace {

	bool _byTarget(const WeightRecord *a, const WeightRecord *b) {
		return a->targetId < b->targetId;
	}

} // anon

size_t ppk2fac::factors::writeFactors(std::ostream &out, const FactorTable &table) {
	std::vector<const WeightRecord*> records;
	for(const WeightRecord &rec : table.records)
		records.push_back(&rec);
	std::sort(records.begin(), records.end(), _byTarget);
	for(size_t i = 1; i < records.size(); ++i) {
		if(records[i]->targetId == records[i - 1]->targetId)
			ppk_argerr("Node " << records[i]->targetId << " appears twice in the factor table.");
	}

	out << table.pilotPointFile << "\n";
	out << table.pilotPointCount << "\n";

	size_t count = 0;
	for(const WeightRecord *rec : records) {
		WeightRecord sorted(*rec);
		sorted.sortByIndex();
		out << std::setw(10) << sorted.targetId << std::setw(6) << sorted.contributors.size();
		for(const Contributor &c : sorted.contributors) {
			if(c.index >= table.pilotPointCount)
				ppk_argerr("Pilot point index " << c.index << " of node " << sorted.targetId << " is out of range.");
			out << std::setw(8) << (c.index + 1) << " "
				<< std::scientific << std::setprecision(9) << std::setw(17) << c.weight;
		}
		out << "\n";
		if(!sorted.contributors.empty())
			++count;
	}
	return count;
}

size_t ppk2fac::factors::writeFactors(const std::string &factorsfile, const FactorTable &table) {
	std::ofstream out(factorsfile.c_str(), std::ios::out | std::ios::trunc);
	if(!out)
		ppk_runerr("Could not open " << factorsfile << " for writing.");
	size_t count = writeFactors(out, table);
	out.close();
	if(out.fail())
		ppk_runerr("Failed to write " << factorsfile << ".");
	ppk_debug("Wrote factors for " << table.records.size() << " nodes to " << factorsfile);
	return count;
}

void ppk2fac::factors::readFactors(const std::string &factorsfile, FactorTable &table) {
	std::ifstream in(factorsfile.c_str());
	if(!in)
		ppk_throw(ParseError, "Could not open " << factorsfile << ".");

	std::string buf;
	if(!std::getline(in, buf))
		ppk_throw(ParseError, factorsfile << ": Missing pilot point file name.");
	table.pilotPointFile = boost::algorithm::trim_copy(buf);

	int count;
	if(!std::getline(in, buf) || !Util::parseInt(boost::algorithm::trim_copy(buf), &count) || count < 0)
		ppk_throw(ParseError, factorsfile << ":2: Missing or invalid pilot point count.");
	table.pilotPointCount = (size_t) count;

	std::set<int> ids;
	std::vector<std::string> tok;
	int line = 2;
	while(std::getline(in, buf)) {
		++line;
		Util::splitString(buf, tok);
		if(tok.empty())
			continue;
		int id, n;
		if(tok.size() < 2 || !Util::parseInt(tok[0], &id) || !Util::parseInt(tok[1], &n) || n < 0)
			ppk_throw(ParseError, factorsfile << ":" << line << ": Expected node id and contributor count.");
		if(tok.size() != 2 + 2 * (size_t) n)
			ppk_throw(ParseError, factorsfile << ":" << line << ": Expected " << n << " index and weight pairs.");
		if(!ids.insert(id).second)
			ppk_throw(ParseError, factorsfile << ":" << line << ": Duplicate node " << id << ".");
		WeightRecord rec(id);
		for(int i = 0; i < n; ++i) {
			int idx;
			double w;
			if(!Util::parseInt(tok[2 + i * 2], &idx) || !Util::parseDouble(tok[3 + i * 2], &w))
				ppk_throw(ParseError, factorsfile << ":" << line << ": Invalid index or weight.");
			if(idx < 1 || (size_t) idx > table.pilotPointCount)
				ppk_throw(ParseError, factorsfile << ":" << line << ": Pilot point index " << idx << " is out of range.");
			rec.contributors.push_back(Contributor((size_t) (idx - 1), w));
		}
		table.records.push_back(rec);
	}
}

void Fac2ParConfig::check() const {
	if(factorsFile.empty())
		ppk_argerr("A factors file is required.");
	if(pilotPointFile.empty())
		ppk_argerr("A pilot points file is required.");
	if(outputFile.empty())
		ppk_argerr("An output file is required.");
	if(hasModel() && (zoneFile.empty() || zoneStructureFile.empty()))
		ppk_argerr("The structure file must be given with the zone and zone-structure files.");
	if(!hasModel() && (!zoneFile.empty() || !zoneStructureFile.empty()))
		ppk_argerr("The zone and zone-structure files require a structure file.");
	if(low > high)
		ppk_argerr("The lower limit " << low << " is greater than the upper limit " << high << ".");
	if(transform == TRANSFORM_LOG && useMean && mean <= 0.0)
		ppk_argerr("The mean must be positive for log-transformed values.");
}

double ppk2fac::factors::applyFactors(const WeightRecord &record, const std::vector<double> &values,
		const Fac2ParConfig &config) {
	return applyFactors(record, values, config, config.transform);
}

double ppk2fac::factors::applyFactors(const WeightRecord &record, const std::vector<double> &values,
		const Fac2ParConfig &config, int transform) {
	if(record.contributors.empty())
		return config.empty;

	const bool log = transform == TRANSFORM_LOG;
	if(log && config.useMean && config.mean <= 0.0)
		ppk_argerr("The mean must be positive for log-transformed values.");
	double v = 0.0;
	double t = 0.0;
	for(const Contributor &c : record.contributors) {
		if(c.index >= values.size())
			ppk_argerr("Pilot point index " << c.index << " of node " << record.targetId << " has no value.");
		double pv = values[c.index];
		if(log) {
			if(pv <= 0.0)
				ppk_argerr("Pilot point " << (c.index + 1) << " has a non-positive value and can't be log-transformed.");
			pv = std::log10(pv);
		}
		v += c.weight * pv;
		t += c.weight;
	}
	if(config.useMean)
		v += (1.0 - t) * (log ? std::log10(config.mean) : config.mean);
	if(log)
		v = std::pow(10.0, v);
	return ppk_max(config.low, ppk_min(config.high, v));
}

void ppk2fac::factors::nodeTransforms(const Fac2ParConfig &config, const FactorTable &table,
		std::map<int, int> &transforms) {
	std::map<std::string, Structure> structures;
	ppk2fac::io::readStructures(config.structureFile, config.defaults, structures);
	std::map<int, int> zones;
	ppk2fac::io::readZones(config.zoneFile, zones);
	std::map<int, std::string> zoneStructures;
	ppk2fac::io::readZoneStructures(config.zoneStructureFile, zoneStructures);

	for(const WeightRecord &rec : table.records) {
		auto zit = zones.find(rec.targetId);
		if(zit == zones.end())
			ppk_throw(CoverageError, "Node " << rec.targetId << " has no zone.");
		auto nit = zoneStructures.find(zit->second);
		if(nit == zoneStructures.end())
			ppk_throw(CoverageError, "Zone " << zit->second << " (node " << rec.targetId << ") has no structure.");
		auto sit = structures.find(Util::lower(nit->second));
		if(sit == structures.end())
			ppk_throw(CoverageError, "Zone " << zit->second << " uses undefined structure " << nit->second << ".");
		transforms[rec.targetId] = sit->second.transform;
	}
}

size_t ppk2fac::factors::fac2par(const Fac2ParConfig &config) {
	config.check();

	FactorTable table;
	readFactors(config.factorsFile, table);

	std::vector<PilotPoint> points;
	ppk2fac::io::readPilotPoints(config.pilotPointFile, points);
	if(points.size() != table.pilotPointCount)
		ppk_throw(CoverageError, "The factors in " << config.factorsFile << " are for " << table.pilotPointCount
				<< " pilot points but " << config.pilotPointFile << " has " << points.size() << ".");

	std::vector<double> values;
	for(const PilotPoint &pp : points)
		values.push_back(pp.value);

	// Without the model files, or with the log override, one transform serves every node.
	std::map<int, int> transforms;
	if(config.hasModel() && config.transform != TRANSFORM_LOG)
		nodeTransforms(config, table, transforms);

	std::ofstream out(config.outputFile.c_str(), std::ios::out | std::ios::trunc);
	if(!out)
		ppk_runerr("Could not open " << config.outputFile << " for writing.");
	size_t count = 0;
	for(const WeightRecord &rec : table.records) {
		out << std::setw(10) << rec.targetId << " "
			<< std::scientific << std::setprecision(9)
			<< applyFactors(rec, values, config, transforms.empty() ? config.transform : transforms[rec.targetId]) << "\n";
		++count;
	}
	out.close();
	if(out.fail())
		ppk_runerr("Failed to write " << config.outputFile << ".");
	ppk_debug("Wrote " << count << " node values to " << config.outputFile);
	return count;
}
