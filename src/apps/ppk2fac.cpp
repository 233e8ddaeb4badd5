#include <iostream>
#include <string>
#include <vector>

#include "ppk2fac.h"
#include "util.hpp"
#include "par2fac.hpp"

using namespace ppk2fac::fac;
using namespace ppk2fac::util;

void usage() {
	std::cerr << "Usage: ppk2fac [options] <pp file> <node file> <structure file> <zone file>\n"
		<< "               <zone structure file> <factors file> <regularisation file>\n"
		<< "               <krige type> <search radius> <min points> <max points>\n"
		<< "Computes the factors that interpolate pilot point values to mesh nodes.\n"
		<< " <regularisation file>       The pilot point covariance output. Use - to skip.\n"
		<< " <krige type>                o - ordinary kriging.\n"
		<< "                             s - simple kriging.\n"
		<< "                             idw - inverse distance weighting.\n"
		<< " <search radius>             Pilot points farther from a node than this are ignored.\n"
		<< " <min points>                Nodes with fewer pilot points in range get no factors.\n"
		<< " <max points>                The most pilot points used for a node.\n"
		<< " --on-singular <policy>      What to do with a singular kriging system:\n"
		<< "                             skip (default), abort or idw.\n"
		<< " --tolerance <float>         The smallest acceptable reciprocal condition number\n"
		<< "                             of a kriging system. Default 1e-12.\n"
		<< " --idw-exponent <float>      The IDW distance exponent. Default 2.\n"
		<< " --threads <int>             The number of threads to use. Default 1.\n"
		<< " -v                          Verbose output.\n"
		<< " -h                          Print this message.\n";
}

int parseMethod(const std::string &type) {
	std::string t = Util::lower(type);
	if(t == "o" || t == "ordinary")
		return METHOD_ORDINARY;
	if(t == "s" || t == "simple")
		return METHOD_SIMPLE;
	if(t == "idw")
		return METHOD_IDW;
	ppk_argerr("Unknown krige type " << type << ".");
}

int parsePolicy(const std::string &policy) {
	std::string p = Util::lower(policy);
	if(p == "skip")
		return ON_SINGULAR_SKIP;
	if(p == "abort")
		return ON_SINGULAR_ABORT;
	if(p == "idw")
		return ON_SINGULAR_IDW;
	ppk_argerr("Unknown singular system policy " << policy << ".");
}

double parseDouble(const std::string &s, const char *name) {
	double v;
	if(!Util::parseDouble(s, &v))
		ppk_argerr("Invalid " << name << ": " << s);
	return v;
}

int parseInt(const std::string &s, const char *name) {
	int v;
	if(!Util::parseInt(s, &v))
		ppk_argerr("Invalid " << name << ": " << s);
	return v;
}

int main(int argc, char **argv) {

	try {

		Par2FacConfig config;
		std::vector<std::string> args;

		for(int i = 1; i < argc; ++i) {
			std::string s(argv[i]);
			if(s == "-h") {
				usage();
				return 0;
			} else if(s == "-v") {
				ppk_loglevel(PPK_LOG_DEBUG);
			} else if(s == "--threads" && i + 1 < argc) {
				config.threads = parseInt(argv[++i], "thread count");
			} else if(s == "--on-singular" && i + 1 < argc) {
				config.onSingular = parsePolicy(argv[++i]);
			} else if(s == "--tolerance" && i + 1 < argc) {
				config.tolerance = parseDouble(argv[++i], "tolerance");
			} else if(s == "--idw-exponent" && i + 1 < argc) {
				config.idwExponent = parseDouble(argv[++i], "IDW exponent");
			} else {
				args.push_back(s);
			}
		}

		if(args.size() != 11)
			ppk_argerr("Expected 11 arguments; " << args.size() << " given.");

		int minPoints = parseInt(args[9], "minimum pilot point count");
		int maxPoints = parseInt(args[10], "maximum pilot point count");
		if(minPoints < 1 || maxPoints < 1)
			ppk_argerr("Pilot point counts must be at least 1.");

		config.pilotPointFile = args[0];
		config.nodeFile = args[1];
		config.structureFile = args[2];
		config.zoneFile = args[3];
		config.zoneStructureFile = args[4];
		config.factorsFile = args[5];
		if(args[6] != "-")
			config.regularisationFile = args[6];
		config.method = parseMethod(args[7]);
		config.searchRadius = parseDouble(args[8], "search radius");
		config.minPilotPoints = (unsigned int) minPoints;
		config.maxPilotPoints = (unsigned int) maxPoints;

		Par2Fac p2f;
		Par2FacResult result = p2f.run(config);

		std::cerr << "Wrote factors for " << result.written << " of " << result.nodes << " nodes";
		if(result.skipped > 0)
			std::cerr << "; " << result.skipped << " nodes skipped";
		std::cerr << "." << std::endl;

	} catch(const std::exception &ex) {
		ppk_error(ex.what());
		usage();
		return 1;
	}

	return 0;
}
