#include <iostream>
#include <string>
#include <vector>

#include "ppk2fac.h"
#include "util.hpp"
#include "factors.hpp"
#include "interp/Structure.hpp"

using namespace ppk2fac::factors;
using namespace ppk2fac::util;

void usage() {
	std::cerr << "Usage: fac2par [options] <factors file> <pp file> <output file>\n"
		<< "Interpolates pilot point values to mesh nodes using the factors written by ppk2fac.\n"
		<< " -l <float>               The lower limit of interpolated values. Default 0.\n"
		<< " -u <float>               The upper limit of interpolated values. Default 1000000.\n"
		<< " -e <float>               The value of nodes with no factors. Default -999.\n"
		<< " --structures <file>      The structure file of the ppk2fac run. Given with\n"
		<< " --zones <file>           the zone and zone-structure files, each node's\n"
		<< " --zone-structures <file> values are combined under the TRANSFORM of its\n"
		<< "                          zone's structure.\n"
		<< " --log                    Interpolate the logarithms of the values at every node.\n"
		<< " --mean <float>           The known mean, for factors computed by simple kriging.\n"
		<< " -v                       Verbose output.\n"
		<< " -h                       Print this message.\n";
}

double parseDouble(const std::string &s, const char *name) {
	double v;
	if(!Util::parseDouble(s, &v))
		ppk_argerr("Invalid " << name << ": " << s);
	return v;
}

int main(int argc, char **argv) {

	try {

		Fac2ParConfig config;
		std::vector<std::string> args;

		for(int i = 1; i < argc; ++i) {
			std::string s(argv[i]);
			if(s == "-h") {
				usage();
				return 0;
			} else if(s == "-v") {
				ppk_loglevel(PPK_LOG_DEBUG);
			} else if(s == "-l" && i + 1 < argc) {
				config.low = parseDouble(argv[++i], "lower limit");
			} else if(s == "-u" && i + 1 < argc) {
				config.high = parseDouble(argv[++i], "upper limit");
			} else if(s == "-e" && i + 1 < argc) {
				config.empty = parseDouble(argv[++i], "empty value");
			} else if(s == "--structures" && i + 1 < argc) {
				config.structureFile = argv[++i];
			} else if(s == "--zones" && i + 1 < argc) {
				config.zoneFile = argv[++i];
			} else if(s == "--zone-structures" && i + 1 < argc) {
				config.zoneStructureFile = argv[++i];
			} else if(s == "--log") {
				config.transform = ppk2fac::interp::TRANSFORM_LOG;
			} else if(s == "--mean" && i + 1 < argc) {
				config.mean = parseDouble(argv[++i], "mean");
				config.useMean = true;
			} else {
				args.push_back(s);
			}
		}

		if(args.size() != 3)
			ppk_argerr("Expected 3 arguments; " << args.size() << " given.");

		config.factorsFile = args[0];
		config.pilotPointFile = args[1];
		config.outputFile = args[2];

		size_t count = fac2par(config);

		std::cerr << "Wrote " << count << " node values to " << config.outputFile << "." << std::endl;

	} catch(const std::exception &ex) {
		ppk_error(ex.what());
		usage();
		return 1;
	}

	return 0;
}
