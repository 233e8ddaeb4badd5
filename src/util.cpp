#include <cmath>
#include <sstream>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

#include "ppk2fac.h"
#include "util.hpp"

using namespace ppk2fac::util;

int ppk__loglevel = PPK_LOG_WARN;

const std::string Util::PP_COMMENTS = "#";
const std::string Util::MODEL_COMMENTS = "#Cc";

void Util::splitString(const std::string &str, std::vector<std::string> &lst) {
	std::string s = boost::algorithm::trim_copy(str);
	lst.clear();
	if(s.empty())
		return;
	boost::algorithm::split(lst, s, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
}

bool Util::isComment(const std::string &line, const std::string &prefixes) {
	std::string s = boost::algorithm::trim_left_copy(line);
	if(s.empty())
		return true;
	return prefixes.find(s[0]) != std::string::npos;
}

bool Util::parseDouble(const std::string &token, double *value) {
	double v;
	if(!boost::conversion::try_lexical_convert(token, v) || !std::isfinite(v))
		return false;
	*value = v;
	return true;
}

bool Util::parseInt(const std::string &token, int *value) {
	return boost::conversion::try_lexical_convert(token, *value);
}

std::string Util::lower(const std::string &str) {
	return boost::algorithm::to_lower_copy(str);
}

bool Util::exists(const std::string &filename) {
	using namespace boost::filesystem;
	path p(filename);
	return boost::filesystem::exists(p) && is_regular_file(p);
}

void Util::status(int step, int of, const std::string &message, bool end) {
	#pragma omp critical(__status)
	{
		if(step < 0)  step = 0;
		if(of <= 0)   of = 1;
		if(step > of) of = step;
		float status = (float) (step * 100) / of;
		std::stringstream out;
		out << "Status: " << std::fixed << std::setprecision(2) << status << "% " << message << std::right << std::setw(40) << std::setfill(' ');
		if(end)
			out << std::endl;
		else
			out << '\r';
		std::cerr << out.str();
		std::cerr.flush();
	}
}
