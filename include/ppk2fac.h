#ifndef __PPK2FAC_H__
#define __PPK2FAC_H__

#include <limits>
#include <exception>
#include <stdexcept>
#include <iostream>
#include <sstream>
#include <iomanip>

#define PPK_PI 3.14159265358979323846

#define ppk_min(a, b) ((a) > (b) ? (b) : (a))
#define ppk_max(a, b) ((a) < (b) ? (b) : (a))
#define ppk_sq(a) ((a) * (a))
#define ppk_rad(x) ((x) * PPK_PI / 180.0)

extern int ppk__loglevel;

#define PPK_LOG_TRACE 5
#define PPK_LOG_DEBUG 4
#define PPK_LOG_WARN 3
#define PPK_LOG_ERROR 2
#define PPK_LOG_NONE 0

#define ppk_loglevel(x) {ppk__loglevel = x;}
#define ppk_log(x, y) { if(ppk__loglevel >= y) std::cerr << std::setprecision(12) << x << std::endl; }
#define ppk_trace(x) ppk_log("TRACE:   " << x, PPK_LOG_TRACE)
#define ppk_debug(x) ppk_log("DEBUG:   " << x, PPK_LOG_DEBUG)
#define ppk_warn(x)  ppk_log("WARNING: " << x, PPK_LOG_WARN)
#define ppk_error(x) ppk_log("ERROR:   " << x, PPK_LOG_ERROR)

#define ppk_argerr(x) {std::stringstream _ss; _ss << x; throw std::invalid_argument(_ss.str());}
#define ppk_runerr(x) {std::stringstream _ss; _ss << x; throw std::runtime_error(_ss.str());}
// Throws an exception of the given type with a streamed message.
#define ppk_throw(type, x) {std::stringstream _ss; _ss << x; throw type(_ss.str());}

#endif
