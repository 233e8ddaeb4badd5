#ifndef __UTIL_HPP__
#define __UTIL_HPP__

#include <string>
#include <vector>

#include "ppk2fac.h"

namespace ppk2fac {

    namespace util {

        /**
         * Provides utility methods for reading line-oriented input files.
         */
        class Util {
        public:

            // Comment prefixes for pilot-point files.
            static const std::string PP_COMMENTS;

            // Comment prefixes for node, zone and zone-structure files.
            static const std::string MODEL_COMMENTS;

            /**
             * Split a whitespace-delimited line into tokens. Runs of
             * whitespace are treated as a single delimiter.
             */
            static void splitString(const std::string &str, std::vector<std::string> &lst);

            /**
             * Return true if the line is blank, or if its first character is
             * one of the given comment prefixes.
             */
            static bool isComment(const std::string &line, const std::string &prefixes);

            /**
             * Parse a double. Returns false if the whole token is not numeric,
             * or if it is not finite (nan, inf).
             */
            static bool parseDouble(const std::string &token, double *value);

            /**
             * Parse an integer. Returns false if the whole token is not an integer.
             */
            static bool parseInt(const std::string &token, int *value);

            static std::string lower(const std::string &str);

            static bool exists(const std::string &filename);

            /**
             * Prints out a status message; a percentage representing current
             * of total steps.
             */
            static void status(int step, int of, const std::string &message = "", bool end = false);

        };

    } // util

} // ppk2fac

#endif
