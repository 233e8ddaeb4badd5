#ifndef __FACTORS_HPP__
#define __FACTORS_HPP__

#include <string>
#include <vector>
#include <map>
#include <ostream>

#include "interp/PilotPoint.hpp"
#include "interp/Structure.hpp"

namespace ppk2fac {

    namespace factors {

        /**
         * The interpolation factors of a run: for every node, the pilot points
         * that contribute to it and their weights.
         */
        class FactorTable {
        public:
            std::string pilotPointFile;
            size_t pilotPointCount;
            std::vector<ppk2fac::interp::WeightRecord> records;
            FactorTable() :
                pilotPointCount(0) {
            }
        };

        /**
         * Writes the table. Nodes are written in ascending id order and their
         * contributors in ascending pilot point index; indices are written
         * 1-based. Returns the number of nodes written with at least one
         * contributor.
         */
        size_t writeFactors(std::ostream &out, const FactorTable &table);

        size_t writeFactors(const std::string &factorsfile, const FactorTable &table);

        /**
         * Reads a factors file written by writeFactors. Indices are returned 0-based.
         */
        void readFactors(const std::string &factorsfile, FactorTable &table);

        // Contains configuration information for applying factors to pilot point values.
        class Fac2ParConfig {
        public:
            std::string factorsFile;
            std::string pilotPointFile;
            std::string outputFile;

            // The model files of the ppk2fac run. If given, each node's values are
            // combined under the TRANSFORM of its zone's structure.
            std::string structureFile;
            std::string zoneFile;
            std::string zoneStructureFile;
            ppk2fac::interp::StructureDefaults defaults;

            // Interpolated values are clamped to [low, high].
            double low;
            double high;

            // The value given to nodes without contributors.
            double empty;

            // If TRANSFORM_LOG, the values of every node are combined as base-10
            // logarithms, whatever the structures declare.
            int transform;

            // The known mean for simple kriging factors. The weight left over when
            // a node's weights don't sum to one is given to the mean.
            bool useMean;
            double mean;

            Fac2ParConfig() :
                low(0.0),
                high(1000000.0),
                empty(-999.0),
                transform(ppk2fac::interp::TRANSFORM_NONE),
                useMean(false),
                mean(0.0) {
            }

            bool hasModel() const {
                return !structureFile.empty();
            }

            void check() const;
        };

        /**
         * Computes the value of one node from the pilot point values, combining
         * them under the given transform. Returns config.empty if the record has
         * no contributors.
         */
        double applyFactors(const ppk2fac::interp::WeightRecord &record, const std::vector<double> &values,
                const Fac2ParConfig &config, int transform);

        double applyFactors(const ppk2fac::interp::WeightRecord &record, const std::vector<double> &values,
                const Fac2ParConfig &config);

        /**
         * Reads the model files named in the config and fills transforms with
         * the transform of each node's structure, keyed by node id. Raises
         * CoverageError if a node in the table has no zone, or its zone no
         * defined structure.
         */
        void nodeTransforms(const Fac2ParConfig &config, const FactorTable &table,
                std::map<int, int> &transforms);

        /**
         * Reads the factors and pilot points named in the config and writes one
         * "node value" line per node to the output file. Returns the number
         * of nodes written.
         */
        size_t fac2par(const Fac2ParConfig &config);

    } // factors

} // ppk2fac

#endif
