#ifndef __READERS_HPP__
#define __READERS_HPP__

#include <string>
#include <vector>
#include <map>

#include "interp/PilotPoint.hpp"
#include "interp/Structure.hpp"

namespace ppk2fac {

    namespace io {

        /**
         * Read a pilot points file. Each line holds id, x, y and, optionally,
         * zone and value. Lines starting with # are comments. Raises
         * ParseError if the file can't be read, a record is malformed or
         * the file holds no pilot points.
         */
        void readPilotPoints(const std::string &ppfile, std::vector<ppk2fac::interp::PilotPoint> &points);

        /**
         * Read a mesh node file: id, x, y per line.
         */
        void readNodes(const std::string &nodefile, std::vector<ppk2fac::interp::GridNode> &nodes);

        /**
         * Read a zone file. The first record is a header and is skipped; the rest
         * are node id, zone id pairs. The map is keyed by node id.
         */
        void readZones(const std::string &zonefile, std::map<int, int> &zones);

        /**
         * Read a zone-structure file: zone id, structure name pairs. Each zone may
         * appear once.
         */
        void readZoneStructures(const std::string &zsfile, std::map<int, std::string> &zoneStructures);

        /**
         * Read the STRUCTURE and VARIOGRAM blocks of a structure file. Missing keys
         * take their values from defaults. The map is keyed by the lower-cased
         * structure name; each structure has its variograms resolved.
         */
        void readStructures(const std::string &structfile, const ppk2fac::interp::StructureDefaults &defaults,
                std::map<std::string, ppk2fac::interp::Structure> &structures);

    } // io

} // ppk2fac

#endif
