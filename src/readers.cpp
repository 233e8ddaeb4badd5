#include <fstream>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "ppk2fac.h"
#include "errors.hpp"
#include "util.hpp"
#include "readers.hpp"

#define ppk_parseerr(file, line, x) ppk_throw(ParseError, file << ":" << line << ": " << x)

using namespace ppk2fac;
using namespace ppk2fac::util;
using namespace ppk2fac::interp;

namespace {

	void openInput(const std::string &filename, std::ifstream &in) {
		if(filename.empty())
			ppk_throw(ParseError, "An input file name is required.");
		if(!Util::exists(filename))
			ppk_throw(ParseError, "The file " << filename << " does not exist.");
		in.open(filename.c_str());
		if(!in)
			ppk_throw(ParseError, "Could not open " << filename << ".");
	}

	double toDouble(const std::string &file, int line, const std::string &token, const char *field) {
		double v;
		if(!Util::parseDouble(token, &v))
			ppk_parseerr(file, line, "The " << field << " field is not numeric: " << token);
		return v;
	}

	int toInt(const std::string &file, int line, const std::string &token, const char *field) {
		int v;
		if(!Util::parseInt(token, &v))
			ppk_parseerr(file, line, "The " << field << " field is not an integer: " << token);
		return v;
	}

	/**
	 * Parses the blocks of a structure file. States change on STRUCTURE,
	 * VARIOGRAM and END lines. Blocks of any other kind are skipped.
	 */
	class StructureParser {
	private:

		static const int SEEK_BLOCK = 0;
		static const int IN_STRUCTURE = 1;
		static const int IN_VARIOGRAM = 2;
		static const int IN_UNKNOWN = 3;

		// A structure's reference to a variogram block, resolved after parsing.
		class VariogramRef {
		public:
			std::string name;
			double contribution;
			int line;
			VariogramRef(const std::string &name, double contribution, int line) :
				name(name), contribution(contribution), line(line) {
			}
		};

		const std::string &m_file;
		const StructureDefaults &m_defaults;
		int m_state;
		int m_blockLine;
		std::string m_blockName;

		Structure m_structure;
		std::vector<VariogramRef> m_refs;
		int m_numVariogram;

		VariogramModel m_variogram;
		bool m_hasType;
		bool m_hasRange;

		std::map<std::string, Structure> m_structures;
		std::map<std::string, std::vector<VariogramRef> > m_structureRefs;
		std::map<std::string, VariogramModel> m_variograms;

		void beginStructure(const std::vector<std::string> &tok, int line) {
			if(tok.size() < 2)
				ppk_parseerr(m_file, line, "STRUCTURE requires a name.");
			if(m_structures.find(Util::lower(tok[1])) != m_structures.end())
				ppk_parseerr(m_file, line, "Duplicate structure " << tok[1] << ".");
			m_structure = Structure();
			m_structure.name = tok[1];
			m_structure.nugget = m_defaults.nugget;
			m_structure.transform = m_defaults.transform;
			m_structure.maxPowerVariance = m_defaults.maxPowerVariance;
			m_refs.clear();
			m_numVariogram = -1;
			m_state = IN_STRUCTURE;
			m_blockLine = line;
		}

		void beginVariogram(const std::vector<std::string> &tok, int line) {
			if(tok.size() < 2)
				ppk_parseerr(m_file, line, "VARIOGRAM requires a name.");
			if(m_variograms.find(Util::lower(tok[1])) != m_variograms.end())
				ppk_parseerr(m_file, line, "Duplicate variogram " << tok[1] << ".");
			m_variogram = VariogramModel();
			m_variogram.name = tok[1];
			m_variogram.bearing = m_defaults.bearing;
			m_variogram.anisotropy = m_defaults.anisotropy;
			m_hasType = false;
			m_hasRange = false;
			m_state = IN_VARIOGRAM;
			m_blockLine = line;
		}

		void endStructure(int line) {
			if(m_refs.empty())
				ppk_parseerr(m_file, line, "Structure " << m_structure.name << " lists no variograms.");
			if(m_numVariogram >= 0 && (size_t) m_numVariogram != m_refs.size())
				ppk_parseerr(m_file, line, "Structure " << m_structure.name << " declares NUMVARIOGRAM "
						<< m_numVariogram << " but lists " << m_refs.size() << ".");
			std::string key = Util::lower(m_structure.name);
			m_structures[key] = m_structure;
			m_structureRefs[key] = m_refs;
			m_state = SEEK_BLOCK;
			ppk_trace("Structure " << m_structure.name << ": nugget " << m_structure.nugget
					<< ", transform " << m_structure.transform << ", " << m_refs.size() << " variograms");
		}

		void endVariogram(int line) {
			if(!m_hasType)
				ppk_parseerr(m_file, line, "Variogram " << m_variogram.name << " has no VARTYPE.");
			if(!m_hasRange)
				ppk_parseerr(m_file, line, "Variogram " << m_variogram.name << " has no A.");
			m_variograms[Util::lower(m_variogram.name)] = m_variogram;
			m_state = SEEK_BLOCK;
			ppk_trace("Variogram " << m_variogram.name << ": vartype " << m_variogram.vartype
					<< ", a " << m_variogram.a << ", bearing " << m_variogram.bearing
					<< ", anisotropy " << m_variogram.anisotropy);
		}

		// Returns the value token following a key, or raises.
		const std::string &value(const std::vector<std::string> &tok, int line) {
			if(tok.size() < 2)
				ppk_parseerr(m_file, line, "Key " << tok[0] << " has no value.");
			return tok[1];
		}

		void structureKey(const std::string &key, const std::vector<std::string> &tok, int line) {
			if(key == "nugget") {
				m_structure.nugget = toDouble(m_file, line, value(tok, line), "NUGGET");
				if(m_structure.nugget < 0.0)
					ppk_parseerr(m_file, line, "NUGGET must not be negative.");
			} else if(key == "transform") {
				std::string t = Util::lower(value(tok, line));
				if(t == "none") {
					m_structure.transform = TRANSFORM_NONE;
				} else if(t == "log") {
					m_structure.transform = TRANSFORM_LOG;
				} else {
					ppk_parseerr(m_file, line, "Unknown TRANSFORM " << tok[1] << ".");
				}
			} else if(key == "maxpowervar") {
				m_structure.maxPowerVariance = toDouble(m_file, line, value(tok, line), "MAXPOWERVAR");
			} else if(key == "numvariogram") {
				m_numVariogram = toInt(m_file, line, value(tok, line), "NUMVARIOGRAM");
			} else if(key == "variogram") {
				double contribution = m_defaults.contribution;
				if(tok.size() > 2)
					contribution = toDouble(m_file, line, tok[2], "VARIOGRAM contribution");
				if(contribution <= 0.0)
					ppk_parseerr(m_file, line, "The contribution of variogram " << tok[1] << " must be positive.");
				m_refs.push_back(VariogramRef(value(tok, line), contribution, line));
			} else {
				ppk_debug("Ignoring unknown structure key " << tok[0] << " at " << m_file << ":" << line);
			}
		}

		void variogramKey(const std::string &key, const std::vector<std::string> &tok, int line) {
			if(key == "vartype") {
				m_variogram.vartype = toInt(m_file, line, value(tok, line), "VARTYPE");
				if(m_variogram.vartype < VARTYPE_SPHERICAL || m_variogram.vartype > VARTYPE_POWER)
					ppk_parseerr(m_file, line, "Unknown VARTYPE " << m_variogram.vartype << ".");
				m_hasType = true;
			} else if(key == "bearing") {
				m_variogram.bearing = toDouble(m_file, line, value(tok, line), "BEARING");
			} else if(key == "a") {
				m_variogram.a = toDouble(m_file, line, value(tok, line), "A");
				if(m_variogram.a <= 0.0)
					ppk_parseerr(m_file, line, "A must be positive.");
				m_hasRange = true;
			} else if(key == "anisotropy") {
				m_variogram.anisotropy = toDouble(m_file, line, value(tok, line), "ANISOTROPY");
				if(m_variogram.anisotropy <= 0.0)
					ppk_parseerr(m_file, line, "ANISOTROPY must be positive.");
			} else {
				ppk_debug("Ignoring unknown variogram key " << tok[0] << " at " << m_file << ":" << line);
			}
		}

	public:

		StructureParser(const std::string &file, const StructureDefaults &defaults) :
			m_file(file),
			m_defaults(defaults),
			m_state(SEEK_BLOCK),
			m_blockLine(0),
			m_numVariogram(-1),
			m_hasType(false),
			m_hasRange(false) {
		}

		void line(const std::vector<std::string> &tok, int line) {
			std::string key = Util::lower(tok[0]);
			switch(m_state) {
			case SEEK_BLOCK:
				if(key == "structure") {
					beginStructure(tok, line);
				} else if(key == "variogram") {
					beginVariogram(tok, line);
				} else if(key == "end") {
					ppk_parseerr(m_file, line, "END outside of a block.");
				} else {
					// Some other block; skipped up to its END.
					ppk_debug("Skipping unknown block " << tok[0] << " at " << m_file << ":" << line);
					m_blockName = tok[0];
					m_blockLine = line;
					m_state = IN_UNKNOWN;
				}
				break;
			case IN_STRUCTURE:
				if(key == "end") {
					endStructure(line);
				} else if(key == "structure") {
					ppk_parseerr(m_file, line, "STRUCTURE inside structure " << m_structure.name << "; missing END?");
				} else {
					structureKey(key, tok, line);
				}
				break;
			case IN_VARIOGRAM:
				if(key == "end") {
					endVariogram(line);
				} else if(key == "structure" || key == "variogram") {
					ppk_parseerr(m_file, line, tok[0] << " inside variogram " << m_variogram.name << "; missing END?");
				} else {
					variogramKey(key, tok, line);
				}
				break;
			case IN_UNKNOWN:
				if(key == "end") {
					m_state = SEEK_BLOCK;
				} else if(key == "structure") {
					ppk_parseerr(m_file, line, "STRUCTURE inside block " << m_blockName << "; missing END?");
				}
				break;
			}
		}

		/**
		 * Checks that no block is left open and resolves the variogram
		 * references of every structure.
		 */
		void finish(std::map<std::string, Structure> &structures) {
			if(m_state == IN_STRUCTURE)
				ppk_parseerr(m_file, m_blockLine, "Structure " << m_structure.name << " has no END.");
			if(m_state == IN_VARIOGRAM)
				ppk_parseerr(m_file, m_blockLine, "Variogram " << m_variogram.name << " has no END.");
			if(m_state == IN_UNKNOWN)
				ppk_parseerr(m_file, m_blockLine, "Block " << m_blockName << " has no END.");
			for(auto &it : m_structures) {
				Structure &s = it.second;
				for(const VariogramRef &ref : m_structureRefs[it.first]) {
					auto vit = m_variograms.find(Util::lower(ref.name));
					if(vit == m_variograms.end())
						ppk_parseerr(m_file, ref.line, "Structure " << s.name << " refers to undefined variogram " << ref.name << ".");
					s.variograms.push_back(StructureVariogram(ref.contribution, vit->second));
				}
				structures[it.first] = s;
			}
		}

	};

} // anon

namespace ppk2fac {

	namespace io {

		void readPilotPoints(const std::string &ppfile, std::vector<PilotPoint> &points) {
			std::ifstream in;
			openInput(ppfile, in);
			std::set<std::string> ids;
			std::vector<std::string> tok;
			std::string buf;
			int line = 0;
			while(std::getline(in, buf)) {
				++line;
				if(Util::isComment(buf, Util::PP_COMMENTS))
					continue;
				Util::splitString(buf, tok);
				if(tok.size() < 3)
					ppk_parseerr(ppfile, line, "Expected id, x and y.");
				PilotPoint pp(tok[0],
						toDouble(ppfile, line, tok[1], "x"),
						toDouble(ppfile, line, tok[2], "y"));
				if(tok.size() > 3)
					pp.zone = toInt(ppfile, line, tok[3], "zone");
				if(tok.size() > 4)
					pp.value = toDouble(ppfile, line, tok[4], "value");
				if(!ids.insert(pp.id).second)
					ppk_parseerr(ppfile, line, "Duplicate pilot point " << pp.id << ".");
				points.push_back(pp);
			}
			if(points.empty())
				ppk_throw(ParseError, "No pilot points in " << ppfile << ".");
			ppk_debug("Read " << points.size() << " pilot points from " << ppfile);
		}

		void readNodes(const std::string &nodefile, std::vector<GridNode> &nodes) {
			std::ifstream in;
			openInput(nodefile, in);
			std::set<int> ids;
			std::vector<std::string> tok;
			std::string buf;
			int line = 0;
			while(std::getline(in, buf)) {
				++line;
				if(Util::isComment(buf, Util::MODEL_COMMENTS))
					continue;
				Util::splitString(buf, tok);
				if(tok.size() < 3)
					ppk_parseerr(nodefile, line, "Expected id, x and y.");
				GridNode node(toInt(nodefile, line, tok[0], "node id"),
						toDouble(nodefile, line, tok[1], "x"),
						toDouble(nodefile, line, tok[2], "y"));
				if(!ids.insert(node.id).second)
					ppk_parseerr(nodefile, line, "Duplicate node " << node.id << ".");
				nodes.push_back(node);
			}
			if(nodes.empty())
				ppk_throw(ParseError, "No nodes in " << nodefile << ".");
			ppk_debug("Read " << nodes.size() << " nodes from " << nodefile);
		}

		void readZones(const std::string &zonefile, std::map<int, int> &zones) {
			std::ifstream in;
			openInput(zonefile, in);
			std::vector<std::string> tok;
			std::string buf;
			int line = 0;
			bool header = true;
			while(std::getline(in, buf)) {
				++line;
				if(Util::isComment(buf, Util::MODEL_COMMENTS))
					continue;
				if(header) {
					header = false;
					continue;
				}
				Util::splitString(buf, tok);
				if(tok.size() < 2)
					ppk_parseerr(zonefile, line, "Expected node id and zone id.");
				int node = toInt(zonefile, line, tok[0], "node id");
				int zone = toInt(zonefile, line, tok[1], "zone id");
				if(!zones.insert(std::make_pair(node, zone)).second)
					ppk_parseerr(zonefile, line, "Node " << node << " is assigned a zone twice.");
			}
			ppk_debug("Read " << zones.size() << " zone assignments from " << zonefile);
		}

		void readZoneStructures(const std::string &zsfile, std::map<int, std::string> &zoneStructures) {
			std::ifstream in;
			openInput(zsfile, in);
			std::vector<std::string> tok;
			std::string buf;
			int line = 0;
			while(std::getline(in, buf)) {
				++line;
				if(Util::isComment(buf, Util::MODEL_COMMENTS))
					continue;
				Util::splitString(buf, tok);
				if(tok.size() < 2)
					ppk_parseerr(zsfile, line, "Expected zone id and structure name.");
				int zone = toInt(zsfile, line, tok[0], "zone id");
				if(!zoneStructures.insert(std::make_pair(zone, tok[1])).second)
					ppk_parseerr(zsfile, line, "Zone " << zone << " is assigned a structure twice.");
			}
			ppk_debug("Read " << zoneStructures.size() << " zone structures from " << zsfile);
		}

		void readStructures(const std::string &structfile, const StructureDefaults &defaults,
				std::map<std::string, Structure> &structures) {
			std::ifstream in;
			openInput(structfile, in);
			StructureParser parser(structfile, defaults);
			std::vector<std::string> tok;
			std::string buf;
			int line = 0;
			while(std::getline(in, buf)) {
				++line;
				if(Util::isComment(buf, Util::PP_COMMENTS))
					continue;
				Util::splitString(buf, tok);
				parser.line(tok, line);
			}
			parser.finish(structures);
			ppk_debug("Read " << structures.size() << " structures from " << structfile);
		}

	} // io

} // ppk2fac
