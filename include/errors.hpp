#ifndef __ERRORS_HPP__
#define __ERRORS_HPP__

#include <string>
#include <stdexcept>

namespace ppk2fac {

    /**
     * An input file could not be opened, or a record in it is malformed.
     * Fatal.
     */
    class ParseError : public std::runtime_error {
    public:
        ParseError(const std::string &msg) :
            std::runtime_error(msg) {
        }
    };

    /**
     * Two pilot points share the same coordinates. Fatal; raised before
     * any weights are computed.
     */
    class DegenerateGeometryError : public std::runtime_error {
    public:
        DegenerateGeometryError(const std::string &msg) :
            std::runtime_error(msg) {
        }
    };

    /**
     * The mesh, zone and structure inputs do not cover each other. Fatal.
     */
    class CoverageError : public std::runtime_error {
    public:
        CoverageError(const std::string &msg) :
            std::runtime_error(msg) {
        }
    };

    /**
     * The kriging system for a node could not be solved.
     */
    class SingularKrigingSystemError : public std::runtime_error {
    private:
        int m_zone;
        int m_node;
    public:
        SingularKrigingSystemError(int zone, int node, const std::string &msg) :
            std::runtime_error(msg),
            m_zone(zone), m_node(node) {
        }

        int zone() const {
            return m_zone;
        }

        int node() const {
            return m_node;
        }
    };

    /**
     * Fewer than the minimum number of pilot points were found inside the
     * search radius of a node. Recoverable.
     */
    class InsufficientPilotPointsError : public std::runtime_error {
    private:
        int m_node;
        size_t m_found;
        size_t m_required;
    public:
        InsufficientPilotPointsError(int node, size_t found, size_t required, const std::string &msg) :
            std::runtime_error(msg),
            m_node(node), m_found(found), m_required(required) {
        }

        int node() const {
            return m_node;
        }

        size_t found() const {
            return m_found;
        }

        size_t required() const {
            return m_required;
        }
    };

} // ppk2fac

#endif
