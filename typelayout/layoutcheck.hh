#ifndef TYPELAYOUT_LAYOUTCHECK_HH
#define TYPELAYOUT_LAYOUTCHECK_HH

#include "layoutmodel.hh"

namespace TypeLayout
{
    /** Thrown by checkLayout when a report is not self-consistent */
    class MalformedReport : public LayoutException
    {
        std::string m_type_name;

    public:
        MalformedReport(std::string const& type_name, std::string const& reason)
            : LayoutException("malformed layout for " + type_name + ": " + reason)
            , m_type_name(type_name) {}
        ~MalformedReport() throw() {}

        std::string getTypeName() const { return m_type_name; }
    };

    /** Checks that \c report describes a possible memory layout:
     * <ul>
     *  <li> the alignment is a non-zero power of two and the size is a
     *       multiple of it
     *  <li> every field lies within the type
     *  <li> fields do not overlap
     * </ul>
     *
     * Neither LayoutDisplay nor the exporters call it: they render whatever
     * they are given.
     *
     * @throws MalformedReport on the first violation found
     */
    void checkLayout(LayoutReport const& report);

    /** Non-throwing version of checkLayout */
    bool isWellFormed(LayoutReport const& report);
}

#endif

