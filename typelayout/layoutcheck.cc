#include "layoutcheck.hh"
#include <boost/lexical_cast.hpp>

using namespace std;
using boost::lexical_cast;

namespace TypeLayout
{
    void checkLayout(LayoutReport const& report)
    {
        string const type_name = report.getTypeName();
        size_t const alignment = report.getAlignment();
        if (alignment == 0)
            throw MalformedReport(type_name, "null alignment");
        if ((alignment & (alignment - 1)) != 0)
            throw MalformedReport(type_name, "alignment " + lexical_cast<string>(alignment) + " is not a power of two");
        if (report.getSize() % alignment != 0)
            throw MalformedReport(type_name, "size " + lexical_cast<string>(report.getSize())
                    + " is not a multiple of the alignment " + lexical_cast<string>(alignment));

        LayoutReport::FieldList fields = report.getSortedFields();
        FieldDescriptor const* last = 0;
        for (LayoutReport::FieldList::const_iterator it = fields.begin(); it != fields.end(); ++it)
        {
            // getEndOffset() may wrap around for absurd offsets
            if (it->getOffset() > report.getSize() || it->getSize() > report.getSize() - it->getOffset())
                throw MalformedReport(type_name, "field " + it->getName() + " at offset "
                        + lexical_cast<string>(it->getOffset()) + " with size "
                        + lexical_cast<string>(it->getSize()) + " does not fit in the type");

            // Empty members can share their offset with the next field
            if (last && last->getEndOffset() > it->getOffset() && it->getSize() != 0)
                throw MalformedReport(type_name, "fields " + last->getName() + " and " + it->getName() + " overlap");

            if (!last || it->getEndOffset() > last->getEndOffset())
                last = &(*it);
        }
    }

    bool isWellFormed(LayoutReport const& report)
    {
        try { checkLayout(report); }
        catch(MalformedReport const&) { return false; }
        return true;
    }
}

