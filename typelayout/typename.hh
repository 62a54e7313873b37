#ifndef __TYPELAYOUT_TYPENAME_HH__
#define __TYPELAYOUT_TYPENAME_HH__

#include <string>
#include <boost/type_index.hpp>
#include <boost/lexical_cast.hpp>

namespace TypeLayout
{
    /** Returns a display name for \c T, including its cv-qualifiers and
     * references.
     *
     * The result depends on the compiler's type printer and is meant to be
     * read by humans only. Never parse it.
     */
    template<typename T>
    std::string getTypeName()
    { return boost::typeindex::type_id_with_cvr<T>().pretty_name(); }

    /** Returns the display name of a non-type template parameter */
    template<typename T>
    std::string getParameterName(T const& value)
    { return boost::lexical_cast<std::string>(value); }

    /** Checks that \c name can be used as a layout or field name, i.e. that
     * it is not empty and does not contain line breaks or other control
     * characters that would break the table output
     */
    bool isValidLayoutName(std::string const& name);

    /** Removes the namespace and class scopes from a C++ type name,
     * leaving template arguments untouched.
     *
     * getBasename("std::pair<int, ns::A>") returns "pair<int, ns::A>"
     */
    std::string getBasename(std::string const& full_name);
}

#endif

