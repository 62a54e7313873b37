#ifndef __TYPELAYOUT_LAYOUTBUILDER_HH__
#define __TYPELAYOUT_LAYOUTBUILDER_HH__

#include <string>
#include <stddef.h>

#include <boost/static_assert.hpp>
#include <boost/type_traits/alignment_of.hpp>
#include <boost/type_traits/is_base_of.hpp>
#include <boost/type_traits/is_class.hpp>
#include <boost/type_traits/is_same.hpp>
#include <boost/type_traits/is_union.hpp>
#include <boost/lexical_cast.hpp>

#include "layoutmodel.hh"
#include "typename.hh"

/** Registers the named field \c member of \c type into the LayoutBuilder
 * \c builder. \c type must not contain commas: use a typedef for template
 * instances
 */
#define TYPELAYOUT_FIELD(builder, type, member) \
    (builder).addField(#member, offsetof(type, member), &type::member)

/** Registers \c member of \c type as the positional field \c index. The field
 * is displayed by its index instead of its name
 */
#define TYPELAYOUT_POSITIONAL_FIELD(builder, index, type, member) \
    (builder).addField(static_cast<size_t>(index), offsetof(type, member), &type::member)

namespace TypeLayout
{
    /** Helper class to build the LayoutReport of a C++ type
     *
     * Size and alignment are the ones of \c T. Field offsets are provided by
     * the caller, normally through offsetof (see TYPELAYOUT_FIELD), and the
     * field sizes and type names are deduced from the member pointers.
     *
     * Only classes and structures can be described. Unions (and non-class
     * types such as enums) are rejected at compile time.
     */
    template<typename T>
    class LayoutBuilder
    {
        BOOST_STATIC_ASSERT_MSG((boost::is_class<T>::value && !boost::is_union<T>::value),
                "type layouts can only be built for structures and classes");

        std::string m_name;
        LayoutReport::FieldList m_fields;
        LayoutReport::ParameterList m_parameters;

    public:
        typedef T layout_type;

        /** Initializes the builder, using getTypeName<T>() as the type name */
        LayoutBuilder()
            : m_name(getTypeName<T>()) {}
        /** Initializes the builder with an explicit display name */
        explicit LayoutBuilder(std::string const& name)
            : m_name(name) {}

        /** Adds a named field
         *
         * @arg name    the field name
         * @arg offset  the field offset, as returned by offsetof
         * @arg member  the member pointer. It is used only to deduce the
         *              field type
         */
        template<typename Field, typename Owner>
        LayoutBuilder& addField(std::string const& name, size_t offset, Field Owner::*)
        {
            BOOST_STATIC_ASSERT((boost::is_same<Owner, T>::value || boost::is_base_of<Owner, T>::value));
            m_fields.push_back(FieldDescriptor(name, getTypeName<Field>(), sizeof(Field), offset));
            return *this;
        }

        /** Adds a positional field, named by its zero-based index */
        template<typename Field, typename Owner>
        LayoutBuilder& addField(size_t index, size_t offset, Field Owner::* member)
        { return addField(boost::lexical_cast<std::string>(index), offset, member); }

        /** Adds a template type parameter */
        template<typename Parameter>
        LayoutBuilder& addParameter()
        {
            m_parameters.push_back(getTypeName<Parameter>());
            return *this;
        }

        /** Adds a non-type template parameter */
        template<typename Value>
        LayoutBuilder& addParameterValue(Value const& value)
        {
            m_parameters.push_back(getParameterName(value));
            return *this;
        }

        /** Returns the layout report of T */
        LayoutReport getLayout() const
        {
            return LayoutReport(m_name, sizeof(T), boost::alignment_of<T>::value,
                    m_fields, m_parameters);
        }
    };

    /** Types are made inspectable by specializing this template and
     * providing a static describe() method:
     *
     * <code>
     * namespace TypeLayout {
     *     template<> struct Inspectable<Foo>
     *     {
     *         static LayoutReport describe()
     *         {
     *             LayoutBuilder<Foo> builder("Foo");
     *             TYPELAYOUT_FIELD(builder, Foo, a);
     *             TYPELAYOUT_FIELD(builder, Foo, b);
     *             return builder.getLayout();
     *         }
     *     };
     * }
     * </code>
     *
     * The primary template is left undefined so that asking for the layout
     * of a type that has not been registered fails at compile time.
     */
    template<typename T>
    struct Inspectable;

    /** Returns the layout of the inspectable type T */
    template<typename T>
    LayoutReport layout_of()
    { return Inspectable<T>::describe(); }
}

#endif

