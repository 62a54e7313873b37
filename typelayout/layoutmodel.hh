#ifndef __TYPELAYOUT_LAYOUTMODEL_HH__
#define __TYPELAYOUT_LAYOUTMODEL_HH__

#include <string>
#include <vector>
#include <stdexcept>
#include <stddef.h>

namespace TypeLayout
{
    /** Base class for all exceptions related to layout descriptions */
    class LayoutException : public std::runtime_error
    {
    public:
        LayoutException(std::string const& msg) : std::runtime_error(msg) {}
    };

    /** A field in a LayoutReport
     *
     * The offset and size are the ones computed by the compiler for the
     * containing type. They are never recomputed here.
     */
    class FieldDescriptor
    {
        std::string m_name;
        std::string m_type_name;
        size_t m_size;
        size_t m_offset;

    public:
        FieldDescriptor(std::string const& name, std::string const& type_name,
                size_t size, size_t offset);

	/** The field name, or its zero-based index for positional fields */
        std::string getName() const;
	/** The declared type of the field, for display only */
        std::string getTypeName() const;
	/** Size in bytes of the field */
        size_t getSize() const;
	/** The offset, in bytes, of this field w.r.t. the
	 * beginning of the containing type */
        size_t getOffset() const;
        /** Offset of the first byte after this field */
        size_t getEndOffset() const;

	bool operator == (FieldDescriptor const& field) const;
	bool operator != (FieldDescriptor const& field) const;
    };

    /** Layout of one inspected type
     *
     * A LayoutReport is a read-only snapshot built once, from a fully
     * instanciated type, by LayoutBuilder. It performs no validation: see
     * checkLayout for that.
     *
     * The field list is kept in the order it has been given. Consumers that
     * need it sorted by offset (LayoutDisplay, the exporters) sort it
     * themselves.
     */
    class LayoutReport
    {
    public:
        typedef std::vector<FieldDescriptor> FieldList;
        typedef std::vector<std::string> ParameterList;

    private:
        std::string m_type_name;
        size_t m_size;
        size_t m_alignment;
        FieldList m_fields;
        ParameterList m_generic_parameters;

    public:
        LayoutReport(std::string const& type_name, size_t size, size_t alignment,
                FieldList const& fields = FieldList(),
                ParameterList const& generic_parameters = ParameterList());

	/** The inspected type name */
        std::string getTypeName() const;
	/** Size in bytes of a value */
        size_t getSize() const;
        /** Minimum alignment requirement, in bytes */
        size_t getAlignment() const;
	/** The list of all fields, in the order they were registered */
        FieldList const& getFields() const;
        /** The fields, sorted by ascending offset. Fields sharing the same
         * offset keep their relative order */
        FieldList getSortedFields() const;
        /** Get a field by its name
         * @return 0 if there is no @c name field, or the FieldDescriptor object */
        FieldDescriptor const* getField(std::string const& name) const;
        /** The display names of the template parameters the type has been
         * instanciated with */
        ParameterList const& getGenericParameters() const;

        bool operator == (LayoutReport const& other) const;
        bool operator != (LayoutReport const& other) const;
    };
}

#endif

