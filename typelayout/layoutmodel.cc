#include "layoutmodel.hh"

#include <algorithm>

using namespace std;

namespace
{
    bool offsetLess(TypeLayout::FieldDescriptor const& a, TypeLayout::FieldDescriptor const& b)
    { return a.getOffset() < b.getOffset(); }
}

namespace TypeLayout
{
    FieldDescriptor::FieldDescriptor(std::string const& name, std::string const& type_name,
            size_t size, size_t offset)
        : m_name(name), m_type_name(type_name)
        , m_size(size), m_offset(offset) {}

    std::string FieldDescriptor::getName() const { return m_name; }
    std::string FieldDescriptor::getTypeName() const { return m_type_name; }
    size_t FieldDescriptor::getSize() const { return m_size; }
    size_t FieldDescriptor::getOffset() const { return m_offset; }
    size_t FieldDescriptor::getEndOffset() const { return m_offset + m_size; }

    bool FieldDescriptor::operator == (FieldDescriptor const& field) const
    {
        return m_name == field.m_name
            && m_type_name == field.m_type_name
            && m_size == field.m_size
            && m_offset == field.m_offset;
    }
    bool FieldDescriptor::operator != (FieldDescriptor const& field) const
    { return !(*this == field); }



    LayoutReport::LayoutReport(std::string const& type_name, size_t size, size_t alignment,
            FieldList const& fields, ParameterList const& generic_parameters)
        : m_type_name(type_name), m_size(size), m_alignment(alignment)
        , m_fields(fields), m_generic_parameters(generic_parameters) {}

    std::string LayoutReport::getTypeName() const { return m_type_name; }
    size_t LayoutReport::getSize() const { return m_size; }
    size_t LayoutReport::getAlignment() const { return m_alignment; }
    LayoutReport::FieldList const& LayoutReport::getFields() const { return m_fields; }
    LayoutReport::ParameterList const& LayoutReport::getGenericParameters() const
    { return m_generic_parameters; }

    LayoutReport::FieldList LayoutReport::getSortedFields() const
    {
        FieldList sorted(m_fields);
        stable_sort(sorted.begin(), sorted.end(), offsetLess);
        return sorted;
    }

    FieldDescriptor const* LayoutReport::getField(std::string const& name) const
    {
        for (FieldList::const_iterator it = m_fields.begin(); it != m_fields.end(); ++it)
        {
            if (it->getName() == name)
                return &(*it);
        }
        return 0;
    }

    bool LayoutReport::operator == (LayoutReport const& other) const
    {
        return m_type_name == other.m_type_name
            && m_size == other.m_size
            && m_alignment == other.m_alignment
            && m_fields == other.m_fields
            && m_generic_parameters == other.m_generic_parameters;
    }
    bool LayoutReport::operator != (LayoutReport const& other) const
    { return !(*this == other); }
}

