#include "layoutdisplay.hh"
#include <iostream>
#include <sstream>
#include <algorithm>
#include <boost/lexical_cast.hpp>

using namespace TypeLayout;
using namespace std;
using boost::lexical_cast;

char const* const TypeLayout::PaddingName = "[padding]";

namespace
{
    string justify(string const& value, size_t width)
    {
        if (value.size() >= width)
            return value;
        return value + string(width - value.size(), ' ');
    }
}

LayoutRows TypeLayout::layout_rows(LayoutReport const& report)
{
    LayoutReport::FieldList fields = report.getSortedFields();

    LayoutRows rows;
    size_t covered_offset = 0;
    for (LayoutReport::FieldList::const_iterator it = fields.begin(); it != fields.end(); ++it)
    {
        if (it->getOffset() > covered_offset)
            rows.push_back(LayoutRow(covered_offset, PaddingName, it->getOffset() - covered_offset, true));

        rows.push_back(LayoutRow(it->getOffset(), it->getName(), it->getSize(), false));
        covered_offset = it->getEndOffset();
    }

    // Tail padding, e.g. for over-aligned types
    if (covered_offset < report.getSize())
        rows.push_back(LayoutRow(covered_offset, PaddingName, report.getSize() - covered_offset, true));

    return rows;
}

LayoutDisplay::LayoutDisplay(std::ostream& stream)
    : m_stream(stream) {}

void LayoutDisplay::displayRow(Widths const& widths, std::string const& offset,
        std::string const& name, std::string const& size)
{
    m_stream << "| " << justify(offset, widths.offset)
        << " | " << justify(name, widths.name)
        << " | " << justify(size, widths.size)
        << " |\n";
}

void LayoutDisplay::display(LayoutReport const& report)
{
    m_stream << report.getTypeName()
        << " (size " << report.getSize()
        << ", alignment " << report.getAlignment() << ")\n";

    LayoutReport::FieldList const& fields = report.getFields();
    LayoutRows rows = layout_rows(report);

    // The name column only reserves room for the padding label if the
    // fields do not add up to the type size. This is decided once, before
    // the padding rows are generated.
    size_t declared_total = 0;
    size_t longest_name = fields.empty() ? 1 : 0;
    for (LayoutReport::FieldList::const_iterator it = fields.begin(); it != fields.end(); ++it)
    {
        declared_total += it->getSize();
        longest_name = max(longest_name, it->getName().size());
    }
    if (declared_total < report.getSize())
        longest_name = max(longest_name, string(PaddingName).size());

    Widths widths;
    widths.offset = string("Offset").size();
    widths.name   = max(longest_name, string("Name").size());
    widths.size   = string("Size").size();
    for (LayoutRows::const_iterator it = rows.begin(); it != rows.end(); ++it)
    {
        widths.offset = max(widths.offset, lexical_cast<string>(it->offset).size());
        widths.size   = max(widths.size,   lexical_cast<string>(it->size).size());
    }

    displayRow(widths, "Offset", "Name", "Size");
    displayRow(widths, string(widths.offset, '-'), string(widths.name, '-'), string(widths.size, '-'));

    for (LayoutRows::const_iterator it = rows.begin(); it != rows.end(); ++it)
        displayRow(widths, lexical_cast<string>(it->offset), it->name, lexical_cast<string>(it->size));
}

std::ostream& TypeLayout::details::operator << (std::ostream& stream, do_layout_display display)
{
    LayoutDisplay visitor(stream);
    visitor.display(display.report);
    return stream;
}

std::ostream& TypeLayout::operator << (std::ostream& stream, LayoutReport const& report)
{ return stream << layout_display(report); }

std::string TypeLayout::toString(LayoutReport const& report)
{
    ostringstream stream;
    stream << layout_display(report);
    return stream.str();
}

