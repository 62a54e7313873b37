#ifndef TYPELAYOUT_LAYOUTDISPLAY_HH
#define TYPELAYOUT_LAYOUTDISPLAY_HH

#include "layoutmodel.hh"
#include <iosfwd>
#include <string>
#include <vector>

namespace TypeLayout
{
    /** The name displayed for padding rows */
    extern char const* const PaddingName;

    /** One row of a rendered layout table. It is either a field of the
     * report or a padding gap inferred between two fields (or after the last
     * one)
     */
    struct LayoutRow
    {
        size_t offset;
        std::string name;
        size_t size;
        bool padding;

        LayoutRow(size_t offset_, std::string const& name_, size_t size_, bool padding_)
            : offset(offset_), name(name_), size(size_), padding(padding_) {}
    };
    typedef std::vector<LayoutRow> LayoutRows;

    /** Returns the rows LayoutDisplay would print for \c report, in order.
     *
     * Fields are sorted by offset, and a padding row is inserted wherever a
     * field starts after the end of the previous one, as well as at the end
     * of the type if the last field does not reach its size. Nothing is
     * validated: overlapping fields simply do not generate padding.
     */
    LayoutRows layout_rows(LayoutReport const& report);

    /** Pretty-prints a LayoutReport as a table on an output stream
     *
     * <code>
     * Foo (size 8, alignment 4)
     * | Offset | Name      | Size |
     * | ------ | --------- | ---- |
     * | 0      | a         | 1    |
     * | 1      | [padding] | 3    |
     * | 4      | b         | 4    |
     * </code>
     *
     * You can use <code>stream << report</code> and
     * <code>stream << layout_display(report)</code> instead
     */
    class LayoutDisplay
    {
        struct Widths
        {
            size_t offset;
            size_t name;
            size_t size;
        };

        std::ostream& m_stream;

        void displayRow(Widths const& widths, std::string const& offset,
                std::string const& name, std::string const& size);

    public:
        LayoutDisplay(std::ostream& stream);

        void display(LayoutReport const& report);
    };

    namespace details
    {
        struct do_layout_display
        {
            LayoutReport const& report;
            do_layout_display(LayoutReport const& report_)
                : report(report_) {}
        };
        std::ostream& operator << (std::ostream& stream, do_layout_display display);
    }

    /** stream operator to pretty-print a layout report on a stream
     * <code>
     *	std::cout << TypeLayout::layout_display(report) << std::endl;
     * </code>
     */
    inline details::do_layout_display layout_display(LayoutReport const& report)
    { return details::do_layout_display(report); }

    /** Pretty prints a layout report on a given output stream */
    std::ostream& operator << (std::ostream& stream, LayoutReport const& report);

    /** Returns the text LayoutDisplay generates for \c report */
    std::string toString(LayoutReport const& report);
}

#endif

