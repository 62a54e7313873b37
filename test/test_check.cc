#include <boost/test/unit_test.hpp>

#include <test/testsuite.hh>
#include <typelayout/layoutcheck.hh>
#include <typelayout/layoutdisplay.hh>
#include <typelayout/registry.hh>
#include <typelayout/registryiterator.hh>
#include <lang/csupport/standard_layouts.hh>

#include <limits>

using namespace TypeLayout;
using namespace TypeLayoutTest;
using namespace std;

BOOST_AUTO_TEST_CASE( test_check_accepts_compiled_layouts )
{
    BOOST_CHECK_NO_THROW(checkLayout(layout_of<Foo>()));
    BOOST_CHECK_NO_THROW(checkLayout(layout_of<OverAligned>()));
    BOOST_CHECK_NO_THROW(checkLayout(layout_of<Empty>()));
    BOOST_CHECK_NO_THROW(checkLayout(layout_of<Tuple>()));
    BOOST_CHECK(isWellFormed(layout_of<Derived>()));
    BOOST_CHECK(isWellFormed(LayoutReport("Unit", 0, 1)));
}

BOOST_AUTO_TEST_CASE( test_check_rejects_bad_alignments )
{
    BOOST_CHECK_THROW(checkLayout(LayoutReport("A", 4, 0)), MalformedReport);
    BOOST_CHECK_THROW(checkLayout(LayoutReport("A", 6, 3)), MalformedReport);
    BOOST_CHECK_THROW(checkLayout(LayoutReport("A", 6, 4)), MalformedReport);
    BOOST_CHECK(!isWellFormed(LayoutReport("A", 6, 4)));
}

BOOST_AUTO_TEST_CASE( test_check_rejects_fields_out_of_the_type )
{
    LayoutReport::FieldList fields;
    fields.push_back(field("a", 4, 0));
    fields.push_back(field("b", 8, 4));
    LayoutReport report("TooSmall", 8, 4, fields);

    try
    {
        checkLayout(report);
        BOOST_ERROR("checkLayout accepted a field beyond the end of the type");
    }
    catch(MalformedReport const& e)
    {
        BOOST_CHECK_EQUAL("TooSmall", e.getTypeName());
        BOOST_CHECK(string(e.what()).find("field b") != string::npos);
    }
}

BOOST_AUTO_TEST_CASE( test_check_rejects_fields_whose_end_offset_wraps_around )
{
    LayoutReport::FieldList fields;
    fields.push_back(field("a", 4, 0));
    fields.push_back(field("bad", 2, numeric_limits<size_t>::max()));
    LayoutReport report("Wrapped", 8, 4, fields);

    BOOST_CHECK_THROW(checkLayout(report), MalformedReport);
    BOOST_CHECK(!isWellFormed(report));

    LayoutReport::FieldList huge;
    huge.push_back(field("huge", numeric_limits<size_t>::max(), 4));
    BOOST_CHECK(!isWellFormed(LayoutReport("Huge", 8, 4, huge)));
}

BOOST_AUTO_TEST_CASE( test_check_rejects_overlapping_fields )
{
    LayoutReport::FieldList fields;
    fields.push_back(field("b", 4, 2));
    fields.push_back(field("a", 4, 0));
    LayoutReport report("Overlap", 8, 4, fields);
    BOOST_CHECK_THROW(checkLayout(report), MalformedReport);

    // The renderer still displays it
    BOOST_CHECK_NO_THROW(toString(report));
}

BOOST_AUTO_TEST_CASE( test_check_detects_overlaps_with_a_non_adjacent_field )
{
    LayoutReport::FieldList fields;
    fields.push_back(field("a", 8, 0));
    fields.push_back(field("b", 1, 2));
    fields.push_back(field("c", 1, 4));
    LayoutReport report("Nested", 8, 8, fields);
    BOOST_CHECK(!isWellFormed(report));
}

BOOST_AUTO_TEST_CASE( test_check_standard_layouts )
{
    Registry registry;
    CXX::addStandardLayouts(registry);
    BOOST_REQUIRE(!registry.empty());
    for (RegistryIterator it = registry.begin(); it != registry.end(); ++it)
        BOOST_CHECK_MESSAGE(isWellFormed(*it), it.getName() + " is not well formed");
}

