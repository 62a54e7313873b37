#include <boost/test/unit_test.hpp>

#include <test/testsuite.hh>
#include <typelayout/layoutbuilder.hh>
#include <typelayout/layoutdisplay.hh>
#include <typelayout/typename.hh>

using namespace TypeLayout;
using namespace TypeLayoutTest;
using namespace std;

BOOST_AUTO_TEST_CASE( test_builder_uses_the_compiled_layout )
{
    LayoutReport report = layout_of<Foo>();
    BOOST_CHECK_EQUAL("Foo", report.getTypeName());
    BOOST_CHECK_EQUAL(sizeof(Foo), report.getSize());
    BOOST_CHECK_EQUAL(alignof(Foo), report.getAlignment());
    BOOST_CHECK(report.getGenericParameters().empty());

    BOOST_REQUIRE_EQUAL(2, report.getFields().size());
    FieldDescriptor const& a = report.getFields()[0];
    BOOST_CHECK_EQUAL("a", a.getName());
    BOOST_CHECK_EQUAL(getTypeName<uint8_t>(), a.getTypeName());
    BOOST_CHECK_EQUAL(sizeof(uint8_t), a.getSize());
    BOOST_CHECK_EQUAL(offsetof(Foo, a), a.getOffset());

    FieldDescriptor const& b = report.getFields()[1];
    BOOST_CHECK_EQUAL("b", b.getName());
    BOOST_CHECK_EQUAL(getTypeName<uint32_t>(), b.getTypeName());
    BOOST_CHECK_EQUAL(sizeof(uint32_t), b.getSize());
    BOOST_CHECK_EQUAL(offsetof(Foo, b), b.getOffset());
}

BOOST_AUTO_TEST_CASE( test_builder_reports_over_alignment )
{
    LayoutReport report = layout_of<OverAligned>();
    BOOST_CHECK_EQUAL(128, report.getSize());
    BOOST_CHECK_EQUAL(128, report.getAlignment());

    LayoutRows rows = layout_rows(report);
    BOOST_REQUIRE_EQUAL(2, rows.size());
    BOOST_CHECK_EQUAL("value", rows[0].name);
    BOOST_CHECK(rows[1].padding);
    BOOST_CHECK_EQUAL(1, rows[1].offset);
    BOOST_CHECK_EQUAL(127, rows[1].size);
}

BOOST_AUTO_TEST_CASE( test_builder_on_empty_structures )
{
    // Empty C++ structures still occupy one byte
    LayoutReport report = layout_of<Empty>();
    BOOST_CHECK(report.getFields().empty());
    BOOST_CHECK_EQUAL(sizeof(Empty), report.getSize());

    LayoutRows rows = layout_rows(report);
    BOOST_REQUIRE_EQUAL(1, rows.size());
    BOOST_CHECK(rows[0].padding);
    BOOST_CHECK_EQUAL(sizeof(Empty), rows[0].size);
}

BOOST_AUTO_TEST_CASE( test_builder_names_positional_fields_by_index )
{
    LayoutReport report = layout_of<Tuple>();
    BOOST_REQUIRE_EQUAL(3, report.getFields().size());
    BOOST_CHECK_EQUAL("0", report.getFields()[0].getName());
    BOOST_CHECK_EQUAL("1", report.getFields()[1].getName());
    BOOST_CHECK_EQUAL("2", report.getFields()[2].getName());
    BOOST_CHECK_EQUAL(offsetof(Tuple, m2), report.getFields()[2].getOffset());

    LayoutRows rows = layout_rows(report);
    BOOST_REQUIRE_EQUAL(4, rows.size());
    BOOST_CHECK_EQUAL("[padding]", rows[2].name);
    BOOST_CHECK_EQUAL(offsetof(Tuple, m2) - offsetof(Tuple, m1) - 1, rows[2].size);
}

BOOST_AUTO_TEST_CASE( test_builder_records_template_parameters )
{
    typedef Buffer<uint8_t, 5> Buffer5;
    LayoutReport report = layout_of<Buffer5>();

    BOOST_CHECK_EQUAL(getTypeName<Buffer5>(), report.getTypeName());
    BOOST_CHECK_EQUAL(sizeof(Buffer5), report.getSize());

    BOOST_REQUIRE_EQUAL(2, report.getGenericParameters().size());
    BOOST_CHECK_EQUAL(getTypeName<uint8_t>(), report.getGenericParameters()[0]);
    BOOST_CHECK_EQUAL("5", report.getGenericParameters()[1]);

    FieldDescriptor const* data = report.getField("data");
    BOOST_REQUIRE(data);
    BOOST_CHECK_EQUAL(5, data->getSize());
    BOOST_CHECK_EQUAL(offsetof(Buffer5, data), data->getOffset());
}

BOOST_AUTO_TEST_CASE( test_builder_accepts_inherited_members )
{
    LayoutReport report = layout_of<Derived>();
    BOOST_REQUIRE(report.getField("x"));
    BOOST_CHECK_EQUAL(sizeof(double), report.getField("x")->getSize());
    BOOST_CHECK_EQUAL(getTypeName<double>(), report.getField("x")->getTypeName());
    BOOST_REQUIRE(report.getField("tag"));
    BOOST_CHECK_EQUAL(sizeof(double), report.getField("tag")->getOffset());
    BOOST_CHECK_EQUAL(sizeof(Derived), report.getSize());
}

BOOST_AUTO_TEST_CASE( test_builder_default_name )
{
    LayoutBuilder<Foo> builder;
    BOOST_CHECK_EQUAL(getTypeName<Foo>(), builder.getLayout().getTypeName());
}

BOOST_AUTO_TEST_CASE( test_type_names )
{
    BOOST_CHECK_EQUAL("int", getTypeName<int>());
    BOOST_CHECK_EQUAL("Foo", getTypeName<Foo>());
    BOOST_CHECK(getTypeName<int const>() != getTypeName<int>());
    BOOST_CHECK_EQUAL("42", getParameterName(42));

    BOOST_CHECK(isValidLayoutName("Foo"));
    BOOST_CHECK(isValidLayoutName("std::pair<int, double>"));
    BOOST_CHECK(!isValidLayoutName(""));
    BOOST_CHECK(!isValidLayoutName("Foo\nBar"));

    BOOST_CHECK_EQUAL("Foo", getBasename("Foo"));
    BOOST_CHECK_EQUAL("Foo", getBasename("ns::inner::Foo"));
    BOOST_CHECK_EQUAL("pair<int, ns::A>", getBasename("std::pair<int, ns::A>"));
    BOOST_CHECK_EQUAL("Scalar", getBasename("Matrix<ns::A, 3>::Scalar"));
}

