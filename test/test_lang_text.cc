#include <boost/test/unit_test.hpp>

#include <test/testsuite.hh>
#include <utilmm/configfile/configset.hh>
#include <typelayout/pluginmanager.hh>
#include <typelayout/exporter.hh>
#include <typelayout/registry.hh>
#include <typelayout/layoutdisplay.hh>
#include <lang/text/export.hh>

#include <memory>
#include <sstream>

using namespace TypeLayout;
using namespace TypeLayoutTest;
using namespace std;

BOOST_AUTO_TEST_CASE( test_text_export_displays_every_layout )
{
    Registry registry;
    registry.add<Tuple>();
    registry.add<Foo>();

    string expected = toString(layout_of<Foo>()) + "\n" + toString(layout_of<Tuple>());
    BOOST_CHECK_EQUAL(expected, PluginManager::save("text", registry));

    // Same result through the exporter object
    TextExport text_export;
    Exporter& exporter = text_export;
    ostringstream stream;
    exporter.save(stream, utilmm::config_set(), registry);
    BOOST_CHECK_EQUAL(expected, stream.str());
}

BOOST_AUTO_TEST_CASE( test_text_export_of_an_empty_registry )
{
    Registry registry;
    BOOST_CHECK_EQUAL("", PluginManager::save("text", registry));
}

BOOST_AUTO_TEST_CASE( test_text_export_selection )
{
    Registry registry;
    registry.add<Foo>();
    registry.add<Tuple>();
    registry.add<Empty>();

    utilmm::config_set config;
    config.insert("layouts", "Tuple");
    config.insert("layouts", "Empty");
    string expected = toString(layout_of<Tuple>()) + "\n" + toString(layout_of<Empty>());
    BOOST_CHECK_EQUAL(expected, PluginManager::save("text", config, registry));

    // Nothing is written if a layout is missing
    config.insert("layouts", "Missing");
    ostringstream stream;
    BOOST_CHECK_THROW(PluginManager::save("text", config, registry, stream), Undefined);
    BOOST_CHECK_EQUAL("", stream.str());
}

BOOST_AUTO_TEST_CASE( test_text_export_strict_mode )
{
    LayoutReport::FieldList fields;
    fields.push_back(field("a", 4, 0));
    fields.push_back(field("b", 4, 2));

    Registry registry;
    registry.add(LayoutReport("Overlap", 8, 4, fields));

    // Renders malformed layouts by default
    BOOST_CHECK_EQUAL(toString(registry.layout("Overlap")), PluginManager::save("text", registry));

    utilmm::config_set config;
    config.set("strict", "true");
    BOOST_CHECK_THROW(PluginManager::save("text", config, registry), ExportError);

    registry.clear();
    registry.add<Foo>();
    BOOST_CHECK_NO_THROW(PluginManager::save("text", config, registry));
}

BOOST_AUTO_TEST_CASE( test_text_export_boolean_options )
{
    LayoutReport::FieldList fields;
    fields.push_back(field("a", 4, 0));
    fields.push_back(field("b", 4, 2));
    Registry registry;
    registry.add(LayoutReport("Overlap", 8, 4, fields));

    utilmm::config_set config;
    config.set("strict", "1");
    BOOST_CHECK_THROW(PluginManager::save("text", config, registry), ExportError);
    config.set("strict", "0");
    BOOST_CHECK_NO_THROW(PluginManager::save("text", config, registry));
    config.set("strict", "maybe");
    BOOST_CHECK_THROW(PluginManager::save("text", config, registry), boost::bad_lexical_cast);
}

