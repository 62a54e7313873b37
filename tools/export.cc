#include "export.hh"

#include <typelayout/exporter.hh>
#include <typelayout/pluginmanager.hh>
#include <typelayout/registry.hh>

#include "utilmm/configfile/commandline.hh"
using utilmm::command_line;
#include "utilmm/configfile/configset.hh"
using utilmm::config_set;

#include <iostream>
#include <memory>
#include <boost/algorithm/string/join.hpp>

using namespace std;
using namespace TypeLayout;

namespace
{
    list<string> exportOptions()
    {
        static const char* arguments[] =
        { ":format,f=string|output format (default: xml)",
          ":output,o=string|output file (default: standard output)",
          "no_indent:no-indent|do not indent the output (xml)",
          ":strict|fail if a layout is not self-consistent (text)",
          ":verbose,v|display progress information" };
        return list<string>(arguments, arguments + 5);
    }
}

Export::Export()
    : Mode("export") { }

bool Export::apply(int argc, char* const argv[])
{
    config_set config;
    command_line commandline(exportOptions());
    if (!commandline.parse(argc, argv, config))
    {
        help(cerr);
        return false;
    }

    if (config.get<bool>("no_indent", false))
        config.set("indent", "false");
    list<string> names = commandline.remaining();
    if (!names.empty())
        config.set("layouts", names);

    Registry registry;
    loadLayouts(registry);

    bool const verbose = config.get<bool>("verbose", false);
    string const format = config.get<string>("format", "xml");
    string const output = config.get<string>("output", "");

    PluginManager::self manager;
    unique_ptr<Exporter> exporter(manager->exporter(format));
    if (!output.empty())
    {
        exporter->save(output, config, registry);
        if (verbose)
            clog << "typelayout: saved " << format << " output in " << output << endl;
    }
    else
        exporter->save(cout, config, registry);

    return true;
}

void Export::help(std::ostream& out) const
{
    PluginManager::self manager;
    list<string> formats = manager->getExporterNames();
    out <<
        "Usage: typelayout export [options] [layout...]\n"
        "Exports the given layouts, or all of them\n"
        "\t--format, -f FORMAT  output format, one of " << boost::join(formats, ", ") << " (default: xml)\n"
        "\t--output, -o FILE    output file (default: standard output)\n"
        "\t--no-indent          do not indent the output (xml)\n"
        "\t--strict             fail if a layout is not self-consistent (text)\n"
        "\t--verbose, -v        display progress information" << endl;
}
