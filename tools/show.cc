#include "show.hh"

#include <typelayout/registry.hh>
#include <typelayout/layoutcheck.hh>
#include <typelayout/pluginmanager.hh>

#include "utilmm/configfile/commandline.hh"
using utilmm::command_line;
#include "utilmm/configfile/configset.hh"
using utilmm::config_set;

#include <iostream>

using namespace std;
using namespace TypeLayout;

namespace
{
    list<string> showOptions()
    {
        static const char* arguments[] =
        { ":strict|fail if a layout is not self-consistent" };
        return list<string>(arguments, arguments + 1);
    }
}

Show::Show()
    : Mode("show") { }

bool Show::apply(int argc, char* const argv[])
{
    config_set config;
    command_line commandline(showOptions());
    if (!commandline.parse(argc, argv, config))
    {
        help(cerr);
        return false;
    }

    Registry registry;
    loadLayouts(registry);

    list<string> names = commandline.remaining();
    if (!names.empty())
        config.set("layouts", names);
    else
        names = registry.names();

    if (config.get<bool>("strict", false))
    {
        for (list<string>::const_iterator it = names.begin(); it != names.end(); ++it)
        {
            try { checkLayout(registry.layout(*it)); }
            catch(MalformedReport const& e)
            {
                cerr << "typelayout: " << e.what() << endl;
                return false;
            }
        }
        config.erase("strict");
    }

    // The text exporter resolves the whole selection before writing
    PluginManager::save("text", config, registry, cout);
    return true;
}

void Show::help(std::ostream& out) const
{
    out <<
        "Usage: typelayout show [--strict] [layout...]\n"
        "Displays the memory layout of the given layouts, or of all of them\n"
        "\t--strict         fail if a layout is not self-consistent" << endl;
}
