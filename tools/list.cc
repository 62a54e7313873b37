#include "list.hh"

#include <typelayout/registry.hh>
#include <typelayout/registryiterator.hh>

#include "utilmm/configfile/commandline.hh"
using utilmm::command_line;
#include "utilmm/configfile/configset.hh"
using utilmm::config_set;

#include <iostream>

using namespace std;
using namespace TypeLayout;

namespace
{
    list<string> listOptions()
    {
        static const char* arguments[] =
        { ":basename|display the layout names without their namespaces",
          ":source|display where each layout has been defined" };
        return list<string>(arguments, arguments + 2);
    }
}

List::List()
    : Mode("list") { }

bool List::apply(int argc, char* const argv[])
{
    config_set config;
    command_line commandline(listOptions());
    if (!commandline.parse(argc, argv, config))
    {
        help(cerr);
        return false;
    }
    if (!commandline.remaining().empty())
    {
        cerr << "typelayout: list does not take any layout name" << endl;
        help(cerr);
        return false;
    }

    bool const basename = config.get<bool>("basename", false);
    bool const source   = config.get<bool>("source", false);

    Registry registry;
    loadLayouts(registry);

    RegistryIterator const end = registry.end();
    for (RegistryIterator it = registry.begin(); it != end; ++it)
    {
        cout << (basename ? it.getBasename() : it.getName());
        if (source)
            cout << "\t" << (it.getSource().empty() ? "-" : it.getSource());
        cout << "\n";
    }
    return true;
}

void List::help(std::ostream& out) const
{
    out <<
        "Usage: typelayout list [--basename] [--source]\n"
        "Lists the names of all the available layouts\n"
        "\t--basename       display the layout names without their namespaces\n"
        "\t--source         display where each layout has been defined" << endl;
}
