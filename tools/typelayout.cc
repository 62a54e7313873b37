#include <iostream>
#include <map>
#include <string>

#include "mode.hh"
#include "list.hh"
#include "show.hh"
#include "export.hh"

#include <typelayout/pluginmanager.hh>

using namespace std;

namespace
{
    void usage()
    {
        cerr <<
            "Usage: typelayout [mode] [mode-args]\n"
            "\twhere mode is one of: list, show, export\n"
            "\tcall typelayout [mode] help for information on a particular mode" << endl;
    }

    typedef map<string, Mode*> ModeMap;
    ModeMap modes;
    void registerMode(Mode* mode)
    {
        ModeMap::iterator it = modes.find(mode->getName());
        if (it != modes.end())
            delete it->second;
        modes[mode->getName()] = mode;
    }
    void clearModes()
    {
        for (ModeMap::iterator it = modes.begin(); it != modes.end(); ++it)
            delete it->second;
        modes.clear();
    }
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        usage();
        return 1;
    }

    // Keep the plugin manager alive, so that plugins are loaded only once
    TypeLayout::PluginManager::self the_manager;

    registerMode(new List);
    registerMode(new Show);
    registerMode(new Export);

    ModeMap::iterator it = modes.find(argv[1]);
    if (it == modes.end())
    {
        usage();
        clearModes();
        return 1;
    }

    bool success = false;
    try
    {
        success = it->second->main(argc - 1, argv + 1);
    }
    catch(std::exception const& e)
    {
        cerr << "typelayout: " << e.what() << endl;
    }

    clearModes();
    return success ? 0 : 1;
}
