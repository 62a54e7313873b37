#include "pluginmanager.hh"
#include "exporter.hh"
#include "ioplugins.hh"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <boost/filesystem.hpp>
#include <dlfcn.h>

using namespace std;
using namespace TypeLayout;
using namespace boost::filesystem;

namespace
{
    template<typename Map, typename Object>
    bool add_plugin(Map& plugin_map, Object* object)
    {
        if (plugin_map.insert( make_pair(object->getName(), object) ).second)
            return true;
        delete object;
        return false;
    }

    template<typename Object>
    Object* get_plugin( map<string, Object*> const& plugin_map, string const& name)
    {
        typename map<string, Object*>::const_iterator it = plugin_map.find(name);
        if (it == plugin_map.end())
            throw PluginNotFound(name);
        return it->second;
    }

    template<typename Container>
    void clear(Container& container)
    {
        for (typename Container::iterator it = container.begin(); it != container.end(); ++it)
            delete it->second;
        container.clear();
    }
}

PluginManager::PluginManager()
{
    registerIOPlugins(*this);

    if (const char* pluginPath = getenv("TYPELAYOUT_PLUGIN_PATH"))
    {
        std::string const delim(":");
        std::string s(pluginPath);
        size_t pos;
        do
        {
            pos = s.find(delim);
            std::string directory = s.substr(0, pos);
            if (!directory.empty())
                loadPluginFromDirectory(directory);
            s.erase(0, (pos == std::string::npos) ? pos : pos + delim.length());
        } while (pos != std::string::npos);
    }
}

PluginManager::~PluginManager()
{
    clear(m_exporters);
    for (std::vector<LayoutDefinitionPlugin*>::iterator it = m_definition_plugins.begin();
            it != m_definition_plugins.end(); ++it)
        delete *it;
    m_definition_plugins.clear();

    for (vector<void*>::iterator it = m_library_handles.begin(); it != m_library_handles.end(); ++it)
        dlclose(*it);
}

/**
 * uses "loadPlugin" to try to load all "*.so" or "*.dylib" files in the
 * given directory
 *
 * @return true if any plugin could be loaded, false if no plugin could be
 *         loaded (and prints a warning)
 */
bool PluginManager::loadPluginFromDirectory(std::string const& directory)
{
    path plugin_dir(directory);
    boost::system::error_code error;
    if (!is_directory(plugin_dir, error))
    {
        cerr << "typelayout: plugin directory '" << directory << "' does not exist" << endl;
        return false;
    }

    bool success = false;
    directory_iterator end_it;
    for (directory_iterator it(plugin_dir, error); !error && it != end_it; it.increment(error))
    {
        if (it->path().extension() == ".so" || it->path().extension() == ".dylib")
            success |= loadPlugin(it->path().string());
    }

    if (!success)
        cerr << "typelayout: can't load a plugin from directory '" << directory << "'" << endl;

    return success;
}

bool PluginManager::loadPlugin(std::string const& path)
{
    void* libhandle = dlopen(path.c_str(), RTLD_LAZY);
    if (!libhandle)
    {
        cerr << "typelayout: cannot load plugin " << path << ": " << dlerror() << endl;
        return false;
    }

    void* libentry  = dlsym(libhandle, "registerPlugins");
    if (!libentry)
    {
        cerr << "typelayout: '" << path << "' does not seem to be a valid typelayout plugin" << endl;
        dlclose(libhandle);
        return false;
    }

    PluginEntryPoint function = reinterpret_cast<PluginEntryPoint>(libentry);
    function(*this);
    m_library_handles.push_back(libhandle);
    return true;
}

bool PluginManager::add(ExportPlugin* plugin)
{ return add_plugin(m_exporters, plugin); }
void PluginManager::add(LayoutDefinitionPlugin* plugin)
{ m_definition_plugins.push_back(plugin); }

void PluginManager::registerPluginLayouts(Registry& registry)
{
    for (vector<LayoutDefinitionPlugin*>::iterator it = m_definition_plugins.begin();
            it != m_definition_plugins.end(); ++it)
    {
        (*it)->registerLayouts(registry);
    }
}

Exporter* PluginManager::exporter(std::string const& name) const
{ return get_plugin(m_exporters, name)->create(); }

std::list<std::string> PluginManager::getExporterNames() const
{
    list<string> names;
    for (map<string, ExportPlugin*>::const_iterator it = m_exporters.begin(); it != m_exporters.end(); ++it)
        names.push_back(it->first);
    return names;
}

std::string PluginManager::save(std::string const& kind, Registry const& registry)
{
    utilmm::config_set config;
    return save(kind, config, registry);
}

std::string PluginManager::save(std::string const& kind, utilmm::config_set const& config, Registry const& registry)
{
    ostringstream stream;
    save(kind, config, registry, stream);
    return stream.str();
}
void PluginManager::save(std::string const& kind, Registry const& registry, std::ostream& into)
{
    utilmm::config_set config;
    save(kind, config, registry, into);
}
void PluginManager::save(std::string const& kind, utilmm::config_set const& config, Registry const& registry, std::ostream& into)
{
    PluginManager::self manager;
    unique_ptr<Exporter> exporter(manager->exporter(kind));
    exporter->save(into, config, registry);
}

