#include "registry.hh"
#include "registryiterator.hh"
#include "typename.hh"
#include "pluginmanager.hh"

using namespace std;

namespace TypeLayout
{
    Registry::Registry()
    {
        PluginManager::self()->registerPluginLayouts(*this);
    }
    Registry::~Registry() { clear(); }

    LayoutReport const& Registry::add(LayoutReport const& layout, std::string const& source_id)
    {
        string const name = layout.getTypeName();
        if (!isValidLayoutName(name))
            throw BadName(name);

        LayoutMap::iterator it = m_layouts.find(name);
        if (it != m_layouts.end())
        {
            if (it->second.layout != layout)
                throw AlreadyDefined(name);
            return it->second.layout;
        }

        it = m_layouts.insert(make_pair(name, RegistryEntry(layout, source_id))).first;
        return it->second.layout;
    }

    bool Registry::has(std::string const& name) const
    { return m_layouts.find(name) != m_layouts.end(); }

    LayoutReport const* Registry::get(std::string const& name) const
    {
        LayoutMap::const_iterator it = m_layouts.find(name);
        if (it == m_layouts.end())
            return 0;
        return &it->second.layout;
    }

    LayoutReport const& Registry::layout(std::string const& name) const
    {
        LayoutReport const* result = get(name);
        if (!result)
            throw Undefined(name);
        return *result;
    }

    RegistryIterator Registry::find(std::string const& name) const
    { return RegistryIterator(*this, m_layouts.find(name)); }

    std::string Registry::source(std::string const& name) const
    {
        LayoutMap::const_iterator it = m_layouts.find(name);
        if (it == m_layouts.end())
            throw Undefined(name);
        return it->second.source_id;
    }

    std::list<std::string> Registry::names() const
    {
        list<string> result;
        for (LayoutMap::const_iterator it = m_layouts.begin(); it != m_layouts.end(); ++it)
            result.push_back(it->first);
        return result;
    }

    bool Registry::remove(std::string const& name)
    { return m_layouts.erase(name) > 0; }

    void Registry::merge(Registry const& registry)
    {
        for (LayoutMap::const_iterator it = registry.m_layouts.begin(); it != registry.m_layouts.end(); ++it)
            add(it->second.layout, it->second.source_id);
    }

    RegistryIterator Registry::begin() const { return RegistryIterator(*this, m_layouts.begin()); }
    RegistryIterator Registry::end() const { return RegistryIterator(*this, m_layouts.end()); }

    size_t Registry::size() const { return m_layouts.size(); }
    bool Registry::empty() const { return m_layouts.empty(); }
    void Registry::clear() { m_layouts.clear(); }
}

