#ifndef TYPELAYOUT_REGISTRY_HH
#define TYPELAYOUT_REGISTRY_HH

#include "layoutmodel.hh"
#include "layoutbuilder.hh"
#include <map>
#include <list>
#include <stdexcept>

namespace TypeLayout
{
    class RegistryIterator;

    /** Base for exceptions thrown by the registry */
    class RegistryException : public std::runtime_error
    {
    public:
        RegistryException(std::string const& what) : std::runtime_error(what) {}
    };

    /** A layout has not been found while it was expected */
    class Undefined : public RegistryException
    {
        std::string m_name;

    public:
        Undefined(const std::string& name)
            : RegistryException("undefined layout '" + name + "'")
            , m_name(name) {}
        ~Undefined() throw() {}

        std::string getName() const { return m_name; }
    };

    /** A different layout is already registered under the same name */
    class AlreadyDefined : public RegistryException
    {
        std::string m_name;

    public:
        AlreadyDefined(std::string const& name)
            : RegistryException("layout " + name + " already defined in registry")
            , m_name(name) {}
        ~AlreadyDefined() throw() {}

        std::string getName() const { return m_name; }
    };

    /** An attempt has been made of registering a layout with an invalid name */
    class BadName : public RegistryException
    {
        const std::string m_name;

    public:
        BadName(const std::string& name)
            : RegistryException("'" + name + "' is not a valid layout name")
            , m_name(name) {}
        ~BadName() throw() {}
    };

    /** A set of layout reports, indexed by type name
     *
     * Layout definition plugins (see PluginManager) are given the
     * opportunity to register their layouts when a registry is created.
     */
    class Registry
    {
        friend class RegistryIterator;

    private:
        struct RegistryEntry
        {
            LayoutReport layout;
            std::string  source_id;

            RegistryEntry(LayoutReport const& layout_, std::string const& source_id_)
                : layout(layout_), source_id(source_id_) {}
        };
        typedef std::map<std::string, RegistryEntry> LayoutMap;

        LayoutMap m_layouts;

    public:
	typedef RegistryIterator Iterator;

        Registry();
        ~Registry();

        /** Adds a new layout, using its type name as key
         *
         * Adding a layout that is already registered is a no-op
         *
         * @arg source_id an arbitrary identifier for where the layout comes
         *      from (a plugin name, a header, ...)
         * @throws BadName if the type name is not valid (see isValidLayoutName)
         * @throws AlreadyDefined if a different layout is already registered
         *      under that name
         */
        LayoutReport const& add(LayoutReport const& layout, std::string const& source_id = "");

        /** Adds the layout of the inspectable type T */
        template<typename T>
        LayoutReport const& add(std::string const& source_id = "")
        { return add(layout_of<T>(), source_id); }

        /** Checks for the availability of a particular layout */
        bool has(std::string const& name) const;

        /** Gets a layout
         * @return the layout if it exists, 0 otherwise
         */
        LayoutReport const* get(std::string const& name) const;

        /** Gets a layout
         * @throws Undefined if there is no such layout
         */
        LayoutReport const& layout(std::string const& name) const;

        /** Gets a RegistryIterator on a given layout
         * @return the iterator, or end() if it is not found
         */
        RegistryIterator find(std::string const& name) const;

        /** Get the source ID of \c name
         * @throws Undefined if there is no such layout
         */
        std::string source(std::string const& name) const;

        /** Returns the names of the registered layouts, sorted */
        std::list<std::string> names() const;

        /** Removes a layout
         * @return true if it was registered, and false otherwise
         */
        bool remove(std::string const& name);

        /** Adds all the layouts of \c registry into this one
         * @throws AlreadyDefined if both registries define different
         *      layouts under the same name. In that case, the layouts
         *      merged before the conflict are kept.
         */
        void merge(Registry const& registry);

        /** Returns an iterator on the first layout, in name order */
        RegistryIterator begin() const;
        /** Returns the past-the-end iterator */
        RegistryIterator end() const;

        /** The count of layouts */
        size_t size() const;
        /** true if there is no layout in the registry */
        bool empty() const;
        /** Removes all layouts */
        void clear();
    };
}

#endif

