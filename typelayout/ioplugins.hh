#ifndef TYPELAYOUT_IOPLUGINS_HH
#define TYPELAYOUT_IOPLUGINS_HH

#include "exporter.hh"
#include <boost/static_assert.hpp>
#include <boost/type_traits/is_base_and_derived.hpp>

namespace TypeLayout
{
    class PluginManager;

    /** An ExportPlugin that creates exporters of class \c Type */
    template<typename Type>
    class GenericExportPlugin
        : public ExportPlugin
    {
        BOOST_STATIC_ASSERT((boost::is_base_and_derived<Exporter, Type>::value));

    public:
        GenericExportPlugin(char const* name)
            : ExportPlugin(name) {}
        Exporter* create()
        { return new Type; }
    };

    /** Registers the exporters built in the library */
    void registerIOPlugins(PluginManager& manager);
}

/** Defines the entry point of a plugin library that provides one exporter */
#define TYPELAYOUT_REGISTER_EXPORT(name, klass) extern "C" void registerPlugins(TypeLayout::PluginManager& manager) {\
    manager.add(new TypeLayout::GenericExportPlugin<klass>(#name)); \
}

#endif

