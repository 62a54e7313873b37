#ifndef TYPELAYOUT_PLUGINMANAGER_HH
#define TYPELAYOUT_PLUGINMANAGER_HH

#include <map>
#include <list>
#include <string>
#include <vector>
#include <iosfwd>
#include <stdexcept>
#include <utilmm/singleton/use.hh>
#include <utilmm/configfile/configset.hh>

namespace TypeLayout
{
    class Registry;

    class Exporter;
    class ExportPlugin;

    /** Exception thrown when an unknown plugin is requested */
    struct PluginNotFound : std::runtime_error
    {
        PluginNotFound(std::string const& name)
            : std::runtime_error("plugin '" + name + "' not found") { }
    };

    /** Generic error for problems during export */
    struct ExportError : std::runtime_error
    {
        ExportError(std::string const& msg) : std::runtime_error(msg) {}
    };

    /** Plugins that register layouts of their own types in every new
     * Registry object
     */
    class LayoutDefinitionPlugin
    {
    public:
        virtual ~LayoutDefinitionPlugin() {}
        virtual void registerLayouts(Registry& registry) = 0;
    };

    /** The plugin manager
     *
     * It is a singleton, using utilmm::singleton. You have to access it using
     * <code>
     *  PluginManager::self manager;
     *
     *  manager->exporter("xml")
     * </code>
     *
     * The object is destroyed when the last of the use<> objects is, and
     * created back (reloading the plugins) when a new use<> object is built.
     * Exporters created from a plugin library must therefore be destroyed
     * before the last use<> object. The "text" and
     * "xml" exporters are always available. Additional plugins are loaded
     * from the directories listed in the TYPELAYOUT_PLUGIN_PATH environment
     * variable (colon-separated). A plugin is a shared library that exports
     * <code>extern "C" void registerPlugins(TypeLayout::PluginManager&)</code>
     */
    class PluginManager
    {
        std::map<std::string, ExportPlugin*> m_exporters;
        std::vector<LayoutDefinitionPlugin*> m_definition_plugins;
        std::vector<void*> m_library_handles;

        bool loadPluginFromDirectory(std::string const& directory);
        bool loadPlugin(std::string const& path);

        typedef void (*PluginEntryPoint)(PluginManager&);

        PluginManager();
        ~PluginManager();

        PluginManager(PluginManager const&);
        PluginManager& operator = (PluginManager const&);

    public:
	/** Registers a new exporter. The manager takes ownership of \c plugin
	 * @return false if there is already an exporter of the same name, in
	 *   which case \c plugin is deleted */
        bool add(ExportPlugin* plugin);

        /** Registers a new layout definition plugin. The manager takes
         * ownership of \c plugin */
        void add(LayoutDefinitionPlugin* plugin);

        /** Calls every LayoutDefinitionPlugin on \c registry */
        void registerPluginLayouts(Registry& registry);

	/** Build a new exporter from its plugin name. The caller owns the
	 * returned object
	 * @throws PluginNotFound */
        Exporter* exporter(std::string const& name) const;

        /** The names of all the available exporters */
        std::list<std::string> getExporterNames() const;

	/** \overload
	 */
        static std::string save
	    ( std::string const& kind
	    , Registry const& registry);

	/** \overload
	 */
        static std::string save
	    ( std::string const& kind
	    , utilmm::config_set const& config
	    , Registry const& registry);

       	/** \overload
	 */
	static void save
	    ( std::string const& kind
	    , Registry const& registry
	    , std::ostream& into);

       	/** Exports a registry to an ostream object
	 * @arg kind	    the output format. It has to be a valid exporter name
	 * @arg config      format-specific configuration. See each exporter documentation for details.
	 * @arg registry    the registry to export
	 * @arg into	    the ostream object to export to
	 * @throws PluginNotFound if \c kind is invalid
	 * @throws ExportError if an error occured during the export
	 */
	static void save
	    ( std::string const& kind
	    , utilmm::config_set const& config
	    , Registry const& registry
	    , std::ostream& into);

	/** The one PluginManager object. See main PluginManager documentation
	 * for its use.
	 */
        typedef utilmm::singleton::use<PluginManager> self;

    private:
        friend class utilmm::singleton::wrapper<PluginManager>;
    };
}

#endif

