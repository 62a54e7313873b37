#ifndef TYPELAYOUT_EXPORTER_HH
#define TYPELAYOUT_EXPORTER_HH

#include <iosfwd>
#include <string>
#include <utilmm/configfile/configset.hh>
#include "pluginmanager.hh"
#include "registryiterator.hh"

namespace TypeLayout
{
    class Registry;
    class Exporter;

    class ExportPlugin
    {
        std::string m_name;

    public:
        ExportPlugin(std::string const& name)
            : m_name(name) {}
        virtual ~ExportPlugin() {}

        std::string getName() const { return m_name; }
        virtual Exporter* create() = 0;
    };

    /** Base class for export objects
     *
     * The following configuration options are common to all exporters:
     * <ul>
     *  <li> layouts: if set, only the layouts listed (one value per layout
     *       name) are exported, in the order given. Otherwise, every layout
     *       of the registry is exported in name order.
     * </ul>
     */
    class Exporter
    {
    protected:
        /** Called by save to add a preamble before saving the layouts
	 * @see save
	 */
        virtual void begin(std::ostream& stream, utilmm::config_set const& config, Registry const& registry);
        /** Called by save to add data after saving all layouts
	 * @see save
	 */
        virtual void end  (std::ostream& stream, utilmm::config_set const& config, Registry const& registry);

    public:
        virtual ~Exporter() {}

        /** Serialize a whole registry into a file, overwriting an existing
         * file.
         * @throws ExportError if the file cannot be written
         */
        virtual void save(std::string const& file_name,
                          utilmm::config_set const& config,
                          Registry const& registry);

        /** Serialize a registry using this exporter
         *
         * @arg stream   the stream to write to
	 * @arg config   configuration object if per-exporter configuration is needed
         * @arg registry the registry to be saved
	 *
       	 * The default implementation calls begin(), saves the selected
       	 * layouts and finally calls end()
	 *
         * @exception Undefined if the 'layouts' option names a layout that
         *          is not in the registry
	 * @exception ExportError for all export errors
	 */
        virtual void save
            ( std::ostream& stream
	    , utilmm::config_set const& config
            , Registry const& registry );

        /** Serialize one layout in \c stream.
	 * @arg stream	the stream to write to
	 * @arg layout	the layout to be serialized
         * @return true if the layout has been saved and false if it is ignored by this exporter
         */
        virtual bool save
            ( std::ostream& stream
            , RegistryIterator const& layout ) = 0;
    };
}

#endif

