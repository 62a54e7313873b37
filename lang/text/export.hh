#ifndef TYPELAYOUT_LANG_TEXT_EXPORT_HH
#define TYPELAYOUT_LANG_TEXT_EXPORT_HH

#include <typelayout/exporter.hh>

/** Exports layouts as the tables generated by TypeLayout::LayoutDisplay,
 * separated by empty lines.
 *
 * Configuration options:
 * <ul>
 *  <li> strict (bool, default false): check each layout with
 *       TypeLayout::checkLayout before displaying it. The export fails with
 *       ExportError on the first malformed layout.
 * </ul>
 */
class TextExport : public TypeLayout::Exporter
{
    bool m_strict;
    bool m_first;

protected:
    virtual void begin(std::ostream& stream, utilmm::config_set const& config, TypeLayout::Registry const& registry);

public:
    TextExport();

    virtual bool save
        ( std::ostream& stream
        , TypeLayout::RegistryIterator const& layout);
};

#endif

