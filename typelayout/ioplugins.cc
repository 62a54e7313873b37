#include "ioplugins.hh"

#include "pluginmanager.hh"
#include "lang/text/export.hh"
#include "lang/xml/export.hh"

namespace
{
    typedef TypeLayout::GenericExportPlugin<TextExport> TextExportPlugin;
    typedef TypeLayout::GenericExportPlugin<XmlExport>  XmlExportPlugin;
}

void TypeLayout::registerIOPlugins(PluginManager& manager)
{
    manager.add(new TextExportPlugin("text"));
    manager.add(new XmlExportPlugin("xml"));
}

