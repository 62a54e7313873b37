#ifndef TYPELAYOUT_LANG_XML_EXPORT_HH
#define TYPELAYOUT_LANG_XML_EXPORT_HH

#include <typelayout/exporter.hh>
#include <libxml/xmlwriter.h>

/** Exports layouts as an XML document
 *
 * <code>
 * <?xml version="1.0" encoding="UTF-8"?>
 * <typelayout>
 *   <layout type_name="Foo" size="8" alignment="4">
 *     <fields>
 *       <field name="a" type_name="unsigned char" size="1" offset="0"/>
 *       <field name="b" type_name="unsigned int" size="4" offset="4"/>
 *     </fields>
 *     <generic_parameters/>
 *   </layout>
 * </typelayout>
 * </code>
 *
 * Element and attribute names are the ones of LayoutReport and
 * FieldDescriptor. Fields are saved in offset order, and padding is not
 * saved.
 *
 * Configuration options:
 * <ul>
 *  <li> indent (bool, default true): indent the generated document
 * </ul>
 */
class XmlExport : public TypeLayout::Exporter
{
    xmlBufferPtr     m_buffer;
    xmlTextWriterPtr m_writer;

    void release();

    XmlExport(XmlExport const&);
    XmlExport& operator = (XmlExport const&);

protected:
    /** Called by save to add a prelude before saving all layouts */
    virtual void begin(std::ostream& stream, utilmm::config_set const& config, TypeLayout::Registry const& registry);
    /** Called by save to add data after saving all layouts */
    virtual void end  (std::ostream& stream, utilmm::config_set const& config, TypeLayout::Registry const& registry);

public:
    XmlExport();
    ~XmlExport();

    virtual bool save
        ( std::ostream& stream
        , TypeLayout::RegistryIterator const& layout);
};

#endif

