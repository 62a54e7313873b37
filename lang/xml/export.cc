#include "export.hh"
#include <iostream>
#include <boost/lexical_cast.hpp>

#include <typelayout/layoutmodel.hh>

using namespace TypeLayout;
using namespace std;
using boost::lexical_cast;

namespace
{
    xmlChar const* xml(char const* value)
    { return reinterpret_cast<xmlChar const*>(value); }

    void check(int result, char const* operation)
    {
        if (result < 0)
            throw ExportError(string("xml export: ") + operation + " failed");
    }

    void writeAttribute(xmlTextWriterPtr writer, char const* name, string const& value)
    { check(xmlTextWriterWriteAttribute(writer, xml(name), xml(value.c_str())), "writing an attribute"); }

    void writeAttribute(xmlTextWriterPtr writer, char const* name, size_t value)
    { writeAttribute(writer, name, lexical_cast<string>(value)); }

    void startElement(xmlTextWriterPtr writer, char const* name)
    { check(xmlTextWriterStartElement(writer, xml(name)), "starting an element"); }

    void endElement(xmlTextWriterPtr writer)
    { check(xmlTextWriterEndElement(writer), "closing an element"); }
}

XmlExport::XmlExport()
    : m_buffer(0), m_writer(0) {}

XmlExport::~XmlExport()
{ release(); }

void XmlExport::release()
{
    if (m_writer)
        xmlFreeTextWriter(m_writer);
    if (m_buffer)
        xmlBufferFree(m_buffer);
    m_writer = 0;
    m_buffer = 0;
}

void XmlExport::begin
    ( ostream& /*stream*/
    , utilmm::config_set const& config
    , Registry const& /*registry*/ )
{
    release();

    m_buffer = xmlBufferCreate();
    if (!m_buffer)
        throw ExportError("xml export: cannot allocate the output buffer");
    m_writer = xmlNewTextWriterMemory(m_buffer, 0);
    if (!m_writer)
        throw ExportError("xml export: cannot create the XML writer");

    if (config.get<bool>("indent", true))
    {
        check(xmlTextWriterSetIndent(m_writer, 1), "setting indentation");
        check(xmlTextWriterSetIndentString(m_writer, xml("  ")), "setting indentation");
    }

    check(xmlTextWriterStartDocument(m_writer, NULL, "UTF-8", NULL), "starting the document");
    startElement(m_writer, "typelayout");
}

void XmlExport::end
    ( ostream& stream
    , utilmm::config_set const& /*config*/
    , Registry const& /*registry*/ )
{
    check(xmlTextWriterEndDocument(m_writer), "ending the document");

    // The writer must be freed before the buffer is read, as it flushes
    // its pending output on destruction
    xmlFreeTextWriter(m_writer);
    m_writer = 0;

    stream.write(reinterpret_cast<char const*>(xmlBufferContent(m_buffer)), xmlBufferLength(m_buffer));
    release();

    if (!stream)
        throw ExportError("xml export: failed to write the document");
}

bool XmlExport::save
    ( ostream& /*stream*/
    , RegistryIterator const& layout )
{
    startElement(m_writer, "layout");
    writeAttribute(m_writer, "type_name", layout->getTypeName());
    writeAttribute(m_writer, "size", layout->getSize());
    writeAttribute(m_writer, "alignment", layout->getAlignment());

    startElement(m_writer, "fields");
    LayoutReport::FieldList fields = layout->getSortedFields();
    for (LayoutReport::FieldList::const_iterator it = fields.begin(); it != fields.end(); ++it)
    {
        startElement(m_writer, "field");
        writeAttribute(m_writer, "name", it->getName());
        writeAttribute(m_writer, "type_name", it->getTypeName());
        writeAttribute(m_writer, "size", it->getSize());
        writeAttribute(m_writer, "offset", it->getOffset());
        endElement(m_writer);
    }
    endElement(m_writer);

    startElement(m_writer, "generic_parameters");
    LayoutReport::ParameterList const& parameters = layout->getGenericParameters();
    for (LayoutReport::ParameterList::const_iterator it = parameters.begin(); it != parameters.end(); ++it)
    {
        check(xmlTextWriterWriteElement(m_writer, xml("generic_parameter"), xml(it->c_str())),
                "writing a generic parameter");
    }
    endElement(m_writer);

    endElement(m_writer);
    return true;
}

