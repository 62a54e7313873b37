#include "export.hh"
#include <iostream>

#include <typelayout/layoutcheck.hh>
#include <typelayout/layoutdisplay.hh>

using namespace TypeLayout;
using namespace std;

TextExport::TextExport()
    : m_strict(false), m_first(true) {}

void TextExport::begin
    ( ostream& /*stream*/
    , utilmm::config_set const& config
    , Registry const& /*registry*/ )
{
    m_strict = config.get<bool>("strict", false);
    m_first  = true;
}

bool TextExport::save
    ( ostream& stream
    , RegistryIterator const& layout )
{
    if (m_strict)
    {
        try { checkLayout(*layout); }
        catch(MalformedReport const& e)
        { throw ExportError(e.what()); }
    }

    if (!m_first)
        stream << "\n";
    m_first = false;

    LayoutDisplay display(stream);
    display.display(*layout);
    return true;
}

