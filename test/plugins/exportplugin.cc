#include <typelayout/pluginmanager.hh>
#include <typelayout/ioplugins.hh>
#include <typelayout/registryiterator.hh>

#include <iostream>

/** Writes the size of each layout, one per line */
class SizeExport : public TypeLayout::Exporter
{
public:
    bool save(std::ostream& stream, TypeLayout::RegistryIterator const& layout)
    {
        stream << layout.getName() << " " << layout->getSize() << "\n";
        return true;
    }
};

TYPELAYOUT_REGISTER_EXPORT(sizes, SizeExport)
