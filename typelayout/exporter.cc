#include "exporter.hh"
#include "registry.hh"
#include "registryiterator.hh"
#include <fstream>
#include <iostream>

using namespace TypeLayout;
using namespace std;

void Exporter::save(std::string const& file_name,
                    utilmm::config_set const& config,
                    Registry const& registry)
{
    std::ofstream file(file_name.c_str(), std::ofstream::trunc);
    if (!file)
        throw ExportError("cannot open " + file_name + " for writing");

    save(file, config, registry);

    file.flush();
    if (!file)
        throw ExportError("failed to write " + file_name);
}

void Exporter::save(std::ostream& stream, utilmm::config_set const& config,
                    Registry const& registry)
{
    // Resolve the selection first, so that nothing is written if one of the
    // requested layouts does not exist
    std::list<RegistryIterator> selected;
    std::list<std::string> names = config.get< std::list<std::string> >("layouts");
    if (names.empty())
    {
        RegistryIterator const it_end(registry.end());
        for (RegistryIterator it = registry.begin(); it != it_end; ++it)
            selected.push_back(it);
    }
    else
    {
        for (std::list<std::string>::const_iterator it = names.begin(); it != names.end(); ++it)
        {
            RegistryIterator layout = registry.find(*it);
            if (layout == registry.end())
                throw Undefined(*it);
            selected.push_back(layout);
        }
    }

    begin(stream, config, registry);
    for (std::list<RegistryIterator>::const_iterator it = selected.begin(); it != selected.end(); ++it)
        save(stream, *it);
    end(stream, config, registry);
}

void Exporter::begin(std::ostream& stream, utilmm::config_set const& config, Registry const& registry) {}
void Exporter::end(std::ostream& stream, utilmm::config_set const& config, Registry const& registry) {}

