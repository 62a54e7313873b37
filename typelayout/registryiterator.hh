#ifndef TYPELAYOUT_REGISTRYITERATOR_HH
#define TYPELAYOUT_REGISTRYITERATOR_HH

#include "registry.hh"
#include "layoutmodel.hh"
#include "typename.hh"
#include <boost/iterator/iterator_facade.hpp>

namespace TypeLayout
{
    /** Iterator on the layouts of the registry, in name order */
    class RegistryIterator
        : public boost::iterator_facade
            < RegistryIterator
            , LayoutReport const
            , boost::forward_traversal_tag >
    {
        friend class Registry;

    public:
        RegistryIterator(RegistryIterator const& other)
            : m_registry(other.m_registry), m_iter(other.m_iter) {}

        RegistryIterator& operator = (RegistryIterator const& other)
        {
            m_registry = other.m_registry;
            m_iter = other.m_iter;
            return *this;
        }

        /** The layout name */
        std::string getName() const { return m_iter->first; }
        /** The layout name without namespaces */
        std::string getBasename() const { return TypeLayout::getBasename(m_iter->first); }
        /** The source ID for this layout */
        std::string getSource() const { return m_iter->second.source_id; }

        Registry const& getRegistry() const { return *m_registry; }

    private:
        typedef Registry::LayoutMap::const_iterator BaseIter;
        Registry const* m_registry;
        BaseIter m_iter;

        explicit RegistryIterator(Registry const& registry, BaseIter init)
            : m_registry(&registry), m_iter(init) {}
        friend class boost::iterator_core_access;

        bool equal(RegistryIterator const& other) const
        { return other.m_iter == m_iter; }
        void increment()
        { ++m_iter; }
        LayoutReport const& dereference() const
        { return m_iter->second.layout; }
    };
}

#endif

