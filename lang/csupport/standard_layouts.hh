#ifndef TYPELAYOUT_CXX_STANDARD_LAYOUTS_HH
#define TYPELAYOUT_CXX_STANDARD_LAYOUTS_HH

#include <typelayout/registry.hh>

namespace TypeLayout
{
    namespace CXX
    {
        /** Adds the layouts of some structures of the C and POSIX libraries
         * (timespec, timeval, tm, div_t, ldiv_t, lldiv_t) and of
         * std::pair<char, double>, as compiled on this machine */
        void addStandardLayouts(TypeLayout::Registry& registry);
    }
}

#endif

