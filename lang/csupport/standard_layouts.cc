#include "standard_layouts.hh"
#include <typelayout/layoutbuilder.hh>

#include <stdlib.h>
#include <time.h>
#include <sys/time.h>
#include <utility>

using namespace TypeLayout;

namespace
{
    typedef std::pair<char, double> CharDoublePair;
    char const* const SourceID = "standard";
}

namespace TypeLayout
{
    template<> struct Inspectable<timespec>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<timespec> builder("timespec");
            TYPELAYOUT_FIELD(builder, timespec, tv_sec);
            TYPELAYOUT_FIELD(builder, timespec, tv_nsec);
            return builder.getLayout();
        }
    };

    template<> struct Inspectable<timeval>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<timeval> builder("timeval");
            TYPELAYOUT_FIELD(builder, timeval, tv_sec);
            TYPELAYOUT_FIELD(builder, timeval, tv_usec);
            return builder.getLayout();
        }
    };

    template<> struct Inspectable<tm>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<tm> builder("tm");
            TYPELAYOUT_FIELD(builder, tm, tm_sec);
            TYPELAYOUT_FIELD(builder, tm, tm_min);
            TYPELAYOUT_FIELD(builder, tm, tm_hour);
            TYPELAYOUT_FIELD(builder, tm, tm_mday);
            TYPELAYOUT_FIELD(builder, tm, tm_mon);
            TYPELAYOUT_FIELD(builder, tm, tm_year);
            TYPELAYOUT_FIELD(builder, tm, tm_wday);
            TYPELAYOUT_FIELD(builder, tm, tm_yday);
            TYPELAYOUT_FIELD(builder, tm, tm_isdst);
#if defined(__GLIBC__) && defined(__USE_MISC)
            TYPELAYOUT_FIELD(builder, tm, tm_gmtoff);
            TYPELAYOUT_FIELD(builder, tm, tm_zone);
#endif
            return builder.getLayout();
        }
    };

    template<> struct Inspectable<div_t>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<div_t> builder("div_t");
            TYPELAYOUT_FIELD(builder, div_t, quot);
            TYPELAYOUT_FIELD(builder, div_t, rem);
            return builder.getLayout();
        }
    };

    template<> struct Inspectable<ldiv_t>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<ldiv_t> builder("ldiv_t");
            TYPELAYOUT_FIELD(builder, ldiv_t, quot);
            TYPELAYOUT_FIELD(builder, ldiv_t, rem);
            return builder.getLayout();
        }
    };

    template<> struct Inspectable<lldiv_t>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<lldiv_t> builder("lldiv_t");
            TYPELAYOUT_FIELD(builder, lldiv_t, quot);
            TYPELAYOUT_FIELD(builder, lldiv_t, rem);
            return builder.getLayout();
        }
    };

    template<> struct Inspectable<CharDoublePair>
    {
        static LayoutReport describe()
        {
            LayoutBuilder<CharDoublePair> builder("std::pair<char, double>");
            TYPELAYOUT_FIELD(builder, CharDoublePair, first);
            TYPELAYOUT_FIELD(builder, CharDoublePair, second);
            builder.addParameter<char>();
            builder.addParameter<double>();
            return builder.getLayout();
        }
    };
}

void TypeLayout::CXX::addStandardLayouts(TypeLayout::Registry& registry)
{
    registry.add<timespec>(SourceID);
    registry.add<timeval>(SourceID);
    registry.add<tm>(SourceID);
    registry.add<div_t>(SourceID);
    registry.add<ldiv_t>(SourceID);
    registry.add<lldiv_t>(SourceID);
    registry.add<CharDoublePair>(SourceID);
}

