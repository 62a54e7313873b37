#ifndef TYPELAYOUT_TOOLS_EXPORT_HH
#define TYPELAYOUT_TOOLS_EXPORT_HH

#include "mode.hh"

class Export : public Mode
{
public:
    Export();

    virtual bool apply(int argc, char* const argv[]);
    virtual void help(std::ostream& stream) const;
};

#endif
