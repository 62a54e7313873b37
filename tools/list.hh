#ifndef TYPELAYOUT_TOOLS_LIST_HH
#define TYPELAYOUT_TOOLS_LIST_HH

#include "mode.hh"

class List : public Mode
{
public:
    List();

    virtual bool apply(int argc, char* const argv[]);
    virtual void help(std::ostream& stream) const;
};

#endif
