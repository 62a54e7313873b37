#ifndef TYPELAYOUT_TOOLS_SHOW_HH
#define TYPELAYOUT_TOOLS_SHOW_HH

#include "mode.hh"

class Show : public Mode
{
public:
    Show();

    virtual bool apply(int argc, char* const argv[]);
    virtual void help(std::ostream& stream) const;
};

#endif
