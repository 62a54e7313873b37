#include "mode.hh"
#include <typelayout/registry.hh>
#include <lang/csupport/standard_layouts.hh>
#include <iostream>

using namespace std;

Mode::Mode(const std::string& name)
    : m_name(name) {}

Mode::~Mode() {}

std::string Mode::getName() const { return m_name; }

bool Mode::main(int argc, char* const argv[])
{
    if (argc > 1 && argv[1] == string("help"))
    {
        help(cout);
        return true;
    }
    return apply(argc, argv);
}

void Mode::loadLayouts(TypeLayout::Registry& registry)
{ TypeLayout::CXX::addStandardLayouts(registry); }
