#ifndef TYPELAYOUT_TOOLS_MODE_HH
#define TYPELAYOUT_TOOLS_MODE_HH

#include <iosfwd>
#include <string>

namespace TypeLayout
{
    class Registry;
}

/** Base class for the subcommands of the typelayout tool */
class Mode
{
protected:
    /** Runs the mode. argv[0] is the mode name
     * @return true on success */
    virtual bool apply(int argc, char* const argv[]) = 0;
    virtual void help(std::ostream& stream) const = 0;

    /** Fills \c registry with every layout known to the tool: the standard
     * layouts and the ones defined by plugins */
    static void loadLayouts(TypeLayout::Registry& registry);

public:
    Mode(const std::string& name);
    virtual ~Mode();

    std::string getName() const;

    /** Displays the mode help if the first argument is 'help', and calls
     * apply otherwise */
    bool main(int argc, char* const argv[]);

private:
    std::string m_name;
};

#endif
