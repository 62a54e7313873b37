#include "typename.hh"
#include <ctype.h>

using namespace std;

namespace TypeLayout
{
    bool isValidLayoutName(std::string const& name)
    {
        if (name.empty())
            return false;

        for (string::const_iterator it = name.begin(); it != name.end(); ++it)
        {
            if (iscntrl(static_cast<unsigned char>(*it)))
                return false;
        }
        return true;
    }

    std::string getBasename(std::string const& full_name)
    {
        // Only the scope separators outside of template argument lists
        // count
        int depth = 0;
        size_t start = 0;
        for (size_t i = 0; i < full_name.size(); ++i)
        {
            char c = full_name[i];
            if (c == '<')
                ++depth;
            else if (c == '>')
                --depth;
            else if (depth == 0 && c == ':' && i + 1 < full_name.size() && full_name[i + 1] == ':')
            {
                start = i + 2;
                ++i;
            }
        }
        return string(full_name, start);
    }
}

