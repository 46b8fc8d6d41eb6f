#include <string>

#include "types.hpp"

std::string ValidationError::locationStr() const
{
    std::string result;
    for(const std::string& part : location)
    {
        if(!result.empty())
        {
            result += ".";
        }
        result += part;
    }
    return result;
}
