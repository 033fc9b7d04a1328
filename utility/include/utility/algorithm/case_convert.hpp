#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace Utility::Algorithm
{
    /**
     * @brief Converts the passed ASCII string to lower case by out parameter.
     *
     * @param input The string to convert.
     */
    inline void toLowerCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
    }

    /**
     * @brief Converts the passed ASCII string to lower case and returns it.
     */
    inline std::string toLowerCase(std::string input)
    {
        toLowerCaseInplace(input);
        return input;
    }
}
