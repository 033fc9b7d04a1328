#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace Utility::SearchPath
{
#ifdef _WIN32
    constexpr char separator = ';';
#else
    constexpr char separator = ':';
#endif

    /**
     * @brief Splits a PATH-like list into its elements. Empty elements are kept, because some runtimes give them a
     * meaning (the current directory).
     *
     * @param list The list, e.g. the value of PATH.
     * @param sep Element separator.
     * @return std::vector<std::string> Empty for an empty list.
     */
    std::vector<std::string> split(std::string_view list, char sep = separator);

    std::string join(std::vector<std::string> const& elements, char sep = separator);

    /**
     * @brief Returns true if entry is one of the elements of list. Trailing slashes are not significant.
     */
    bool contains(std::string_view list, std::string_view entry, char sep = separator);

    /**
     * @brief Adds entry to the list unless it is already part of it.
     *
     * @param list The current list, may be empty.
     * @param entry The new element.
     * @param front Prepend instead of append.
     * @return std::string The new list. Exactly entry if list was empty.
     */
    std::string extend(std::string_view list, std::string_view entry, bool front = false, char sep = separator);
}
