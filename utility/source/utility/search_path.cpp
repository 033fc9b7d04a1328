#include <utility/search_path.hpp>

#include <algorithm>

namespace Utility::SearchPath
{
    namespace
    {
        std::string_view withoutTrailingSlashes(std::string_view element)
        {
            while (element.size() > 1 && (element.back() == '/' || element.back() == '\\'))
                element.remove_suffix(1);
            return element;
        }
    }

    std::vector<std::string> split(std::string_view list, char sep)
    {
        std::vector<std::string> elements{};
        if (list.empty())
            return elements;

        std::size_t begin = 0;
        for (;;)
        {
            const auto end = list.find(sep, begin);
            if (end == std::string_view::npos)
            {
                elements.emplace_back(list.substr(begin));
                break;
            }
            elements.emplace_back(list.substr(begin, end - begin));
            begin = end + 1;
        }
        return elements;
    }

    std::string join(std::vector<std::string> const& elements, char sep)
    {
        std::string result{};
        for (auto iter = elements.begin(); iter != elements.end(); ++iter)
        {
            if (iter != elements.begin())
                result.push_back(sep);
            result += *iter;
        }
        return result;
    }

    bool contains(std::string_view list, std::string_view entry, char sep)
    {
        const auto elements = split(list, sep);
        const auto needle = withoutTrailingSlashes(entry);
        return std::any_of(elements.begin(), elements.end(), [needle](std::string const& element) {
            return withoutTrailingSlashes(element) == needle;
        });
    }

    std::string extend(std::string_view list, std::string_view entry, bool front, char sep)
    {
        if (list.empty())
            return std::string{entry};

        if (contains(list, entry, sep))
            return std::string{list};

        if (front)
            return std::string{entry} + sep + std::string{list};
        return std::string{list} + sep + std::string{entry};
    }
}
