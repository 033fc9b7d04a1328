#include <process/environment.hpp>
#include <utility/search_path.hpp>

#include <boost/process/v2/environment.hpp>

#include <utility>

namespace bp2 = boost::process::v2;

Environment::Environment(
    bool clean,
    std::unordered_map<std::string, std::string> const& mergeIn,
    std::string const& pathMergeIn)
    : environment_{}
{
    if (!clean)
        loadFromCurrent();

    merge(mergeIn, true);
    if (!pathMergeIn.empty())
        extendPath(pathMergeIn);
}
std::unordered_map<std::string, std::string>& Environment::environment()
{
    return environment_;
}
std::unordered_map<std::string, std::string> const& Environment::environment() const
{
    return environment_;
}
void Environment::loadFromCurrent()
{
    environment_ = {};
    const auto currentEnv = bp2::environment::current();
    for (auto iter = currentEnv.begin(); iter != currentEnv.end(); ++iter)
    {
        auto deref = *iter;
        if (deref.key().empty())
            continue;
        environment_.emplace(deref.key().string(), deref.value().string());
    }
}
std::optional<std::string> Environment::get(std::string const& key) const
{
    auto iter = environment_.find(key);
    if (iter == environment_.end())
        return std::nullopt;
    return iter->second;
}
void Environment::set(std::string const& key, std::string value)
{
    environment_[key] = std::move(value);
}
void Environment::extendPath(std::string const& path, bool front)
{
    extendSearchPath("PATH", path, front);
}
void Environment::extendSearchPath(std::string const& variable, std::string const& entry, bool front)
{
    auto iter = environment_.find(variable);
    if (iter == environment_.end())
        environment_[variable] = entry;
    else
        iter->second = Utility::SearchPath::extend(iter->second, entry, front);
}
void Environment::merge(std::unordered_map<std::string, std::string> const& other, bool overwrite)
{
    for (auto const& [key, value] : other)
    {
        if (overwrite || environment_.find(key) == environment_.end())
            environment_[key] = value;
    }
}
