#pragma once

#include <optional>
#include <string>
#include <unordered_map>

/**
 * @brief Key/value snapshot of a process environment. Handed to child processes explicitly, the environment of the
 * current process is only ever read.
 */
class Environment
{
  public:
    Environment() = default;
    Environment(
        bool clean,
        std::unordered_map<std::string, std::string> const& mergeIn,
        std::string const& pathMergeIn = {});

    std::unordered_map<std::string, std::string>& environment();
    std::unordered_map<std::string, std::string> const& environment() const;

    void loadFromCurrent();

    std::optional<std::string> get(std::string const& key) const;
    void set(std::string const& key, std::string value);

    void extendPath(std::string const& path, bool front = true);

    /**
     * @brief Adds an entry to a PATH-like variable (PATH, PYTHONPATH, ...).
     * An unset or empty variable becomes exactly the entry. An entry that is already listed is not added twice.
     *
     * @param variable The variable to extend.
     * @param entry The new list element.
     * @param front Prepend instead of append.
     */
    void extendSearchPath(std::string const& variable, std::string const& entry, bool front = false);

    void merge(std::unordered_map<std::string, std::string> const& other, bool overwrite = true);

  private:
    std::unordered_map<std::string, std::string> environment_;
};
