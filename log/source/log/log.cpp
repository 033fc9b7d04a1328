#include <log/log.hpp>

namespace Log
{
    namespace Detail
    {
        Logger logger{};
    }

    void setup(std::string const& name)
    {
        Detail::logger.setup(name);
    }
}
