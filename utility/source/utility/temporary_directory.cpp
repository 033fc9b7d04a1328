#include <utility/temporary_directory.hpp>

#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

using namespace std::string_literals;

namespace Utility
{
    namespace
    {
        [[maybe_unused]] std::string generateRandomString(int length)
        {
            std::string characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
            std::string randomString;

            std::random_device device;
            std::mt19937 rng(device());
            std::uniform_int_distribution<int> distribution(0, static_cast<int>(characters.length()) - 1);

            for (int i = 0; i < length; ++i)
                randomString += characters[distribution(rng)];

            return randomString;
        }
    }

    TemporaryDirectory::TemporaryDirectory()
        : TemporaryDirectory{std::filesystem::temp_directory_path() / "suite_launcher_tmpdir", true}
    {}

    TemporaryDirectory::TemporaryDirectory(std::filesystem::path basePath, bool removeBase)
        : m_basePath{std::move(basePath)}
        , m_path{}
        , m_removeBase{removeBase}
    {
        if (!std::filesystem::exists(m_basePath))
            std::filesystem::create_directories(m_basePath);

#if __linux__
        std::string dirNameAsString{(m_basePath / "dirXXXXXX").string()};
        bool valid = mkdtemp(dirNameAsString.data()) && std::filesystem::is_directory(dirNameAsString);
        if (valid)
            m_path = dirNameAsString;
#else
        int i = 0;
        for (; i != 1000; ++i)
        {
            const auto path = m_basePath / ("dir"s + generateRandomString(10));
            if (std::filesystem::create_directory(path))
            {
                m_path = path;
                break;
            }
        }
        bool valid = i != 1000;
#endif
        if (!valid)
            throw std::runtime_error("Could not setup temporary directory in: "s + m_basePath.string());
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code error;
        std::filesystem::remove_all(m_path, error);
        if (m_removeBase)
            std::filesystem::remove(m_basePath, error);
    }

    std::filesystem::path const& TemporaryDirectory::path() const
    {
        return m_path;
    }
}
