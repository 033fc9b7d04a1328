#include <launcher/application.hpp>
#include <launcher/exit_code.hpp>
#include <log/log.hpp>

#include <exception>

int main(int argc, char** argv)
{
    try
    {
        return SuiteLauncher::launch(argc, argv);
    }
    catch (std::exception const& e)
    {
        Log::critical("Unexpected failure: {}", e.what());
        return SuiteLauncher::ExitCode::InternalError;
    }
}
