#include <voipcap.hpp>
#include <loguru.hpp>


int main(int argc, char* argv[])
{
    loguru::Options options;
    options.verbosity_flag = nullptr;
    loguru::init(argc, argv, options);
    loguru::g_stderr_verbosity = loguru::Verbosity_INFO;

    loguru::add_file("log/voipcap.log", loguru::Append, loguru::Verbosity_MAX);

    LOG_F(INFO, "Launching voipcap");

    try {
        auto app = voipcap::Voipcap::from_args(argc, argv);
        return app->run();
    } catch (const std::exception& e)
    {
        LOG_F(ERROR, "Error: %s", e.what());
        return 1;
    }
}
