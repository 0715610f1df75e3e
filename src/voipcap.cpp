#include <voipcap.hpp>

#include <loguru.hpp>
#include <capture_engine.hpp>
#include <summary_worker.hpp>
#include <shutdown_coordinator.hpp>

namespace voipcap {

std::unique_ptr<Voipcap> Voipcap::from_args(int argc, char** argv) {
    auto app = std::make_unique<Voipcap>();
    app->_config = CaptureConfig::from_args(argc, argv);
    return app;
}

int Voipcap::run() {
    SummaryWorker worker;
    CaptureEngine engine(_config, worker);
    worker.set_link_type(engine.link_type());

    ShutdownCoordinator shutdown([&]() { engine.stop(); });

    auto error = engine.run();
    shutdown.notify_finished();

    worker.report();
    if (error) {
        LOG_F(ERROR, "%s", error->message.c_str());
        return 1;
    }

    LOG_F(INFO, "[*] Finished capture.");
    return 0;
}

}
