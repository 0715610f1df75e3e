#include <shutdown_coordinator.hpp>

#include <cstdlib>
#include <loguru.hpp>
#include <constants.hpp>
#include <signal_handler.hpp>

namespace voipcap {

ShutdownCoordinator::ShutdownCoordinator(std::function<void()> stop_capture)
    : _stop_capture(std::move(stop_capture))
{
    SignalHandler::setup();
    _thread = std::thread(&ShutdownCoordinator::run, this);
}

ShutdownCoordinator::~ShutdownCoordinator()
{
    notify_finished();
    if (_thread.joinable()) {
        _thread.join();
    }
    SignalHandler::restore();
}

void ShutdownCoordinator::notify_finished()
{
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _finished = true;
    }
    _cv.notify_all();
}

bool ShutdownCoordinator::signalled() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _signalled;
}

void ShutdownCoordinator::run()
{
    std::unique_lock<std::mutex> lock(_mutex);
    while (!_finished) {
        _cv.wait_for(lock, timing::signal_poll, [&]() { return _finished; });
        if (_finished) {
            return;
        }

        int sig = SignalHandler::pending();
        if (sig == 0) {
            continue;
        }
        SignalHandler::clear();
        _signalled = true;

        LOG_F(INFO, "Sniffer received stop signal %d", sig);
        lock.unlock();
        _stop_capture();
        lock.lock();

        if (!_cv.wait_for(lock, timing::shutdown_grace, [&]() { return _finished; })) {
            LOG_F(WARNING, "Capture did not stop within %lld ms, exiting",
                  static_cast<long long>(timing::shutdown_grace.count()));
            std::quick_exit(EXIT_SUCCESS);
        }
        return;
    }
}

}
