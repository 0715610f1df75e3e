#pragma once

#include <mutex>
#include <thread>
#include <functional>
#include <condition_variable>

namespace voipcap {

// Watches for a recorded termination signal, asks the engine to stop and
// gives it a grace period to wind down before ending the process.
class ShutdownCoordinator {

public:
explicit ShutdownCoordinator(std::function<void()> stop_capture);
~ShutdownCoordinator();

ShutdownCoordinator(const ShutdownCoordinator&) = delete;
ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

// Called once the capture loop has returned.
void notify_finished();

bool signalled() const;

private:
void run();

std::function<void()> _stop_capture;
mutable std::mutex _mutex;
std::condition_variable _cv;
bool _finished = false;
bool _signalled = false;
std::thread _thread;

};

}
