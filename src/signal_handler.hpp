#pragma once

#include <csignal>

namespace voipcap {

// Records SIGINT/SIGTERM for ShutdownCoordinator to pick up. The handler
// itself only stores the signal number.
class SignalHandler {
public:
    static void setup();
    static void restore();
    static int pending();
    static void clear();

private:
    static void handle_signal(int sig);
    static volatile std::sig_atomic_t received;
};

}
