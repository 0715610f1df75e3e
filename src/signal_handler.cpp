#include "signal_handler.hpp"

namespace voipcap {

volatile std::sig_atomic_t SignalHandler::received = 0;

void SignalHandler::setup() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
}

void SignalHandler::restore() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

int SignalHandler::pending() {
    return received;
}

void SignalHandler::clear() {
    received = 0;
}

void SignalHandler::handle_signal(int sig) {
    received = sig;
}

}
