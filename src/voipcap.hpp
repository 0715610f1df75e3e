#pragma once

#include <memory>
#include <capture_config.hpp>

namespace voipcap {

class Voipcap {

public:
static std::unique_ptr<Voipcap> from_args(int argc, char** argv);

// Returns the process exit status.
int run();

private:
CaptureConfig _config;

};

}
