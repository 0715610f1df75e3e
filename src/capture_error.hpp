#pragma once

#include <string>
#include <stdexcept>

namespace voipcap {

// Thrown while opening a backend or preparing the engine, before the read
// loop starts.
class SetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fatal condition recorded by the read loop and handed back from run().
struct CaptureError
{
    std::string message;
};

}
