#ifndef PNEUMATIC_TRANSFER_ERROR_HPP
#define PNEUMATIC_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace pneumatic {
namespace transfer {

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error(message) {}
};

// Directory listing or metadata read failed, traversal aborted
class DiscoveryError : public TransferError {
public:
    explicit DiscoveryError(const std::string& message)
        : TransferError("Discovery failed: " + message) {}
};

class PlanningError : public TransferError {
public:
    explicit PlanningError(const std::string& message)
        : TransferError("Planning failed: " + message) {}
};

} // namespace transfer
} // namespace pneumatic

#endif // PNEUMATIC_TRANSFER_ERROR_HPP
