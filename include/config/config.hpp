#ifndef PNEUMATIC_CONFIG_HPP
#define PNEUMATIC_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "network/session.hpp"
#include "transfer/transfer_plan.hpp"

namespace pneumatic {
namespace config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Config error: " + message) {}
};

struct ServerConfig {
    static constexpr std::size_t DEFAULT_DISCOVERY_WORKERS = 16;
    static constexpr const char* DEFAULT_ADDRESS = "127.0.0.1";
    static constexpr uint16_t DEFAULT_PORT = 3000;

    std::vector<std::string> roots;
    std::optional<uint64_t> small_file_threshold_bytes;
    std::optional<uint64_t> large_file_threshold_bytes;
    std::optional<uint64_t> bundle_target_size;
    std::size_t discovery_workers = DEFAULT_DISCOVERY_WORKERS;
    std::string address = DEFAULT_ADDRESS;
    uint16_t port = DEFAULT_PORT;
    bool close_on_unsupported_protocol = false;


    // ---- GETTERS WITH DEFAULTS ----
    uint64_t get_small_file_threshold() const;
    uint64_t get_large_file_threshold() const;
    uint64_t get_bundle_target_size() const;
    transfer::PlanThresholds plan_thresholds() const;
    network::UnsupportedProtocolPolicy unsupported_protocol_policy() const;
};

// Reads a JSON document. Missing keys keep their defaults. Throws ConfigError.
ServerConfig load_config(const std::string& path);

// Same as load_config, from an in-memory JSON document
ServerConfig parse_config(const std::string& json);

} // namespace config
} // namespace pneumatic

#endif // PNEUMATIC_CONFIG_HPP
