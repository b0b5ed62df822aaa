#ifndef PNEUMATIC_NETWORK_STREAM_HPP
#define PNEUMATIC_NETWORK_STREAM_HPP

#include <cstdint>
#include <string>
#include <boost/system/error_code.hpp>

namespace pneumatic {
namespace network {

// Ordered, reliable byte stream underneath a secure channel
class Stream {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~Stream() = default;


    // ---- DATA TRANSFER ----
    // Writes the whole buffer unless an error occurs. Returns bytes written.
    virtual std::size_t write(const uint8_t* data, std::size_t size, boost::system::error_code& ec) = 0;
    // Reads exactly size bytes unless an error occurs. Returns bytes read.
    virtual std::size_t read(uint8_t* data, std::size_t size, boost::system::error_code& ec) = 0;


    // ---- TEARDOWN ----
    // Shuts both directions down; blocked reads and writes return with an error.
    // Safe to call from a thread other than the one doing I/O, and more than once.
    virtual void close() = 0;


    // ---- GETTERS ----
    virtual const std::string& remote_address() const = 0;

protected:
    Stream() = default;
};

} // namespace network
} // namespace pneumatic

#endif // PNEUMATIC_NETWORK_STREAM_HPP
