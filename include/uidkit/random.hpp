#pragma once

#include <uidkit/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace uidkit {

// Source of cryptographically secure bytes for UUID generation.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Fill exactly len bytes or report why not.
    virtual Status fill(uint8_t* buf, size_t len) = 0;
};

// Reads a kernel random device. There is no fallback to a
// non-cryptographic generator when the device is unusable.
class DeviceRandom : public RandomSource {
public:
    explicit DeviceRandom(std::string path = "/dev/urandom");

    Status fill(uint8_t* buf, size_t len) override;

private:
    std::string path_;
};

// Process-wide /dev/urandom source.
RandomSource& system_random();

// fill() or raise FatalError.
void fill_random_or_die(RandomSource& rng, uint8_t* buf, size_t len);

} // namespace uidkit
