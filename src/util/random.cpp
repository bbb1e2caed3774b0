#include <uidkit/random.hpp>
#include <uidkit/log.hpp>
#include <fstream>

namespace uidkit {

DeviceRandom::DeviceRandom(std::string path) : path_(std::move(path)) {}

Status DeviceRandom::fill(uint8_t* buf, size_t len) {
    std::ifstream dev(path_, std::ios::binary);
    if (!dev.is_open()) {
        return UidError(UidError::Random,
            "cannot open random device: " + path_);
    }
    dev.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
    if (static_cast<size_t>(dev.gcount()) != len) {
        return UidError(UidError::Random,
            "short read from random device: " + path_,
            "wanted " + std::to_string(len) + " bytes, got " +
            std::to_string(dev.gcount()));
    }
    return ok_status();
}

RandomSource& system_random() {
    static DeviceRandom urandom;
    return urandom;
}

void fill_random_or_die(RandomSource& rng, uint8_t* buf, size_t len) {
    auto r = rng.fill(buf, len);
    if (r.is_err()) {
        log::error("secure random source failed: %s", r.error().message.c_str());
        throw FatalError(std::move(r).error());
    }
}

} // namespace uidkit
