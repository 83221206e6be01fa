#include <fuid/random.hpp>
#include <fuid/log.hpp>
#include <fstream>

namespace fuid {

DeviceRandomSource::DeviceRandomSource(std::string path)
    : path_(std::move(path)) {}

Result<RandomBytes> DeviceRandomSource::random_bytes() {
    std::ifstream dev(path_, std::ios::binary);
    if (!dev.is_open()) {
        return FuidError(FuidError::RandomSourceError,
            "cannot open random device: " + path_,
            "set [random] device in the config to a readable entropy source");
    }

    RandomBytes out;
    dev.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (static_cast<size_t>(dev.gcount()) != out.size()) {
        return FuidError(FuidError::RandomSourceError,
            "short read from random device: " + path_,
            "got " + std::to_string(dev.gcount()) + " of 16 bytes");
    }
    return Result<RandomBytes>::ok(out);
}

Result<RandomBytes> CallbackRandomSource::random_bytes() {
    if (!fn_) {
        return FuidError(FuidError::RandomSourceError,
            "random source callback is empty");
    }
    auto r = fn_();
    if (r.is_err() && r.error().code != FuidError::RandomSourceError) {
        // Callers see every source failure under one code.
        log::debug("random callback failed: %s", r.error().message.c_str());
        return FuidError(FuidError::RandomSourceError,
            "random source callback failed: " + r.error().message,
            r.error().hint);
    }
    return r;
}

} // namespace fuid
