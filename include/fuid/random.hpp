#pragma once

#include <fuid/result.hpp>
#include <array>
#include <cstdint>
#include <functional>
#include <string>

namespace fuid {

using RandomBytes = std::array<uint8_t, 16>;

// Capability handed to Fuid::generate(). Implementations decide their own
// thread safety; the codec never caches or shares a source.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // 16 cryptographically strong bytes, or RandomSourceError.
    virtual Result<RandomBytes> random_bytes() = 0;
};

// Reads from a character device such as /dev/urandom. There is no fallback
// generator: an unreadable device is an error.
class DeviceRandomSource : public RandomSource {
public:
    explicit DeviceRandomSource(std::string path = default_device());

    Result<RandomBytes> random_bytes() override;

    const std::string& path() const { return path_; }

    static std::string default_device() { return "/dev/urandom"; }

private:
    std::string path_;
};

// Adapts a plain function into a RandomSource.
class CallbackRandomSource : public RandomSource {
public:
    using Callback = std::function<Result<RandomBytes>()>;

    explicit CallbackRandomSource(Callback fn) : fn_(std::move(fn)) {}

    Result<RandomBytes> random_bytes() override;

private:
    Callback fn_;
};

} // namespace fuid
