#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace asesweep {

/* Coarse classification carried into the manifest and the run outcome. */
enum class ErrorKind : std::uint8_t {
    None = 0,
    Config,
    DeviceUnavailable,
    DeviceCommunication,
    DeviceTimeout,
    SaturationExhausted,
    PreconditionTimeout,
    Cancelled,
    Storage,
    Internal
};

const char* toString(ErrorKind k) noexcept;

/* Root of everything the engine throws on purpose. */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_{kind} {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/* Rejected option value; raised before any device is touched. */
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what)
        : Error(ErrorKind::Config, what) {}
};

/*
  Adapter-level failure.
  'code' is the driver's own status code (0 when the driver gave none),
  'device' names the adapter for the log ("rotator", "pulser", ...).
*/
class DeviceError : public Error {
public:
    DeviceError(ErrorKind kind, std::string device, int code, const std::string& message)
        : Error(kind, device + ": " + message + (code ? " (code " + std::to_string(code) + ")" : ""))
        , device_{std::move(device)}, code_{code}, message_{message} {}

    [[nodiscard]] const std::string& device()  const noexcept { return device_; }
    [[nodiscard]] int                code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    std::string device_;
    int         code_;
    std::string message_;
};

/* Device claimed by other software, or not reachable at all. Fatal before the sweep. */
class DeviceUnavailableError : public DeviceError {
public:
    DeviceUnavailableError(std::string device, const std::string& message, int code = 0)
        : DeviceError(ErrorKind::DeviceUnavailable, std::move(device), code, message) {}
};

/* Communication broke down mid-run. Fatal for the run. */
class DeviceCommunicationError : public DeviceError {
public:
    DeviceCommunicationError(std::string device, const std::string& message, int code = 0)
        : DeviceError(ErrorKind::DeviceCommunication, std::move(device), code, message) {}

protected:
    DeviceCommunicationError(ErrorKind kind, std::string device, const std::string& message, int code)
        : DeviceError(kind, std::move(device), code, message) {}
};

/* A blocking adapter call exceeded its bound. */
class DeviceTimeoutError : public DeviceCommunicationError {
public:
    DeviceTimeoutError(std::string device, const std::string& message, double timeoutS)
        : DeviceCommunicationError(ErrorKind::DeviceTimeout, std::move(device), message, 0)
        , timeoutS_{timeoutS} {}

    [[nodiscard]] double timeoutS() const noexcept { return timeoutS_; }

private:
    double timeoutS_;
};

/* Every preset saturated at one angle. Recoverable: the point is recorded as failed. */
class SaturationExhaustedError : public Error {
public:
    explicit SaturationExhaustedError(double shortestS)
        : Error(ErrorKind::SaturationExhausted,
                "saturation persists at shortest preset " + std::to_string(shortestS) + " s")
        , shortestS_{shortestS} {}

    [[nodiscard]] double shortestS() const noexcept { return shortestS_; }

private:
    double shortestS_;
};

using ExhaustedPresetsError = SaturationExhaustedError;

/* Detector never reached its temperature threshold within the bounded wait. */
class PreconditionTimeoutError : public Error {
public:
    explicit PreconditionTimeoutError(const std::string& what)
        : Error(ErrorKind::PreconditionTimeout, what) {}
};

/* External abort request observed between steps. */
class CancelledError : public Error {
public:
    CancelledError()
        : Error(ErrorKind::Cancelled, "cancelled by user") {}
};

/* Run directory / manifest could not be written. */
class StorageError : public Error {
public:
    explicit StorageError(const std::string& what)
        : Error(ErrorKind::Storage, what) {}
};

} // namespace asesweep
