#ifndef DROIDBRIDGE_ERRORS_HPP
#define DROIDBRIDGE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace droidbridge {

// Base class for every error raised by the library.
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Construction-time errors

class BinaryNotFoundError : public Error {
public:
    explicit BinaryNotFoundError(const std::string& binary)
        : Error("Binary not found in path: \"" + binary + "\""), binary_(binary) {}

    const std::string& binary() const { return binary_; }

private:
    std::string binary_;
};

class InvalidArgumentError : public Error {
public:
    using Error::Error;
};

// Raised only when the OS refuses to create the child (pipe/fork failure).
class ProcessSpawnError : public Error {
public:
    using Error::Error;
};

// Semantic errors: an expected marker is absent from the tool output

class ConnectionError : public Error {
public:
    using Error::Error;
};

class WindowNotFoundError : public Error {
public:
    using Error::Error;
};

class ApplicationErrorError : public Error {
public:
    using Error::Error;
};

class ApplicationNotRespondingError : public Error {
public:
    using Error::Error;
};

class WakeupFailedError : public Error {
public:
    using Error::Error;
};

class UnknownKeyError : public Error {
public:
    explicit UnknownKeyError(const std::string& key)
        : Error("Provided key \"" + key + "\" does not have a mapping"), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

class MalformedHierarchyError : public Error {
public:
    using Error::Error;
};

class ScreenshotError : public Error {
public:
    using Error::Error;
};

} // namespace droidbridge

#endif // DROIDBRIDGE_ERRORS_HPP
