#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

namespace funcobj {

// Exception raised on behalf of interpreted code. The kind is the name the
// interpreter reports it under (e.g. "TypeError").
class Exception : public std::runtime_error {
private:
    std::string kind_;

public:
    Exception(const std::string& kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    const std::string& kind() const { return kind_; }
};

// A value of the wrong category was supplied.
class TypeError : public Exception {
public:
    explicit TypeError(const std::string& msg) : Exception("TypeError", msg) {}
};

// A value of the right category violates a structural invariant.
class ValueError : public Exception {
public:
    explicit ValueError(const std::string& msg) : Exception("ValueError", msg) {}
};

// Missing, read-only or undeletable attribute.
class AttributeError : public Exception {
public:
    explicit AttributeError(const std::string& msg) : Exception("AttributeError", msg) {}
};

} // namespace funcobj

#endif // ERRORS_HPP
