#pragma once
// Errors raised by the catalog

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace cohort {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

// Argument to remove() or slice() that cannot be interpreted
class InvalidArgument : public Error {
public:
    explicit InvalidArgument(const std::string& what) : Error(what) {}
};

// Member is in the table but the resolution client could not locate it
class MemberNotFound : public Error {
public:
    MemberNotFound(size_t position, const MemberId& id)
        : Error("Could not find member " + std::to_string(position) +
                " (uuid: " + id.to_string() + "); re-add or remove it.")
        , position_(position)
        , id_(id)
    {}

    size_t position() const { return position_; }
    const MemberId& id() const { return id_; }

private:
    size_t position_;
    MemberId id_;
};

// Permission-class failure while writing through to a durable store
class PermissionDenied : public Error {
public:
    explicit PermissionDenied(const std::string& what) : Error(what) {}
};

// Record field that does not fit the configured encoding
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& what) : Error(what) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

} // namespace cohort
