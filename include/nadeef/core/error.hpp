#pragma once

#include <stdexcept>
#include <string>

namespace nadeef {

/// Base class for errors raised by the data model.
class Error : public std::runtime_error {
   public:
    explicit Error(const std::string& message) : std::runtime_error(message) {}
};

/// Row construction or projection violates a structural invariant.
class IntegrityError : public Error {
   public:
    explicit IntegrityError(const std::string& message) : Error(message) {}
};

/// A column was requested that is absent from the current schema.
class LookupError : public Error {
   public:
    explicit LookupError(const std::string& message) : Error(message) {}
};

/// A value was read as an incompatible type.
class TypeError : public Error {
   public:
    explicit TypeError(const std::string& message) : Error(message) {}
};

}  // namespace nadeef
