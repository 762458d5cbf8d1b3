#pragma once

#include <stdexcept>
#include <string>

namespace hcodec {

// Base for every error raised by the coder. Messages follow "module: detail".
class HcodecError : public std::runtime_error {
public:
    explicit HcodecError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed digit stream, empty model, missing tree for a non-empty stream.
class InvalidInputError : public HcodecError {
public:
    using HcodecError::HcodecError;
};

// Symbol has no entry in the code table.
class LookupFailureError : public HcodecError {
public:
    using HcodecError::HcodecError;
};

// Storage could not be opened, read or written.
class PersistenceIOError : public HcodecError {
public:
    using HcodecError::HcodecError;
};

// Serialized or hand-built tree breaks the format or the tree invariants.
class MalformedModelError : public HcodecError {
public:
    using HcodecError::HcodecError;
};

} // namespace hcodec
