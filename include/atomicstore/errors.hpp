#pragma once

#include <stdexcept>
#include <string>

namespace atomicstore {

// A callback tried to mutate the store that is currently invoking it.
class ReentrancyError : public std::logic_error {
public:
    explicit ReentrancyError(const std::string& msg) : std::logic_error(msg) {}
};

// A batch was used again after execute().
class BatchStateError : public std::logic_error {
public:
    explicit BatchStateError(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace atomicstore
