#ifndef STOREERROR_HPP
#define STOREERROR_HPP

#include <stdexcept>
#include <string>

// A backing store could not complete a load, persist or erase.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

#endif // STOREERROR_HPP
