#ifndef TRACKER_ERRORS_HPP
#define TRACKER_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace FtseTracker {
namespace Core {

// Fetch did not complete or the upstream answered with a non-success status.
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& message) : std::runtime_error(message) {}
};

// An expected structural element of the page is absent.
class PageParseError : public std::runtime_error {
public:
    explicit PageParseError(const std::string& message) : std::runtime_error(message) {}
};

// Text is present where a number is expected but does not parse as one.
class FieldValueError : public std::runtime_error {
public:
    explicit FieldValueError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace Core
} // namespace FtseTracker

#endif // TRACKER_ERRORS_HPP
