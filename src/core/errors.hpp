#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

/*
  Relay error types.

  The web layer translates these to HTTP status codes. Delivery failures are
  never thrown: they are recorded in a DeliveryOutcome instead.
*/

// Bad registry input or a malformed inbound request (400)
class ValidationError : public std::runtime_error {
public:
  explicit ValidationError(const std::string &msg, std::string details = {})
      : std::runtime_error(msg), details_(std::move(details)) {}

  const std::string &details() const { return details_; }

private:
  std::string details_;
};

// Unknown endpoint id or route (404)
class NotFoundError : public std::runtime_error {
public:
  explicit NotFoundError(const std::string &msg) : std::runtime_error(msg) {}
};

// Registry file could not be read or written
class StorageError : public std::runtime_error {
public:
  explicit StorageError(const std::string &msg) : std::runtime_error(msg) {}
};

// Unexpected fault inside the relay itself (500)
class InternalError : public std::runtime_error {
public:
  explicit InternalError(const std::string &msg) : std::runtime_error(msg) {}
};

#endif // ERRORS_HPP
