#pragma once

// C++ standard library version: This project uses the C++17 standard library.
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>


namespace textdet
{

// Base class of every error raised by the library
class Error : public std::runtime_error
{
public:
  explicit Error(const std::string & message)
  : std::runtime_error(message) {}
};

// Model missing or corrupt, or the accelerator could not host it
class BackendLoadError : public Error
{
public:
  explicit BackendLoadError(const std::string & message)
  : Error(message) {}
};

// Every accelerator in the preference list failed
class NoAcceleratorAvailable : public BackendLoadError
{
public:
  NoAcceleratorAvailable(const std::string & message, std::vector<std::string> failures)
  : BackendLoadError(message), failures_(std::move(failures)) {}

  // One "<provider>: <reason>" entry per attempted accelerator
  const std::vector<std::string> & failures() const noexcept { return failures_; }

private:
  std::vector<std::string> failures_;
};

// Operation attempted in the wrong lifecycle state
class InvalidStateError : public Error
{
public:
  explicit InvalidStateError(const std::string & message)
  : Error(message) {}
};

// detect() called on a detector that is not Ready
class NotLoadedError : public Error
{
public:
  explicit NotLoadedError(const std::string & message)
  : Error(message) {}
};

// Runtime shape or device fault while running the network
class InferenceError : public Error
{
public:
  explicit InferenceError(const std::string & message)
  : Error(message) {}
};

// Corrupt or unsupported input image
class DecodeError : public Error
{
public:
  explicit DecodeError(const std::string & message)
  : Error(message) {}
};

// Option value outside its documented range
class InvalidOptionsError : public Error
{
public:
  explicit InvalidOptionsError(const std::string & message)
  : Error(message) {}
};

} // namespace textdet
