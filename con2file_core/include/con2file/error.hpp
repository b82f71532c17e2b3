#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace con2file
{

class Error : public std::runtime_error
{
 public:
  using std::runtime_error::runtime_error;
};

// Bad argument (empty path, illegal characters, non-positive limit).
// Always raised before any filesystem access.
class ValidationError : public Error
{
 public:
  ValidationError(const std::string& argument, const std::string& reason);

  const std::string& Argument() const { return argument_; }

 private:
  std::string argument_;
};

// A filesystem call failed while creating a redirection
class IoError : public Error
{
 public:
  IoError(const std::string& operation, const std::string& path, int err);

  const std::string& Path() const { return path_; }
  std::error_code Code() const { return code_; }

 private:
  std::string path_;
  std::error_code code_;
};

class HandleReleasedError : public Error
{
 public:
  explicit HandleReleasedError(const std::string& path);
};

}  // namespace con2file
