#include "con2file/error.hpp"

#include <fmt/format.h>

namespace con2file
{

ValidationError::ValidationError(const std::string& argument, const std::string& reason)
    : Error(fmt::format("invalid argument '{}': {}", argument, reason)), argument_(argument)
{
}

IoError::IoError(const std::string& operation, const std::string& path, int err)
    : Error(fmt::format("{} '{}' failed: {}", operation, path,
                        std::error_code(err, std::generic_category()).message())),
      path_(path),
      code_(err, std::generic_category())
{
}

HandleReleasedError::HandleReleasedError(const std::string& path)
    : Error(fmt::format("redirection to '{}' has already been released", path))
{
}

}  // namespace con2file
