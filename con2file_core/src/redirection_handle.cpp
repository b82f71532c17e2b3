#include "con2file/redirection_handle.hpp"

#include <exception>
#include <system_error>

#include "con2file/diagnostics.hpp"
#include "con2file/error.hpp"
#include "con2file/path_util.hpp"

namespace con2file
{

RedirectionHandle::RedirectionHandle(const std::string& file_path, IOutputTarget& target,
                                     RedirectionRegistry& registry)
    : target_(target), registry_(registry)
{
  ValidatePath(file_path, "file_path");
  std::string absolute = Canonicalize(file_path);

  std::string dir = SplitPath(absolute).dir;
  int err = MakeDirectories(dir);
  if (err != 0)
  {
    throw IoError("create directory", dir, err);
  }
  // The directory exists now, so symlinks in it resolve
  path_ = Canonicalize(absolute);

  sink_ = FileStreamBuf::Open(path_);

  registry_.Register(path_);
  try
  {
    previous_ = target_.Push(sink_.get());
  }
  catch (...)
  {
    registry_.Release(path_);
    throw;
  }
  active_.store(true, std::memory_order_release);

  C2F_LOG_DEBUG("redirected output to '{}'", path_);
}

RedirectionHandle::~RedirectionHandle() { Release(); }

void RedirectionHandle::Flush()
{
  std::lock_guard<std::mutex> lock(release_mutex_);
  if (!IsActive())
  {
    throw HandleReleasedError(path_);
  }
  int err = sink_->Flush();
  if (err != 0)
  {
    throw IoError("flush", path_, err);
  }
}

int64_t RedirectionHandle::FileSize() const
{
  if (!IsActive())
  {
    return 0;
  }
  return FileSizeOf(path_).value_or(0);
}

void RedirectionHandle::Release() noexcept
{
  std::lock_guard<std::mutex> lock(release_mutex_);
  if (!active_.exchange(false, std::memory_order_acq_rel))
  {
    return;
  }

  try
  {
    if (!target_.Remove(sink_.get()))
    {
      C2F_LOG_WARN("redirection to '{}' released out of order; the newer redirection stays "
                   "in place",
                   path_);
    }
  }
  catch (const std::exception& e)
  {
    C2F_LOG_ERROR("restoring output after '{}' failed: {}", path_, e.what());
  }

  int err = sink_->Close();
  if (err != 0)
  {
    C2F_LOG_WARN("closing '{}' failed: {}",
                 path_, std::error_code(err, std::generic_category()).message());
  }

  try
  {
    registry_.Release(path_);
  }
  catch (const std::exception& e)
  {
    C2F_LOG_ERROR("deregistering '{}' failed: {}", path_, e.what());
  }

  C2F_LOG_DEBUG("released redirection to '{}'", path_);
}

}  // namespace con2file
