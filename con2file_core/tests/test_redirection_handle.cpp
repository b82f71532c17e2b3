#include <gtest/gtest.h>
#include <sys/stat.h>

#include <cerrno>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include "../include/con2file/diagnostics.hpp"
#include "../include/con2file/error.hpp"
#include "../include/con2file/output_target.hpp"
#include "../include/con2file/redirection_handle.hpp"
#include "../include/con2file/redirection_registry.hpp"
#include "../include/con2file/sinks/callback_sink.hpp"
#include "temp_dir.hpp"

namespace
{

// Target that refuses every redirection
class BrokenTarget : public con2file::IOutputTarget
{
 public:
  std::streambuf* Get() const override { return nullptr; }
  void Set(std::streambuf*) override {}
  std::streambuf* Push(std::streambuf*) override
  {
    throw std::runtime_error("target unavailable");
  }
  bool Remove(std::streambuf*) override { return false; }
};

}  // namespace

class RedirectionHandleTest : public TempDirTest
{
 protected:
  std::ostringstream console_;
  con2file::StreamOutputTarget target_{console_};
  con2file::RedirectionRegistry registry_;
  std::vector<con2file::DiagEntry> warnings_;
  std::mutex warnings_mutex_;

  void SetUp() override
  {
    TempDirTest::SetUp();
    auto& diag = con2file::Diagnostics::Instance();
    diag.ClearSinks();
    auto sink = std::make_unique<con2file::CallbackSink>(
        [this](const con2file::DiagEntry& entry)
        {
          std::lock_guard<std::mutex> lock(warnings_mutex_);
          warnings_.push_back(entry);
        });
    sink->SetLevel(con2file::LogLevel::Warn);
    diag.AddSink(std::move(sink));
  }

  void TearDown() override
  {
    con2file::Diagnostics::Instance().ResetSinks();
    TempDirTest::TearDown();
  }

  std::unique_ptr<con2file::RedirectionHandle> open(const std::string& name)
  {
    return std::make_unique<con2file::RedirectionHandle>(path_in(name), target_, registry_);
  }

  size_t warning_count()
  {
    std::lock_guard<std::mutex> lock(warnings_mutex_);
    return warnings_.size();
  }
};

TEST_F(RedirectionHandleTest, RedirectsAndRestores)
{
  std::streambuf* original = console_.rdbuf();
  console_ << "before|";

  auto handle = open("out.log");
  EXPECT_TRUE(handle->IsActive());
  EXPECT_EQ(handle->Previous(), original);
  EXPECT_EQ(target_.Get(), handle->Sink());

  console_ << "into file\n";
  handle->Release();

  EXPECT_FALSE(handle->IsActive());
  EXPECT_EQ(target_.Get(), original);
  console_ << "after";

  EXPECT_EQ(read_file(path_in("out.log")), "into file\n");
  EXPECT_EQ(console_.str(), "before|after");
}

TEST_F(RedirectionHandleTest, FilePathIsCanonicalAbsolute)
{
  auto handle = open("sub/../out.log");
  EXPECT_EQ(handle->FilePath().front(), '/');
  EXPECT_EQ(handle->FilePath().find(".."), std::string::npos);
  EXPECT_EQ(registry_.CountFor(path_in("out.log")), 1);
}

TEST_F(RedirectionHandleTest, NestedHandlesRestoreInReverseOrder)
{
  std::streambuf* original = console_.rdbuf();

  auto outer = open("outer.log");
  console_ << "outer-1\n";
  auto inner = open("inner.log");
  EXPECT_EQ(inner->Previous(), outer->Sink());
  console_ << "inner\n";

  inner->Release();
  EXPECT_EQ(target_.Get(), outer->Sink());
  console_ << "outer-2\n";

  outer->Release();
  EXPECT_EQ(target_.Get(), original);

  EXPECT_EQ(read_file(path_in("outer.log")), "outer-1\nouter-2\n");
  EXPECT_EQ(read_file(path_in("inner.log")), "inner\n");
  EXPECT_EQ(warning_count(), 0u);
}

TEST_F(RedirectionHandleTest, DoubleReleaseIsNoop)
{
  auto first = open("same.log");
  auto second = open("same.log");
  EXPECT_EQ(registry_.CountFor(path_in("same.log")), 2);

  second->Release();
  second->Release();
  EXPECT_EQ(registry_.CountFor(path_in("same.log")), 1);

  first->Release();
  EXPECT_EQ(registry_.CountFor(path_in("same.log")), 0);
}

TEST_F(RedirectionHandleTest, DestructorReleases)
{
  std::streambuf* original = console_.rdbuf();
  {
    auto handle = open("scoped.log");
    console_ << "scoped\n";
    EXPECT_EQ(registry_.TotalCount(), 1);
  }
  EXPECT_EQ(target_.Get(), original);
  EXPECT_EQ(registry_.TotalCount(), 0);
  EXPECT_EQ(read_file(path_in("scoped.log")), "scoped\n");
}

TEST_F(RedirectionHandleTest, FlushAndFileSize)
{
  auto handle = open("sized.log");
  console_ << "12345";
  handle->Flush();
  EXPECT_EQ(handle->FileSize(), 5);

  handle->Release();
  EXPECT_EQ(handle->FileSize(), 0);
  EXPECT_THROW(handle->Flush(), con2file::HandleReleasedError);
  EXPECT_EQ(file_size(path_in("sized.log")), 5u);
}

TEST_F(RedirectionHandleTest, CreatesMissingDirectories)
{
  auto handle = open("a/b/c/deep.log");
  console_ << "deep\n";
  handle->Release();
  EXPECT_EQ(read_file(path_in("a/b/c/deep.log")), "deep\n");
}

TEST_F(RedirectionHandleTest, AppendsToExistingFile)
{
  write_file(path_in("existing.log"), "old\n");
  auto handle = open("existing.log");
  console_ << "new\n";
  handle->Release();
  EXPECT_EQ(read_file(path_in("existing.log")), "old\nnew\n");
}

TEST_F(RedirectionHandleTest, InvalidPathLeavesNothingBehind)
{
  std::streambuf* original = console_.rdbuf();

  EXPECT_THROW(con2file::RedirectionHandle("", target_, registry_),
               con2file::ValidationError);
  EXPECT_THROW(con2file::RedirectionHandle("  ", target_, registry_),
               con2file::ValidationError);
  EXPECT_THROW(con2file::RedirectionHandle(tmp_dir_ + "/", target_, registry_),
               con2file::ValidationError);

  EXPECT_EQ(registry_.TotalCount(), 0);
  EXPECT_EQ(target_.Get(), original);
  EXPECT_EQ(count_entries(tmp_dir_), 0u);
}

TEST_F(RedirectionHandleTest, OpenFailureIsIoError)
{
  ASSERT_EQ(::mkdir(path_in("taken").c_str(), 0755), 0);
  std::streambuf* original = console_.rdbuf();

  try
  {
    con2file::RedirectionHandle handle(path_in("taken"), target_, registry_);
    FAIL() << "expected IoError";
  }
  catch (const con2file::IoError& e)
  {
    EXPECT_EQ(e.Code().value(), EISDIR);
  }
  EXPECT_EQ(registry_.TotalCount(), 0);
  EXPECT_EQ(target_.Get(), original);
}

TEST_F(RedirectionHandleTest, DirectoryFailureIsIoError)
{
  write_file(path_in("plain"), "x");
  EXPECT_THROW(con2file::RedirectionHandle(path_in("plain/sub/out.log"), target_, registry_),
               con2file::IoError);
  EXPECT_EQ(registry_.TotalCount(), 0);
}

TEST_F(RedirectionHandleTest, FailedSwapDeregisters)
{
  BrokenTarget broken;
  EXPECT_THROW(con2file::RedirectionHandle(path_in("x.log"), broken, registry_),
               std::runtime_error);
  EXPECT_EQ(registry_.TotalCount(), 0);
}

TEST_F(RedirectionHandleTest, SharedFileIsCountedPerHandle)
{
  std::streambuf* original = console_.rdbuf();
  std::vector<std::unique_ptr<con2file::RedirectionHandle>> handles;
  for (int i = 0; i < 5; ++i)
  {
    handles.push_back(open("shared.log"));
    console_ << "line " << i << "\n";
  }
  EXPECT_EQ(registry_.CountFor(path_in("shared.log")), 5);
  EXPECT_EQ(registry_.ActivePaths().size(), 1u);

  while (!handles.empty())
  {
    handles.back()->Release();
    handles.pop_back();
  }
  EXPECT_EQ(registry_.CountFor(path_in("shared.log")), 0);
  EXPECT_TRUE(registry_.ActivePaths().empty());
  EXPECT_EQ(target_.Get(), original);
  EXPECT_EQ(read_file(path_in("shared.log")), "line 0\nline 1\nline 2\nline 3\nline 4\n");
  EXPECT_EQ(warning_count(), 0u);
}

TEST_F(RedirectionHandleTest, DifferentPathsNeverShareState)
{
  auto a = open("a.log");
  auto b = open("b.log");
  EXPECT_NE(a->Sink(), b->Sink());
  EXPECT_EQ(b->Previous(), a->Sink());
  EXPECT_EQ(registry_.CountFor(path_in("a.log")), 1);
  EXPECT_EQ(registry_.CountFor(path_in("b.log")), 1);
  b->Release();
  a->Release();
}

TEST_F(RedirectionHandleTest, OutOfOrderReleaseWarns)
{
  std::streambuf* original = console_.rdbuf();
  auto first = open("first.log");
  auto second = open("second.log");

  first->Release();
  EXPECT_EQ(target_.Get(), second->Sink());
  ASSERT_EQ(warning_count(), 1u);
  EXPECT_EQ(warnings_[0].level, con2file::LogLevel::Warn);
  EXPECT_NE(std::string(warnings_[0].msg).find("out of order"), std::string::npos);

  console_ << "still in second\n";
  second->Release();
  EXPECT_EQ(target_.Get(), original);
  EXPECT_EQ(warning_count(), 1u);
  EXPECT_EQ(registry_.TotalCount(), 0);
  EXPECT_EQ(read_file(path_in("second.log")), "still in second\n");
}

TEST_F(RedirectionHandleTest, CreationOrderDestructionLeavesStreamUsable)
{
  std::streambuf* original = console_.rdbuf();
  console_ << "start|";

  auto a = open("a.log");
  auto b = open("b.log");
  a.reset();
  b.reset();

  EXPECT_EQ(target_.Get(), original);
  console_ << "after both released";
  EXPECT_FALSE(console_.bad());
  EXPECT_EQ(console_.str(), "start|after both released");
}

TEST_F(RedirectionHandleTest, MiddleHandleReleasedFirst)
{
  std::streambuf* original = console_.rdbuf();
  auto a = open("a.log");
  auto b = open("b.log");
  auto c = open("c.log");

  b.reset();
  EXPECT_EQ(target_.Get(), c->Sink());

  c->Release();
  EXPECT_EQ(target_.Get(), a->Sink());
  console_ << "back in a\n";

  a->Release();
  EXPECT_EQ(target_.Get(), original);
  EXPECT_EQ(read_file(path_in("a.log")), "back in a\n");
}

TEST_F(RedirectionHandleTest, RedirectsStdCout)
{
  std::string path = path_in("console.log");
  std::streambuf* original = std::cout.rdbuf();
  {
    con2file::RedirectionHandle handle(path, con2file::ConsoleOutput(), registry_);
    std::cout << "captured from cout" << std::endl;
    handle.Release();
  }
  EXPECT_EQ(std::cout.rdbuf(), original);
  EXPECT_EQ(read_file(path), "captured from cout\n");
}

TEST(StreamOutputTarget, RemoveOfUnknownBufferKeepsStream)
{
  std::ostringstream out;
  std::ostringstream other;
  con2file::StreamOutputTarget target(out);
  std::streambuf* original = out.rdbuf();

  EXPECT_FALSE(target.Remove(other.rdbuf()));
  EXPECT_EQ(target.Get(), original);

  EXPECT_EQ(target.Push(other.rdbuf()), original);
  EXPECT_TRUE(target.Remove(other.rdbuf()));
  EXPECT_FALSE(target.Remove(other.rdbuf()));
  EXPECT_EQ(target.Get(), original);
}
