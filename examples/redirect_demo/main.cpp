#include <con2file/diagnostics.hpp>
#include <con2file/error.hpp>
#include <con2file/redirection_factory.hpp>
#include <con2file/redirection_handle.hpp>
#include <con2file/redirection_registry.hpp>
#include <con2file/sinks/callback_sink.hpp>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <thread>

int main()
{
  auto& diag = con2file::Diagnostics::Instance();

  // --- Diagnostics setup ---

  // Default stderr sink stays at Warn; the callback reports rotation and
  // release problems in one place
  diag.AddSink(std::make_unique<con2file::CallbackSink>(
      [](const con2file::DiagEntry& entry)
      {
        if (entry.level >= con2file::LogLevel::Error)
        {
          std::fprintf(stderr, "[ALERT] %s\n", entry.msg);
        }
      }));
  diag.SetLevel(con2file::LogLevel::Debug);

  const std::string dir = "/tmp/con2file_example";

  // --- Simple redirection ---

  std::cout << "this line goes to the terminal" << std::endl;
  {
    con2file::RedirectionHandle handle(dir + "/simple.log");
    std::cout << "this line goes to " << handle.FilePath() << std::endl;
    handle.Release();
  }
  std::cout << "back on the terminal" << std::endl;

  // --- Nested redirections, released in reverse order ---
  {
    con2file::RedirectionHandle outer(dir + "/outer.log");
    std::cout << "outer 1" << std::endl;
    {
      con2file::RedirectionHandle inner(dir + "/inner.log");
      std::cout << "inner" << std::endl;
    }  // inner released here
    std::cout << "outer 2" << std::endl;
  }

  // --- Rotating file ---

  for (int run = 0; run < 3; ++run)
  {
    auto handle = con2file::RedirectionFactory::CreateRotating(dir + "/app.log", 256, 3);
    for (int i = 0; i < 20; ++i)
    {
      std::cout << "run " << run << " line " << i << std::endl;
    }
    handle->Release();
  }

  auto info = con2file::RedirectionFactory::GetRotationInfo(dir + "/app.log");
  std::printf("app.log: %d files, %lld bytes, oldest %s\n", info.file_count,
              static_cast<long long>(info.total_size), info.oldest_path.value_or("-").c_str());
  int removed = con2file::RedirectionFactory::CleanupRotatedFiles(dir + "/app.log", 1);
  std::printf("cleanup removed %d backups\n", removed);

  // --- Timestamped file ---
  {
    auto handle = con2file::RedirectionFactory::CreateTimestamped(dir + "/session.log");
    std::cout << "session started" << std::endl;
    std::printf("timestamped file: %s\n", handle->FilePath().c_str());
    handle->Release();
  }

  // --- Config-driven ---
  {
    con2file::RedirectionConfig config;
    config.base_path = dir + "/configured.log";
    config.type = con2file::RedirectionType::TimestampedRotating;
    config.max_size_bytes = 1024;
    config.max_files = 2;
    auto handle = con2file::RedirectionFactory::Create(config);
    std::cout << "configured as " << con2file::to_string(config.type) << std::endl;
    handle->Release();
  }

  // --- Temporary redirection with early cancellation ---

  con2file::CancelToken token;
  auto done = con2file::RedirectionFactory::CreateTemporary(dir + "/temporary.log",
                                                            std::chrono::seconds(5), token);
  std::cout << "captured by the temporary redirection" << std::endl;
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  token.Cancel();
  done.get();

  // --- Error handling ---

  try
  {
    con2file::RedirectionHandle bad("");
  }
  catch (const con2file::ValidationError& e)
  {
    std::printf("rejected: %s\n", e.what());
  }

  std::printf("active redirections: %d\n",
              con2file::RedirectionRegistry::Instance().TotalCount());
  std::printf("Example finished. Check %s for the redirected output.\n", dir.c_str());
  return 0;
}
