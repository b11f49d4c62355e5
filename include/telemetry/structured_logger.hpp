#pragma once
#include <string>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <queue>
#include <nlohmann/json.hpp>

// JSON-lines event sink (one object per line). Inactive until Initialize();
// events emitted before that are discarded.
class StructuredLogger {
public:
  static StructuredLogger& Instance();
  void Initialize(const std::string& file_path);
  // Adds "event" and "ts_ms" to fields and enqueues the line. Invalid UTF-8
  // in string fields is written as U+FFFD.
  void Event(const std::string& name, nlohmann::json fields = nlohmann::json::object());
  // Drains the queue and stops the writer.
  void Shutdown();
private:
  StructuredLogger() = default;
  ~StructuredLogger();
  void Worker();
  std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> queue_;
  std::thread worker_;
  bool running_ = false;
  std::string file_path_;
};
