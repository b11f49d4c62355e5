#include "telemetry/structured_logger.hpp"
#include <chrono>
#include <fstream>

StructuredLogger& StructuredLogger::Instance() {
  static StructuredLogger inst;
  return inst;
}

StructuredLogger::~StructuredLogger() { Shutdown(); }

void StructuredLogger::Initialize(const std::string& file_path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) return;
  file_path_ = file_path;
  running_ = true;
  worker_ = std::thread(&StructuredLogger::Worker, this);
}

void StructuredLogger::Shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (worker_.joinable()) worker_.join();
}

void StructuredLogger::Event(const std::string& name, nlohmann::json fields) {
  if (!fields.is_object()) fields = nlohmann::json{{"value", fields}};
  auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
  fields["event"] = name;
  fields["ts_ms"] = now.time_since_epoch().count();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;
    // node-supplied text may not be UTF-8
    queue_.push(fields.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
  }
  cv_.notify_one();
}

void StructuredLogger::Worker() {
  std::ofstream out(file_path_, std::ios::app | std::ios::out);
  std::string batch;
  while (true) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&]{ return !queue_.empty() || !running_; });
    while (!queue_.empty()) {
      batch.append(queue_.front());
      batch.push_back('\n');
      queue_.pop();
    }
    bool stop = !running_;
    lock.unlock();
    if (!batch.empty()) {
      out << batch;
      out.flush();
      batch.clear();
    }
    if (stop) break;
  }
}
