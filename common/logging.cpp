// logging.cpp - Async logger backed by a Vyukov MPMC bounded queue

#include "common/logging.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <strings.h>
#include <thread>

namespace Common {

namespace {

struct LogRecord {
  int64_t seconds{0};
  int64_t nanos{0};
  uint32_t thread_id{0};
  LogLevel level{LogLevel::INFO};
  uint16_t len{0};
  char msg[480]{};
};

// ---------- Runtime-sized Vyukov MPMC bounded queue ----------
class MPMCQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  explicit MPMCQueue(std::size_t capacity)
  : size_(std::min(roundUpPow2(capacity), MAX_CAPACITY)),
    mask_(size_ - 1),
    buffer_(std::make_unique<Cell[]>(size_)) {
    for (std::size_t i = 0; i < size_; ++i) {
      buffer_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  DELETE_COPY_AND_MOVE(MPMCQueue);
  ~MPMCQueue() = default;

  bool enqueue(const LogRecord& rec) noexcept {
    std::size_t pos = tail_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
      if (diff == 0) {
        if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          c.data = rec;
          c.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // full
      } else {
        pos = tail_.load(std::memory_order_relaxed);
      }
    }
  }

  bool dequeue(LogRecord& out) noexcept {
    std::size_t pos = head_.load(std::memory_order_relaxed);
    for (;;) {
      Cell& c = buffer_[pos & mask_];
      std::size_t seq = c.seq.load(std::memory_order_acquire);
      intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
      if (diff == 0) {
        if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed)) {
          out = c.data;
          c.seq.store(pos + size_, std::memory_order_release);
          return true;
        }
      } else if (diff < 0) {
        return false; // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  [[nodiscard]] bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

private:
  struct Cell {
    CACHE_ALIGNED std::atomic<std::size_t> seq{0};
    LogRecord data{};
  };

  static std::size_t roundUpPow2(std::size_t n) noexcept {
    if (n < 2) return 2;
    --n;
    n |= n >> 1;  n |= n >> 2;  n |= n >> 4;
    n |= n >> 8;  n |= n >> 16; n |= n >> 32;
    return n + 1;
  }

  CACHE_ALIGNED std::atomic<std::size_t> head_{0};
  CACHE_ALIGNED std::atomic<std::size_t> tail_{0};
  std::size_t size_;
  std::size_t mask_;
  std::unique_ptr<Cell[]> buffer_;
};

const char* paddedLevel(LogLevel level) noexcept {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO ";
    case LogLevel::WARN:  return "WARN ";
    case LogLevel::ERROR: return "ERROR";
    default:              return "UNKN ";
  }
}

std::size_t queueCapacityFromEnv(std::size_t default_capacity) noexcept {
  const char* env = std::getenv("LOGGER_QUEUE_SIZE");
  if (!env) {
    return default_capacity;
  }
  char* end = nullptr;
  unsigned long value = std::strtoul(env, &end, 10);
  if (end == env || value == 0) {
    return default_capacity;
  }
  return static_cast<std::size_t>(value);
}

// ---------- Async file writer ----------
class AsyncLogWriter {
public:
  AsyncLogWriter(FILE* file, std::size_t capacity)
  : file_(file),
    queue_(capacity),
    writer_thread_(),
    mutex_(),
    cv_() {
    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  DELETE_COPY_AND_MOVE(AsyncLogWriter);

  ~AsyncLogWriter() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  bool push(const LogRecord& rec) noexcept {
    if (UNLIKELY(!queue_.enqueue(rec))) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    cv_.notify_one();
    return true;
  }

  [[nodiscard]] LoggerStats stats() const noexcept {
    LoggerStats s;
    s.messages_written = written_.load(std::memory_order_relaxed);
    s.messages_dropped = drops_.load(std::memory_order_relaxed);
    s.bytes_written = bytes_.load(std::memory_order_relaxed);
    return s;
  }

private:
  void writerLoop() noexcept {
    LogRecord rec;
    while (true) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(50), [this] {
          return !running_.load(std::memory_order_acquire) || !queue_.empty();
        });
        if (!running_.load(std::memory_order_acquire) && queue_.empty()) {
          break;
        }
      }

      bool wrote = false;
      while (queue_.dequeue(rec)) {
        int n = std::fprintf(file_, "[%lld.%09lld][%s][T%u] %s\n",
                             static_cast<long long>(rec.seconds),
                             static_cast<long long>(rec.nanos),
                             paddedLevel(rec.level),
                             rec.thread_id,
                             rec.msg);
        if (n > 0) {
          written_.fetch_add(1, std::memory_order_relaxed);
          bytes_.fetch_add(static_cast<uint64_t>(n), std::memory_order_relaxed);
        }
        wrote = true;
      }
      if (wrote) {
        std::fflush(file_);
      }
    }
  }

  FILE* file_;
  MPMCQueue queue_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_{true};
  CACHE_ALIGNED std::atomic<uint64_t> drops_{0};
  CACHE_ALIGNED std::atomic<uint64_t> written_{0};
  CACHE_ALIGNED std::atomic<uint64_t> bytes_{0};
};

std::mutex g_writer_mutex;
std::unique_ptr<AsyncLogWriter> g_writer;
std::atomic<LogLevel> g_file_level{LogLevel::INFO};
std::atomic<LogLevel> g_console_level{LogLevel::WARN};

} // namespace

auto initLogging(const char* log_file) noexcept -> bool {
  if (!log_file || !*log_file) {
    return false;
  }

  std::filesystem::path p(log_file);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
  }

  FILE* file = std::fopen(log_file, "a");
  if (!file) {
    std::fprintf(stderr, "Failed to open log file: %s\n", log_file);
    return false;
  }

  std::lock_guard<std::mutex> lock(g_writer_mutex);
  g_writer.reset();
  g_writer = std::make_unique<AsyncLogWriter>(file, queueCapacityFromEnv(8192));
  return true;
}

auto shutdownLogging() noexcept -> void {
  std::lock_guard<std::mutex> lock(g_writer_mutex);
  g_writer.reset();
}

auto setLogLevel(LogLevel level) noexcept -> void {
  g_file_level.store(level, std::memory_order_relaxed);
}

auto setConsoleLevel(LogLevel level) noexcept -> void {
  g_console_level.store(level, std::memory_order_relaxed);
}

auto getLogLevel() noexcept -> LogLevel {
  return g_file_level.load(std::memory_order_relaxed);
}

auto parseLogLevel(const char* text, LogLevel& out) noexcept -> bool {
  if (!text) {
    return false;
  }
  if (strcasecmp(text, "DEBUG") == 0) {
    out = LogLevel::DEBUG;
  } else if (strcasecmp(text, "INFO") == 0) {
    out = LogLevel::INFO;
  } else if (strcasecmp(text, "WARN") == 0 || strcasecmp(text, "WARNING") == 0) {
    out = LogLevel::WARN;
  } else if (strcasecmp(text, "ERROR") == 0) {
    out = LogLevel::ERROR;
  } else if (strcasecmp(text, "OFF") == 0) {
    out = LogLevel::OFF;
  } else {
    return false;
  }
  return true;
}

auto logLevelName(LogLevel level) noexcept -> const char* {
  switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO:  return "INFO";
    case LogLevel::WARN:  return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::OFF:   return "OFF";
  }
  return "UNKNOWN";
}

auto getLoggerStats() noexcept -> LoggerStats {
  std::lock_guard<std::mutex> lock(g_writer_mutex);
  return g_writer ? g_writer->stats() : LoggerStats{};
}

void logMessage(LogLevel level, const char* format, ...) noexcept {
  const bool to_file = level >= g_file_level.load(std::memory_order_relaxed);
  const bool to_console = level >= g_console_level.load(std::memory_order_relaxed);
  if (LIKELY(!to_file && !to_console)) {
    return;
  }

  LogRecord rec;
  va_list args;
  va_start(args, format);
  int len = std::vsnprintf(rec.msg, sizeof(rec.msg), format, args);
  va_end(args);
  if (UNLIKELY(len < 0)) {
    return;
  }
  rec.len = static_cast<uint16_t>(std::min<std::size_t>(static_cast<std::size_t>(len), sizeof(rec.msg) - 1));
  rec.level = level;

  if (to_console) {
    std::fprintf(stderr, "%s: %s\n", logLevelName(level), rec.msg);
  }

  if (!to_file) {
    return;
  }

  auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
  rec.seconds = nanos / 1000000000;
  rec.nanos = nanos % 1000000000;
  rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

  // Push is non-blocking; the lock only guards against a concurrent shutdown.
  std::lock_guard<std::mutex> lock(g_writer_mutex);
  if (g_writer) {
    g_writer->push(rec);
  }
}

} // namespace Common
