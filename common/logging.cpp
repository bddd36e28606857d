// Async logger: callers format into a fixed record, a Vyukov MPMC bounded
// queue hands records to one writer thread that batches them with writev.

#include "common/logging.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <sys/stat.h>
#include <sys/uio.h>
#include <unistd.h>

#include "common/time_utils.h"

namespace Common {

namespace {

// ---------- Runtime-sized Vyukov MPMC bounded queue ----------
class MPMCQueue {
public:
  static constexpr std::size_t MAX_CAPACITY = 65536;

  struct LogRecord {
    uint64_t timestamp{0};
    uint32_t thread_id{0};
    uint16_t level{0};
    uint16_t len{0};
    char msg[Logger::MAX_MSG_SIZE]{};
  };

  // Delete copy/move constructors
  MPMCQueue(const MPMCQueue&) = delete;
  MPMCQueue& operator=(const MPMCQueue&) = delete;
  MPMCQueue(MPMCQueue&&) = delete;
  MPMCQueue& operator=(MPMCQueue&&) = delete;

  explicit MPMCQueue(std::size_t capacity)
  : size_(std::min(roundUpPow2(capacity), MAX_CAPACITY)),
    mask_(size_ - 1),
    buffer_(new Cell[size_]) {
    for (std::size_t i = 0; i < size_; ++i) {
      buffer_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

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
        return false;  // full
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
        return false;  // empty
      } else {
        pos = head_.load(std::memory_order_relaxed);
      }
    }
  }

  bool empty() const noexcept {
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

std::size_t envSize(const char* name, std::size_t fallback, std::size_t max_value) noexcept {
  const char* env = std::getenv(name);
  if (!env) {
    return fallback;
  }
  char* end = nullptr;
  unsigned long long v = std::strtoull(env, &end, 10);
  if (end == env || v == 0 || v > max_value) {
    return fallback;
  }
  return static_cast<std::size_t>(v);
}

// ---------- Async logger implementation ----------
class AsyncLoggerImpl {
public:
  static constexpr std::size_t MAX_BATCH_SIZE = 256;

  // Delete copy/move constructors
  AsyncLoggerImpl(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl& operator=(const AsyncLoggerImpl&) = delete;
  AsyncLoggerImpl(AsyncLoggerImpl&&) = delete;
  AsyncLoggerImpl& operator=(AsyncLoggerImpl&&) = delete;

  AsyncLoggerImpl(const char* path, std::size_t capacity)
  : file_(nullptr),
    queue_(envSize("MARKGATE_LOG_QUEUE_CAPACITY", capacity, MPMCQueue::MAX_CAPACITY)),
    batch_size_(envSize("MARKGATE_LOG_BATCH", 64, MAX_BATCH_SIZE)),
    flush_ms_(static_cast<int>(envSize("MARKGATE_LOG_FLUSH_MS", 100, 10000))),
    writer_thread_(),
    mutex_(),
    cv_(),
    running_(true) {
    std::strncpy(path_, path, sizeof(path_) - 1);
    path_[sizeof(path_) - 1] = '\0';

    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
      // fopen below reports the failure
    }

    file_ = std::fopen(path_, "w");
    if (!file_) {
      std::fprintf(stderr, "Warning: cannot open log file %s, logging disabled\n", path_);
    } else {
      std::fprintf(file_, "[LOGGER_CONFIG] batch_size=%zu flush_ms=%d\n", batch_size_, flush_ms_);
      std::fflush(file_);
    }

    writer_thread_ = std::thread([this] { writerLoop(); });
  }

  ~AsyncLoggerImpl() {
    running_.store(false, std::memory_order_release);
    cv_.notify_all();
    if (writer_thread_.joinable()) {
      writer_thread_.join();
    }
    if (file_) {
      std::fflush(file_);
      std::fclose(file_);
    }
  }

  bool log(uint16_t level, const char* msg, std::size_t len) noexcept {
    MPMCQueue::LogRecord rec{};
    rec.timestamp = getWallClockNanos();
    rec.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
    rec.level = level;
    rec.len = static_cast<uint16_t>(std::min(len, sizeof(rec.msg) - 1));
    if (rec.len > 0) {
      std::memcpy(rec.msg, msg, rec.len);
    }
    rec.msg[rec.len] = '\0';

    if (!queue_.enqueue(rec)) {
      drops_.fetch_add(1, std::memory_order_relaxed);
      return false;
    }
    cv_.notify_one();
    return true;
  }

  uint64_t getDrops() const noexcept { return drops_.load(std::memory_order_relaxed); }
  uint64_t getWritten() const noexcept { return written_.load(std::memory_order_relaxed); }
  uint64_t getBytes() const noexcept { return bytes_.load(std::memory_order_relaxed); }

private:
  void writerLoop() {
    MPMCQueue::LogRecord batch[MAX_BATCH_SIZE];
    char headers[MAX_BATCH_SIZE][64];
    struct iovec iovecs[MAX_BATCH_SIZE * 3];
    static const char newline = '\n';
    auto last_flush = std::chrono::steady_clock::now();

    std::unique_lock<std::mutex> lock(mutex_);
    while (running_.load(std::memory_order_acquire) || !queue_.empty()) {
      cv_.wait_for(lock, std::chrono::milliseconds(flush_ms_), [this] {
        return !running_.load(std::memory_order_acquire) || !queue_.empty();
      });
      lock.unlock();

      std::size_t n = 0;
      while (n < batch_size_ && queue_.dequeue(batch[n])) {
        ++n;
      }

      if (n > 0 && file_) {
        std::size_t iovec_count = 0;
        for (std::size_t i = 0; i < n; ++i) {
          const auto& rec = batch[i];
          int header_len = std::snprintf(headers[i], sizeof(headers[i]),
              "[%llu.%09llu][%s][T%u] ",
              static_cast<unsigned long long>(rec.timestamp / 1'000'000'000ULL),
              static_cast<unsigned long long>(rec.timestamp % 1'000'000'000ULL),
              Logger::levelToString(static_cast<Logger::Level>(rec.level)),
              rec.thread_id);
          if (header_len <= 0) {
            continue;
          }
          iovecs[iovec_count++] = {headers[i], static_cast<size_t>(header_len)};
          iovecs[iovec_count++] = {const_cast<char*>(rec.msg), rec.len};
          iovecs[iovec_count++] = {const_cast<char*>(&newline), 1};
          written_.fetch_add(1, std::memory_order_relaxed);
          bytes_.fetch_add(static_cast<uint64_t>(header_len) + rec.len + 1, std::memory_order_relaxed);
        }

        // stdio may hold buffered config lines, flush before bypassing it
        std::fflush(file_);
        bool written = false;
        if (isRegularFile(fileno(file_))) {
          written = ::writev(fileno(file_), iovecs, static_cast<int>(iovec_count)) >= 0;
        }
        if (!written) {
          for (std::size_t i = 0; i < iovec_count; ++i) {
            std::fwrite(iovecs[i].iov_base, 1, iovecs[i].iov_len, file_);
          }
        }
      }

      auto now = std::chrono::steady_clock::now();
      if (file_ && (queue_.empty() ||
          std::chrono::duration_cast<std::chrono::milliseconds>(now - last_flush).count() >= flush_ms_)) {
        std::fflush(file_);
        last_flush = now;
      }
      lock.lock();
    }
  }

  static bool isRegularFile(int fd) noexcept {
    struct stat st;
    if (fstat(fd, &st) == 0) {
      return S_ISREG(st.st_mode);
    }
    return false;
  }

  char path_[512]{};
  FILE* file_;
  MPMCQueue queue_;
  std::size_t batch_size_;
  int flush_ms_;
  std::thread writer_thread_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::atomic<bool> running_;
  CACHE_ALIGNED std::atomic<uint64_t> drops_{0};
  CACHE_ALIGNED std::atomic<uint64_t> written_{0};
  CACHE_ALIGNED std::atomic<uint64_t> bytes_{0};
};

std::unique_ptr<AsyncLoggerImpl> g_logger_impl;
std::atomic<AsyncLoggerImpl*> g_active{nullptr};
std::mutex g_logger_mutex;
std::atomic<uint16_t> g_min_level{Logger::INFO};
std::atomic<uint64_t> g_filtered{0};

} // namespace

// ========== Logger ==========

bool Logger::isEnabled(Level level) noexcept {
  if (static_cast<uint16_t>(level) < g_min_level.load(std::memory_order_relaxed)) {
    g_filtered.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  return true;
}

void Logger::write(Level level, const char* msg, size_t len) noexcept {
  AsyncLoggerImpl* impl = g_active.load(std::memory_order_acquire);
  if (impl) {
    impl->log(static_cast<uint16_t>(level), msg, len);
  }
}

Logger::Stats Logger::getStats() noexcept {
  Stats stats;
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  if (g_logger_impl) {
    stats.messages_written = g_logger_impl->getWritten();
    stats.messages_dropped = g_logger_impl->getDrops();
    stats.bytes_written = g_logger_impl->getBytes();
  }
  stats.messages_filtered = g_filtered.load(std::memory_order_relaxed);
  return stats;
}

const char* Logger::levelToString(Level level) noexcept {
  switch (level) {
    case DEBUG: return "DEBUG";
    case INFO:  return "INFO ";
    case WARN:  return "WARN ";
    case ERROR: return "ERROR";
    case FATAL: return "FATAL";
  }
  return "UNKN ";
}

// ========== Lifecycle ==========

void initLogging(const char* log_file) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_active.store(nullptr, std::memory_order_release);
  g_logger_impl.reset();
  g_logger_impl = std::make_unique<AsyncLoggerImpl>(log_file, 4096);
  g_active.store(g_logger_impl.get(), std::memory_order_release);
}

void shutdownLogging() {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  g_active.store(nullptr, std::memory_order_release);
  g_logger_impl.reset();
}

void setLogLevel(Logger::Level level) noexcept {
  g_min_level.store(static_cast<uint16_t>(level), std::memory_order_relaxed);
}

Logger::Level getLogLevel() noexcept {
  return static_cast<Logger::Level>(g_min_level.load(std::memory_order_relaxed));
}

bool defaultLogPath(const char* prefix, char* out, size_t out_size) noexcept {
  const char* dir = std::getenv("MARKGATE_LOGS_DIR");
  if (!dir || dir[0] == '\0') {
    dir = "logs";
  }
  char stamp[32];
  formatFileTimestamp(stamp, sizeof(stamp));
  int n = std::snprintf(out, out_size, "%s/%s_%s.log", dir, prefix, stamp);
  return n > 0 && static_cast<size_t>(n) < out_size;
}

} // namespace Common
