#ifndef NOCTURNA_BACKEND_COMMON_LOGGER_H
#define NOCTURNA_BACKEND_COMMON_LOGGER_H

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <optional>
#include <mutex>
#include <chrono>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace nocturna::backend::common {

class Logger {
public:
	static Logger& instance();

	// Configure shared sinks used by all loggers (console + rotating file)
	// Parameters:
	//   logFilePath  - path to main log file (rotating)
	//   defaultLevel - fallback global level (overridden by NOCTURNA_LOG_LEVEL env var if set)
	//   flushEvery   - periodic flush interval
	//   flushOn      - level on/above which every message forces flush
	void initialize(const std::string& logFilePath,
			  spdlog::level::level_enum defaultLevel = spdlog::level::info,
			  std::chrono::seconds flushEvery = std::chrono::seconds{1},
			  spdlog::level::level_enum flushOn = spdlog::level::warn);

	[[nodiscard]] bool isInitialized() const noexcept { return initialized_; }

	// Set new global level (does NOT override per-logger explicit levels)
	void setGlobalLevel(spdlog::level::level_enum level);
	spdlog::level::level_enum getGlobalLevel() const noexcept { return globalLevel_; }

	// Set explicit level for a named logger (created now or in future)
	void setLoggerLevel(const std::string& name, spdlog::level::level_enum level);

	// Clear explicit per-logger override (logger reverts to global level)
	void clearLoggerLevel(const std::string& name);

	// Rate-limited warning: emits at most once per period per key.
	// key: logical grouping (e.g., "gateway_unavailable"). period: minimum interval between emissions.
	// Returns true when the message passed the limiter (it is dropped silently if
	// logging is not initialized).
	bool warnRateLimited(const std::string& loggerName, const std::string& key, std::chrono::milliseconds period, const std::string& message);

	void shutdown();

	// Async pool settings resolved by the last initialize() from
	// NOCTURNA_LOG_QUEUE_SIZE / NOCTURNA_LOG_WORKERS (malformed values fall back to defaults).
	static constexpr std::size_t kDefaultQueueSize = 8192;
	static constexpr std::size_t kDefaultWorkerThreads = 1;
	std::size_t queueSize() const noexcept { return queueSize_; }
	std::size_t workerThreads() const noexcept { return workerThreads_; }

	// Get (or create) a named logger that uses the shared sinks.
	// Throws std::runtime_error when called before initialize().
	std::shared_ptr<spdlog::logger> get(const std::string& name);

	// Same as get() but returns nullptr instead of throwing when logging is not set up.
	// Analysis components treat a null logger as "silent".
	std::shared_ptr<spdlog::logger> tryGet(const std::string& name);

	Logger(const Logger&) = delete;
	Logger& operator=(const Logger&) = delete;

private:
	Logger();
	~Logger();

	// Parses NOCTURNA_LOG_LEVEL (empty if not set / invalid)
	std::optional<spdlog::level::level_enum> envLogLevel() const;
	std::shared_ptr<spdlog::logger> createLocked(const std::string& name);

	bool initialized_ = false;
	spdlog::level::level_enum globalLevel_ = spdlog::level::info;
	std::size_t queueSize_ = kDefaultQueueSize;
	std::size_t workerThreads_ = kDefaultWorkerThreads;
	std::unordered_map<std::string, spdlog::level::level_enum> perLoggerLevels_;
	std::vector<std::string> loggerNames_; // names of created loggers (for global level updates)
	mutable std::mutex mutex_;

	std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
	std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> file_sink_;

	struct RateLimitEntry { std::chrono::steady_clock::time_point last; };
	std::unordered_map<std::string, RateLimitEntry> rateLimitMap_;
};

} // namespace nocturna::backend::common

#endif // NOCTURNA_BACKEND_COMMON_LOGGER_H
