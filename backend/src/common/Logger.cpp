#include "Logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/async.h>
#include <spdlog/async_logger.h>

#include <filesystem>
#include <cstdlib>
#include <stdexcept>

namespace nocturna::backend::common {

namespace {
// Positive integer from the environment, or the default when unset / malformed.
std::size_t readEnvSize(const char* name, std::size_t def)
{
	const char* v = std::getenv(name);
	if (!v) return def;
	try {
		std::size_t used = 0;
		long long parsed = std::stoll(v, &used);
		if (used == std::string(v).size() && parsed > 0) return static_cast<std::size_t>(parsed);
	} catch (const std::logic_error&) {
	}
	spdlog::warn("Ignoring malformed {}='{}' (expected a positive integer), using {}", name, v, def);
	return def;
}
}

Logger& Logger::instance()
{
	static Logger inst;
	return inst;
}

Logger::Logger() = default;

Logger::~Logger() = default;

void Logger::initialize(const std::string& logFilePath,
			  spdlog::level::level_enum defaultLevel,
			  std::chrono::seconds flushEvery,
			  spdlog::level::level_enum flushOn)
{
	std::scoped_lock lock(mutex_);
	if (initialized_) {
		spdlog::warn("Logger::initialize() called more than once; ignoring subsequent call");
		return;
	}
	try {
		std::filesystem::path p{logFilePath};
		if (p.has_parent_path()) {
			std::error_code ec;
			std::filesystem::create_directories(p.parent_path(), ec);
			if (ec) {
				spdlog::warn("Failed to create log directory '{}': {}", p.parent_path().string(), ec.message());
			}
		}

		// Async thread pool must exist before the first async logger.
		//   NOCTURNA_LOG_QUEUE_SIZE (default 8192)
		//   NOCTURNA_LOG_WORKERS (default 1)
		queueSize_ = readEnvSize("NOCTURNA_LOG_QUEUE_SIZE", kDefaultQueueSize);
		workerThreads_ = readEnvSize("NOCTURNA_LOG_WORKERS", kDefaultWorkerThreads);
		if (!spdlog::thread_pool()) {
			spdlog::init_thread_pool(queueSize_, workerThreads_);
		}

		console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
		file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFilePath, 5 * 1024 * 1024, 3);

		spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

		if (auto envLevel = envLogLevel()) {
			globalLevel_ = *envLevel;
		} else {
			globalLevel_ = defaultLevel;
		}
		// Registry baseline stays at trace so per-logger levels are authoritative
		spdlog::set_level(spdlog::level::trace);

		spdlog::flush_on(flushOn);
		spdlog::flush_every(flushEvery);

		initialized_ = true;
	} catch (const spdlog::spdlog_ex& ex) {
		spdlog::error("Logger initialization failed: {}", ex.what());
	}
}

void Logger::shutdown()
{
	std::scoped_lock lock(mutex_);
	if (!initialized_) return;
	spdlog::shutdown();
	// spdlog::shutdown() drops the default logger too; keep a plain console one so
	// free spdlog:: calls stay valid until the next initialize().
	spdlog::set_default_logger(std::make_shared<spdlog::logger>(
		"", std::make_shared<spdlog::sinks::stdout_color_sink_mt>()));
	console_sink_.reset();
	file_sink_.reset();
	loggerNames_.clear();
	initialized_ = false;
}

std::shared_ptr<spdlog::logger> Logger::get(const std::string& name)
{
	std::scoped_lock lock(mutex_);
	if (!initialized_) {
		throw std::runtime_error("Logger::get() called before initialize()");
	}
	return createLocked(name);
}

std::shared_ptr<spdlog::logger> Logger::tryGet(const std::string& name)
{
	std::scoped_lock lock(mutex_);
	if (!initialized_) return nullptr;
	return createLocked(name);
}

std::shared_ptr<spdlog::logger> Logger::createLocked(const std::string& name)
{
	if (auto existing = spdlog::get(name)) {
		return existing;
	}
	auto dist = std::make_shared<spdlog::sinks::dist_sink_mt>();
	if (console_sink_) dist->add_sink(console_sink_);
	if (file_sink_) dist->add_sink(file_sink_);
	auto new_logger = std::make_shared<spdlog::async_logger>(
		name,
		spdlog::sinks_init_list{dist},
		spdlog::thread_pool(),
		spdlog::async_overflow_policy::block
	);
	spdlog::level::level_enum desiredLevel = globalLevel_;
	if (auto it = perLoggerLevels_.find(name); it != perLoggerLevels_.end()) {
		desiredLevel = it->second;
	}
	new_logger->set_level(desiredLevel);
	spdlog::register_logger(new_logger);
	// Registration applies the registry level; restore ours
	new_logger->set_level(desiredLevel);
	loggerNames_.push_back(name);
	return new_logger;
}

void Logger::setGlobalLevel(spdlog::level::level_enum level)
{
	std::scoped_lock lock(mutex_);
	globalLevel_ = level;
	for (const auto& n : loggerNames_) {
		if (perLoggerLevels_.find(n) == perLoggerLevels_.end()) {
			if (auto l = spdlog::get(n)) {
				l->set_level(level);
			}
		}
	}
}

void Logger::setLoggerLevel(const std::string& name, spdlog::level::level_enum level)
{
	std::scoped_lock lock(mutex_);
	perLoggerLevels_[name] = level;
	if (auto l = spdlog::get(name)) {
		l->set_level(level);
	}
}

void Logger::clearLoggerLevel(const std::string& name)
{
	std::scoped_lock lock(mutex_);
	perLoggerLevels_.erase(name);
	if (auto l = spdlog::get(name)) {
		l->set_level(globalLevel_);
	}
}

std::optional<spdlog::level::level_enum> Logger::envLogLevel() const
{
	const char* lvl = std::getenv("NOCTURNA_LOG_LEVEL");
	if (!lvl) return std::nullopt;
	auto l = spdlog::level::from_str(lvl);
	// from_str maps unknown names to off; only accept "off" when spelled out
	if (l == spdlog::level::off && std::string(lvl) != "off") {
		return std::nullopt;
	}
	return l;
}

bool Logger::warnRateLimited(const std::string& loggerName, const std::string& key, std::chrono::milliseconds period, const std::string& message)
{
	auto now = std::chrono::steady_clock::now();
	bool shouldLog = false;
	{
		std::scoped_lock lock(mutex_);
		auto &entry = rateLimitMap_[key];
		if (now - entry.last >= period) {
			entry.last = now;
			shouldLog = true;
		}
	}
	if (shouldLog) {
		if (auto lg = tryGet(loggerName)) {
			lg->warn(message);
		}
	}
	return shouldLog;
}

} // namespace nocturna::backend::common
