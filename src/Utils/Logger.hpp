/*
 * StrideGraph - Architecture Threat Modeling Engine
 * Copyright (C) 2026 StrideGraph Security
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once
/**
 * @file Logger.hpp
 * @brief Process-wide logger used by the pipeline, the loaders and the CLI.
 *
 * Records go to stderr and/or a size-rotated file, either as plain text or
 * as one JSON object per line. In async mode a single worker drains a
 * bounded queue; what happens when the queue fills is set by
 * LoggerConfig::bpPolicy.
 *
 * The analysis stages themselves never log. All public methods may be
 * called from any thread. Macros do nothing until Initialize() has run.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace StrideGraph {
	namespace Utils {

		// ============================================================================
		// Log Levels
		// ============================================================================

		/// Record levels, ascending. Anything below LoggerConfig::minimalLevel is dropped.
		enum class LogLevel : uint8_t {
			Trace = 0,
			Debug,
			Info,
			Warn,
			Error,
			Fatal
		};

		/**
		 * @brief Short upper-case name of a level ("INFO", "WARN", ...).
		 */
		[[nodiscard]] const char* LogLevelName(LogLevel level) noexcept;

		/**
		 * @brief Parse a level name (case-insensitive). Returns false if unknown.
		 */
		[[nodiscard]] bool ParseLogLevel(const std::string& text, LogLevel& out) noexcept;

		// ============================================================================
		// Configuration
		// ============================================================================

		struct LoggerConfig {
			/// Records held for the worker before bpPolicy applies
			size_t maxQueueSize = 1000;

			enum class BackPressurePolicy {
				Block,       ///< Producer waits for the worker
				DropOldest,  ///< Oldest queued record is discarded
				DropNewest   ///< Incoming record is discarded
			} bpPolicy = BackPressurePolicy::DropOldest;

			bool async = true;
			bool toConsole = true;          ///< stderr
			bool toFile = false;
			bool jsonLines = false;
			bool includeSrcLocation = true; ///< file:line and function in each record
			bool includeThreadId = true;

			std::string logDirectory = "logs";
			std::string baseFileName = "StrideGraph";     ///< <dir>/<base>.log, rotated to <base>.N.log
			uint64_t maxFileSizeBytes = 10ULL * 1024ULL * 1024ULL;
			size_t maxFileCount = 5;

			LogLevel minimalLevel = LogLevel::Info;
			LogLevel flushLevel = LogLevel::Error;        ///< Records at or above this are flushed at once
		};

		// ============================================================================
		// Logger Class
		// ============================================================================

		/**
		 * @brief Singleton sink behind the SG_LOG_* macros.
		 *
		 * Typical CLI setup:
		 * @code
		 *   LoggerConfig cfg;
		 *   cfg.toFile = true;
		 *   cfg.logDirectory = "logs";
		 *   Logger::Instance().Initialize(cfg);
		 *
		 *   SG_LOG_INFO("Pipeline", "Analyzed %zu components", count);
		 *
		 *   Logger::Instance().ShutDown();
		 * @endcode
		 */
		class Logger {
		public:
			[[nodiscard]] static Logger& Instance();

			/// Applies @p cfg. An already running logger is shut down first.
			void Initialize(const LoggerConfig& cfg);

			/// Drains the queue, joins the worker and closes the file
			void ShutDown();

			[[nodiscard]] bool IsInitialized() const noexcept;

			void setMinimalLevel(LogLevel level) noexcept;

			[[nodiscard]] bool IsEnabled(LogLevel level) const noexcept;

			/// printf-style entry point used by the macros
			void LogEx(LogLevel level,
			           const char* category,
			           const char* file,
			           int line,
			           const char* function,
			           const char* format, ...)
#if defined(__GNUC__) || defined(__clang__)
				__attribute__((format(printf, 7, 8)))
#endif
				;

			void LogMessage(LogLevel level,
			                const char* category,
			                const std::string& message,
			                const char* file = nullptr,
			                int line = 0,
			                const char* function = nullptr);

			void Flush();

			[[nodiscard]] static std::string FormatMessageV(const char* fmt, va_list args);

			/// Logs "Enter" on construction and the elapsed time on destruction
			class Scope {
			public:
				Scope(const char* category,
				      const char* file,
				      int line,
				      const char* function,
				      const char* messageOnEnter = "Enter",
				      LogLevel level = LogLevel::Debug);
				~Scope();

				Scope(const Scope&) = delete;
				Scope& operator=(const Scope&) = delete;
				Scope(Scope&&) = delete;
				Scope& operator=(Scope&&) = delete;

			private:
				const char* m_category;
				const char* m_file;
				const char* m_function;
				int m_line;
				std::chrono::steady_clock::time_point m_start;
				LogLevel m_level;
			};

			Logger(const Logger&) = delete;
			Logger& operator=(const Logger&) = delete;

		private:
			Logger();
			~Logger();

			// ========================================================================
			// Internal Types
			// ========================================================================

			struct LogItem {
				LogLevel level = LogLevel::Info;
				std::string category;
				std::string message;
				std::string file;
				std::string function;
				int line = 0;
				uint64_t tid = 0;
				std::chrono::system_clock::time_point ts{};
			};

			// ========================================================================
			// Internal Methods
			// ========================================================================

			void WorkerLoop();
			void Enqueue(LogItem&& item);
			void Write(const LogItem& item);
			void WriteConsole(const std::string& line);
			void WriteFile(const std::string& line);

			[[nodiscard]] std::string FormatPlain(const LogItem& item) const;
			[[nodiscard]] std::string FormatAsJson(const LogItem& item) const;
			[[nodiscard]] static std::string EscapeJson(const std::string& s);
			[[nodiscard]] static std::string FormatIso8601UTC(std::chrono::system_clock::time_point ts);

			void OpenLogFileIfNeeded();
			void RotateIfNeeded(size_t nextWriteBytes);
			void PerformRotation();
			[[nodiscard]] std::string BaseLogPath() const;

			void StopWorker();

			// ========================================================================
			// Member Variables
			// ========================================================================

			std::atomic<bool> m_initialized{ false };
			std::atomic<LogLevel> m_minLevel{ LogLevel::Info };

			LoggerConfig m_cfg{};
			mutable std::mutex m_cfgMutex;    ///< Guards m_cfg and the sinks

			std::deque<LogItem> m_queue;
			mutable std::mutex m_queueMutex;
			std::condition_variable m_queueCv;  ///< Worker wake-up
			std::condition_variable m_spaceCv;  ///< Block policy wake-up
			std::thread m_worker;
			std::atomic<bool> m_stop{ false };

			std::FILE* m_file{ nullptr };
			uint64_t m_currentSize{ 0 };
		};

	}  // namespace Utils
}  // namespace StrideGraph

// ============================================================================
// Macros
// ============================================================================
//
//   SG_LOG_WARN("Rules", "Rule %zu: %s", index, message.c_str());
//   SG_LOG_SCOPE("Pipeline");
//
// Arguments are not evaluated when the level is disabled.

#define SG_LOG_AT_LEVEL_(lvl, category, fmt, ...) \
    do { \
        auto& _lg = ::StrideGraph::Utils::Logger::Instance(); \
        if (_lg.IsInitialized() && _lg.IsEnabled(lvl)) { \
            _lg.LogEx((lvl), (category), __FILE__, __LINE__, __func__, (fmt), ##__VA_ARGS__); \
        } \
    } while(0)

#define SG_LOG_TRACE(category, fmt, ...) \
    SG_LOG_AT_LEVEL_(::StrideGraph::Utils::LogLevel::Trace, category, fmt, ##__VA_ARGS__)

#define SG_LOG_DEBUG(category, fmt, ...) \
    SG_LOG_AT_LEVEL_(::StrideGraph::Utils::LogLevel::Debug, category, fmt, ##__VA_ARGS__)

#define SG_LOG_INFO(category, fmt, ...) \
    SG_LOG_AT_LEVEL_(::StrideGraph::Utils::LogLevel::Info, category, fmt, ##__VA_ARGS__)

#define SG_LOG_WARN(category, fmt, ...) \
    SG_LOG_AT_LEVEL_(::StrideGraph::Utils::LogLevel::Warn, category, fmt, ##__VA_ARGS__)

#define SG_LOG_ERROR(category, fmt, ...) \
    SG_LOG_AT_LEVEL_(::StrideGraph::Utils::LogLevel::Error, category, fmt, ##__VA_ARGS__)

#define SG_LOG_FATAL(category, fmt, ...) \
    SG_LOG_AT_LEVEL_(::StrideGraph::Utils::LogLevel::Fatal, category, fmt, ##__VA_ARGS__)

#define SG_LOG_CONCAT_INNER_(a, b) a##b
#define SG_LOG_CONCAT_(a, b) SG_LOG_CONCAT_INNER_(a, b)

#define SG_LOG_SCOPE(category) \
    ::StrideGraph::Utils::Logger::Scope SG_LOG_CONCAT_(_sg_scope_obj_, __LINE__)( \
        (category), __FILE__, __LINE__, __func__)
