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
/**
 * @file Logger.cpp
 * @brief Logger implementation: async queue, console/file sinks, rotation.
 */

#include "pch.h"
#include "Logger.hpp"

#include <cctype>
#include <ctime>
#include <filesystem>
#include <functional>
#include <system_error>
#include <vector>

namespace StrideGraph {
	namespace Utils {

		namespace fs = std::filesystem;

		const char* LogLevelName(LogLevel level) noexcept {
			switch (level) {
			case LogLevel::Trace: return "TRACE";
			case LogLevel::Debug: return "DEBUG";
			case LogLevel::Info:  return "INFO";
			case LogLevel::Warn:  return "WARN";
			case LogLevel::Error: return "ERROR";
			case LogLevel::Fatal: return "FATAL";
			}
			return "UNKNOWN";
		}

		bool ParseLogLevel(const std::string& text, LogLevel& out) noexcept {
			std::string upper;
			upper.reserve(text.size());
			for (const char c : text) {
				upper.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
			}
			if (upper == "WARNING") {
				upper = "WARN";
			}
			for (uint8_t i = 0; i <= static_cast<uint8_t>(LogLevel::Fatal); ++i) {
				const auto level = static_cast<LogLevel>(i);
				if (upper == LogLevelName(level)) {
					out = level;
					return true;
				}
			}
			return false;
		}

		// ============================================================================
		// Lifecycle
		// ============================================================================

		Logger& Logger::Instance() {
			static Logger instance;
			return instance;
		}

		Logger::Logger() = default;

		Logger::~Logger() {
			ShutDown();
		}

		void Logger::Initialize(const LoggerConfig& cfg) {
			if (m_initialized.load(std::memory_order_acquire)) {
				ShutDown();
			}

			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				m_cfg = cfg;
				if (m_cfg.maxQueueSize == 0) {
					m_cfg.maxQueueSize = 1;
				}
				m_currentSize = 0;
			}
			m_minLevel.store(cfg.minimalLevel, std::memory_order_release);

			if (cfg.async) {
				m_stop.store(false, std::memory_order_release);
				m_worker = std::thread(&Logger::WorkerLoop, this);
			}

			m_initialized.store(true, std::memory_order_release);
		}

		void Logger::ShutDown() {
			if (!m_initialized.exchange(false, std::memory_order_acq_rel)) {
				return;
			}

			StopWorker();

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
				std::fclose(m_file);
				m_file = nullptr;
			}
		}

		void Logger::StopWorker() {
			if (!m_worker.joinable()) {
				return;
			}
			{
				std::lock_guard<std::mutex> lock(m_queueMutex);
				m_stop.store(true, std::memory_order_release);
			}
			m_queueCv.notify_all();
			m_spaceCv.notify_all();
			m_worker.join();
		}

		bool Logger::IsInitialized() const noexcept {
			return m_initialized.load(std::memory_order_acquire);
		}

		void Logger::setMinimalLevel(LogLevel level) noexcept {
			m_minLevel.store(level, std::memory_order_release);
		}

		bool Logger::IsEnabled(LogLevel level) const noexcept {
			return static_cast<uint8_t>(level) >=
				static_cast<uint8_t>(m_minLevel.load(std::memory_order_acquire));
		}

		// ============================================================================
		// Front end
		// ============================================================================

		std::string Logger::FormatMessageV(const char* fmt, va_list args) {
			if (!fmt) {
				return {};
			}

			va_list probe;
			va_copy(probe, args);
			const int needed = std::vsnprintf(nullptr, 0, fmt, probe);
			va_end(probe);
			if (needed <= 0) {
				return {};
			}

			std::vector<char> buffer(static_cast<size_t>(needed) + 1);
			va_list copy;
			va_copy(copy, args);
			std::vsnprintf(buffer.data(), buffer.size(), fmt, copy);
			va_end(copy);
			return std::string(buffer.data(), static_cast<size_t>(needed));
		}

		void Logger::LogEx(LogLevel level,
		                   const char* category,
		                   const char* file,
		                   int line,
		                   const char* function,
		                   const char* format, ...) {
			if (!IsInitialized() || !IsEnabled(level)) {
				return;
			}

			va_list args;
			va_start(args, format);
			std::string message = FormatMessageV(format, args);
			va_end(args);

			LogMessage(level, category, message, file, line, function);
		}

		void Logger::LogMessage(LogLevel level,
		                        const char* category,
		                        const std::string& message,
		                        const char* file,
		                        int line,
		                        const char* function) {
			if (!IsInitialized() || !IsEnabled(level)) {
				return;
			}

			LogItem item;
			item.level = level;
			item.category = category ? category : "";
			item.message = message;
			item.file = file ? file : "";
			item.function = function ? function : "";
			item.line = line;
			item.tid = static_cast<uint64_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));
			item.ts = std::chrono::system_clock::now();

			bool async = false;
			{
				std::lock_guard<std::mutex> lock(m_cfgMutex);
				async = m_cfg.async;
			}

			if (async && m_worker.joinable()) {
				Enqueue(std::move(item));
			}
			else {
				Write(item);
			}
		}

		void Logger::Flush() {
			if (m_worker.joinable()) {
				std::unique_lock<std::mutex> lock(m_queueMutex);
				m_spaceCv.wait(lock, [this] {
					return m_queue.empty() || m_stop.load(std::memory_order_acquire);
				});
			}

			std::lock_guard<std::mutex> lock(m_cfgMutex);
			if (m_file) {
				std::fflush(m_file);
			}
			std::fflush(stderr);
		}

		// ============================================================================
		// Async queue
		// ============================================================================

		void Logger::Enqueue(LogItem&& item) {
			std::unique_lock<std::mutex> lock(m_queueMutex);

			if (m_queue.size() >= m_cfg.maxQueueSize) {
				switch (m_cfg.bpPolicy) {
				case LoggerConfig::BackPressurePolicy::Block:
					m_spaceCv.wait(lock, [this] {
						return m_queue.size() < m_cfg.maxQueueSize || m_stop.load(std::memory_order_acquire);
					});
					break;
				case LoggerConfig::BackPressurePolicy::DropOldest:
					m_queue.pop_front();
					break;
				case LoggerConfig::BackPressurePolicy::DropNewest:
					return;
				}
			}

			m_queue.push_back(std::move(item));
			lock.unlock();
			m_queueCv.notify_one();
		}

		void Logger::WorkerLoop() {
			for (;;) {
				LogItem item;
				{
					std::unique_lock<std::mutex> lock(m_queueMutex);
					m_queueCv.wait(lock, [this] {
						return !m_queue.empty() || m_stop.load(std::memory_order_acquire);
					});
					if (m_queue.empty()) {
						// stop requested and queue drained
						m_spaceCv.notify_all();
						return;
					}
					item = std::move(m_queue.front());
					m_queue.pop_front();
				}

				Write(item);
				m_spaceCv.notify_all();
			}
		}

		// ============================================================================
		// Sinks
		// ============================================================================

		void Logger::Write(const LogItem& item) {
			std::lock_guard<std::mutex> lock(m_cfgMutex);

			const std::string line = m_cfg.jsonLines ? FormatAsJson(item) : FormatPlain(item);

			if (m_cfg.toConsole) {
				WriteConsole(line);
			}
			if (m_cfg.toFile) {
				WriteFile(line);
			}

			if (static_cast<uint8_t>(item.level) >= static_cast<uint8_t>(m_cfg.flushLevel)) {
				std::fflush(stderr);
				if (m_file) {
					std::fflush(m_file);
				}
			}
		}

		void Logger::WriteConsole(const std::string& line) {
			std::fwrite(line.data(), 1, line.size(), stderr);
			std::fputc('\n', stderr);
		}

		void Logger::WriteFile(const std::string& line) {
			RotateIfNeeded(line.size() + 1);
			OpenLogFileIfNeeded();
			if (!m_file) {
				return;
			}
			std::fwrite(line.data(), 1, line.size(), m_file);
			std::fputc('\n', m_file);
			m_currentSize += line.size() + 1;
		}

		std::string Logger::BaseLogPath() const {
			return (fs::path(m_cfg.logDirectory) / (m_cfg.baseFileName + ".log")).string();
		}

		void Logger::OpenLogFileIfNeeded() {
			if (m_file) {
				return;
			}

			std::error_code ec;
			fs::create_directories(m_cfg.logDirectory, ec);
			if (ec) {
				std::fprintf(stderr, "[Logger] cannot create log directory '%s': %s\n",
				             m_cfg.logDirectory.c_str(), ec.message().c_str());
				m_cfg.toFile = false;
				return;
			}

			const std::string path = BaseLogPath();
			m_file = std::fopen(path.c_str(), "ab");
			if (!m_file) {
				std::fprintf(stderr, "[Logger] cannot open log file '%s'\n", path.c_str());
				m_cfg.toFile = false;
				return;
			}

			const auto size = fs::file_size(path, ec);
			m_currentSize = ec ? 0 : static_cast<uint64_t>(size);
		}

		void Logger::RotateIfNeeded(size_t nextWriteBytes) {
			if (m_cfg.maxFileSizeBytes == 0 || !m_file) {
				return;
			}
			if (m_currentSize + nextWriteBytes <= m_cfg.maxFileSizeBytes) {
				return;
			}
			PerformRotation();
		}

		void Logger::PerformRotation() {
			std::fclose(m_file);
			m_file = nullptr;
			m_currentSize = 0;

			const std::string base = BaseLogPath();
			std::error_code ec;

			if (m_cfg.maxFileCount <= 1) {
				fs::remove(base, ec);
				return;
			}

			// base.log -> base.log.1 -> ... -> base.log.(N-1); oldest is dropped
			const size_t last = m_cfg.maxFileCount - 1;
			fs::remove(base + "." + std::to_string(last), ec);
			for (size_t i = last; i > 1; --i) {
				const std::string from = base + "." + std::to_string(i - 1);
				if (fs::exists(from, ec)) {
					fs::rename(from, base + "." + std::to_string(i), ec);
				}
			}
			fs::rename(base, base + ".1", ec);
		}

		// ============================================================================
		// Formatting
		// ============================================================================

		std::string Logger::FormatIso8601UTC(std::chrono::system_clock::time_point ts) {
			const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(ts);
			const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(ts - secs).count();
			const std::time_t t = std::chrono::system_clock::to_time_t(secs);

			std::tm tmUtc{};
#ifdef _WIN32
			gmtime_s(&tmUtc, &t);
#else
			gmtime_r(&t, &tmUtc);
#endif
			char buf[40];
			std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
			              tmUtc.tm_year + 1900, tmUtc.tm_mon + 1, tmUtc.tm_mday,
			              tmUtc.tm_hour, tmUtc.tm_min, tmUtc.tm_sec, static_cast<int>(millis));
			return buf;
		}

		std::string Logger::FormatPlain(const LogItem& item) const {
			std::string out;
			out.reserve(item.message.size() + 96);
			out += FormatIso8601UTC(item.ts);
			out += " [";
			out += LogLevelName(item.level);
			out += "] ";
			if (m_cfg.includeThreadId) {
				out += "[tid:";
				out += std::to_string(item.tid % 100000);
				out += "] ";
			}
			if (!item.category.empty()) {
				out += "[";
				out += item.category;
				out += "] ";
			}
			out += item.message;
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += " (";
				out += fs::path(item.file).filename().string();
				out += ":";
				out += std::to_string(item.line);
				if (!item.function.empty()) {
					out += " ";
					out += item.function;
				}
				out += ")";
			}
			return out;
		}

		std::string Logger::EscapeJson(const std::string& s) {
			std::string out;
			out.reserve(s.size() + 8);
			for (const char c : s) {
				switch (c) {
				case '"':  out += "\\\""; break;
				case '\\': out += "\\\\"; break;
				case '\n': out += "\\n"; break;
				case '\r': out += "\\r"; break;
				case '\t': out += "\\t"; break;
				default:
					if (static_cast<unsigned char>(c) < 0x20) {
						char buf[8];
						std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
						out += buf;
					}
					else {
						out.push_back(c);
					}
				}
			}
			return out;
		}

		std::string Logger::FormatAsJson(const LogItem& item) const {
			std::string out = "{\"ts\":\"" + FormatIso8601UTC(item.ts) + "\"";
			out += ",\"level\":\"";
			out += LogLevelName(item.level);
			out += "\",\"category\":\"" + EscapeJson(item.category) + "\"";
			out += ",\"message\":\"" + EscapeJson(item.message) + "\"";
			if (m_cfg.includeThreadId) {
				out += ",\"tid\":" + std::to_string(item.tid);
			}
			if (m_cfg.includeSrcLocation && !item.file.empty()) {
				out += ",\"file\":\"" + EscapeJson(item.file) + "\"";
				out += ",\"line\":" + std::to_string(item.line);
				out += ",\"function\":\"" + EscapeJson(item.function) + "\"";
			}
			out += "}";
			return out;
		}

		// ============================================================================
		// Scope
		// ============================================================================

		Logger::Scope::Scope(const char* category,
		                     const char* file,
		                     int line,
		                     const char* function,
		                     const char* messageOnEnter,
		                     LogLevel level)
			: m_category(category)
			, m_file(file)
			, m_function(function)
			, m_line(line)
			, m_start(std::chrono::steady_clock::now())
			, m_level(level) {
			auto& lg = Logger::Instance();
			if (lg.IsInitialized() && lg.IsEnabled(m_level)) {
				lg.LogMessage(m_level, m_category,
				              std::string(messageOnEnter ? messageOnEnter : "Enter"),
				              m_file, m_line, m_function);
			}
		}

		Logger::Scope::~Scope() {
			auto& lg = Logger::Instance();
			if (!lg.IsInitialized() || !lg.IsEnabled(m_level)) {
				return;
			}
			const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
				std::chrono::steady_clock::now() - m_start).count();
			lg.LogMessage(m_level, m_category,
			              "Exit (" + std::to_string(elapsed) + " us)",
			              m_file, m_line, m_function);
		}

	}  // namespace Utils
}  // namespace StrideGraph
