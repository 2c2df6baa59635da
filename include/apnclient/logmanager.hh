/*
    Apnclient, a client library for the Apple Push Notification service.
    Copyright (C) 2010-2025 Belledonne Communications SARL, All rights reserved.

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU Affero General Public License as
    published by the Free Software Foundation, either version 3 of the
    License, or (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
    GNU Affero General Public License for more details.

    You should have received a copy of the GNU Affero General Public License
    along with this program. If not, see <http://www.gnu.org/licenses/>.
*/

#pragma once

#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#define APNCLIENT_LOG_DOMAIN "apnclient"

#ifndef BCTBX_LOG_DOMAIN
#define BCTBX_LOG_DOMAIN APNCLIENT_LOG_DOMAIN
#endif

#include <bctoolbox/logging.h>

#define STREAM_LOG(thelevel) BCTBX_SLOG(APNCLIENT_LOG_DOMAIN, thelevel)

#define SLOGD STREAM_LOG(BCTBX_LOG_DEBUG)
#define SLOGI STREAM_LOG(BCTBX_LOG_MESSAGE)
#define SLOGW STREAM_LOG(BCTBX_LOG_WARNING)
#define SLOGE STREAM_LOG(BCTBX_LOG_ERROR)

/**
 * Prefix of the log lines written by the LOG* macros: "<mLogPrefix>::<method> - ".
 * The calling scope must define an 'mLogPrefix' attribute or variable.
 */
#define LOG_CONTEXT mLogPrefix << "::" << __func__ << " - "

#define LOGD STREAM_LOG(BCTBX_LOG_DEBUG) << LOG_CONTEXT
#define LOGI STREAM_LOG(BCTBX_LOG_MESSAGE) << LOG_CONTEXT
#define LOGW STREAM_LOG(BCTBX_LOG_WARNING) << LOG_CONTEXT
#define LOGE STREAM_LOG(BCTBX_LOG_ERROR) << LOG_CONTEXT

namespace apnclient {

struct LoggerParameters {
	bool enableStandardOutput{true};
	BctbxLogLevel level{BCTBX_LOG_WARNING}; // Logging level for both standard output and file log handlers.

	std::string logFilename{};
	std::string logDirectory{};
};

/**
 * Tool to configure logging in apnclient.
 */
class LogManager {
public:
	LogManager(const LogManager&) = delete;
	~LogManager() = default;

	static LogManager& get();
	/**
	 * @throw invalid_argument if the provided name does not correspond to any known log level.
	 * @return bctoolbox log level from provided name
	 */
	static BctbxLogLevel logLevelFromName(const std::string& name);

	/**
	 * @param ptr pointer to instance of the class
	 * @param className name of the class
	 * @return logging prefix for an instance of a class (output: ClassName[ptr])
	 */
	template <typename T>
	static std::string makeLogPrefixForInstance(const T* ptr, std::string_view className) {
		std::stringstream logPrefix{};
		logPrefix << className << "[" << ptr << "]";
		return logPrefix.str();
	}

	/**
	 * Apply the provided set of parameters to the logger. Leave 'params' empty to disable (and remove if set) a log
	 * handler.
	 *
	 * @note The default configuration only has standard output enabled.
	 * @param params parameters to configure the instance
	 */
	void configure(const LoggerParameters& params = LoggerParameters());

	/**
	 * Set the log level for all domains.
	 */
	void setLogLevel(BctbxLogLevel level);
	BctbxLogLevel getLogLevel() const;

	bool standardOutputIsEnabled() const;
	bool fileLoggingIsEnabled() const;

private:
	class BctbxLogHandler {
	public:
		BctbxLogHandler(bctbx_log_handler_t* handler);
		virtual ~BctbxLogHandler();

		/**
		 * @return true if the log handler is found in the list of all active handlers.
		 */
		virtual bool isSet() const;

	protected:
		bctbx_log_handler_t* mHandler{};
	};

	class LogHandler : public BctbxLogHandler {
	public:
		LogHandler(BctbxLogHandlerFunc func);
	};

	class FileLogHandler : public BctbxLogHandler {
	public:
		/**
		 * @param maxSize maximum size of the log file
		 * @param path path to the log file (directory)
		 * @param name name of the log file
		 */
		FileLogHandler(size_t maxSize, std::string_view path, std::string_view name);
	};

	LogManager();

	static constexpr std::string_view mLogPrefix{"LogManager"};
	static std::unique_ptr<LogManager> sInstance;

	BctbxLogLevel mLevel{BCTBX_LOG_WARNING};
	std::unique_ptr<LogHandler> mStdOutLogHandler{};
	std::unique_ptr<FileLogHandler> mFileLogHandler{};
};

} // namespace apnclient
