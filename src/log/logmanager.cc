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

#include <sys/stat.h>

#include <cerrno>
#include <cstdarg>
#include <limits>
#include <stdexcept>

#include "apnclient/logmanager.hh"

using namespace std;

namespace apnclient {

unique_ptr<LogManager> LogManager::sInstance{};

static void logStdOut(void*, const char* domain, BctbxLogLevel level, const char* msg, va_list args) {
	bctbx_logv_out(domain, level, msg, args);
}

LogManager::BctbxLogHandler::BctbxLogHandler(bctbx_log_handler_t* handler) : mHandler(handler) {
	if (handler) bctbx_add_log_handler(handler);
}

LogManager::BctbxLogHandler::~BctbxLogHandler() {
	if (BctbxLogHandler::isSet()) bctbx_remove_log_handler(mHandler);
}

bool LogManager::BctbxLogHandler::isSet() const {
	if (mHandler) return bctbx_list_find(bctbx_get_log_handlers(), mHandler) != nullptr;
	return false;
}

LogManager::LogHandler::LogHandler(BctbxLogHandlerFunc func)
    : BctbxLogHandler(
          bctbx_create_log_handler(func, [](bctbx_log_handler_t* handler) { bctbx_free(handler); }, nullptr)) {
}

LogManager::FileLogHandler::FileLogHandler(size_t maxSize, string_view path, string_view name)
    : BctbxLogHandler(bctbx_create_file_log_handler(maxSize, string{path}.c_str(), string{name}.c_str())) {
}

LogManager::LogManager() = default;

LogManager& LogManager::get() {
	if (!sInstance) {
		sInstance = unique_ptr<LogManager>(new LogManager());
		sInstance->configure();
	}
	return *sInstance;
}

BctbxLogLevel LogManager::logLevelFromName(const string& name) {
	if (name == "debug") return BCTBX_LOG_DEBUG;
	if (name == "message") return BCTBX_LOG_MESSAGE;
	if (name == "warning") return BCTBX_LOG_WARNING;
	if (name == "error") return BCTBX_LOG_ERROR;

	throw invalid_argument{"unknown log-level '" + name + "'"};
}

void LogManager::configure(const LoggerParameters& params) {
	// Used to print important information even if the standard output handler is not enabled.
	static constexpr auto logToStdOut = [](BctbxLogLevel level, const std::string& message) {
		bctbx_log(APNCLIENT_LOG_DOMAIN, level, "%s", (string{mLogPrefix} + " - " + message).c_str());
	};

	setLogLevel(params.level);

	if (!params.logFilename.empty()) {
		struct stat st {};
		if (stat(params.logDirectory.c_str(), &st) != 0 && errno == ENOENT) {
			throw runtime_error{"log directory '" + params.logDirectory + "' does not exist, please create it"};
		}

		if (params.enableStandardOutput)
			logToStdOut(BCTBX_LOG_MESSAGE, "Writing logs in: " + params.logDirectory + "/" + params.logFilename);

		mFileLogHandler =
		    make_unique<FileLogHandler>(numeric_limits<size_t>::max(), params.logDirectory, params.logFilename);
		if (!mFileLogHandler->isSet()) {
			const auto error = "Could not create log file handler [name: " + params.logFilename +
			                   ", path: " + params.logDirectory + "]";
			if (!params.enableStandardOutput) throw runtime_error{error};
			logToStdOut(BCTBX_LOG_ERROR, error + " (not fatal when logging is enabled on standard output)");
		}
	} else mFileLogHandler.reset();

	if (params.enableStandardOutput) {
		if (mStdOutLogHandler == nullptr) {
			mStdOutLogHandler = make_unique<LogHandler>(logStdOut);
			if (!mStdOutLogHandler->isSet()) logToStdOut(BCTBX_LOG_ERROR, "Could not create log handler for standard output");
		}
	} else mStdOutLogHandler.reset();
}

void LogManager::setLogLevel(BctbxLogLevel level) {
	mLevel = level;
	bctbx_set_log_level(nullptr /*any domain*/, level);
}

BctbxLogLevel LogManager::getLogLevel() const {
	return mLevel;
}

bool LogManager::standardOutputIsEnabled() const {
	return mStdOutLogHandler && mStdOutLogHandler->isSet();
}

bool LogManager::fileLoggingIsEnabled() const {
	return mFileLogHandler && mFileLogHandler->isSet();
}

} // namespace apnclient
