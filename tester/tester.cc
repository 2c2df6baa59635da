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

#include "tester.hh"

#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <string>

#include <bctoolbox/logging.h>
#include <bctoolbox/tester.h>

#include "apnclient/logmanager.hh"

namespace apnclient {
namespace tester {

static int verbose_arg_func(const char*) {
	LogManager::get().setLogLevel(BCTBX_LOG_DEBUG);
	return 0;
}

static int silent_arg_func([[maybe_unused]] const char* arg) {
	LogManager::get().setLogLevel(BCTBX_LOG_FATAL);
	return 0;
}

static void log_handler(int lev, const char* fmt, va_list args) {
	va_list cap;
	va_copy(cap, args);
	/* Otherwise, we must use stdio to avoid log formatting (for autocompletion etc.) */
	vfprintf(lev == BCTBX_LOG_ERROR ? stderr : stdout, fmt, cap);
	fprintf(lev == BCTBX_LOG_ERROR ? stderr : stdout, "\n");
	va_end(cap);
}

void apnclient_tester_init() {
	// Peers of the HTTP/2 tests may close their connection at any time.
	signal(SIGPIPE, SIG_IGN);

	// Initialize logs
	LoggerParameters logParams{};
	logParams.level = BCTBX_LOG_WARNING;
	logParams.enableStandardOutput = true;
	LogManager::get().configure(logParams);

	bc_tester_set_verbose_func(verbose_arg_func);
	bc_tester_set_silent_func(silent_arg_func);
	bc_tester_init(log_handler, BCTBX_LOG_MESSAGE, BCTBX_LOG_ERROR, ".");
}

void apnclient_tester_uninit(void) {
	bc_tester_uninit();
}

} // namespace tester
} // namespace apnclient

int main(int argc, char* argv[]) {
	using namespace apnclient::tester;

	apnclient_tester_init();

	for (auto i = 1; i < argc; ++i) {
		auto ret = bc_tester_parse_args(argc, argv, i);
		if (ret > 0) {
			i += ret - 1;
			continue;
		} else if (ret < 0) {
			bc_tester_helper(argv[0], "");
		}
		return ret;
	}

	auto ret = bc_tester_start(argv[0]);
	apnclient_tester_uninit();
	return ret;
}
