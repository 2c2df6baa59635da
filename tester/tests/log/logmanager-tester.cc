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

#include <stdexcept>

#include "apnclient/logmanager.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace apnclient;
using namespace apnclient::tester;

namespace {

void levelFromName() {
	BC_ASSERT_CPP_EQUAL(LogManager::logLevelFromName("debug"), BCTBX_LOG_DEBUG);
	BC_ASSERT_CPP_EQUAL(LogManager::logLevelFromName("message"), BCTBX_LOG_MESSAGE);
	BC_ASSERT_CPP_EQUAL(LogManager::logLevelFromName("warning"), BCTBX_LOG_WARNING);
	BC_ASSERT_CPP_EQUAL(LogManager::logLevelFromName("error"), BCTBX_LOG_ERROR);
	BC_ASSERT_THROWN(LogManager::logLevelFromName("verbose"), invalid_argument);
	BC_ASSERT_THROWN(LogManager::logLevelFromName("DEBUG"), invalid_argument);
}

void missingLogDirectory() {
	auto& logManager = LogManager::get();
	const auto level = logManager.getLogLevel();

	LoggerParameters params{};
	params.level = level;
	params.logDirectory = "/nonexistent/apnclient/logs";
	params.logFilename = "apnclient.log";
	BC_ASSERT_THROWN(logManager.configure(params), runtime_error);
	BC_ASSERT_FALSE(logManager.fileLoggingIsEnabled());
	BC_ASSERT_TRUE(logManager.standardOutputIsEnabled());
}

void instanceLogPrefix() {
	const int value = 0;
	const auto prefix = LogManager::makeLogPrefixForInstance(&value, "AppleClient");
	BC_ASSERT_TRUE(prefix.rfind("AppleClient[", 0) == 0);
	BC_ASSERT_TRUE(prefix.back() == ']');
}

TestSuite _("LogManager",
            {
                CLASSY_TEST(levelFromName),
                CLASSY_TEST(missingLogDirectory),
                CLASSY_TEST(instanceLogPrefix),
            });

} // namespace
