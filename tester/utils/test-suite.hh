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

#include <utility>
#include <vector>

#include "bctoolbox/tester.h"

namespace apnclient::tester {

/**
 * Instances of this class automatically register to BCUnit on construction and MUST have static lifetimes.
 * I.e. This class is intended to be instanced as a static variable in each test-file to streamline the registration of
 * tests.
 */
class TestSuite {
public:
	TestSuite(const char* name, std::vector<test_t>&& tests) : mTests(std::move(tests)), mSuite{} {
		mSuite.name = name;
		mSuite.nb_tests = int(mTests.size());
		mSuite.tests = mTests.data();
		bc_tester_add_suite(&mSuite);
	}

	const char* getName() const {
		return mSuite.name;
	}

private:
	std::vector<test_t> mTests;
	test_suite_t mSuite;
};

} // namespace apnclient::tester
