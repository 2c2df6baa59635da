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

#include <string>
#include <string_view>
#include <vector>

#include "utils/string-utils.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace apnclient;
using namespace apnclient::tester;

namespace {

void split() {
	const vector<string_view> expected{"api.push.apple.com", "443"};
	BC_ASSERT_TRUE(string_utils::split(string_view{"api.push.apple.com:443"}, ":") == expected);
	BC_ASSERT_CPP_EQUAL(string_utils::split(string_view{"a.b.c"}, ".").size(), 3U);
	BC_ASSERT_CPP_EQUAL(string_utils::split(string_view{"a..b"}, ".").size(), 3U);
	BC_ASSERT_TRUE(string_utils::split(string_view{""}, ".").empty());
}

void printableAscii() {
	BC_ASSERT_TRUE(string_utils::isPrintableAscii("EC1BF194-B3B2-424A-89A9-5A918A6E6B5E"));
	BC_ASSERT_TRUE(string_utils::isPrintableAscii(""));
	BC_ASSERT_TRUE(string_utils::isPrintableAscii("with space\tand tab"));
	BC_ASSERT_FALSE(string_utils::isPrintableAscii("caf\xc3\xa9"));
	BC_ASSERT_FALSE(string_utils::isPrintableAscii("line\n"));
	BC_ASSERT_FALSE(string_utils::isPrintableAscii("del\x7f"));
}

void parseUnsigned() {
	BC_ASSERT_CPP_EQUAL(string_utils::parseUnsigned("443", 65535).value_or(0), 443U);
	BC_ASSERT_CPP_EQUAL(string_utils::parseUnsigned("65535", 65535).value_or(0), 65535U);
	BC_ASSERT_FALSE(string_utils::parseUnsigned("65536", 65535).has_value());
	BC_ASSERT_FALSE(string_utils::parseUnsigned("", 65535).has_value());
	BC_ASSERT_FALSE(string_utils::parseUnsigned("12a", 65535).has_value());
	BC_ASSERT_FALSE(string_utils::parseUnsigned(" 12", 65535).has_value());
	BC_ASSERT_FALSE(string_utils::parseUnsigned("-1", 65535).has_value());
	BC_ASSERT_FALSE(string_utils::parseUnsigned("99999999999999999999999", ~0ULL).has_value());
}

TestSuite _("StringUtils",
            {
                CLASSY_TEST(split),
                CLASSY_TEST(printableAscii),
                CLASSY_TEST(parseUnsigned),
            });

} // namespace
