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

#include "string-utils.hh"

#include <charconv>

using namespace std;

namespace apnclient::string_utils {

vector<string_view> split(string_view str, string_view delimiter) noexcept {
	vector<string_view> out;

	if (!str.empty()) {
		if (delimiter.empty()) return {str};
		size_t pos = 0, oldPos = 0;
		for (; (pos = str.find(delimiter, pos)) != string_view::npos; oldPos = pos + delimiter.length(), pos = oldPos)
			out.push_back(str.substr(oldPos, pos - oldPos));
		out.push_back(str.substr(oldPos));
	}

	return out;
}

bool isPrintableAscii(string_view str) noexcept {
	for (const auto c : str) {
		const auto uc = static_cast<unsigned char>(c);
		if (uc != '\t' && (uc < 0x20 || uc > 0x7e)) return false;
	}
	return true;
}

optional<unsigned long long> parseUnsigned(string_view str, unsigned long long max) noexcept {
	unsigned long long value = 0;
	const auto* end = str.data() + str.size();
	const auto [ptr, ec] = from_chars(str.data(), end, value);
	if (str.empty() || ec != errc{} || ptr != end || value > max) return nullopt;
	return value;
}

} // namespace apnclient::string_utils
