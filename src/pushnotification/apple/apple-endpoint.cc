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

#include "apple-endpoint.hh"

#include <limits>
#include <stdexcept>

#include "utils/string-utils.hh"

using namespace std;

namespace apnclient::pushnotification {

Endpoint Endpoint::fromString(const string& str) {
	const auto parts = string_utils::split(string_view{str}, ":");
	if (parts.size() != 2) {
		throw invalid_argument{"invalid endpoint '" + str + "', expected 'host:port'"};
	}
	const auto port = string_utils::parseUnsigned(parts[1], numeric_limits<uint16_t>::max());
	if (!port) {
		throw invalid_argument{"invalid port in endpoint '" + str + "'"};
	}
	return Endpoint{string{parts[0]}, static_cast<uint16_t>(*port)};
}

string Endpoint::toString() const {
	return mHost + ":" + to_string(mPort);
}

string Endpoint::getUrl() const {
	return "https://" + toString();
}

ostream& operator<<(ostream& os, const Endpoint& endpoint) {
	return os << endpoint.toString();
}

} // namespace apnclient::pushnotification
