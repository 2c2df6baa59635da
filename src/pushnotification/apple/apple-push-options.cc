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

#include "apple-push-options.hh"

#include <nghttp2/nghttp2.h>

#include "pushnotification/push-notification-exceptions.hh"

using namespace std;

namespace apnclient::pushnotification {

namespace {

void addHeader(HttpHeaders& headers, const string& name, const string& value) {
	if (!nghttp2_check_header_value(reinterpret_cast<const uint8_t*>(value.data()), value.size())) {
		throw HeaderError{name, value};
	}
	headers.add(name, value);
}

} // namespace

HttpHeaders PushOptions::toHeaders() const {
	HttpHeaders headers{};
	if (pushType) addHeader(headers, "apns-push-type", *pushType);
	if (id) addHeader(headers, "apns-id", *id);
	if (expiration) addHeader(headers, "apns-expiration", to_string(*expiration));
	if (priority) addHeader(headers, "apns-priority", to_string(*priority));
	addHeader(headers, "apns-topic", topic);
	if (collapseId) addHeader(headers, "apns-collapse-id", *collapseId);
	return headers;
}

} // namespace apnclient::pushnotification
