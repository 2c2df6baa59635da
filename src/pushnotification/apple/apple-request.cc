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

#include "apple-request.hh"

#include <nghttp2/nghttp2.h>

#include "apnclient/logmanager.hh"
#include "pushnotification/push-notification-exceptions.hh"

using namespace std;

namespace apnclient {
namespace pushnotification {

AppleRequest::AppleRequest(const Endpoint& endpoint,
                           const string& deviceToken,
                           const string& bearerToken,
                           const PushOptions& options,
                           const Payload& payload)
    : mDeviceToken(deviceToken) {
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "AppleRequest");

	const auto path = "/3/device/" + deviceToken;
	if (!nghttp2_check_header_value(reinterpret_cast<const uint8_t*>(path.data()), path.size())) {
		throw HeaderError{":path", path};
	}

	HttpHeaders headers{};
	headers.add(":method", "POST");
	headers.add(":scheme", "https");
	headers.add(":authority", endpoint.toString());
	headers.add(":path", path);
	headers.add("authorization", "Bearer " + bearerToken);
	headers.concat(options.toHeaders());
	this->setHeaders(headers);

	setBody(payload.toString());

	LOGD << "Apple PNR https headers are :\n" << headers.toString();
	LOGD << "Apple PNR payload is :\n" << getBodyAsString();
	if (mBody.size() > MAXPAYLOAD_SIZE) {
		LOGW << "Payload size (" << mBody.size() << "B) is higher than " << MAXPAYLOAD_SIZE
		     << "B, APNs will likely reject it";
	}
}

} // namespace pushnotification
} // namespace apnclient
