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

#include <string>

#include "apple-endpoint.hh"
#include "apple-payload.hh"
#include "apple-push-options.hh"
#include "utils/transport/http/http-message.hh"

namespace apnclient {
namespace pushnotification {

/**
 * This class represent one Apple push notification request: the HTTP/2 POST to '/3/device/<token>' carrying the
 * provider token, the 'apns-*' option headers and the JSON payload.
 */
class AppleRequest : public HttpMessage {
public:
	/**
	 * @throw HeaderError if the device token or an option value cannot be sent in an HTTP/2 header.
	 */
	AppleRequest(const Endpoint& endpoint,
	             const std::string& deviceToken,
	             const std::string& bearerToken,
	             const PushOptions& options,
	             const Payload& payload);

	const std::string& getDeviceToken() const noexcept {
		return mDeviceToken;
	}

protected:
	// Apple rejects larger payloads with 'PayloadTooLarge' (VoIP pushes excepted, which may reach 5120 bytes).
	static constexpr std::size_t MAXPAYLOAD_SIZE = 4096;

private:
	std::string mDeviceToken;
	std::string mLogPrefix{};
};

} // namespace pushnotification
} // namespace apnclient
