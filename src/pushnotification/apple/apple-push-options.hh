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

#include <cstdint>
#include <optional>
#include <string>

#include "utils/transport/http/http-headers.hh"

namespace apnclient::pushnotification {

/**
 * Per-request settings of an APNs push, each one carried by its own 'apns-*' header.
 */
struct PushOptions {
	std::optional<std::string> pushType{};
	std::optional<std::string> id{};
	std::optional<std::uint64_t> expiration{};
	std::optional<std::uint8_t> priority{};
	std::string topic{};
	std::optional<std::string> collapseId{};

	/**
	 * @return the 'apns-*' headers of the set options, 'apns-topic' always included.
	 * @throw HeaderError if a value cannot be sent as an HTTP/2 header value.
	 */
	HttpHeaders toHeaders() const;
};

} // namespace apnclient::pushnotification
