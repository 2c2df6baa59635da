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

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "http-message.hh"
#include "http-response.hh"

namespace apnclient {

/**
 * Raised by HttpTransport::send() when no complete response could be obtained: connection failure, stream reset,
 * timeout or malformed response.
 */
class HttpTransportError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Something able to carry one HTTP request to a remote server and to bring its response back.
 */
class HttpTransport {
public:
	virtual ~HttpTransport() = default;

	/**
	 * Send the request and block until the whole response has been received.
	 *
	 * @throw HttpTransportError
	 */
	virtual std::shared_ptr<HttpResponse> send(const std::shared_ptr<HttpMessage>& request) = 0;

	/**
	 * Maximum amount of time to wait for the response of one request.
	 */
	virtual void setRequestTimeout(std::chrono::milliseconds timeout) = 0;
	virtual std::chrono::milliseconds getRequestTimeout() const = 0;
};

} // namespace apnclient
