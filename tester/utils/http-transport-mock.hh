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
#include <functional>
#include <memory>
#include <queue>
#include <string>

#include "utils/transport/http/http-transport.hh"

namespace apnclient::tester {

/**
 * An HttpTransport that never touches the network: every request is recorded and answered by a user-provided handler.
 */
class HttpTransportMock : public HttpTransport {
public:
	using Handler = std::function<std::shared_ptr<HttpResponse>(const std::shared_ptr<HttpMessage>&)>;

	explicit HttpTransportMock(const Handler& handler) : mHandler(handler) {
	}

	/**
	 * Make a mock that answers every request with the same status, headers and body.
	 */
	static std::shared_ptr<HttpTransportMock> replying(int status, const HttpHeaders& headers, const std::string& body) {
		return std::make_shared<HttpTransportMock>(
		    [status, headers, body](const auto&) { return makeResponse(status, headers, body); });
	}

	static std::shared_ptr<HttpResponse> makeResponse(int status, const HttpHeaders& headers, const std::string& body) {
		auto response = std::make_shared<HttpResponse>(headers, body);
		response->getHeaders().add(":status", std::to_string(status));
		return response;
	}

	std::shared_ptr<HttpResponse> send(const std::shared_ptr<HttpMessage>& request) override {
		mRequestsReceived.push(request);
		return mHandler(request);
	}

	void setRequestTimeout(std::chrono::milliseconds timeout) override {
		mTimeout = timeout;
	}
	std::chrono::milliseconds getRequestTimeout() const override {
		return mTimeout;
	}

	std::shared_ptr<HttpMessage> popRequestReceived() {
		if (mRequestsReceived.empty()) return nullptr;
		auto request = mRequestsReceived.front();
		mRequestsReceived.pop();
		return request;
	}
	std::size_t getRequestsReceivedCount() const {
		return mRequestsReceived.size();
	}

private:
	Handler mHandler;
	std::queue<std::shared_ptr<HttpMessage>> mRequestsReceived{};
	std::chrono::milliseconds mTimeout{std::chrono::seconds{30}};
};

} // namespace apnclient::tester
