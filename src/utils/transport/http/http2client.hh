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

#include <array>
#include <map>
#include <memory>
#include <string>

#include <nghttp2/nghttp2.h>

#include "http-message.hh"
#include "http-response.hh"
#include "http-transport.hh"
#include "utils/transport/tls-connection.hh"

namespace apnclient {

/**
 * A blocking HTTP/2 client over a TLS connection.
 * One connection is established to the remote server on the first request and re-used by the following ones.
 * The connection is closed when the server sends a GOAWAY frame or when an I/O error occurs, and re-established on
 * the next request. Failed requests are never retried.
 */
class Http2Client : public HttpTransport {
public:
	class SessionSettings {
	public:
		SessionSettings(uint32_t maxConcurrentStreams = 1000)
		    : mSettings{{{NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, maxConcurrentStreams}}} {
		}

		int submitTo(nghttp2_session* session) {
			return nghttp2_submit_settings(session, NGHTTP2_FLAG_NONE, mSettings.data(), mSettings.size());
		}

	private:
		std::array<nghttp2_settings_entry, 1> mSettings;
	};

	Http2Client(std::unique_ptr<TlsConnection>&& connection, SessionSettings&& sessionSettings = SessionSettings());
	/**
	 * @param trustStorePath CA file used to verify the server, leave empty to use the system trust store.
	 */
	Http2Client(const std::string& host,
	            const std::string& port,
	            const std::string& trustStorePath = "",
	            SessionSettings&& sessionSettings = SessionSettings());
	~Http2Client() override;

	/**
	 * Send a request to the remote server and wait for its complete response.
	 * If an HTTP/2 connection is already active between you and the remote server this connection is re-used. Else a
	 * new connection is automatically created.
	 *
	 * @throw HttpTransportError on connection errors, stream errors, timeouts or if the response status is invalid.
	 */
	std::shared_ptr<HttpResponse> send(const std::shared_ptr<HttpMessage>& request) override;

	void setRequestTimeout(std::chrono::milliseconds requestTimeout) override {
		mRequestTimeout = requestTimeout;
	}
	std::chrono::milliseconds getRequestTimeout() const override {
		return mRequestTimeout;
	}

	std::string getHost() const {
		return mConn->getPort() == "443" ? mConn->getHost() : mConn->getHost() + ":" + mConn->getPort();
	}

	bool isConnected() const {
		return mHttpSession != nullptr;
	}

private:
	struct NgHttp2SessionDeleter {
		void operator()(nghttp2_session* ptr) const noexcept {
			nghttp2_session_del(ptr);
		}
	};
	using NgHttp2SessionPtr = std::unique_ptr<nghttp2_session, NgHttp2SessionDeleter>;

	struct Stream {
		std::shared_ptr<HttpMessage> request{};
		std::shared_ptr<HttpResponse> response{std::make_shared<HttpResponse>()};
		bool closed{false};
		// Nobody waits for the response anymore, the stream is forgotten as soon as nghttp2 closes it.
		bool cancelled{false};
		uint32_t errorCode{NGHTTP2_NO_ERROR};
	};

	void connect();
	void http2Setup();
	void disconnect() noexcept;
	void cancelStream(int32_t streamId) noexcept;

	ssize_t doSend(nghttp2_session& session, const uint8_t* data, size_t length) noexcept;
	ssize_t doRecv(nghttp2_session& session, uint8_t* data, size_t length) noexcept;
	void onFrameSent(nghttp2_session& session, const nghttp2_frame& frame) noexcept;
	void onFrameRecv(nghttp2_session& session, const nghttp2_frame& frame) noexcept;
	void onHeaderRecv(nghttp2_session& session,
	                  const nghttp2_frame& frame,
	                  const std::string& name,
	                  const std::string& value,
	                  uint8_t flags) noexcept;
	void onDataReceived(
	    nghttp2_session& session, uint8_t flags, int32_t streamId, const uint8_t* data, size_t datalen) noexcept;
	void onStreamClosed(nghttp2_session& session, int32_t stream_id, uint32_t error_code) noexcept;

	std::unique_ptr<TlsConnection> mConn{};
	std::string mLogPrefix{};
	int32_t mLastSID{-1};

	NgHttp2SessionPtr mHttpSession{};
	SessionSettings mSessionSettings{};

	std::map<int32_t, Stream> mActiveStreams{};

	/**
	 * Delay for one request timeout, default is 30s.
	 */
	std::chrono::milliseconds mRequestTimeout{std::chrono::seconds{30}};
};

class Http2Tools {
public:
	static const char* frameTypeToString(uint8_t frameType) noexcept;
};

} // namespace apnclient
