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

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include <nghttp2/nghttp2.h>
#include <openssl/ssl.h>

#include "utils/transport/http/http-headers.hh"

namespace apnclient::tester {

class Request {
public:
	HttpHeaders headers{};
	std::string body{};
};

class Answer {
public:
	enum class Action {
		Respond,
		// Send a GOAWAY frame, then the response.
		RespondAndGoAway,
		// Never answer the request.
		Ignore,
		// Reset the stream with REFUSED_STREAM.
		Reset,
	};

	static Answer respond(int status, const HttpHeaders& headers = {}, const std::string& body = "") {
		return Answer{Action::Respond, status, headers, body};
	}
	static Answer respondAndGoAway(int status, const HttpHeaders& headers = {}, const std::string& body = "") {
		return Answer{Action::RespondAndGoAway, status, headers, body};
	}
	static Answer ignore() {
		return Answer{Action::Ignore, 0, {}, ""};
	}
	static Answer reset() {
		return Answer{Action::Reset, 0, {}, ""};
	}

	Action action{Action::Respond};
	int status{200};
	HttpHeaders headers{};
	std::string body{};
};

/**
 * A TLS HTTP/2 server running in its own thread and listening on the loopback interface.
 * It serves one connection at a time with a certificate generated on construction, for the host '127.0.0.1'.
 * Clients must use getTrustStorePath() as trust store.
 */
class Http2MockServer {
public:
	using Handler = std::function<Answer(const Request&)>;

	explicit Http2MockServer(const Handler& handler);
	Http2MockServer(const Http2MockServer&) = delete;
	~Http2MockServer();

	std::string getPort() const {
		return std::to_string(mPort);
	}
	const std::string& getTrustStorePath() const {
		return mTrustStorePath;
	}

	std::shared_ptr<Request> popRequestReceived();
	int getAcceptedConnectionsCount() const {
		return mAcceptedConnections;
	}
	int getResetStreamsCount() const {
		return mResetStreams;
	}

private:
	struct Stream {
		Request request{};
		std::string responseBody{};
		std::size_t offset{0};
	};

	struct SSLCtxDeleter {
		void operator()(SSL_CTX* ctx) const noexcept {
			SSL_CTX_free(ctx);
		}
	};

	void makeCredentials();
	void listen();
	void run();
	void acceptConnection();
	void processInput();
	void closeConnection() noexcept;
	void onRequest(int32_t streamId);

	static ssize_t onSend(nghttp2_session*, const uint8_t* data, size_t length, int, void* userData);
	static int onBeginHeaders(nghttp2_session*, const nghttp2_frame* frame, void* userData);
	static int onHeader(nghttp2_session*,
	                    const nghttp2_frame* frame,
	                    const uint8_t* name,
	                    size_t namelen,
	                    const uint8_t* value,
	                    size_t valuelen,
	                    uint8_t,
	                    void* userData);
	static int onDataChunk(nghttp2_session*, uint8_t, int32_t streamId, const uint8_t* data, size_t len, void* userData);
	static int onFrameRecv(nghttp2_session*, const nghttp2_frame* frame, void* userData);
	static int onStreamClose(nghttp2_session*, int32_t streamId, uint32_t errorCode, void* userData);
	static ssize_t readBody(nghttp2_session*,
	                        int32_t,
	                        uint8_t* buf,
	                        size_t length,
	                        uint32_t* dataFlags,
	                        nghttp2_data_source* source,
	                        void*);

	Handler mHandler;
	std::unique_ptr<SSL_CTX, SSLCtxDeleter> mCtx{};
	std::string mTrustStorePath{};
	int mListenFd{-1};
	uint16_t mPort{0};

	// Only used by the server thread.
	int mFd{-1};
	SSL* mSsl{nullptr};
	nghttp2_session* mSession{nullptr};
	std::map<int32_t, Stream> mStreams{};

	std::mutex mMutex{};
	std::queue<std::shared_ptr<Request>> mRequestsReceived{};
	std::atomic_int mAcceptedConnections{0};
	std::atomic_int mResetStreams{0};
	std::atomic_bool mStop{false};
	std::thread mThread{};
};

} // namespace apnclient::tester
