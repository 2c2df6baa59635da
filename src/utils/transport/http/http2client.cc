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

#include "http2client.hh"

#include <algorithm>
#include <limits>
#include <sstream>

#include <nghttp2/nghttp2ver.h>

#include "apnclient/logmanager.hh"

using namespace std;

namespace apnclient {

Http2Client::Http2Client(unique_ptr<TlsConnection>&& connection, SessionSettings&& sessionSettings)
    : mConn(std::move(connection)), mSessionSettings(std::move(sessionSettings)) {

	ostringstream os{};
	os << "Http2Client[" << this << "]";
	mLogPrefix = os.str();

	SLOGD << mLogPrefix << ": constructing Http2Client with TlsConnection[" << mConn.get() << "]";
}

Http2Client::Http2Client(const string& host,
                         const string& port,
                         const string& trustStorePath,
                         SessionSettings&& sessionSettings)
    : Http2Client(make_unique<TlsConnection>(host, port, trustStorePath, true), std::move(sessionSettings)) {
}

Http2Client::~Http2Client() {
	disconnect();
}

shared_ptr<HttpResponse> Http2Client::send(const shared_ptr<HttpMessage>& request) {
	auto logPrefix = mLogPrefix;

	SLOGD << logPrefix << ": sending request[" << request << "]:\n" << request->toString();

	if (!isConnected()) {
		SLOGD << logPrefix << ": not connected. Trying to connect...";
		connect();
	}

	const auto headers = request->getHeaders().makeCHeaderList();
	auto streamId = nghttp2_submit_request(mHttpSession.get(), nullptr, headers.data(), headers.size(),
	                                       request->getCDataProvider(), nullptr);
	if (streamId < 0) {
		throw HttpTransportError{"request submit failed. reason=[" + string{nghttp2_strerror(streamId)} + "]"};
	}

	logPrefix = mLogPrefix + "[" + to_string(streamId) + "]";

	// The stream MUST be registered before nghttp2_session_send() for the callbacks to find it.
	auto& stream = mActiveStreams[streamId];
	stream.request = request;

	const auto deadline = chrono::steady_clock::now() + mRequestTimeout;
	while (true) {
		auto status = nghttp2_session_send(mHttpSession.get());
		if (status < 0) {
			disconnect();
			throw HttpTransportError{"request sending failed. reason=[" + string{nghttp2_strerror(status)} + "]"};
		}
		if (stream.closed) break;

		const auto now = chrono::steady_clock::now();
		if (now >= deadline) {
			SLOGD << logPrefix << ": closing stream after request timeout";
			cancelStream(streamId);
			throw HttpTransportError{"request timeout (" + to_string(mRequestTimeout.count()) + "ms)"};
		}

		bool hasData = false;
		try {
			hasData = mConn->waitForData(chrono::duration_cast<chrono::milliseconds>(deadline - now));
		} catch (const runtime_error& e) {
			disconnect();
			throw HttpTransportError{e.what()};
		}
		if (!hasData) continue;

		status = nghttp2_session_recv(mHttpSession.get());
		if (status < 0) {
			disconnect();
			throw HttpTransportError{"error while receiving HTTP2 data[" + string{nghttp2_strerror(status)} + "]"};
		}
		if (stream.closed) break;
	}

	auto node = mActiveStreams.extract(streamId);
	auto& closedStream = node.mapped();

	if (mLastSID >= 0) {
		SLOGD << mLogPrefix << ": closing connection after receiving GOAWAY frame. Last processed stream is ["
		      << mLastSID << "]";
		disconnect();
	}

	if (closedStream.errorCode != NGHTTP2_NO_ERROR) {
		throw HttpTransportError{"stream closed with error code [" + to_string(closedStream.errorCode) +
		                         "]: " + nghttp2_http2_strerror(closedStream.errorCode)};
	}

	try {
		closedStream.response->getStatusCode(); // throw an exception if the status code is invalid.
	} catch (const runtime_error& e) {
		throw HttpTransportError{string{"error during status code evaluation: "} + e.what()};
	}

	SLOGD << logPrefix << ": response received for HttpRequest[" << request << "]:\n"
	      << closedStream.response->toString();
	return closedStream.response;
}

void Http2Client::connect() {
	mConn->setTimeout(mRequestTimeout);
	try {
		mConn->connect();
	} catch (const runtime_error& e) {
		throw HttpTransportError{e.what()};
	}
	http2Setup();
}

void Http2Client::http2Setup() {
	auto sendCb = [](nghttp2_session* session, const uint8_t* data, size_t length, [[maybe_unused]] int flags,
	                 void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		return thiz->doSend(*session, data, length);
	};
	auto recvCb = [](nghttp2_session* session, uint8_t* buf, size_t length, [[maybe_unused]] int flags,
	                 void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		return thiz->doRecv(*session, buf, length);
	};
	auto frameSentCb = [](nghttp2_session* session, const nghttp2_frame* frame, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onFrameSent(*session, *frame);
		return 0;
	};
	auto frameRecvCb = [](nghttp2_session* session, const nghttp2_frame* frame, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onFrameRecv(*session, *frame);
		return 0;
	};
	auto onHeaderRecvCb = [](nghttp2_session* session, const nghttp2_frame* frame, const uint8_t* name, size_t namelen,
	                         const uint8_t* value, size_t valuelen, uint8_t flags, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		string nameStr{reinterpret_cast<const char*>(name), namelen};
		string valueStr{reinterpret_cast<const char*>(value), valuelen};
		thiz->onHeaderRecv(*session, *frame, nameStr, valueStr, flags);
		return 0;
	};
	auto onDataChunkRecvCb = [](nghttp2_session* session, uint8_t flags, int32_t stream_id, const uint8_t* data,
	                            size_t len, void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onDataReceived(*session, flags, stream_id, data, len);
		return 0;
	};
	auto onStreamClosedCb = [](nghttp2_session* session, int32_t stream_id, uint32_t error_code,
	                           void* user_data) noexcept {
		auto thiz = static_cast<Http2Client*>(user_data);
		thiz->onStreamClosed(*session, stream_id, error_code);
		return 0;
	};

	nghttp2_session_callbacks* cbs;
	nghttp2_session_callbacks_new(&cbs);
	nghttp2_session_callbacks_set_send_callback(cbs, sendCb);
	nghttp2_session_callbacks_set_recv_callback(cbs, recvCb);
	nghttp2_session_callbacks_set_on_frame_send_callback(cbs, frameSentCb);
	nghttp2_session_callbacks_set_on_frame_recv_callback(cbs, frameRecvCb);
	nghttp2_session_callbacks_set_on_header_callback(cbs, onHeaderRecvCb);
	nghttp2_session_callbacks_set_on_data_chunk_recv_callback(cbs, onDataChunkRecvCb);
	nghttp2_session_callbacks_set_on_stream_close_callback(cbs, onStreamClosedCb);

	unique_ptr<nghttp2_session_callbacks, void (*)(nghttp2_session_callbacks*)> cbsPtr{cbs,
	                                                                                   nghttp2_session_callbacks_del};

	nghttp2_session* session;
	nghttp2_session_client_new(&session, cbs, this);
	NgHttp2SessionPtr httpSession{session};

	int status;
	if ((status = mSessionSettings.submitTo(session)) != 0) {
		mConn->disconnect();
		throw HttpTransportError{"submitting settings failed [status=" + to_string(status) + "]"};
	}

	mHttpSession = std::move(httpSession);
	SLOGD << mLogPrefix << ": HTTP/2 session established with " << getHost();
}

ssize_t Http2Client::doSend([[maybe_unused]] nghttp2_session& session, const uint8_t* data, size_t length) noexcept {
	length = min(length, size_t(numeric_limits<int>::max()));
	auto nwritten = mConn->write(data, int(length));
	if (nwritten < 0) {
		SLOGE << mLogPrefix << ": error while writing into socket[" << nwritten << "]";
		return NGHTTP2_ERR_CALLBACK_FAILURE;
	}
	if (nwritten == 0 && length > 0) return NGHTTP2_ERR_WOULDBLOCK;
	return nwritten;
}

ssize_t Http2Client::doRecv([[maybe_unused]] nghttp2_session& session, uint8_t* data, size_t length) noexcept {
	length = min(length, size_t(numeric_limits<int>::max()));
	auto nread = mConn->read(data, int(length));
	if (nread < 0) {
		SLOGD << mLogPrefix << ": connection closed by peer";
		return NGHTTP2_ERR_EOF;
	}
	if (nread == 0 && length > 0) return NGHTTP2_ERR_WOULDBLOCK;
	return nread;
}

/**
 * Synchronously called by nghttp2_session_send
 */
void Http2Client::onFrameSent([[maybe_unused]] nghttp2_session& session, const nghttp2_frame& frame) noexcept {
	SLOGD << mLogPrefix << "[" << frame.hd.stream_id << "]: " << Http2Tools::frameTypeToString(frame.hd.type)
	      << " frame sent (" << frame.hd.length << "B)";
}

void Http2Client::onFrameRecv([[maybe_unused]] nghttp2_session& session, const nghttp2_frame& frame) noexcept {
	auto logPrefix = mLogPrefix + "[" + to_string(frame.hd.stream_id) + "]: ";
	SLOGD << logPrefix << Http2Tools::frameTypeToString(frame.hd.type) << " frame received (" << frame.hd.length
	      << "B)";

	switch (frame.hd.type) {
		case NGHTTP2_SETTINGS:
			if ((frame.hd.flags & NGHTTP2_FLAG_ACK) == 0) {
				SLOGD << logPrefix << "server settings received";
			}
			break;
		case NGHTTP2_GOAWAY: {
			ostringstream msg{};
			msg << logPrefix << "GOAWAY frame received, errorCode=[" << frame.goaway.error_code << "], lastStreamId=["
			    << frame.goaway.last_stream_id << "]:";
			if (frame.goaway.opaque_data_len > 0) {
				msg << endl;
				msg.write(reinterpret_cast<const char*>(frame.goaway.opaque_data), frame.goaway.opaque_data_len);
			} else {
				msg << " <empty>";
			}
			SLOGD << msg.str();
			SLOGD << "Scheduling connection closing";
			mLastSID = frame.goaway.last_stream_id;
			break;
		}
	}
}

void Http2Client::onHeaderRecv([[maybe_unused]] nghttp2_session& session,
                               const nghttp2_frame& frame,
                               const string& name,
                               const string& value,
                               uint8_t flags) noexcept {
	const auto& streamId = frame.hd.stream_id;

	auto streamIterator = mActiveStreams.find(streamId);
	if (streamIterator != mActiveStreams.end()) {
		streamIterator->second.response->getHeaders().add(name, value, flags);
	} else {
		SLOGE << mLogPrefix << "[" << streamId << "]: receiving header for an unknown stream. Just ignoring";
	}
}

void Http2Client::onDataReceived([[maybe_unused]] nghttp2_session& session,
                                 [[maybe_unused]] uint8_t flags,
                                 int32_t streamId,
                                 const uint8_t* data,
                                 size_t datalen) noexcept {
	auto streamIterator = mActiveStreams.find(streamId);
	if (streamIterator != mActiveStreams.end()) {
		streamIterator->second.response->appendBody(string(reinterpret_cast<const char*>(data), datalen));
	} else {
		SLOGE << mLogPrefix << "[" << streamId << "]: data received for an unknown stream";
	}
}

void Http2Client::onStreamClosed([[maybe_unused]] nghttp2_session& session,
                                 int32_t stream_id,
                                 uint32_t error_code) noexcept {
	auto logPrefix = mLogPrefix + "[" + to_string(stream_id) + "]";
	if (NGHTTP2_NO_ERROR == error_code) {
		SLOGD << logPrefix << ": stream closed without error";
	} else {
		SLOGD << logPrefix << ": stream closed with error code [" << error_code
		      << "] : " << nghttp2_http2_strerror(error_code);
	}

	auto streamIterator = mActiveStreams.find(stream_id);
	if (streamIterator == mActiveStreams.end()) return;
	if (streamIterator->second.cancelled) {
		mActiveStreams.erase(streamIterator);
		return;
	}
	streamIterator->second.closed = true;
	streamIterator->second.errorCode = error_code;
}

void Http2Client::cancelStream(int32_t streamId) noexcept {
	// The request must outlive the stream: nghttp2 may still read its body until RST_STREAM is sent.
	auto streamIterator = mActiveStreams.find(streamId);
	if (streamIterator != mActiveStreams.end()) streamIterator->second.cancelled = true;
	nghttp2_submit_rst_stream(mHttpSession.get(), NGHTTP2_FLAG_NONE, streamId, NGHTTP2_CANCEL);
	if (nghttp2_session_send(mHttpSession.get()) < 0) disconnect();
}

void Http2Client::disconnect() noexcept {
	if (!isConnected()) return;
	SLOGD << mLogPrefix << ": disconnecting";
	mHttpSession.reset();
	mConn->disconnect();
	mActiveStreams.clear();
	mLastSID = -1;
}

const char* Http2Tools::frameTypeToString(uint8_t frameType) noexcept {
	switch (frameType) {
		case NGHTTP2_DATA:
			return "DATA";
		case NGHTTP2_HEADERS:
			return "HEADERS";
		case NGHTTP2_PRIORITY:
			return "PRIORITY";
		case NGHTTP2_RST_STREAM:
			return "RST_STREAM";
		case NGHTTP2_SETTINGS:
			return "SETTINGS";
		case NGHTTP2_PUSH_PROMISE:
			return "PUSH_PROMISE";
		case NGHTTP2_PING:
			return "PING";
		case NGHTTP2_GOAWAY:
			return "GOAWAY";
		case NGHTTP2_WINDOW_UPDATE:
			return "WINDOW_UPDATE";
		case NGHTTP2_CONTINUATION:
			return "CONTINUATION";
#if NGHTTP2_VERSION_NUM >= 0x010a00 // v1.10.0
		case NGHTTP2_ALTSVC:
			return "ALTSVC";
#endif
#if NGHTTP2_VERSION_NUM >= 0x012100 // v1.33.0
		case NGHTTP2_ORIGIN:
			return "ORIGIN";
#endif
	}
	return "UNKNOWN";
}

} /* namespace apnclient */
