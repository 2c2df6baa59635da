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

#include "http2-mock-server.hh"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509v3.h>

#include "apnclient/logmanager.hh"

using namespace std;

namespace apnclient::tester {

namespace {

constexpr auto kHost = "127.0.0.1";

struct EvpPkeyDeleter {
	void operator()(EVP_PKEY* key) const noexcept {
		EVP_PKEY_free(key);
	}
};
struct X509Deleter {
	void operator()(X509* cert) const noexcept {
		X509_free(cert);
	}
};
struct BIODeleter {
	void operator()(BIO* bio) const noexcept {
		BIO_free_all(bio);
	}
};

unique_ptr<EVP_PKEY, EvpPkeyDeleter> makeKey() {
	auto* ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
	EVP_PKEY* key = nullptr;
	const auto generated = ctx != nullptr && EVP_PKEY_keygen_init(ctx) > 0 &&
	                       EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_X9_62_prime256v1) > 0 &&
	                       EVP_PKEY_keygen(ctx, &key) > 0;
	EVP_PKEY_CTX_free(ctx);
	if (!generated) throw runtime_error{"cannot generate the server private key"};
	return unique_ptr<EVP_PKEY, EvpPkeyDeleter>{key};
}

// Self-signed certificate valid for 'kHost' as a DNS name and as an IP address.
unique_ptr<X509, X509Deleter> makeCertificate(EVP_PKEY* key) {
	unique_ptr<X509, X509Deleter> cert{X509_new()};
	if (cert == nullptr) throw runtime_error{"X509_new() failed"};

	X509_set_version(cert.get(), 2);
	ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
	X509_gmtime_adj(X509_getm_notBefore(cert.get()), -3600);
	X509_gmtime_adj(X509_getm_notAfter(cert.get()), 24 * 3600);
	X509_set_pubkey(cert.get(), key);
	auto* name = X509_get_subject_name(cert.get());
	X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(kHost), -1, -1, 0);
	X509_set_issuer_name(cert.get(), name);

	X509V3_CTX v3Ctx{};
	X509V3_set_ctx_nodb(&v3Ctx);
	X509V3_set_ctx(&v3Ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
	for (const auto& [nid, value] : {pair{NID_basic_constraints, "critical,CA:TRUE"},
	                                 pair{NID_subject_alt_name, "DNS:127.0.0.1,IP:127.0.0.1"}}) {
		auto* extension = X509V3_EXT_conf_nid(nullptr, &v3Ctx, nid, value);
		if (extension == nullptr) throw runtime_error{string{"cannot create certificate extension "} + value};
		X509_add_ext(cert.get(), extension, -1);
		X509_EXTENSION_free(extension);
	}

	if (X509_sign(cert.get(), key, EVP_sha256()) == 0) throw runtime_error{"cannot sign the server certificate"};
	return cert;
}

int selectAlpn(SSL*, const unsigned char** out, unsigned char* outlen, const unsigned char* in, unsigned int inlen,
               void*) {
	if (nghttp2_select_next_protocol(const_cast<unsigned char**>(out), outlen, in, inlen) != 1) {
		return SSL_TLSEXT_ERR_NOACK;
	}
	return SSL_TLSEXT_ERR_OK;
}

} // namespace

Http2MockServer::Http2MockServer(const Handler& handler) : mHandler(handler) {
	listen();
	makeCredentials();
	mThread = thread{&Http2MockServer::run, this};
}

Http2MockServer::~Http2MockServer() {
	mStop = true;
	if (mThread.joinable()) mThread.join();
	closeConnection();
	if (mListenFd >= 0) ::close(mListenFd);
	error_code ec{};
	filesystem::remove(mTrustStorePath, ec);
}

shared_ptr<Request> Http2MockServer::popRequestReceived() {
	lock_guard<mutex> lock{mMutex};
	if (mRequestsReceived.empty()) return nullptr;
	auto request = mRequestsReceived.front();
	mRequestsReceived.pop();
	return request;
}

void Http2MockServer::makeCredentials() {
	const auto key = makeKey();
	const auto cert = makeCertificate(key.get());

	mCtx.reset(SSL_CTX_new(TLS_server_method()));
	if (mCtx == nullptr || SSL_CTX_use_certificate(mCtx.get(), cert.get()) != 1 ||
	    SSL_CTX_use_PrivateKey(mCtx.get(), key.get()) != 1) {
		throw runtime_error{"cannot set up the server TLS context"};
	}
	SSL_CTX_set_alpn_select_cb(mCtx.get(), selectAlpn, nullptr);

	ostringstream fileName{};
	fileName << "apnclient-tester-" << getpid() << "-" << this << ".pem";
	mTrustStorePath = (filesystem::temp_directory_path() / fileName.str()).string();
	unique_ptr<BIO, BIODeleter> file{BIO_new_file(mTrustStorePath.c_str(), "w")};
	if (file == nullptr || PEM_write_bio_X509(file.get(), cert.get()) != 1) {
		throw runtime_error{"cannot write '" + mTrustStorePath + "'"};
	}
}

void Http2MockServer::listen() {
	mListenFd = ::socket(AF_INET, SOCK_STREAM, 0);
	if (mListenFd < 0) throw runtime_error{string{"socket() failed: "} + strerror(errno)};

	const int reuse = 1;
	::setsockopt(mListenFd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

	sockaddr_in address{};
	address.sin_family = AF_INET;
	address.sin_port = 0;
	::inet_pton(AF_INET, kHost, &address.sin_addr);
	if (::bind(mListenFd, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 || ::listen(mListenFd, 8) != 0) {
		throw runtime_error{string{"cannot listen on the loopback interface: "} + strerror(errno)};
	}

	socklen_t addressLen = sizeof(address);
	::getsockname(mListenFd, reinterpret_cast<sockaddr*>(&address), &addressLen);
	mPort = ntohs(address.sin_port);
}

void Http2MockServer::run() {
	while (!mStop) {
		array<pollfd, 2> fds{pollfd{mListenFd, POLLIN, 0}, pollfd{mFd, POLLIN, 0}};
		if (::poll(fds.data(), fds.size(), 20) < 0) {
			if (errno == EINTR) continue;
			SLOGE << "Http2MockServer: poll() failed: " << strerror(errno);
			return;
		}
		if (mFd >= 0 && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) processInput();
		if (fds[0].revents & POLLIN) acceptConnection();
	}
}

void Http2MockServer::acceptConnection() {
	const auto fd = ::accept(mListenFd, nullptr, nullptr);
	if (fd < 0) return;
	closeConnection();
	mFd = fd;

	// Bounds the blocking TLS reads of the server thread.
	timeval timeout{5, 0};
	::setsockopt(mFd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

	mSsl = SSL_new(mCtx.get());
	if (mSsl == nullptr || SSL_set_fd(mSsl, mFd) != 1 || SSL_accept(mSsl) != 1) {
		SLOGD << "Http2MockServer: TLS handshake failed";
		closeConnection();
		return;
	}
	mAcceptedConnections++;

	nghttp2_session_callbacks* callbacks;
	nghttp2_session_callbacks_new(&callbacks);
	nghttp2_session_callbacks_set_send_callback(callbacks, onSend);
	nghttp2_session_callbacks_set_on_begin_headers_callback(callbacks, onBeginHeaders);
	nghttp2_session_callbacks_set_on_header_callback(callbacks, onHeader);
	nghttp2_session_callbacks_set_on_data_chunk_recv_callback(callbacks, onDataChunk);
	nghttp2_session_callbacks_set_on_frame_recv_callback(callbacks, onFrameRecv);
	nghttp2_session_callbacks_set_on_stream_close_callback(callbacks, onStreamClose);
	nghttp2_session_server_new(&mSession, callbacks, this);
	nghttp2_session_callbacks_del(callbacks);

	const nghttp2_settings_entry settings{NGHTTP2_SETTINGS_MAX_CONCURRENT_STREAMS, 100};
	if (nghttp2_submit_settings(mSession, NGHTTP2_FLAG_NONE, &settings, 1) != 0 || nghttp2_session_send(mSession) != 0) {
		closeConnection();
	}
}

void Http2MockServer::processInput() {
	array<uint8_t, 16384> buffer{};
	do {
		const auto nread = SSL_read(mSsl, buffer.data(), static_cast<int>(buffer.size()));
		if (nread <= 0) {
			SLOGD << "Http2MockServer: connection closed by peer";
			closeConnection();
			return;
		}
		if (nghttp2_session_mem_recv(mSession, buffer.data(), nread) < 0 || nghttp2_session_send(mSession) != 0) {
			closeConnection();
			return;
		}
	} while (SSL_pending(mSsl) > 0);
}

void Http2MockServer::closeConnection() noexcept {
	if (mSession) {
		nghttp2_session_del(mSession);
		mSession = nullptr;
	}
	mStreams.clear();
	if (mSsl) {
		SSL_free(mSsl);
		mSsl = nullptr;
	}
	if (mFd >= 0) {
		::close(mFd);
		mFd = -1;
	}
}

void Http2MockServer::onRequest(int32_t streamId) {
	auto& stream = mStreams.at(streamId);
	{
		lock_guard<mutex> lock{mMutex};
		mRequestsReceived.push(make_shared<Request>(stream.request));
	}

	const auto answer = mHandler(stream.request);
	switch (answer.action) {
		case Answer::Action::Ignore:
			return;
		case Answer::Action::Reset:
			nghttp2_submit_rst_stream(mSession, NGHTTP2_FLAG_NONE, streamId, NGHTTP2_REFUSED_STREAM);
			return;
		case Answer::Action::RespondAndGoAway:
			nghttp2_submit_goaway(mSession, NGHTTP2_FLAG_NONE, streamId, NGHTTP2_NO_ERROR, nullptr, 0);
			break;
		case Answer::Action::Respond:
			break;
	}

	HttpHeaders headers{{":status", to_string(answer.status)}};
	headers.concat(answer.headers);
	const auto nva = headers.makeCHeaderList();
	stream.responseBody = answer.body;
	nghttp2_data_provider provider{};
	provider.source.ptr = &stream;
	provider.read_callback = readBody;
	nghttp2_submit_response(mSession, streamId, nva.data(), nva.size(), answer.body.empty() ? nullptr : &provider);
}

ssize_t Http2MockServer::onSend(nghttp2_session*, const uint8_t* data, size_t length, int, void* userData) {
	auto& thiz = *static_cast<Http2MockServer*>(userData);
	size_t written = 0;
	while (written < length) {
		const auto nwritten = SSL_write(thiz.mSsl, data + written, static_cast<int>(length - written));
		if (nwritten <= 0) return NGHTTP2_ERR_CALLBACK_FAILURE;
		written += nwritten;
	}
	return static_cast<ssize_t>(length);
}

int Http2MockServer::onBeginHeaders(nghttp2_session*, const nghttp2_frame* frame, void* userData) {
	auto& thiz = *static_cast<Http2MockServer*>(userData);
	if (frame->hd.type == NGHTTP2_HEADERS && frame->headers.cat == NGHTTP2_HCAT_REQUEST) {
		thiz.mStreams.try_emplace(frame->hd.stream_id);
	}
	return 0;
}

int Http2MockServer::onHeader(nghttp2_session*,
                              const nghttp2_frame* frame,
                              const uint8_t* name,
                              size_t namelen,
                              const uint8_t* value,
                              size_t valuelen,
                              uint8_t,
                              void* userData) {
	auto& thiz = *static_cast<Http2MockServer*>(userData);
	auto stream = thiz.mStreams.find(frame->hd.stream_id);
	if (stream != thiz.mStreams.end()) {
		stream->second.request.headers.add(string{reinterpret_cast<const char*>(name), namelen},
		                                   string{reinterpret_cast<const char*>(value), valuelen});
	}
	return 0;
}

int Http2MockServer::onDataChunk(
    nghttp2_session*, uint8_t, int32_t streamId, const uint8_t* data, size_t len, void* userData) {
	auto& thiz = *static_cast<Http2MockServer*>(userData);
	auto stream = thiz.mStreams.find(streamId);
	if (stream != thiz.mStreams.end()) {
		stream->second.request.body.append(reinterpret_cast<const char*>(data), len);
	}
	return 0;
}

int Http2MockServer::onFrameRecv(nghttp2_session*, const nghttp2_frame* frame, void* userData) {
	auto& thiz = *static_cast<Http2MockServer*>(userData);
	const auto isRequestEnd = (frame->hd.type == NGHTTP2_HEADERS || frame->hd.type == NGHTTP2_DATA) &&
	                          (frame->hd.flags & NGHTTP2_FLAG_END_STREAM) != 0;
	if (isRequestEnd && thiz.mStreams.count(frame->hd.stream_id) != 0) thiz.onRequest(frame->hd.stream_id);
	return 0;
}

int Http2MockServer::onStreamClose(nghttp2_session*, int32_t streamId, uint32_t errorCode, void* userData) {
	auto& thiz = *static_cast<Http2MockServer*>(userData);
	if (errorCode != NGHTTP2_NO_ERROR) {
		SLOGD << "Http2MockServer[" << streamId << "]: stream reset with error code [" << errorCode << "]";
		thiz.mResetStreams++;
	}
	thiz.mStreams.erase(streamId);
	return 0;
}

ssize_t Http2MockServer::readBody(nghttp2_session*,
                                  int32_t,
                                  uint8_t* buf,
                                  size_t length,
                                  uint32_t* dataFlags,
                                  nghttp2_data_source* source,
                                  void*) {
	auto& stream = *static_cast<Stream*>(source->ptr);
	const auto count = min(length, stream.responseBody.size() - stream.offset);
	memcpy(buf, stream.responseBody.data() + stream.offset, count);
	stream.offset += count;
	if (stream.offset == stream.responseBody.size()) *dataFlags |= NGHTTP2_DATA_FLAG_EOF;
	return static_cast<ssize_t>(count);
}

} // namespace apnclient::tester
