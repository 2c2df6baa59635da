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

#include "tls-connection.hh"

#include <cerrno>
#include <cstring>
#include <ostream>
#include <sstream>
#include <thread>

#include <poll.h>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include "apnclient/logmanager.hh"

using namespace std;

namespace apnclient {

TlsConnection::TlsConnection(const string& host, const string& port, const string& trustStorePath, bool mustBeHttp2)
    : mHost{host}, mPort{port}, mMustBeHttp2{mustBeHttp2} {
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "TlsConnection");

	auto ctx = makeDefaultCtx();
	if (ctx == nullptr) throw CreationError{"SSL_CTX_new() failed"};

	SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, handleVerifyCallback);

	const auto loaded = trustStorePath.empty()
	                        ? SSL_CTX_set_default_verify_paths(ctx.get())
	                        : SSL_CTX_load_verify_locations(ctx.get(), trustStorePath.c_str(), nullptr);
	if (!loaded) {
		throw CreationError{formatBioError("error loading trust store '" + trustStorePath + "'", loaded)};
	}

	mCtx = std::move(ctx);
}

void TlsConnection::connect() {
	if (isConnected()) return;

	/* Create and setup the connection */
	auto hostname = mHost + ":" + mPort;
	SSL* ssl = nullptr;

	BIOUniquePtr newBio{BIO_new_ssl_connect(mCtx.get())};
	if (newBio == nullptr) throw runtime_error{formatBioError("BIO_new_ssl_connect() failed", 0)};
	BIO_set_conn_hostname(newBio.get(), hostname.c_str());
	BIO_get_ssl(newBio.get(), &ssl);
	SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
	SSL_set_options(ssl, SSL_OP_ALL);
	SSL_set_tlsext_host_name(ssl, mHost.c_str());
	SSL_set1_host(ssl, mHost.c_str());
	if (mMustBeHttp2) {
		unsigned char protos[] = {2, 'h', '2'};
		unsigned int protos_len = sizeof(protos);
		SSL_set_alpn_protos(ssl, protos, protos_len);
	}
	BIO_set_nbio(newBio.get(), 1);

	/* Ensure that the error queue is empty */
	ERR_clear_error();

	/* Do the connection by actively waiting for connection completion */
	auto status = 0;
	chrono::milliseconds time{0};
	const auto errmsg = "Error while connecting to tls://" + hostname;
	while (status <= 0) {
		status = BIO_do_handshake(newBio.get());
		if (status <= 0 && !BIO_should_retry(newBio.get())) {
			throw runtime_error{formatBioError(errmsg, status)};
		}
		if (status > 0) break;
		if (time >= mTimeout) {
			throw runtime_error{errmsg + ": timeout"};
		}

		constexpr chrono::milliseconds sleepDuration{10};
		this_thread::sleep_for(sleepDuration);
		time += sleepDuration;
	};

	/* Check the certificate */
	if (SSL_get_verify_result(ssl) != X509_V_OK) {
		throw runtime_error{string{"Certificate verification error: "} +
		                    X509_verify_cert_error_string(SSL_get_verify_result(ssl))};
	}

	if (mMustBeHttp2) {
		const unsigned char* alpn = nullptr;
		unsigned int alpnLen = 0;
		SSL_get0_alpn_selected(ssl, &alpn, &alpnLen);
		if (alpn == nullptr || alpnLen != 2 || memcmp("h2", alpn, 2) != 0) {
			throw runtime_error{errmsg + ": h2 is not negotiated"};
		}
	}

	LOGD << "Connected to " << hostname;
	mBio = std::move(newBio);
}

void TlsConnection::disconnect() noexcept {
	if (mBio) LOGD << "Disconnecting from " << mHost << ":" << mPort;
	mBio.reset();
}

int TlsConnection::getFd() const noexcept {
	if (mBio == nullptr) {
		return -1;
	}
	int fd = 0;
	ERR_clear_error();
	auto status = BIO_get_fd(mBio.get(), &fd);
	if (status < 0) {
		LOGE << formatBioError("getting fd from BIO failed", status);
		return -1;
	}
	return fd;
}

int TlsConnection::read(void* data, int dlen) noexcept {
	if (mBio == nullptr) return -1;
	ERR_clear_error();
	auto nread = BIO_read(mBio.get(), data, dlen);
	if (nread <= 0) {
		if (BIO_should_retry(mBio.get())) {
			// Either the socket was empty or there wasn't enough data to
			// form a complete TLS message. Return '0' to require the
			// upper code to try later.
			return 0;
		}
		// EOF or error: the other end closed the connection.
		LOGD << formatBioError("error while reading data", nread);
		disconnect();
		return -1;
	}
	return nread;
}

int TlsConnection::write(const void* data, int dlen) noexcept {
	if (mBio == nullptr) return -1;
	if (dlen <= 0) return 0;
	ERR_clear_error();
	auto nwritten = BIO_write(mBio.get(), data, dlen);
	if (nwritten <= 0) {
		if (BIO_should_retry(mBio.get())) {
			return 0;
		}
		LOGE << formatBioError("error while writing data", nwritten);
		return -1;
	}
	return nwritten;
}

bool TlsConnection::waitForData(chrono::milliseconds timeout) const {
	if (hasPendingData()) return true;

	pollfd polls = {0};
	polls.fd = this->getFd();
	polls.events = POLLIN;

	int ret;
	if ((ret = poll(&polls, 1, timeout.count())) < 0) {
		ostringstream err{};
		err << mLogPrefix << ": error during poll: " << strerror(errno);
		throw runtime_error(err.str());
	}

	return ret != 0;
}

bool TlsConnection::hasPendingData() const noexcept {
	if (mBio == nullptr) return false;
	return BIO_pending(mBio.get()) > 0;
}

TlsConnection::SSLCtxUniquePtr TlsConnection::makeDefaultCtx() {
	SSLCtxUniquePtr ctx{SSL_CTX_new(TLS_client_method())};
	if (ctx) SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
	return ctx;
}

string TlsConnection::formatBioError(const string& msg, int status) {
	ostringstream os;
	os << msg << ": " << status << " - " << strerror(errno) << " - SSL error stack:";
	ERR_print_errors_cb(
	    [](const char* str, [[maybe_unused]] size_t len, void* u) {
		    auto& os = *static_cast<ostream*>(u);
		    os << endl << '\t' << str;
		    return 0;
	    },
	    &os);
	return os.str();
}

int TlsConnection::handleVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx) {
	if (preverifyOk) return preverifyOk;

	char subject_name[256];
	X509* cert = X509_STORE_CTX_get_current_cert(ctx);
	if (!cert) {
		SLOGE << "No certificate found!";
		return 0;
	}
	X509_NAME_oneline(X509_get_subject_name(cert), subject_name, 256);

	int error = X509_STORE_CTX_get_error(ctx);
	switch (error) {
		case X509_V_ERR_CERT_NOT_YET_VALID:
		case X509_V_ERR_CRL_NOT_YET_VALID:
			SLOGE << "Certificate for " << subject_name << " is not yet valid. Push won't work.";
			break;
		case X509_V_ERR_CERT_HAS_EXPIRED:
		case X509_V_ERR_CRL_HAS_EXPIRED:
			SLOGE << "Certificate for " << subject_name << " is expired. Push won't work.";
			break;
		default: {
			const char* errString = X509_verify_cert_error_string(error);
			SLOGE << "Certificate for " << subject_name << " is invalid (reason: " << error << ": "
			      << (errString ? errString : "unknown") << "). Push won't work.";
			break;
		}
	}

	return 0;
}

} // namespace apnclient
