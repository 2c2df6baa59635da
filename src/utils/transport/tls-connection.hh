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
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <openssl/ssl.h>

namespace apnclient {

/**
 * A blocking TLS connection built over the OpenSSL BIO API.
 */
class TlsConnection {
public:
	struct SSLCtxDeleter {
		void operator()(SSL_CTX* ssl) noexcept {
			SSL_CTX_free(ssl);
		}
	};
	using SSLCtxUniquePtr = std::unique_ptr<SSL_CTX, SSLCtxDeleter>;

	class CreationError : public std::runtime_error {
	public:
		explicit CreationError(const std::string& message)
		    : std::runtime_error("failed to create TLSConnection, reason = " + message) {
		}
	};

	/**
	 * @brief Instantiate a new TLS connection. The peer certificate is always verified.
	 *
	 * @param host other end hostname, also sent as SNI
	 * @param port other end port
	 * @param trustStorePath path to a CA file, leave empty to use the system default trust store
	 * @param mustBeHttp2 whether or not to negotiate HTTP/2 through ALPN
	 */
	TlsConnection(const std::string& host,
	              const std::string& port,
	              const std::string& trustStorePath = "",
	              bool mustBeHttp2 = false);

	TlsConnection(const TlsConnection&) = delete;
	TlsConnection(TlsConnection&&) = delete;

	const std::string& getHost() const noexcept {
		return mHost;
	}
	const std::string& getPort() const noexcept {
		return mPort;
	}

	/**
	 * @brief Establish connection with the other end.
	 *
	 * @note You can customize the connection timeout using setTimeout().
	 * @details The connection is established with all furthers I/O set as non-blocking.
	 * @warning This is a blocking operation.
	 * @throw std::runtime_error if the connection, the handshake or the certificate verification failed.
	 */
	void connect();
	void disconnect() noexcept;

	bool isConnected() const noexcept {
		return mBio != nullptr;
	}

	int getFd() const noexcept;

	/**
	 * @brief Attempt to read data from file descriptor.
	 *
	 * @return number of bytes read from file descriptor. A value of zero means "retry later": the socket may be empty
	 * or there were not enough data to form a complete TLS message. A negative value means the connection is broken.
	 */
	int read(void* data, int dlen) noexcept;

	/**
	 * @brief Attempt to write data to file descriptor.
	 *
	 * @return number of bytes written to file descriptor. If -1, an error occurred. If 0, retry later.
	 */
	int write(const void* data, int dlen) noexcept;

	/**
	 * Execute poll() on file descriptor for given amount of time to check if there are data to read.
	 *
	 * @param timeout amount of time for an event to occur. If 0, executes without blocking.
	 * @warning this can be a blocking operation.
	 * @throw std::runtime_error if poll() failed.
	 * @return true if there are data to read from the socket.
	 */
	bool waitForData(std::chrono::milliseconds timeout) const;

	/**
	 * @return true if the TLS layer holds already decrypted data that poll() cannot see.
	 */
	bool hasPendingData() const noexcept;

	/**
	 * Set connection timeout used when connecting to the other end.
	 */
	void setTimeout(const std::chrono::milliseconds& timeout) {
		mTimeout = timeout;
	}

private:
	struct BIODeleter {
		void operator()(BIO* bio) {
			BIO_free_all(bio);
		}
	};
	using BIOUniquePtr = std::unique_ptr<BIO, BIODeleter>;

	static std::string formatBioError(const std::string& msg, int status);
	static int handleVerifyCallback(int preverifyOk, X509_STORE_CTX* ctx);
	static SSLCtxUniquePtr makeDefaultCtx();

	BIOUniquePtr mBio{nullptr};
	SSLCtxUniquePtr mCtx{nullptr};
	std::string mHost{}, mPort{};
	bool mMustBeHttp2 = false;
	std::chrono::milliseconds mTimeout{20000};
	std::string mLogPrefix{};
};

} // namespace apnclient
