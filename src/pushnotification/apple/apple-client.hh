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
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "apple-endpoint.hh"
#include "apple-payload.hh"
#include "apple-push-options.hh"
#include "apple-token-signer.hh"
#include "pushnotification/push-notification-exceptions.hh"
#include "utils/transport/http/http-transport.hh"

namespace apnclient {
namespace pushnotification {

/**
 * Credentials of the developer account and the APNs server to talk to.
 */
struct ClientIdentity {
	std::string teamId{};
	std::string keyId{};
	std::string key{}; // PEM content of the .p8 key file
	Endpoint endpoint{};
};

/**
 * Identifiers APNs attaches to an accepted notification.
 */
struct PushReceipt {
	std::string id{};
	std::optional<std::string> uniqueId{}; // only sent by the development environment
};

/**
 * Body of an APNs error response.
 */
struct ErrorResponse {
	std::string reason{};
	std::optional<std::int64_t> timestamp{}; // milliseconds since the epoch, set with 410 'Unregistered'
};

void from_json(const nlohmann::json& j, ErrorResponse& response);

/*
 * Report that APNs refused the notification.
 */
class ServiceError : public PushNotificationException {
public:
	ServiceError(int statusCode, const ErrorResponse& error, const PushReceipt& receipt);

	int getStatusCode() const noexcept {
		return mStatusCode;
	}
	const ErrorResponse& getErrorResponse() const noexcept {
		return mError;
	}
	const PushReceipt& getReceipt() const noexcept {
		return mReceipt;
	}

private:
	int mStatusCode;
	ErrorResponse mError;
	PushReceipt mReceipt;
};

/**
 * Client of the APNs provider API using token-based authentication.
 * A client owns its token cache and its connection: push() must not be called concurrently on the same instance.
 */
class AppleClient {
public:
	/**
	 * Connect to the endpoint of 'identity' through an HTTP/2 over TLS transport.
	 * @throw InitializeError if the private key is unusable or if the transport cannot be created.
	 */
	explicit AppleClient(const ClientIdentity& identity);
	/**
	 * @throw InitializeError if the private key is unusable.
	 */
	AppleClient(const ClientIdentity& identity, const std::shared_ptr<HttpTransport>& transport);
	AppleClient(const ClientIdentity& identity,
	            std::unique_ptr<TokenSigner>&& signer,
	            const std::shared_ptr<HttpTransport>& transport);

	/**
	 * Send 'payload' to the device identified by 'deviceToken' and wait for the answer of APNs.
	 *
	 * @throw HeaderError if an option cannot be sent as a header. Nothing is sent in that case.
	 * @throw BuildError if the payload cannot be serialized. Nothing is sent in that case.
	 * @throw SignError, SystemTimeError if the provider token could not be refreshed.
	 * @throw TransportError if no response could be received.
	 * @throw HeaderDecodeError if a response header is not valid text.
	 * @throw InvalidResponseError if 'apns-id' is missing or if the body of an error response cannot be decoded.
	 * @throw ServiceError if APNs answered with an error status.
	 */
	PushReceipt push(const Payload& payload, const std::string& deviceToken, const PushOptions& options);

	/**
	 * Set the maximum time to wait for the response of one push, 30s by default.
	 */
	void setRequestTimeout(std::chrono::seconds requestTimeout);

	const Endpoint& getEndpoint() const noexcept {
		return mIdentity.endpoint;
	}
	const TokenSigner& getTokenSigner() const noexcept {
		return *mSigner;
	}

private:
	static std::shared_ptr<HttpTransport> makeTransport(const Endpoint& endpoint);
	static std::optional<std::string> readHeader(const HttpResponse& response, const std::string& name);

	ClientIdentity mIdentity;
	std::unique_ptr<TokenSigner> mSigner;
	std::shared_ptr<HttpTransport> mTransport;
	std::string mLogPrefix{};
};

} // namespace pushnotification
} // namespace apnclient
