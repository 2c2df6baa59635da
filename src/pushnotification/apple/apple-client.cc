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

#include "apple-client.hh"

#include "apnclient/logmanager.hh"
#include "pushnotification/apple/apple-request.hh"
#include "utils/string-utils.hh"
#include "utils/transport/http/http2client.hh"

using namespace std;

namespace apnclient {
namespace pushnotification {

void from_json(const nlohmann::json& j, ErrorResponse& response) {
	j.at("reason").get_to(response.reason);
	if (j.contains("timestamp") && !j.at("timestamp").is_null()) {
		response.timestamp = j.at("timestamp").get<int64_t>();
	}
}

ServiceError::ServiceError(int statusCode, const ErrorResponse& error, const PushReceipt& receipt)
    : PushNotificationException{"APNs rejected notification[" + receipt.id + "] with status " +
                                to_string(statusCode) + " (" + error.reason + ")"},
      mStatusCode(statusCode), mError(error), mReceipt(receipt) {
}

AppleClient::AppleClient(const ClientIdentity& identity)
    : AppleClient(identity, make_unique<TokenSigner>(identity.teamId, identity.keyId, identity.key), nullptr) {
	mTransport = makeTransport(mIdentity.endpoint);
}

AppleClient::AppleClient(const ClientIdentity& identity, const shared_ptr<HttpTransport>& transport)
    : AppleClient(identity, make_unique<TokenSigner>(identity.teamId, identity.keyId, identity.key), transport) {
}

AppleClient::AppleClient(const ClientIdentity& identity,
                         unique_ptr<TokenSigner>&& signer,
                         const shared_ptr<HttpTransport>& transport)
    : mIdentity(identity), mSigner(std::move(signer)), mTransport(transport) {
	mLogPrefix = LogManager::makeLogPrefixForInstance(this, "AppleClient");
	LOGD << "Constructing AppleClient for " << mIdentity.endpoint;
}

shared_ptr<HttpTransport> AppleClient::makeTransport(const Endpoint& endpoint) {
	try {
		return make_shared<Http2Client>(endpoint.getHost(), to_string(endpoint.getPort()));
	} catch (const runtime_error& e) {
		throw InitializeError{string{"cannot create HTTP/2 transport: "} + e.what()};
	}
}

PushReceipt AppleClient::push(const Payload& payload, const string& deviceToken, const PushOptions& options) {
	const auto& token = mSigner->sign();
	auto request = make_shared<AppleRequest>(mIdentity.endpoint, deviceToken, token, options, payload);

	shared_ptr<HttpResponse> response{};
	try {
		response = mTransport->send(request);
	} catch (const HttpTransportError& e) {
		LOGD << "Push to device[" << deviceToken << "] failed: " << e.what();
		throw TransportError{e.what()};
	}

	const auto id = readHeader(*response, "apns-id");
	if (!id) {
		throw InvalidResponseError{"'apns-id' header is missing from APNs response"};
	}
	const PushReceipt receipt{*id, readHeader(*response, "apns-unique-id")};

	int status = 0;
	try {
		status = response->getStatusCode();
	} catch (const runtime_error& e) {
		throw InvalidResponseError{e.what()};
	}
	if (status == 200) {
		LOGD << "Notification[" << receipt.id << "] accepted for device[" << deviceToken << "]";
		return receipt;
	}

	ErrorResponse error{};
	try {
		error = nlohmann::json::parse(response->getBodyAsString()).get<ErrorResponse>();
	} catch (const nlohmann::json::exception& e) {
		throw InvalidResponseError{"cannot decode APNs error response (status " + to_string(status) +
		                           "): " + e.what()};
	}
	LOGD << "Notification[" << receipt.id << "] rejected with status " << status << ": " << error.reason;
	throw ServiceError{status, error, receipt};
}

void AppleClient::setRequestTimeout(chrono::seconds requestTimeout) {
	mTransport->setRequestTimeout(requestTimeout);
}

optional<string> AppleClient::readHeader(const HttpResponse& response, const string& name) {
	auto value = response.getHeaders().get(name);
	if (value && !string_utils::isPrintableAscii(*value)) {
		throw HeaderDecodeError{name};
	}
	return value;
}

} // namespace pushnotification
} // namespace apnclient
