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

#include <atomic>
#include <chrono>
#include <cstring>
#include <memory>
#include <string>

#include "utils/http-mock/http2-mock-server.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"
#include "utils/transport/http/http-headers.hh"
#include "utils/transport/http/http-response.hh"
#include "utils/transport/http/http2client.hh"

using namespace std;
using namespace std::chrono_literals;
using namespace apnclient;
using namespace apnclient::tester;

namespace {

constexpr auto kApnsId = "EC1BF194-B3B2-424A-89A9-5A918A6E6B5E";

shared_ptr<HttpMessage> makeRequest(const Http2MockServer& server, const string& body = R"({"aps":{}})") {
	return make_shared<HttpMessage>(HttpHeaders{{":method", "POST"},
	                                            {":scheme", "https"},
	                                            {":authority", "127.0.0.1:" + server.getPort()},
	                                            {":path", "/3/device/abc"},
	                                            {"apns-topic", "org.example.app"}},
	                                body);
}

void headersReplaceSameName() {
	HttpHeaders headers{{"apns-topic", "first"}, {"apns-priority", "10"}};
	headers.add("apns-topic", "second");
	BC_ASSERT_CPP_EQUAL(headers.getHeadersList().size(), 2U);
	BC_ASSERT_CPP_EQUAL(headers.get("apns-topic").value_or(""), "second");
	BC_ASSERT_FALSE(headers.get("apns-id").has_value());

	HttpHeaders other{{"apns-priority", "5"}, {"apns-id", "id"}};
	headers.concat(other);
	BC_ASSERT_CPP_EQUAL(headers.getHeadersList().size(), 3U);
	BC_ASSERT_CPP_EQUAL(headers.get("apns-priority").value_or(""), "5");
	BC_ASSERT_CPP_EQUAL(headers.toString(), "apns-topic = second\napns-priority = 5\napns-id = id\n");
}

void nghttp2HeaderList() {
	HttpHeaders headers{{":method", "POST"}, {":path", "/3/device/abc"}};
	const auto cHeaders = headers.makeCHeaderList();
	BC_HARD_ASSERT_CPP_EQUAL(cHeaders.size(), 2U);
	BC_ASSERT_CPP_EQUAL(string(reinterpret_cast<const char*>(cHeaders[1].name), cHeaders[1].namelen), ":path");
	BC_ASSERT_CPP_EQUAL(string(reinterpret_cast<const char*>(cHeaders[1].value), cHeaders[1].valuelen),
	                    "/3/device/abc");
}

void responseStatusCode() {
	HttpResponse response{HttpHeaders{{":status", "410"}}, "{}"};
	BC_ASSERT_CPP_EQUAL(response.getStatusCode(), 410);
	BC_ASSERT_CPP_EQUAL(response.getBodyAsString(), "{}");

	for (const auto* status : {"", "abc", "20O", "99", "600", "-200"}) {
		HttpResponse invalid{HttpHeaders{{":status", status}}, ""};
		BC_ASSERT_THROWN(invalid.getStatusCode(), runtime_error);
	}
	BC_ASSERT_THROWN(HttpResponse{}.getStatusCode(), runtime_error);
}

void messageBody() {
	HttpMessage message{};
	message.setBody("{\"aps\":");
	message.appendBody("{}}");
	BC_ASSERT_CPP_EQUAL(message.getBodyAsString(), R"({"aps":{}})");
	BC_ASSERT_CPP_EQUAL(message.getBody().size(), 10U);
	BC_ASSERT_TRUE(message.getCDataProvider() != nullptr);
}

void requestTimeout() {
	Http2Client client{"localhost", "443"};
	BC_ASSERT(client.getRequestTimeout() == 30s);
	client.setRequestTimeout(1500ms);
	BC_ASSERT(client.getRequestTimeout() == 1500ms);
	BC_ASSERT_CPP_EQUAL(client.getHost(), "localhost");
	BC_ASSERT_FALSE(client.isConnected());
}

/*
 * Nothing listens on port 1 of the loopback interface: the connection is refused.
 */
void connectionRefused() {
	Http2Client client{"127.0.0.1", "1"};
	client.setRequestTimeout(2s);
	auto request = make_shared<HttpMessage>(
	    HttpHeaders{{":method", "POST"}, {":scheme", "https"}, {":authority", "127.0.0.1:1"}, {":path", "/"}}, "{}");
	BC_ASSERT_THROWN(client.send(request), HttpTransportError);
	BC_ASSERT_FALSE(client.isConnected());
}

/*
 * The response spans several DATA frames. The connection is kept for the next request.
 */
void responseReceived() {
	const string largeBody = string(40000, 'a') + "end";
	Http2MockServer server{[&largeBody](const Request&) {
		return Answer::respond(200, HttpHeaders{{"apns-id", kApnsId}}, largeBody);
	}};
	Http2Client client{"127.0.0.1", server.getPort(), server.getTrustStorePath()};
	client.setRequestTimeout(5s);

	const auto response = client.send(makeRequest(server, R"({"aps":{"badge":1}})"));
	BC_ASSERT_CPP_EQUAL(response->getStatusCode(), 200);
	BC_ASSERT_CPP_EQUAL(response->getHeaders().get("apns-id").value_or(""), kApnsId);
	BC_ASSERT_CPP_EQUAL(response->getBody().size(), largeBody.size());
	BC_ASSERT_TRUE(response->getBodyAsString() == largeBody);
	BC_ASSERT_TRUE(client.isConnected());

	const auto request = server.popRequestReceived();
	BC_HARD_ASSERT(request != nullptr);
	BC_ASSERT_CPP_EQUAL(request->headers.get(":method").value_or(""), "POST");
	BC_ASSERT_CPP_EQUAL(request->headers.get(":path").value_or(""), "/3/device/abc");
	BC_ASSERT_CPP_EQUAL(request->headers.get("apns-topic").value_or(""), "org.example.app");
	BC_ASSERT_CPP_EQUAL(request->body, R"({"aps":{"badge":1}})");

	BC_ASSERT_CPP_EQUAL(client.send(makeRequest(server))->getStatusCode(), 200);
	BC_ASSERT_CPP_EQUAL(server.getAcceptedConnectionsCount(), 1);
}

void errorStatusIsNotATransportError() {
	Http2MockServer server{[](const Request&) {
		return Answer::respond(410, HttpHeaders{{"apns-id", kApnsId}}, R"({"reason":"Unregistered"})");
	}};
	Http2Client client{"127.0.0.1", server.getPort(), server.getTrustStorePath()};
	client.setRequestTimeout(5s);

	const auto response = client.send(makeRequest(server));
	BC_ASSERT_CPP_EQUAL(response->getStatusCode(), 410);
	BC_ASSERT_CPP_EQUAL(response->getBodyAsString(), R"({"reason":"Unregistered"})");
}

/*
 * The request is reset on timeout. The connection survives and serves the next request.
 */
void unansweredRequestTimesOut() {
	atomic_int requestCount{0};
	Http2MockServer server{[&requestCount](const Request&) {
		return requestCount++ == 0 ? Answer::ignore() : Answer::respond(200, HttpHeaders{{"apns-id", kApnsId}});
	}};
	Http2Client client{"127.0.0.1", server.getPort(), server.getTrustStorePath()};
	client.setRequestTimeout(500ms);

	auto request = makeRequest(server);
	weak_ptr<HttpMessage> unanswered = request;
	BC_ASSERT_THROWN(client.send(request), HttpTransportError);
	BC_ASSERT_TRUE(client.isConnected());
	request.reset();

	client.setRequestTimeout(5s);
	const auto response = client.send(makeRequest(server));
	BC_ASSERT_CPP_EQUAL(response->getStatusCode(), 200);
	BC_ASSERT_CPP_EQUAL(server.getAcceptedConnectionsCount(), 1);
	BC_ASSERT_CPP_EQUAL(server.getResetStreamsCount(), 1);
	// Released once the reset stream is closed.
	BC_ASSERT_TRUE(unanswered.expired());
}

/*
 * The response sent with a GOAWAY frame is delivered, then the connection is closed and a new one is opened for the
 * next request.
 */
void goAwayClosesConnection() {
	Http2MockServer server{
	    [](const Request&) { return Answer::respondAndGoAway(200, HttpHeaders{{"apns-id", kApnsId}}); }};
	Http2Client client{"127.0.0.1", server.getPort(), server.getTrustStorePath()};
	client.setRequestTimeout(5s);

	const auto response = client.send(makeRequest(server));
	BC_ASSERT_CPP_EQUAL(response->getStatusCode(), 200);
	BC_ASSERT_CPP_EQUAL(response->getHeaders().get("apns-id").value_or(""), kApnsId);
	BC_ASSERT_FALSE(client.isConnected());

	BC_ASSERT_CPP_EQUAL(client.send(makeRequest(server))->getStatusCode(), 200);
	BC_ASSERT_CPP_EQUAL(server.getAcceptedConnectionsCount(), 2);
}

void resetStream() {
	Http2MockServer server{[](const Request&) { return Answer::reset(); }};
	Http2Client client{"127.0.0.1", server.getPort(), server.getTrustStorePath()};
	client.setRequestTimeout(5s);

	BC_ASSERT_THROWN(client.send(makeRequest(server)), HttpTransportError);
	// Only the stream failed.
	BC_ASSERT_TRUE(client.isConnected());
}

void untrustedServerCertificate() {
	Http2MockServer server{[](const Request&) { return Answer::respond(200); }};
	Http2Client client{"127.0.0.1", server.getPort()};
	client.setRequestTimeout(5s);

	BC_ASSERT_THROWN(client.send(makeRequest(server)), HttpTransportError);
	BC_ASSERT_FALSE(client.isConnected());
	BC_ASSERT_TRUE(server.popRequestReceived() == nullptr);
}

TestSuite _("Http2Client",
            {
                CLASSY_TEST(headersReplaceSameName),
                CLASSY_TEST(nghttp2HeaderList),
                CLASSY_TEST(responseStatusCode),
                CLASSY_TEST(messageBody),
                CLASSY_TEST(requestTimeout),
                CLASSY_TEST(connectionRefused),
                CLASSY_TEST(responseReceived),
                CLASSY_TEST(errorStatusIsNotATransportError),
                CLASSY_TEST(unansweredRequestTimesOut),
                CLASSY_TEST(goAwayClosesConnection),
                CLASSY_TEST(resetStream),
                CLASSY_TEST(untrustedServerCertificate),
            });

} // namespace
