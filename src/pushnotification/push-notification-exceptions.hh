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

#include <stdexcept>
#include <string>

#include "utils/json/json-object.hh"

namespace apnclient::pushnotification {

/*
 * Base exception for all push notification related exceptions.
 */
class PushNotificationException : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/*
 * Report that the client could not be constructed: the private key is unusable or the transport could not be set up.
 */
class InitializeError : public PushNotificationException {
public:
	using PushNotificationException::PushNotificationException;
};

/*
 * Report that caller-supplied data could not be turned into a JSON object while building a payload.
 */
class BuildError : public PushNotificationException {
public:
	explicit BuildError(const NotAnObjectError& cause)
	    : PushNotificationException{std::string{"cannot convert custom data to a JSON object: "} + cause.what()} {
	}
	using PushNotificationException::PushNotificationException;
};

class SignError : public PushNotificationException {
public:
	using PushNotificationException::PushNotificationException;
};

/*
 * Report that the system clock cannot be used to date a token: it is set before the epoch or it went backwards.
 */
class SystemTimeError : public PushNotificationException {
public:
	using PushNotificationException::PushNotificationException;
};

/*
 * Report that a value cannot be carried by an HTTP/2 request header.
 */
class HeaderError : public PushNotificationException {
public:
	HeaderError(const std::string& name, const std::string& value)
	    : PushNotificationException{"invalid value for header '" + name + "': '" + value + "'"} {
	}
};

/*
 * Report a network, TLS, protocol or timeout failure of the underlying transport.
 */
class TransportError : public PushNotificationException {
public:
	using PushNotificationException::PushNotificationException;
};

class InvalidResponseError : public PushNotificationException {
public:
	using PushNotificationException::PushNotificationException;
};

/*
 * Report that a response header value is not printable text.
 */
class HeaderDecodeError : public PushNotificationException {
public:
	explicit HeaderDecodeError(const std::string& name)
	    : PushNotificationException{"value of response header '" + name + "' is not valid text"} {
	}
};

} // namespace apnclient::pushnotification
