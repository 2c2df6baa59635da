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

#include <cstdint>
#include <ostream>
#include <string>

namespace apnclient::pushnotification {

/**
 * Host and port of an APNs server.
 */
class Endpoint {
public:
	static constexpr const char* kProductionHost = "api.push.apple.com";
	static constexpr const char* kDevelopmentHost = "api.sandbox.push.apple.com";
	static constexpr std::uint16_t kDefaultPort = 443;
	static constexpr std::uint16_t kAlternatePort = 2197;

	static Endpoint production() {
		return Endpoint{kProductionHost, kDefaultPort};
	}
	static Endpoint productionAlternate() {
		return Endpoint{kProductionHost, kAlternatePort};
	}
	static Endpoint development() {
		return Endpoint{kDevelopmentHost, kDefaultPort};
	}
	static Endpoint developmentAlternate() {
		return Endpoint{kDevelopmentHost, kAlternatePort};
	}

	/**
	 * Parse a 'host:port' string.
	 * @throw std::invalid_argument if the string is not made of exactly two ':'-separated parts or if the port is not
	 * a number between 0 and 65535.
	 */
	static Endpoint fromString(const std::string& str);

	Endpoint() : Endpoint(production()) {
	}
	Endpoint(const std::string& host, std::uint16_t port) : mHost(host), mPort(port) {
	}

	const std::string& getHost() const {
		return mHost;
	}
	std::uint16_t getPort() const {
		return mPort;
	}

	/**
	 * @return the 'host:port' form of this endpoint, which fromString() parses back.
	 */
	std::string toString() const;
	/**
	 * @return 'https://host:port'
	 */
	std::string getUrl() const;

	bool operator==(const Endpoint& other) const {
		return mHost == other.mHost && mPort == other.mPort;
	}
	bool operator!=(const Endpoint& other) const {
		return !(*this == other);
	}

private:
	std::string mHost;
	std::uint16_t mPort;
};

std::ostream& operator<<(std::ostream& os, const Endpoint& endpoint);

} // namespace apnclient::pushnotification
