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
#include <optional>
#include <string>
#include <string_view>

namespace apnclient::pushnotification {

/**
 * A provider authentication token together with the instant it was signed.
 */
struct CachedToken {
	std::string token{};
	std::chrono::system_clock::time_point issuedAt{};
};

/**
 * Produce the JSON Web Token sent in the 'authorization' header of every APNs request.
 * The token is signed with ES256 using the .p8 key of the developer account, then re-used until it is 20 minutes old
 * (Apple rejects tokens older than one hour and throttles those refreshed more than once every 20 minutes).
 */
class TokenSigner {
public:
	static constexpr std::chrono::minutes kRefreshThreshold{20};

	/**
	 * @param teamId the 10-character Team ID of the developer account, used as issuer
	 * @param keyId identifier of the signing key, sent as 'kid'
	 * @param pemKey PEM-encoded EC private key (content of the .p8 file)
	 * @throw InitializeError if 'pemKey' cannot be parsed or is not an EC key.
	 */
	TokenSigner(const std::string& teamId, const std::string& keyId, const std::string& pemKey);
	virtual ~TokenSigner() = default;

	/**
	 * @return the cached token if it is younger than kRefreshThreshold, a freshly signed one otherwise.
	 * @throw SignError if the signature could not be computed.
	 * @throw SystemTimeError if the clock reads a date before the Unix epoch or before the date of the cached token.
	 */
	const std::string& sign();

	const std::optional<CachedToken>& getCachedToken() const {
		return mCache;
	}
	const std::string& getTeamId() const {
		return mTeamId;
	}
	const std::string& getKeyId() const {
		return mKeyId;
	}

protected:
	virtual std::chrono::system_clock::time_point now() const;
	/**
	 * Sign a new token claiming 'issuedAt' (in seconds since the Unix epoch) as its issue date.
	 */
	virtual std::string doSign(std::uint64_t issuedAt) const;

private:
	static constexpr std::string_view mLogPrefix{"TokenSigner"};

	std::string mTeamId;
	std::string mKeyId;
	std::string mPemKey;
	std::optional<CachedToken> mCache{};
};

} // namespace apnclient::pushnotification
