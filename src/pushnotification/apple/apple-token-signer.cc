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

#include "apple-token-signer.hh"

#include <memory>

#include <jwt/jwt.hpp>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include "apnclient/logmanager.hh"
#include "pushnotification/push-notification-exceptions.hh"

using namespace std;

namespace apnclient::pushnotification {

namespace {

struct BioDeleter {
	void operator()(BIO* b) {
		BIO_free(b);
	}
};

void checkPrivateKey(const string& pemKey) {
	unique_ptr<BIO, BioDeleter> bio{BIO_new_mem_buf(pemKey.data(), static_cast<int>(pemKey.size()))};
	if (!bio) throw InitializeError{"Unable to parse private key: cannot allocate memory buffer"};

	unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key{PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr),
	                                                   EVP_PKEY_free};
	if (!key) throw InitializeError{"Unable to parse private key: not a valid PEM private key"};
	if (EVP_PKEY_base_id(key.get()) != EVP_PKEY_EC) {
		throw InitializeError{"Unable to parse private key: ES256 requires an EC key"};
	}
}

} // namespace

TokenSigner::TokenSigner(const string& teamId, const string& keyId, const string& pemKey)
    : mTeamId(teamId), mKeyId(keyId), mPemKey(pemKey) {
	checkPrivateKey(mPemKey);
}

const string& TokenSigner::sign() {
	const auto current = now();
	if (current < chrono::system_clock::time_point{}) {
		throw SystemTimeError{"system clock is set before the Unix epoch"};
	}

	if (mCache) {
		if (current < mCache->issuedAt) {
			throw SystemTimeError{"system clock went back before the date of the cached token"};
		}
		if (current - mCache->issuedAt < kRefreshThreshold) return mCache->token;
	}

	const auto issuedAt =
	    static_cast<uint64_t>(chrono::duration_cast<chrono::seconds>(current.time_since_epoch()).count());
	auto token = doSign(issuedAt);
	mCache = CachedToken{std::move(token), current};
	LOGD << "New token signed [teamId: " << mTeamId << ", keyId: " << mKeyId << ", iat: " << issuedAt << "]";
	return mCache->token;
}

chrono::system_clock::time_point TokenSigner::now() const {
	return chrono::system_clock::now();
}

string TokenSigner::doSign(uint64_t issuedAt) const {
	jwt::jwt_object obj{jwt::params::algorithm("ES256"), jwt::params::secret(mPemKey)};
	obj.header().add_header("kid", mKeyId);
	obj.header().remove_header("typ");
	obj.add_claim("iss", mTeamId);
	obj.add_claim("iat", issuedAt);

	error_code ec{};
	auto token = obj.signature(ec);
	if (ec) throw SignError{"failed to sign token: " + ec.message()};
	return token;
}

} // namespace apnclient::pushnotification
