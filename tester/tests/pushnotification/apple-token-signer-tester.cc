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

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/pem.h>

#include "ec-keys.hh"
#include "pushnotification/apple/apple-token-signer.hh"
#include "pushnotification/push-notification-exceptions.hh"
#include "utils/string-utils.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace std::chrono_literals;
using namespace apnclient;
using namespace apnclient::tester;
using namespace apnclient::pushnotification;

namespace {

constexpr auto kTeamId = "TEAM123456";
constexpr auto kKeyId = "KEY1234567";
constexpr uint64_t kStartDate = 1700000000;

/**
 * A TokenSigner whose clock is set by the test, and which counts the signatures it computes.
 */
class ManualClockSigner : public TokenSigner {
public:
	using TokenSigner::TokenSigner;

	void advance(chrono::seconds duration) {
		mClock += duration;
	}
	void setClock(chrono::system_clock::time_point date) {
		mClock = date;
	}
	chrono::system_clock::time_point getClock() const {
		return mClock;
	}
	int getSignCount() const {
		return mSignCount;
	}

protected:
	chrono::system_clock::time_point now() const override {
		return mClock;
	}
	string doSign(uint64_t issuedAt) const override {
		mSignCount++;
		return TokenSigner::doSign(issuedAt);
	}

private:
	chrono::system_clock::time_point mClock{chrono::seconds{kStartDate}};
	mutable int mSignCount{0};
};

struct DecodedToken {
	nlohmann::json header{};
	nlohmann::json claims{};
	string signingInput{};
	string signature{};
};

string base64UrlDecode(string_view encoded) {
	string base64{encoded};
	replace(base64.begin(), base64.end(), '-', '+');
	replace(base64.begin(), base64.end(), '_', '/');
	const auto padding = (4 - base64.size() % 4) % 4;
	base64.append(padding, '=');

	string decoded(base64.size() / 4 * 3, '\0');
	const auto length = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
	                                    reinterpret_cast<const unsigned char*>(base64.data()),
	                                    static_cast<int>(base64.size()));
	BC_HARD_ASSERT(length >= static_cast<int>(padding));
	decoded.resize(length - padding);
	return decoded;
}

DecodedToken decode(const string& token) {
	const auto parts = string_utils::split(string_view{token}, ".");
	BC_HARD_ASSERT_CPP_EQUAL(parts.size(), 3U);

	DecodedToken decoded{};
	decoded.header = nlohmann::json::parse(base64UrlDecode(parts[0]));
	decoded.claims = nlohmann::json::parse(base64UrlDecode(parts[1]));
	decoded.signingInput = string{parts[0]} + "." + string{parts[1]};
	decoded.signature = base64UrlDecode(parts[2]);
	return decoded;
}

/**
 * Check a JWS ES256 signature, made of the raw 32-byte 'r' and 's' values, against kEcPubKey.
 */
bool verifySignature(const DecodedToken& token) {
	if (token.signature.size() != 64) return false;
	const auto* raw = reinterpret_cast<const unsigned char*>(token.signature.data());

	unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig{ECDSA_SIG_new(), ECDSA_SIG_free};
	BC_HARD_ASSERT_NOT_NULL(sig.get());
	BC_HARD_ASSERT(ECDSA_SIG_set0(sig.get(), BN_bin2bn(raw, 32, nullptr), BN_bin2bn(raw + 32, 32, nullptr)) == 1);

	unsigned char* der = nullptr;
	const auto derLength = i2d_ECDSA_SIG(sig.get(), &der);
	BC_HARD_ASSERT(derLength > 0);
	unique_ptr<unsigned char, void (*)(unsigned char*)> derOwner{der, [](unsigned char* p) { OPENSSL_free(p); }};

	unique_ptr<BIO, decltype(&BIO_free)> bio{BIO_new_mem_buf(kEcPubKey, -1), BIO_free};
	unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key{PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr),
	                                                   EVP_PKEY_free};
	BC_HARD_ASSERT_NOT_NULL(key.get());

	unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), EVP_MD_CTX_free};
	BC_HARD_ASSERT(EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get()) == 1);
	return EVP_DigestVerify(ctx.get(), der, derLength,
	                        reinterpret_cast<const unsigned char*>(token.signingInput.data()),
	                        token.signingInput.size()) == 1;
}

void invalidKeys() {
	BC_ASSERT_THROWN(TokenSigner(kTeamId, kKeyId, ""), InitializeError);
	BC_ASSERT_THROWN(TokenSigner(kTeamId, kKeyId, "not a PEM key"), InitializeError);
	// ES256 requires a key on an elliptic curve.
	BC_ASSERT_THROWN(TokenSigner(kTeamId, kKeyId, kRsaPrivKey), InitializeError);
	// A public key cannot sign anything.
	BC_ASSERT_THROWN(TokenSigner(kTeamId, kKeyId, kEcPubKey), InitializeError);
}

void tokenContent() {
	ManualClockSigner signer{kTeamId, kKeyId, kEcPrivKey};
	BC_ASSERT_FALSE(signer.getCachedToken().has_value());

	const auto token = decode(signer.sign());

	BC_ASSERT_CPP_EQUAL(token.header.value("alg", ""), "ES256");
	BC_ASSERT_CPP_EQUAL(token.header.value("kid", ""), kKeyId);
	BC_ASSERT_FALSE(token.header.contains("typ"));

	BC_ASSERT_CPP_EQUAL(token.claims.value("iss", ""), kTeamId);
	BC_HARD_ASSERT(token.claims.contains("iat"));
	BC_ASSERT_CPP_EQUAL(token.claims["iat"].get<uint64_t>(), kStartDate);
	BC_ASSERT_CPP_EQUAL(token.claims.size(), 2U);

	BC_ASSERT_TRUE(verifySignature(token));

	BC_HARD_ASSERT(signer.getCachedToken().has_value());
	BC_ASSERT(signer.getCachedToken()->issuedAt == signer.getClock());
}

void tokenIsReusedForTwentyMinutes() {
	ManualClockSigner signer{kTeamId, kKeyId, kEcPrivKey};

	const auto first = signer.sign();
	BC_ASSERT_CPP_EQUAL(signer.sign(), first);
	signer.advance(19min + 59s);
	BC_ASSERT_CPP_EQUAL(signer.sign(), first);
	BC_ASSERT_CPP_EQUAL(signer.getSignCount(), 1);

	// A token exactly 20 minutes old is replaced.
	signer.advance(1s);
	const auto second = signer.sign();
	BC_ASSERT_CPP_NOT_EQUAL(second, first);
	BC_ASSERT_CPP_EQUAL(signer.getSignCount(), 2);
	BC_ASSERT_CPP_EQUAL(decode(second).claims["iat"].get<uint64_t>(), kStartDate + 20 * 60);
}

void tokenIsRefreshedAfterExpiry() {
	ManualClockSigner signer{kTeamId, kKeyId, kEcPrivKey};
	const auto first = signer.sign();

	signer.advance(21min);
	const auto refreshed = signer.sign();
	BC_ASSERT_CPP_NOT_EQUAL(refreshed, first);
	BC_ASSERT_CPP_EQUAL(signer.getSignCount(), 2);

	const auto token = decode(refreshed);
	BC_ASSERT_CPP_EQUAL(token.claims["iat"].get<uint64_t>(), kStartDate + 21 * 60);
	BC_ASSERT_TRUE(verifySignature(token));
	BC_ASSERT(signer.getCachedToken()->issuedAt == signer.getClock());
	BC_ASSERT_CPP_EQUAL(signer.getCachedToken()->token, refreshed);
}

void unusableSystemClock() {
	ManualClockSigner beforeEpoch{kTeamId, kKeyId, kEcPrivKey};
	beforeEpoch.setClock(chrono::system_clock::time_point{} - 1s);
	BC_ASSERT_THROWN(beforeEpoch.sign(), SystemTimeError);
	BC_ASSERT_FALSE(beforeEpoch.getCachedToken().has_value());
	BC_ASSERT_CPP_EQUAL(beforeEpoch.getSignCount(), 0);

	ManualClockSigner wentBack{kTeamId, kKeyId, kEcPrivKey};
	const auto token = wentBack.sign();
	wentBack.advance(-1min);
	BC_ASSERT_THROWN(wentBack.sign(), SystemTimeError);
	BC_HARD_ASSERT(wentBack.getCachedToken().has_value());
	BC_ASSERT_CPP_EQUAL(wentBack.getCachedToken()->token, token);
	BC_ASSERT_CPP_EQUAL(wentBack.getSignCount(), 1);
}

void signWithSystemClock() {
	TokenSigner signer{kTeamId, kKeyId, kEcPrivKey};
	BC_ASSERT_CPP_EQUAL(signer.getTeamId(), kTeamId);
	BC_ASSERT_CPP_EQUAL(signer.getKeyId(), kKeyId);

	const auto before = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();
	const auto token = signer.sign();
	const auto after = chrono::duration_cast<chrono::seconds>(chrono::system_clock::now().time_since_epoch()).count();

	const auto issuedAt = decode(token).claims["iat"].get<int64_t>();
	BC_ASSERT(before <= issuedAt && issuedAt <= after);
	BC_ASSERT_CPP_EQUAL(signer.sign(), token);
}

TestSuite _("AppleTokenSigner",
            {
                CLASSY_TEST(invalidKeys),
                CLASSY_TEST(tokenContent),
                CLASSY_TEST(tokenIsReusedForTwentyMinutes),
                CLASSY_TEST(tokenIsRefreshedAfterExpiry),
                CLASSY_TEST(unusableSystemClock),
                CLASSY_TEST(signWithSystemClock),
            });

} // namespace
