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
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "pushnotification/push-notification-exceptions.hh"
#include "utils/json/json-object.hh"

namespace apnclient::pushnotification {

/**
 * A boolean of the 'aps' dictionary. Apple only looks at the presence of such a key, so the flag is written as the
 * integer 1 when true and is left out of the payload otherwise.
 */
class OptionalFlag {
public:
	OptionalFlag() = default;
	OptionalFlag(bool value) : mValue(value) {
	}

	bool isSet() const {
		return mValue.has_value();
	}
	bool isTrue() const {
		return mValue.value_or(false);
	}

	void writeTo(nlohmann::ordered_json& object, const char* key) const;

private:
	std::optional<bool> mValue{};
};

struct LocalizedText {
	std::string key{};
	std::optional<std::vector<std::string>> args{};
};

/**
 * A piece of alert text, either literal or given as a localization key with its arguments.
 * Keys names the three JSON fields the text is written into, which depend on the piece (title, subtitle or body).
 */
template <typename Keys>
class AlertText {
public:
	static AlertText normal(const std::string& text) {
		return AlertText{text};
	}
	static AlertText localized(const std::string& key,
	                           const std::optional<std::vector<std::string>>& args = std::nullopt) {
		return AlertText{LocalizedText{key, args}};
	}

	bool isLocalized() const {
		return std::holds_alternative<LocalizedText>(mValue);
	}
	const std::variant<std::string, LocalizedText>& getValue() const {
		return mValue;
	}

	/**
	 * Write the fields of this text directly into 'object'. Only the fields of the held shape are written.
	 */
	void flattenInto(nlohmann::ordered_json& object) const {
		if (const auto* text = std::get_if<std::string>(&mValue)) {
			object[Keys::kText] = *text;
			return;
		}
		const auto& localized = std::get<LocalizedText>(mValue);
		object[Keys::kLocKey] = localized.key;
		if (localized.args) object[Keys::kLocArgs] = *localized.args;
	}

private:
	explicit AlertText(std::variant<std::string, LocalizedText>&& value) : mValue(std::move(value)) {
	}

	std::variant<std::string, LocalizedText> mValue;
};

struct TitleKeys {
	static constexpr const char* kText = "title";
	static constexpr const char* kLocKey = "title-loc-key";
	static constexpr const char* kLocArgs = "title-loc-args";
};
struct SubtitleKeys {
	static constexpr const char* kText = "subtitle";
	static constexpr const char* kLocKey = "subtitle-loc-key";
	static constexpr const char* kLocArgs = "subtitle-loc-args";
};
struct BodyKeys {
	static constexpr const char* kText = "body";
	static constexpr const char* kLocKey = "loc-key";
	static constexpr const char* kLocArgs = "loc-args";
};

using Title = AlertText<TitleKeys>;
using Subtitle = AlertText<SubtitleKeys>;
using Body = AlertText<BodyKeys>;

struct FullAlert {
	std::optional<Title> title{};
	std::optional<Subtitle> subtitle{};
	std::optional<Body> body{};
	std::optional<std::string> launchImage{};
};

/**
 * The 'alert' entry: a bare string, or a dictionary gathering the fields of a FullAlert.
 */
class Alert {
public:
	static Alert text(const std::string& text) {
		return Alert{text};
	}
	static Alert full(const FullAlert& alert) {
		return Alert{alert};
	}

	const std::variant<std::string, FullAlert>& getValue() const {
		return mValue;
	}

private:
	explicit Alert(std::variant<std::string, FullAlert>&& value) : mValue(std::move(value)) {
	}

	std::variant<std::string, FullAlert> mValue;
};

struct CriticalSound {
	OptionalFlag critical{};
	std::optional<std::string> name{};
	std::optional<double> volume{};
};

/**
 * The 'sound' entry: the bare name of a sound file, or a dictionary describing a critical alert sound.
 */
class Sound {
public:
	static Sound named(const std::string& name) {
		return Sound{name};
	}
	static Sound critical(const CriticalSound& sound) {
		return Sound{sound};
	}

	const std::variant<std::string, CriticalSound>& getValue() const {
		return mValue;
	}

private:
	explicit Sound(std::variant<std::string, CriticalSound>&& value) : mValue(std::move(value)) {
	}

	std::variant<std::string, CriticalSound> mValue;
};

enum class InterruptionLevel { Passive, Active, TimeSensitive, Critical };

NLOHMANN_JSON_SERIALIZE_ENUM(InterruptionLevel,
                             {
                                 {InterruptionLevel::Passive, "passive"},
                                 {InterruptionLevel::Active, "active"},
                                 {InterruptionLevel::TimeSensitive, "time-sensitive"},
                                 {InterruptionLevel::Critical, "critical"},
                             })

/**
 * The 'aps' dictionary. Every field is optional and unset fields are not serialized at all, so that a
 * default-constructed Notification gives '{}'.
 */
struct Notification {
	std::optional<Alert> alert{};
	std::optional<std::uint32_t> badge{};
	std::optional<Sound> sound{};
	std::optional<std::string> threadId{};
	std::optional<std::string> category{};
	OptionalFlag contentAvailable{};
	OptionalFlag mutableContent{};
	std::optional<std::string> targetContentId{};
	std::optional<InterruptionLevel> interruptionLevel{};
	std::optional<double> relevanceScore{};
	std::optional<std::string> filterCriteria{};
	std::optional<std::uint64_t> staleDate{};
	std::optional<nlohmann::ordered_json> contentState{};
	std::optional<std::uint64_t> timestamp{};
	std::optional<std::string> event{};
	std::optional<std::uint64_t> dismissalDate{};
	std::optional<std::string> attributesType{};
	std::optional<nlohmann::ordered_json> attributes{};

	/**
	 * Set the Live Activity 'content-state' from anything convertible to a JSON object.
	 * @throw BuildError if 'state' does not convert to a JSON object.
	 */
	template <typename T>
	Notification& withContentState(const T& state) {
		contentState = toObject(state);
		return *this;
	}

	/**
	 * Set the Live Activity 'attributes' from anything convertible to a JSON object.
	 * @throw BuildError if 'attributes' does not convert to a JSON object.
	 */
	template <typename T>
	Notification& withAttributes(const T& value) {
		attributes = toObject(value);
		return *this;
	}

private:
	template <typename T>
	static nlohmann::ordered_json toObject(const T& value) {
		try {
			return toJsonObject(value);
		} catch (const NotAnObjectError& e) {
			throw BuildError{e};
		}
	}
};

/**
 * The whole body of a push request: the 'aps' dictionary plus optional custom keys written beside it.
 */
class Payload {
public:
	Payload() = default;
	explicit Payload(const Notification& aps) : mAps(aps) {
	}

	/**
	 * Set the custom keys from anything convertible to a JSON object. Its keys are written at the top level of the
	 * payload, after 'aps'.
	 * @throw BuildError if 'custom' does not convert to a JSON object or if it contains an 'aps' key.
	 */
	template <typename T>
	Payload& withCustom(const T& custom) {
		nlohmann::ordered_json object{};
		try {
			object = toJsonObject(custom);
		} catch (const NotAnObjectError& e) {
			throw BuildError{e};
		}
		if (object.contains(kApsKey)) {
			throw BuildError{std::string{"custom data cannot define the reserved '"} + kApsKey + "' key"};
		}
		mCustom = std::move(object);
		return *this;
	}

	Notification& getAps() {
		return mAps;
	}
	const Notification& getAps() const {
		return mAps;
	}
	const std::optional<nlohmann::ordered_json>& getCustom() const {
		return mCustom;
	}

	/**
	 * @throw BuildError if a number of the notification is not finite.
	 */
	nlohmann::ordered_json toJson() const;
	/**
	 * @throw BuildError if a number of the notification is not finite or if a string is not valid UTF-8.
	 */
	std::string toString() const;

	static constexpr const char* kApsKey = "aps";

private:
	Notification mAps{};
	std::optional<nlohmann::ordered_json> mCustom{};
};

void to_json(nlohmann::ordered_json& json, const Alert& alert);
void to_json(nlohmann::ordered_json& json, const Sound& sound);
void to_json(nlohmann::ordered_json& json, const Notification& notification);
void to_json(nlohmann::ordered_json& json, const Payload& payload);

} // namespace apnclient::pushnotification
