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

#include "apple-payload.hh"

#include <cmath>

#include "pushnotification/push-notification-exceptions.hh"
#include "utils/variant-utils.hh"

using namespace std;
using json = nlohmann::ordered_json;

namespace apnclient::pushnotification {

void OptionalFlag::writeTo(json& object, const char* key) const {
	if (isTrue()) object[key] = 1;
}

namespace {

template <typename T>
void writeIfSet(json& object, const char* key, const optional<T>& value) {
	if (value) object[key] = *value;
}

// JSON has no representation for NaN and infinities.
void writeIfSet(json& object, const char* key, const optional<double>& value) {
	if (!value) return;
	if (!isfinite(*value)) throw BuildError{string{"value of '"} + key + "' is not a finite number"};
	object[key] = *value;
}

} // namespace

void to_json(json& j, const Alert& alert) {
	Match(alert.getValue())
	    .against([&j](const string& text) { j = text; },
	             [&j](const FullAlert& full) {
		             j = json::object();
		             if (full.title) full.title->flattenInto(j);
		             if (full.subtitle) full.subtitle->flattenInto(j);
		             if (full.body) full.body->flattenInto(j);
		             writeIfSet(j, "launch-image", full.launchImage);
	             });
}

void to_json(json& j, const Sound& sound) {
	Match(sound.getValue())
	    .against([&j](const string& name) { j = name; },
	             [&j](const CriticalSound& critical) {
		             j = json::object();
		             critical.critical.writeTo(j, "critical");
		             writeIfSet(j, "name", critical.name);
		             writeIfSet(j, "volume", critical.volume);
	             });
}

void to_json(json& j, const Notification& n) {
	j = json::object();
	writeIfSet(j, "alert", n.alert);
	writeIfSet(j, "badge", n.badge);
	writeIfSet(j, "sound", n.sound);
	writeIfSet(j, "thread-id", n.threadId);
	writeIfSet(j, "category", n.category);
	n.contentAvailable.writeTo(j, "content-available");
	n.mutableContent.writeTo(j, "mutable-content");
	writeIfSet(j, "target-content-id", n.targetContentId);
	writeIfSet(j, "interruption-level", n.interruptionLevel);
	writeIfSet(j, "relevance-score", n.relevanceScore);
	writeIfSet(j, "filter-criteria", n.filterCriteria);
	writeIfSet(j, "stale-date", n.staleDate);
	writeIfSet(j, "content-state", n.contentState);
	writeIfSet(j, "timestamp", n.timestamp);
	writeIfSet(j, "event", n.event);
	writeIfSet(j, "dismissal-date", n.dismissalDate);
	writeIfSet(j, "attributes-type", n.attributesType);
	writeIfSet(j, "attributes", n.attributes);
}

void to_json(json& j, const Payload& payload) {
	j = json::object();
	j[Payload::kApsKey] = payload.getAps();
	if (const auto& custom = payload.getCustom()) {
		for (const auto& [key, value] : custom->items()) {
			j[key] = value;
		}
	}
}

json Payload::toJson() const {
	return *this;
}

string Payload::toString() const {
	const auto payload = toJson();
	try {
		return payload.dump();
	} catch (const nlohmann::json::type_error& e) {
		throw BuildError{string{"payload contains text that is not valid UTF-8: "} + e.what()};
	}
}

} // namespace apnclient::pushnotification
