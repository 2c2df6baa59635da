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

#include <limits>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pushnotification/apple/apple-payload.hh"
#include "utils/test-patterns/test.hh"
#include "utils/test-suite.hh"

using namespace std;
using namespace apnclient;
using namespace apnclient::tester;
using namespace apnclient::pushnotification;
using json = nlohmann::ordered_json;

namespace {

struct LiveScore {
	string home;
	string away;
	int homeScore;
	int awayScore;
};

void to_json(json& j, const LiveScore& score) {
	j = json{{"home", score.home}, {"away", score.away}, {"homeScore", score.homeScore}, {"awayScore", score.awayScore}};
}

string dump(const Notification& aps) {
	return json(aps).dump();
}

void emptyNotification() {
	BC_ASSERT_CPP_EQUAL(dump(Notification{}), "{}");
	BC_ASSERT_CPP_EQUAL(Payload{}.toString(), R"({"aps":{}})");
}

void filledNotification() {
	FullAlert alert{};
	alert.title = Title::normal("Title");
	alert.subtitle = Subtitle::localized("SUBTITLE_KEY");
	CriticalSound sound{};
	sound.critical = true;

	Notification aps{};
	aps.alert = Alert::full(alert);
	aps.sound = Sound::critical(sound);
	aps.mutableContent = true;
	aps.interruptionLevel = InterruptionLevel::TimeSensitive;
	aps.withAttributes(json{{"attr", "foo"}});

	BC_ASSERT_CPP_EQUAL(dump(aps), R"({"alert":{"title":"Title","subtitle-loc-key":"SUBTITLE_KEY"},)"
	                               R"("sound":{"critical":1},"mutable-content":1,"interruption-level":"time-sensitive",)"
	                               R"("attributes":{"attr":"foo"}})");
}

void customPayload() {
	Payload payload{};
	payload.withCustom(json{{"payload", "payload"}});
	BC_ASSERT_CPP_EQUAL(payload.toString(), R"({"aps":{},"payload":"payload"})");

	// Custom keys keep the order given by the caller, after 'aps'.
	Notification aps{};
	aps.badge = 1;
	Payload ordered{aps};
	ordered.withCustom(json{{"zulu", 1}, {"alpha", json{{"nested", true}}}});
	BC_ASSERT_CPP_EQUAL(ordered.toString(), R"({"aps":{"badge":1},"zulu":1,"alpha":{"nested":true}})");
}

// Flags are written as 1 when true and never as JSON booleans.
void falseFlagsAreOmitted() {
	Notification aps{};
	aps.contentAvailable = false;
	aps.mutableContent = false;
	CriticalSound sound{};
	sound.critical = false;
	aps.sound = Sound::critical(sound);
	BC_ASSERT_CPP_EQUAL(dump(aps), R"({"sound":{}})");

	aps.contentAvailable = true;
	aps.sound.reset();
	BC_ASSERT_CPP_EQUAL(dump(aps), R"({"content-available":1})");

	const auto flags = OptionalFlag{};
	BC_ASSERT_FALSE(flags.isSet());
	BC_ASSERT_FALSE(flags.isTrue());
	BC_ASSERT_TRUE(OptionalFlag{false}.isSet());
}

void localizedAlert() {
	FullAlert alert{};
	alert.title = Title::localized("TITLE_KEY");
	alert.subtitle = Subtitle::localized("SUBTITLE_KEY", vector<string>{"sub"});
	alert.body = Body::localized("BODY_KEY", vector<string>{"a", "b"});
	alert.launchImage = "launch.png";

	Notification aps{};
	aps.alert = Alert::full(alert);
	BC_ASSERT_CPP_EQUAL(dump(aps), R"({"alert":{"title-loc-key":"TITLE_KEY","subtitle-loc-key":"SUBTITLE_KEY",)"
	                               R"("subtitle-loc-args":["sub"],"loc-key":"BODY_KEY","loc-args":["a","b"],)"
	                               R"("launch-image":"launch.png"}})");
	BC_ASSERT_TRUE(alert.body->isLocalized());
	BC_ASSERT_FALSE(Body::normal("text").isLocalized());
}

void plainAlertAndSound() {
	Notification aps{};
	aps.alert = Alert::text("Hello");
	aps.badge = 3;
	aps.sound = Sound::named("default");
	BC_ASSERT_CPP_EQUAL(dump(aps), R"({"alert":"Hello","badge":3,"sound":"default"})");

	FullAlert alert{};
	alert.body = Body::normal("Body");
	aps.alert = Alert::full(alert);
	CriticalSound sound{};
	sound.critical = true;
	sound.name = "alarm.caf";
	sound.volume = 0.5;
	aps.sound = Sound::critical(sound);
	BC_ASSERT_CPP_EQUAL(dump(aps),
	                    R"({"alert":{"body":"Body"},"badge":3,"sound":{"critical":1,"name":"alarm.caf","volume":0.5}})");
}

void liveActivityFields() {
	Notification aps{};
	aps.threadId = "thread";
	aps.category = "MATCH";
	aps.targetContentId = "target";
	aps.relevanceScore = 0.25;
	aps.filterCriteria = "sports";
	aps.staleDate = 1700000600;
	aps.withContentState(LiveScore{"Lyon", "Grenoble", 2, 1});
	aps.timestamp = 1700000000;
	aps.event = "update";
	aps.dismissalDate = 1700003600;
	aps.attributesType = "MatchAttributes";
	aps.withAttributes(map<string, int>{{"season", 2024}});

	BC_ASSERT_CPP_EQUAL(dump(aps), R"({"thread-id":"thread","category":"MATCH","target-content-id":"target",)"
	                               R"("relevance-score":0.25,"filter-criteria":"sports","stale-date":1700000600,)"
	                               R"("content-state":{"home":"Lyon","away":"Grenoble","homeScore":2,"awayScore":1},)"
	                               R"("timestamp":1700000000,"event":"update","dismissal-date":1700003600,)"
	                               R"("attributes-type":"MatchAttributes","attributes":{"season":2024}})");
}

void interruptionLevels() {
	const vector<pair<InterruptionLevel, string>> levels{
	    {InterruptionLevel::Passive, R"("passive")"},
	    {InterruptionLevel::Active, R"("active")"},
	    {InterruptionLevel::TimeSensitive, R"("time-sensitive")"},
	    {InterruptionLevel::Critical, R"("critical")"},
	};
	for (const auto& [level, expected] : levels) {
		BC_ASSERT_CPP_EQUAL(json(level).dump(), expected);
	}
}

// Free-form data must convert to a JSON object, anything else is reported at build time.
void nonObjectDataIsRejected() {
	Notification aps{};
	BC_ASSERT_THROWN(aps.withContentState(vector<int>{1, 2}), BuildError);
	BC_ASSERT_THROWN(aps.withAttributes(string{"scalar"}), BuildError);
	BC_ASSERT_THROWN(aps.withAttributes(json{}), BuildError);
	BC_ASSERT_CPP_EQUAL(dump(aps), "{}");

	Payload payload{};
	BC_ASSERT_THROWN(payload.withCustom(42), BuildError);
	BC_ASSERT_FALSE(payload.getCustom().has_value());

	BC_ASSERT_THROWN(toJsonObject(json::array()), NotAnObjectError);
}

void customApsKeyIsRejected() {
	Payload payload{};
	BC_ASSERT_THROWN(payload.withCustom(json{{"aps", json{{"badge", 1}}}, {"other", 1}}), BuildError);
	BC_ASSERT_CPP_EQUAL(payload.toString(), R"({"aps":{}})");
}

void invalidUtf8IsRejected() {
	Notification aps{};
	aps.alert = Alert::text("caf\xe9");
	BC_ASSERT_THROWN(Payload{aps}.toString(), BuildError);

	Notification threaded{};
	threaded.threadId = "thread-\xff\xfe";
	BC_ASSERT_THROWN(Payload{threaded}.toString(), BuildError);
}

// JSON has no NaN or infinity, such numbers must not turn into 'null'.
void nonFiniteNumbersAreRejected() {
	Notification aps{};
	aps.relevanceScore = numeric_limits<double>::quiet_NaN();
	BC_ASSERT_THROWN(Payload{aps}.toString(), BuildError);
	aps.relevanceScore = numeric_limits<double>::infinity();
	BC_ASSERT_THROWN(Payload{aps}.toJson(), BuildError);
	aps.relevanceScore = 0.5;
	BC_ASSERT_CPP_EQUAL(Payload{aps}.toString(), R"({"aps":{"relevance-score":0.5}})");

	CriticalSound sound{};
	sound.volume = -numeric_limits<double>::infinity();
	Notification alarm{};
	alarm.sound = Sound::critical(sound);
	BC_ASSERT_THROWN(Payload{alarm}.toString(), BuildError);
}

TestSuite _("ApplePayload",
            {
                CLASSY_TEST(emptyNotification),
                CLASSY_TEST(filledNotification),
                CLASSY_TEST(customPayload),
                CLASSY_TEST(falseFlagsAreOmitted),
                CLASSY_TEST(localizedAlert),
                CLASSY_TEST(plainAlertAndSound),
                CLASSY_TEST(liveActivityFields),
                CLASSY_TEST(interruptionLevels),
                CLASSY_TEST(nonObjectDataIsRejected),
                CLASSY_TEST(customApsKeyIsRejected),
                CLASSY_TEST(invalidUtf8IsRejected),
                CLASSY_TEST(nonFiniteNumbersAreRejected),
            });

} // namespace
