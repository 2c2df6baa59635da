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

#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "apnclient/logmanager.hh"
#include "pushnotification/apple/apple-client.hh"
#include "utils/string-utils.hh"

using namespace std;
using namespace apnclient;
using namespace apnclient::pushnotification;

struct PusherArgs {
	string teamId{};
	string keyId{};
	string keyPath{};
	string topic{};
	vector<string> deviceTokens{};
	string endpoint{"production"};
	bool alternatePort{false};
	bool debug{false};
	optional<string> logLevel{};

	optional<string> pushType{};
	optional<string> priority{};
	optional<string> expiration{};
	optional<string> collapseId{};

	optional<string> title{};
	optional<string> body{};
	optional<string> sound{};
	optional<string> badge{};
	optional<string> customPayload{};

	void usage(const char* app) {
		cout << "usage: " << app
		     << " "
		        R"doc(--team-id <id> --key-id <id> --key <file> --topic <topic> --device-token <token> [<token> ...] [options]

A tool to send push notifications to iOS applications through the APNs provider API, using token-based
authentication.

Mandatory parameters:
---------------------
  --team-id <id>                     The 10-character Team ID of the Apple developer account.
  --key-id <id>                      The identifier of the signing key.
  --key <file>                       Path to the .p8 file holding the signing key.
  --topic <topic>                    The bundle ID of the application, with a '.voip' suffix for VoIP pushes.
  --device-token <token> [...]       One or more device tokens. One push notification is sent per token.


General options:
----------------
  -h, --help                         Show this help message and exit.
  --debug                            Print all debug messages on the standard output.
  --log-level {debug,message,warning,error}
                                     Verbosity of the logs. Default: message. --debug overrides it.

  --endpoint {production,development,<host>:<port>}
                                     The APNs server to send the notifications to. Default: production.
  --alternate-port                   Use port 2197 instead of 443 with the 'production' and 'development' servers.


Request options:
----------------
  --push-type <type>                 Value of 'apns-push-type' (alert, background, voip, liveactivity...).
  --priority <n>                     Value of 'apns-priority' (10, 5 or 1).
  --expiration <timestamp>           Value of 'apns-expiration', a UNIX timestamp in seconds.
  --collapse-id <id>                 Value of 'apns-collapse-id'.


Payload options:
----------------
  --title <text>                     Title of the alert.
  --body <text>                      Body of the alert.
  --sound <name>                     Name of the sound file to play.
  --badge <n>                        Number to display on the application icon.
  --custom-payload <json>            Add custom keys in the payload. <json> must be a JSON object and its keys are
                                     placed at the top level, next to 'aps'.

Examples:
---------
* Send an alert to an application installed from the App Store:

    ./apnclient_pusher --team-id ABCDE12345 --key-id KEY1234567 --key AuthKey_KEY1234567.p8
                       --topic org.example.app --device-token '<token>' --push-type alert --title Hello


* Send a background push notification to a development build:

    ./apnclient_pusher --team-id ABCDE12345 --key-id KEY1234567 --key AuthKey_KEY1234567.p8
                       --topic org.example.app --device-token '<token>' --endpoint development
                       --push-type background --priority 5


Environment Variables:
----------------------
  APNCLIENT_LOG_DIR    The directory to write logs into. Logs are only printed on the standard output when unset.
)doc";
	}

	void parse(int argc, char* argv[]) {
		auto showUsageAndExit = [=]() {
			usage(*argv);
			exit(-1);
		};

#define EQ0(i, name) (strcmp(name, argv[i]) == 0)
#define EQ1(i, name) (i + 1 < argc && strcmp(name, argv[i]) == 0)
		for (int i = 1; i < argc; ++i) {
			if (EQ1(i, "--team-id")) {
				teamId = argv[++i];
			} else if (EQ1(i, "--key-id")) {
				keyId = argv[++i];
			} else if (EQ1(i, "--key")) {
				keyPath = argv[++i];
			} else if (EQ1(i, "--topic")) {
				topic = argv[++i];
			} else if (EQ1(i, "--device-token")) {
				while (i + 1 < argc && strncmp(argv[i + 1], "--", 2) != 0) {
					i++;
					deviceTokens.push_back(argv[i]);
				}
			} else if (EQ1(i, "--endpoint")) {
				endpoint = argv[++i];
			} else if (EQ0(i, "--alternate-port")) {
				alternatePort = true;
			} else if (EQ0(i, "--debug")) {
				debug = true;
			} else if (EQ1(i, "--log-level")) {
				logLevel = argv[++i];
			} else if (EQ1(i, "--push-type")) {
				pushType = argv[++i];
			} else if (EQ1(i, "--priority")) {
				priority = argv[++i];
			} else if (EQ1(i, "--expiration")) {
				expiration = argv[++i];
			} else if (EQ1(i, "--collapse-id")) {
				collapseId = argv[++i];
			} else if (EQ1(i, "--title")) {
				title = argv[++i];
			} else if (EQ1(i, "--body")) {
				body = argv[++i];
			} else if (EQ1(i, "--sound")) {
				sound = argv[++i];
			} else if (EQ1(i, "--badge")) {
				badge = argv[++i];
			} else if (EQ1(i, "--custom-payload")) {
				customPayload = argv[++i];
			} else if (EQ0(i, "--help") || EQ0(i, "-h")) {
				usage(*argv);
				exit(0);
			} else {
				cerr << "? arg" << i << " " << argv[i] << endl;
				showUsageAndExit();
			}
		}
#undef EQ0
#undef EQ1

		for (const auto& [value, name] : {pair{&teamId, "--team-id"}, pair{&keyId, "--key-id"},
		                                  pair{&keyPath, "--key"}, pair{&topic, "--topic"}}) {
			if (value->empty()) {
				cerr << "Missing mandatory parameter " << name << endl;
				showUsageAndExit();
			}
		}
		if (deviceTokens.empty()) {
			cerr << "Couldn't find any device token, use --device-token" << endl;
			showUsageAndExit();
		}
	}
};

struct Stats {
	int failed{0};
	int success{0};

	int total() const noexcept {
		return failed + success;
	}
};

static Endpoint makeEndpoint(const PusherArgs& args) {
	if (args.endpoint == "production") {
		return args.alternatePort ? Endpoint::productionAlternate() : Endpoint::production();
	}
	if (args.endpoint == "development") {
		return args.alternatePort ? Endpoint::developmentAlternate() : Endpoint::development();
	}
	return Endpoint::fromString(args.endpoint);
}

static string readKeyFile(const string& path) {
	ifstream file{path};
	if (!file) throw runtime_error{"cannot open key file '" + path + "'"};
	ostringstream content{};
	content << file.rdbuf();
	return content.str();
}

static unsigned long long parseNumber(const optional<string>& value, const char* name, unsigned long long max) {
	const auto number = string_utils::parseUnsigned(*value, max);
	if (!number) throw invalid_argument{string{"invalid value for "} + name + ": '" + *value + "'"};
	return *number;
}

static PushOptions makePushOptions(const PusherArgs& args) {
	PushOptions options{};
	options.topic = args.topic;
	options.pushType = args.pushType;
	options.collapseId = args.collapseId;
	if (args.priority) {
		options.priority = static_cast<uint8_t>(parseNumber(args.priority, "--priority", numeric_limits<uint8_t>::max()));
	}
	if (args.expiration) {
		options.expiration = parseNumber(args.expiration, "--expiration", numeric_limits<uint64_t>::max());
	}
	return options;
}

static Payload makePayload(const PusherArgs& args) {
	Notification aps{};
	if (args.title || args.body) {
		FullAlert alert{};
		if (args.title) alert.title = Title::normal(*args.title);
		if (args.body) alert.body = Body::normal(*args.body);
		aps.alert = Alert::full(alert);
	}
	if (args.sound) aps.sound = Sound::named(*args.sound);
	if (args.badge) {
		aps.badge = static_cast<uint32_t>(parseNumber(args.badge, "--badge", numeric_limits<uint32_t>::max()));
	}
	if (args.pushType && *args.pushType == "background") aps.contentAvailable = true;

	Payload payload{aps};
	if (args.customPayload) {
		nlohmann::ordered_json custom{};
		try {
			custom = nlohmann::ordered_json::parse(*args.customPayload);
		} catch (const nlohmann::json::parse_error& e) {
			throw invalid_argument{string{"invalid JSON for --custom-payload: "} + e.what()};
		}
		payload.withCustom(custom);
	}
	return payload;
}

int main(int argc, char* argv[]) {
	signal(SIGPIPE, SIG_IGN);

	PusherArgs args{};
	args.parse(argc, argv);

	LoggerParameters logParams{};
	if (const char* logDir = std::getenv("APNCLIENT_LOG_DIR")) {
		logParams.logDirectory = logDir;
		logParams.logFilename = "apnclient-pusher.log";
	}
	logParams.level = BCTBX_LOG_MESSAGE;
	logParams.enableStandardOutput = true;
	try {
		if (args.debug) logParams.level = BCTBX_LOG_DEBUG;
		else if (args.logLevel) logParams.level = LogManager::logLevelFromName(*args.logLevel);
		LogManager::get().configure(logParams);
	} catch (const invalid_argument& e) {
		cerr << "Invalid value for --log-level: " << e.what() << endl;
		return EXIT_FAILURE;
	} catch (const runtime_error& e) {
		cerr << "Failed to configure logs: " << e.what() << endl;
		return EXIT_FAILURE;
	}

	unique_ptr<AppleClient> client{};
	PushOptions options{};
	Payload payload{};
	try {
		ClientIdentity identity{args.teamId, args.keyId, readKeyFile(args.keyPath), makeEndpoint(args)};
		options = makePushOptions(args);
		payload = makePayload(args);
		client = make_unique<AppleClient>(identity);
	} catch (const exception& e) {
		SLOGE << e.what();
		return EXIT_FAILURE;
	}

	Stats stats{};
	for (const auto& deviceToken : args.deviceTokens) {
		try {
			const auto receipt = client->push(payload, deviceToken, options);
			SLOGI << "Push notification sent to [" << deviceToken << "], apns-id: " << receipt.id;
			stats.success++;
		} catch (const ServiceError& e) {
			SLOGE << "Push notification to [" << deviceToken << "] rejected: status " << e.getStatusCode()
			      << ", reason: " << e.getErrorResponse().reason;
			stats.failed++;
		} catch (const PushNotificationException& e) {
			SLOGE << "Push notification to [" << deviceToken << "] failed: " << e.what();
			stats.failed++;
		}
	}

	SLOGI << stats.total() << " push notification(s) sent, " << stats.success << " successfully and " << stats.failed
	      << " failed.";
	if (stats.failed > 0 && !args.debug) {
		SLOGI << "There are failed requests, relaunch with --debug to consult exact error cause.";
	}
	SLOGI << "job is done, thanks for using " << argv[0] << ". Bye!";
	return stats.failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
