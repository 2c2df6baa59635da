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

#include <nlohmann/json.hpp>

namespace apnclient {

/*
 * Raised when a value handed over as free-form JSON data does not convert to a JSON object.
 */
class NotAnObjectError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * Convert anything nlohmann::json knows how to serialize into an insertion-ordered JSON object.
 *
 * @throw NotAnObjectError if the conversion fails or if its result is not an object (array, scalar or null).
 */
template <typename T>
nlohmann::ordered_json toJsonObject(const T& value) {
	nlohmann::ordered_json json{};
	try {
		json = value;
	} catch (const nlohmann::json::exception& e) {
		throw NotAnObjectError{std::string{"conversion to JSON failed: "} + e.what()};
	}
	if (!json.is_object()) {
		throw NotAnObjectError{std::string{"expected a JSON object but got "} + json.type_name()};
	}
	return json;
}

} // namespace apnclient
