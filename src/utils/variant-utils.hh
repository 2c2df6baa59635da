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

#include <utility>
#include <variant>

namespace apnclient {

// helper type for the visitor, see https://en.cppreference.com/w/cpp/utility/variant/visit examples
template <class... Ts>
struct overloaded : Ts... {
	using Ts::operator()...;
};

/**
 * Fluent interface to pattern match a std::variant against the given lambdas
 */
template <class Variant>
class Match {
public:
	Match(Variant&& v) : mVariant(std::forward<Variant>(v)) {
	}

	template <class... Patterns>
	decltype(auto) against(Patterns... patterns) && {
		return std::visit(overloaded{patterns...}, std::forward<Variant>(mVariant));
	}

private:
	Variant mVariant;
};

// Constructors (not needed as of C++20)
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
template <typename T>
Match(T&&) -> Match<T>;

} // namespace apnclient
