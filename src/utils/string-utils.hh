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

#include <optional>
#include <string_view>
#include <vector>

namespace apnclient::string_utils {

/**
 * Splits the string by using a delimiter and returns each substrings into a vector.
 * @param[in] str The string to split. An empty string results to an empty vector.
 * @param[in] delimiter The delimiter which encloses each substrings. An empty delimiter,
 * results to a vector containing the entire string (one element).
 */
std::vector<std::string_view> split(std::string_view str, std::string_view delimiter) noexcept;

/**
 * @return true if every character of 'str' is visible ASCII, a space or a horizontal tab.
 */
bool isPrintableAscii(std::string_view str) noexcept;

/**
 * Parse the whole of 'str' as an unsigned decimal number lower or equal to 'max'.
 */
std::optional<unsigned long long> parseUnsigned(std::string_view str, unsigned long long max) noexcept;

} // namespace apnclient::string_utils
