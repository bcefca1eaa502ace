/******************************************************************************
*
*	CAEN SpA - Software Division
*	Via Vetraia, 11 - 55049 - Viareggio ITALY
*	+39 0594 388 398 - www.caen.it
*
*******************************************************************************
*
*	Copyright (C) 2020-2023 CAEN SpA
*
*	This file is part of the CAEN FELib C++ Binding.
*
*	The CAEN FELib C++ Binding is free software; you can redistribute it and/or
*	modify it under the terms of the GNU Lesser General Public
*	License as published by the Free Software Foundation; either
*	version 3 of the License, or (at your option) any later version.
*
*	The CAEN FELib C++ Binding is distributed in the hope that it will be useful,
*	but WITHOUT ANY WARRANTY; without even the implied warranty of
*	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU
*	Lesser General Public License for more details.
*
*	You should have received a copy of the GNU Lesser General Public
*	License along with the CAEN FELib C++ Binding; if not, see
*	https://www.gnu.org/licenses/.
*
*	SPDX-License-Identifier: LGPL-3.0-or-later
*
***************************************************************************//*!
*
*	\file		url.cpp
*	\brief
*
******************************************************************************/

#include "url.hpp"

#include <regex>
#include <vector>

#include <boost/algorithm/string.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/string.hpp"
#include "lib_error.hpp"

using namespace std::literals;

namespace caen {

namespace felib {

url_data parse_url(const std::string& url) {

	url_data data;
	data._url = url;

	/*
	 * Parsing a URI Reference with a Regular Expression
	 * Copied from RFC 3986 at https://www.rfc-editor.org/rfc/rfc3986#page-50
	 */
	static const std::regex url_regex(R"(^(([^:\/?#]+):)?(//([^\/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)"s, std::regex::extended);
	std::smatch url_match_result;

	if (!std::regex_match(url, url_match_result, url_regex))
		throw ex::invalid_argument(fmt::format("invalid URI: {}", url));

	if (!url_match_result[2].matched || !url_match_result[3].matched)
		throw ex::invalid_argument(fmt::format("invalid URI (expected scheme://...): {}", url));

	data._scheme = boost::to_lower_copy(url_match_result[2].str());
	data._authority = url_match_result[4];
	data._path = url_match_result[5];
	data._query = url_match_result[7];
	data._fragment = url_match_result[9];

	// parse optional query
	if (data._query.empty())
		return data;
	for (const auto& str : string::split(data._query, "&")) {
		const auto split_single_query = string::split(str, "=");
		const auto& key = split_single_query.at(0);
		if (string::iequals(key, "log_level"sv)) {
			if (split_single_query.size() != 2)
				throw ex::invalid_argument(fmt::format("invalid query {} in URI {}", str, url));
			data._log_level = spdlog::level::from_str(boost::to_lower_copy(split_single_query[1]));
		}
	}

	return data;
}

} // namespace felib

} // namespace caen
