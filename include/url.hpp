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
*	\file		url.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_URL_HPP_
#define CAEN_FELIB_CPP_INCLUDE_URL_HPP_

#include <optional>
#include <string>

#include <spdlog/common.h>

namespace caen {

namespace felib {

/**
 * @brief Connection URL, like "dig2://caendgtz-usb-12345?log_level=debug".
 *
 * The whole string is passed unchanged to CAEN_FELib_Open; the query keys
 * known by this binding are decoded, others are ignored.
 */
struct url_data {
	std::string _url;			// original string
	std::string _scheme;		// lower case
	std::string _authority;
	std::string _path;
	std::string _query;
	std::string _fragment;
	std::optional<spdlog::level::level_enum> _log_level;
};

/**
 * @brief Split an URL in its components.
 *
 * @param url	the URL
 * @return the URL components
 * @throws ex::invalid_argument if the URL is not valid or has no scheme
 */
url_data parse_url(const std::string& url);

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_URL_HPP_ */
