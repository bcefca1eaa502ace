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
*	\file		url_test.cpp
*	\brief
*
******************************************************************************/

#include <gtest/gtest.h>

#include "lib_error.hpp"
#include "url.hpp"

using namespace caen::felib;

TEST(UrlTest, Components) {
	const auto data = parse_url("Dig2://caendgtz-usb-12345/path?log_level=debug&monitor#frag");
	EXPECT_EQ(data._url, "Dig2://caendgtz-usb-12345/path?log_level=debug&monitor#frag");
	EXPECT_EQ(data._scheme, "dig2");
	EXPECT_EQ(data._authority, "caendgtz-usb-12345");
	EXPECT_EQ(data._path, "/path");
	EXPECT_EQ(data._query, "log_level=debug&monitor");
	EXPECT_EQ(data._fragment, "frag");
	ASSERT_TRUE(data._log_level.has_value());
	EXPECT_EQ(*data._log_level, spdlog::level::debug);
}

TEST(UrlTest, NoQuery) {
	const auto data = parse_url("dig1://caen.internal/usb?link_num=0");
	EXPECT_EQ(data._scheme, "dig1");
	EXPECT_EQ(data._authority, "caen.internal");
	EXPECT_EQ(data._path, "/usb");
	EXPECT_FALSE(data._log_level.has_value());
}

TEST(UrlTest, LogLevelCaseInsensitive) {
	EXPECT_EQ(parse_url("dig2://host?LOG_LEVEL=TRACE")._log_level.value(), spdlog::level::trace);
	EXPECT_EQ(parse_url("dig2://host?log_level=off")._log_level.value(), spdlog::level::off);
}

TEST(UrlTest, Invalid) {
	EXPECT_THROW(parse_url("caendgtz-usb-12345"), ex::invalid_argument);
	EXPECT_THROW(parse_url("dig2:caendgtz-usb-12345"), ex::invalid_argument);
	EXPECT_THROW(parse_url(""), ex::invalid_argument);
	EXPECT_THROW(parse_url("dig2://host?log_level"), ex::invalid_argument);
}
