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
*	\file		node_test.cpp
*	\brief
*
******************************************************************************/

#include <gtest/gtest.h>

#include <memory>
#include <set>
#include <string>
#include <utility>

#include "digitizer.hpp"
#include "fake_native_api.hpp"

using namespace caen::felib;

namespace {

constexpr auto url = "dig2://caendgtz-usb-1234";

struct NodeTest : public ::testing::Test {
	std::shared_ptr<test::fake_native_api> api{std::make_shared<test::fake_native_api>()};
};

} // unnamed namespace

TEST_F(NodeTest, OpenAndClose) {
	{
		digitizer dig(api, url);
		EXPECT_TRUE(dig.is_open());
		EXPECT_TRUE(api->open_flag);
		EXPECT_EQ(dig.handle(), test::fake_native_api::root_handle);
		EXPECT_EQ(dig.url()._scheme, "dig2");
		EXPECT_EQ(dig.url()._authority, "caendgtz-usb-1234");
		EXPECT_EQ(dig.type(), ::CAEN_FELib_DIGITIZER);
	}
	// closed on destruction
	EXPECT_FALSE(api->open_flag);
	EXPECT_EQ(api->count("Close"), 1);
}

TEST_F(NodeTest, ChildNodes) {
	digitizer dig(api, url);
	const auto channels = dig.get_child_nodes("/ch");
	ASSERT_EQ(channels.size(), 3);
	std::set<std::string> names;
	for (const auto& ch : channels) {
		EXPECT_EQ(ch.type(), ::CAEN_FELib_CHANNEL);
		names.insert(ch.name());
	}
	EXPECT_EQ(names, (std::set<std::string>{"0", "1", "2"}));
	EXPECT_EQ(dig["ch"].child_nodes().size(), 3);
}

TEST_F(NodeTest, Navigation) {
	digitizer dig(api, url);
	const auto ch0 = dig["ch"]["0"];
	EXPECT_EQ(ch0, dig.get_node("/ch/0"));
	EXPECT_EQ(ch0.path(), "/ch/0");
	EXPECT_EQ(ch0.parent_node(), dig.get_node("/ch"));
	EXPECT_EQ(ch0.get_parent_node("/par"), ch0);
	EXPECT_EQ(ch0.get_node("/.."), dig["ch"]);
	EXPECT_EQ(to_string(ch0.type()), "CHANNEL");
	EXPECT_EQ(dig.get_node_properties("/cmd/armacquisition"), node_properties("armacquisition", ::CAEN_FELib_COMMAND));
	EXPECT_NE(ch0, dig["ch"]["1"]);
}

TEST_F(NodeTest, Values) {
	digitizer dig(api, url);
	EXPECT_EQ(dig.get_value("/par/numch"), "3");
	EXPECT_EQ(dig["par"]["numch"].value(), "3");
	const auto chenable = dig.get_node("/ch/1/par/chenable");
	chenable.set_value("False");
	EXPECT_EQ(chenable.value(), "False");
	EXPECT_EQ(dig.get_value("/ch/0/par/chenable"), "True");
	dig.set_value("/ch/0/par/chenable", "False");
	EXPECT_EQ(dig.get_value("/ch/0/par/chenable"), "False");
}

TEST_F(NodeTest, ValueWithArgument) {
	digitizer dig(api, url);
	EXPECT_EQ(dig.get_value_with_arg("/par/lut", "12"), "lut[12]");
	EXPECT_EQ(dig.get_value("/par/lut"), "lut[]");
}

TEST_F(NodeTest, ArgumentTooLong) {
	digitizer dig(api, url);
	const auto calls = api->count("GetValue");
	EXPECT_THROW(dig.get_value_with_arg("/par/lut", std::string(300, '1')), ex::invalid_argument);
	EXPECT_THROW(dig.get_value_with_arg("/par/lut", std::string(255, '1')), ex::invalid_argument);
	EXPECT_EQ(api->count("GetValue"), calls);
	EXPECT_EQ(dig.get_value_with_arg("/par/lut", std::string(200, '1')), "lut[" + std::string(200, '1') + "]");
}

TEST_F(NodeTest, Commands) {
	digitizer dig(api, url);
	dig.send_command("/cmd/armacquisition");
	dig["cmd"]["armacquisition"].send_command();
	ASSERT_EQ(api->commands.size(), 2);
	EXPECT_EQ(api->commands[0], "/cmd/armacquisition");
	EXPECT_THROW(dig.send_command("/par/numch"), ex::library_error);
}

TEST_F(NodeTest, UserRegisters) {
	digitizer dig(api, url);
	dig.set_user_register(0x10, 0xcafe);
	EXPECT_EQ(dig.get_user_register(0x10), 0xcafeu);
	EXPECT_EQ(dig.get_user_register(0x14), 0u);
}

TEST_F(NodeTest, DeviceTree) {
	digitizer dig(api, url);
	const auto tree = dig.get_device_tree();
	EXPECT_EQ(tree.at("name"), "dig2");
	EXPECT_TRUE(tree.at("ch").contains("2"));
	EXPECT_EQ(api->count("GetDeviceTree"), 1);

	const auto length = tree.dump().size();
	for (const auto [initial_size, expected_calls] : { std::pair{1, 2}, std::pair{int(length), 2}, std::pair{int(length) + 1, 1} }) {
		auto other_api = std::make_shared<test::fake_native_api>();
		open_options options;
		options.device_tree_initial_size = initial_size;
		digitizer other(other_api, url, options);
		EXPECT_EQ(other.get_device_tree(), tree);
		EXPECT_EQ(other_api->count("GetDeviceTree"), expected_calls) << "initial size " << initial_size;
	}
}

TEST_F(NodeTest, ChildHandlesRetry) {
	open_options options;
	options.child_handles_initial_size = 1;
	digitizer dig(api, url, options);
	EXPECT_EQ(dig.get_child_nodes("/ch").size(), 3);
	EXPECT_EQ(api->count("GetChildHandles"), 2);
	EXPECT_EQ(dig.get_child_nodes("/ch/0/par").size(), 1);
	EXPECT_EQ(api->count("GetChildHandles"), 3);
}

TEST_F(NodeTest, LookupsAreCached) {
	digitizer dig(api, url);
	const auto first = dig.get_node("/par/numch");
	const auto second = dig.get_node("/par/numch");
	EXPECT_EQ(first, second);
	EXPECT_EQ(api->count("GetHandle"), 1);
	dig.get_node("/PAR/NUMCH");
	EXPECT_EQ(api->count("GetHandle"), 2);
	first.name();
	first.name();
	EXPECT_EQ(api->count("GetNodeProperties"), 1);
}

TEST_F(NodeTest, CacheDisabled) {
	open_options options;
	options.cache_capacity = 0;
	digitizer dig(api, url, options);
	dig.get_node("/par/numch");
	dig.get_node("/par/numch");
	EXPECT_EQ(api->count("GetHandle"), 2);
}

TEST_F(NodeTest, CloseInvalidatesNodes) {
	digitizer dig(api, url);
	const auto ch = dig.get_node("/ch");
	dig.close();
	EXPECT_FALSE(dig.is_open());
	EXPECT_FALSE(api->open_flag);
	EXPECT_THROW(ch.get_child_nodes(), ex::invalid_handle);
	EXPECT_THROW(ch.get_value("/0/par/chenable"), ex::invalid_handle);
	EXPECT_THROW(dig.get_node("/ch"), ex::invalid_handle);
	EXPECT_EQ(api->count("GetChildHandles"), 0);
}

TEST_F(NodeTest, CloseTwice) {
	digitizer dig(api, url);
	dig.close();
	EXPECT_THROW(dig.close(), ex::invalid_handle);
	EXPECT_EQ(api->count("Close"), 1);
}

TEST_F(NodeTest, DestroyedDigitizerInvalidatesNodes) {
	auto dig = std::make_unique<digitizer>(api, url);
	const auto ch = dig->get_node("/ch");
	dig.reset();
	EXPECT_THROW(ch.get_child_nodes(), ex::invalid_handle);
	EXPECT_THROW(ch.name(), ex::invalid_handle);
}

TEST_F(NodeTest, MovedDigitizerKeepsSession) {
	digitizer dig(api, url);
	digitizer moved(std::move(dig));
	EXPECT_TRUE(moved.is_open());
	EXPECT_EQ(moved.get_value("/par/numch"), "3");
	moved.close();
	EXPECT_EQ(api->count("Close"), 1);
}

TEST_F(NodeTest, LibraryErrorDetails) {
	digitizer dig(api, url);
	try {
		dig.get_node("/missing");
		FAIL() << "exception not thrown";
	} catch (const ex::library_error& e) {
		EXPECT_EQ(e.code(), error_code::INVALID_PARAM);
		EXPECT_EQ(e.function(), "CAEN_FELib_GetHandle");
		EXPECT_EQ(e.description(), "node missing not found");
		EXPECT_NE(std::string(e.what()).find("CAEN_FELib_GetHandle"), std::string::npos);
	}
	// failures are not cached
	EXPECT_THROW(dig.get_node("/missing"), ex::library_error);
	EXPECT_EQ(api->count("GetHandle"), 2);
}

TEST_F(NodeTest, OpenFailure) {
	EXPECT_THROW(digitizer(api, "dig1://caendgtz-usb-1234"), ex::library_error);
	EXPECT_EQ(api->count("Open"), 1);
	EXPECT_FALSE(api->open_flag);
}

TEST_F(NodeTest, InvalidUrlNotOpened) {
	EXPECT_THROW(digitizer(api, "not a url"), ex::invalid_argument);
	EXPECT_EQ(api->count("Open"), 0);
}

TEST_F(NodeTest, AlreadyOpen) {
	digitizer dig(api, url);
	try {
		digitizer other(api, url);
		FAIL() << "exception not thrown";
	} catch (const ex::library_error& e) {
		EXPECT_EQ(e.code(), error_code::DEVICE_ALREADY_OPEN);
	}
	EXPECT_TRUE(dig.is_open());
}

TEST_F(NodeTest, LibraryQueries) {
	EXPECT_EQ(api->get_lib_version(), "1.3.0");
	EXPECT_EQ(api->get_error_name(error_code::TIMEOUT), "TIMEOUT");
	EXPECT_EQ(nlohmann::json::parse(api->get_lib_info(4)).at(0).at("name"), "dig2");
	EXPECT_EQ(api->count("GetLibInfo"), 2);
	EXPECT_EQ(api->devices_discovery(100), "[]");
}
