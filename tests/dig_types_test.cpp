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
*	\file		dig_types_test.cpp
*	\brief
*
******************************************************************************/

#include <gtest/gtest.h>

#include <cstdint>

#include "dig1_types.hpp"
#include "dig2_types.hpp"

using namespace caen::felib;

TEST(DigTypesTest, Dig2AnalogProbe) {
	EXPECT_EQ(dig2::to_analog_probe_type(0b0010), dig2::dpp_analog_probe_type::energy_filter);
	EXPECT_EQ(dig2::to_analog_probe_type(0b1010), dig2::dpp_analog_probe_type::cfd);
	EXPECT_EQ(dig2::to_analog_probe_type(0b0111), dig2::dpp_analog_probe_type::unknown);
	static_assert(dig2::to_analog_probe_type(0) == dig2::dpp_analog_probe_type::adc_input);
}

TEST(DigTypesTest, Dig2Flags) {
	const std::uint16_t low = combine_flags(dig2::low_priority_flags::self_trigger, dig2::low_priority_flags::itla_trigger);
	EXPECT_EQ(low, 0x240);
	EXPECT_TRUE(has_flag(low, dig2::low_priority_flags::self_trigger));
	EXPECT_FALSE(has_flag(low, dig2::low_priority_flags::software_trigger));
	const std::uint8_t high = 0x21;
	EXPECT_TRUE(has_flag(high, dig2::high_priority_flags_pha::pile_up));
	EXPECT_TRUE(has_flag(high, dig2::high_priority_flags_psd::sca_selected));
	EXPECT_FALSE(has_flag(high, dig2::high_priority_flags_psd::fine_timestamp));
}

TEST(DigTypesTest, Dig1) {
	EXPECT_EQ(to_underlying(dig1::dpp_probe_type::invalid), -1);
	EXPECT_EQ(to_underlying(dig1::dpp_probe_type::trap_baseline), 50);
	const std::uint32_t flags = 0x1002000;
	EXPECT_TRUE(has_flag(flags, dig1::dpp_flags::eor));
	EXPECT_TRUE(has_flag(flags, dig1::dpp_flags::stop_cond));
	EXPECT_FALSE(has_flag(flags, dig1::dpp_flags::pile_up));
}
