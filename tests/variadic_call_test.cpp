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
*	\file		variadic_call_test.cpp
*	\brief
*
******************************************************************************/

#include <gtest/gtest.h>

#include <cstdarg>
#include <cstdint>
#include <stdexcept>
#include <vector>

#include "cpp-utility/variadic_call.hpp"

using namespace caen::felib;

namespace {

// writes its index in each address, like a C function filling buffers
int fill_indexes(std::uint64_t handle, int n, ...) {
	std::va_list args;
	va_start(args, n);
	for (int i = 0; i < n; ++i)
		*static_cast<int*>(va_arg(args, void*)) = i + static_cast<int>(handle);
	va_end(args);
	return n;
}

int call(std::vector<int>& values, std::uint64_t offset) {
	std::vector<void*> args;
	for (auto& v : values)
		args.push_back(&v);
	return variadic::call_expanded<64>(&fill_indexes, args, offset, static_cast<int>(args.size()));
}

} // unnamed namespace

TEST(VariadicCallTest, NoArguments) {
	std::vector<int> values;
	EXPECT_EQ(call(values, 0), 0);
}

TEST(VariadicCallTest, SomeArguments) {
	std::vector<int> values(3, -1);
	EXPECT_EQ(call(values, 10), 3);
	EXPECT_EQ(values, (std::vector<int>{10, 11, 12}));
}

TEST(VariadicCallTest, MaxArguments) {
	std::vector<int> values(64, -1);
	EXPECT_EQ(call(values, 0), 64);
	for (int i = 0; i < 64; ++i)
		EXPECT_EQ(values[i], i);
}

TEST(VariadicCallTest, TooManyArguments) {
	std::vector<int> values(65, -1);
	EXPECT_THROW(call(values, 0), std::invalid_argument);
	EXPECT_EQ(values.front(), -1);
}
