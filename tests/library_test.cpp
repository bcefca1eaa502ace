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
*	\file		library_test.cpp
*	\brief
*
******************************************************************************/

#include <gtest/gtest.h>

#include <string>

#include "caen_felib.hpp"
#include "cpp-utility/dll.hpp"

using namespace caen::felib;

TEST(LibraryTest, LibraryName) {
#if defined(_WIN32)
	EXPECT_EQ(dll::shared_library::get_library_name("CAEN_FELib"), "CAEN_FELib.dll");
#elif defined(__APPLE__)
	EXPECT_EQ(dll::shared_library::get_library_name("CAEN_FELib"), "libCAEN_FELib.dylib");
#else
	EXPECT_EQ(dll::shared_library::get_library_name("CAEN_FELib"), "libCAEN_FELib.so");
#endif
}

TEST(LibraryTest, NotAvailable) {
	EXPECT_THROW(library("/nonexistent/libCAEN_FELib.so"), ex::library_not_available);
}

TEST(LibraryTest, Version) {
	EXPECT_STREQ(CAEN_FELIB_CPP_VERSION_STRING, "1.3.0");
	EXPECT_EQ(CAEN_FELIB_CPP_VERSION, 10300);
}
