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
*	\file		lib_definitions.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_LIB_DEFINITIONS_HPP_
#define CAEN_FELIB_CPP_INCLUDE_LIB_DEFINITIONS_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#define CAEN_FELIB_CPP_VERSION_MAJOR		1
#define CAEN_FELIB_CPP_VERSION_MINOR		3
#define CAEN_FELIB_CPP_VERSION_PATCH		0
#define CAEN_FELIB_CPP_VERSION				(CAEN_FELIB_CPP_VERSION_MAJOR * 10000) + (CAEN_FELIB_CPP_VERSION_MINOR * 100) + (CAEN_FELIB_CPP_VERSION_PATCH)
#define CAEN_FELIB_CPP_STR_HELPER(S)		#S
#define CAEN_FELIB_CPP_STR(S)				CAEN_FELIB_CPP_STR_HELPER(S)
#define CAEN_FELIB_CPP_VERSION_STRING		CAEN_FELIB_CPP_STR(CAEN_FELIB_CPP_VERSION_MAJOR) "." CAEN_FELIB_CPP_STR(CAEN_FELIB_CPP_VERSION_MINOR) "." CAEN_FELIB_CPP_STR(CAEN_FELIB_CPP_VERSION_PATCH)

namespace caen {

namespace felib {

using handle_t = std::uint64_t;

// ordered list of untyped addresses passed to the variadic CAEN_FELib_ReadData
using address_list = std::vector<void*>;

// timeout value meaning "wait forever" on CAEN_FELib_ReadData and CAEN_FELib_HasData
static constexpr int infinite_timeout{-1};

namespace max_size {

// upper bound of fields in a single read data format (variadic arguments of CAEN_FELib_ReadData)
static constexpr std::size_t read_data_args{64};

namespace str {

static constexpr std::size_t version{16};
static constexpr std::size_t error_name{32};
static constexpr std::size_t error_description{256};
static constexpr std::size_t last_error_description{1024};
static constexpr std::size_t node_name{32};
static constexpr std::size_t value{256};
static constexpr std::size_t path{256};

} // namespace str

} // namespace max_size

namespace initial_size {

static constexpr std::size_t child_handles{1 << 6};
static constexpr std::size_t device_tree{1 << 22};
static constexpr std::size_t lib_info{1 << 22};
static constexpr std::size_t devices_discovery{1 << 16};

} // namespace initial_size

namespace default_value {

static constexpr std::size_t cache_capacity{128};

} // namespace default_value

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_LIB_DEFINITIONS_HPP_ */
