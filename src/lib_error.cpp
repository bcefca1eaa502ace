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
*	\file		lib_error.cpp
*	\brief
*
******************************************************************************/

#include "lib_error.hpp"

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace caen {

namespace felib {

namespace ex {

library_error::library_error(error_code code, std::string description, std::string function)
	: runtime_error(fmt::format("{} failed with {} ({}): {}", function, to_string(code), static_cast<int>(code), description))
	, _code{code}
	, _description{std::move(description)}
	, _function{std::move(function)} {
}

} // namespace ex

} // namespace felib

} // namespace caen
