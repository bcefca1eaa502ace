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
*	\file		last_error.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_LAST_ERROR_HPP_
#define CAEN_FELIB_CPP_INCLUDE_LAST_ERROR_HPP_

#include <string>
#include <string_view>

#include <boost/current_function.hpp>

#include "lib_error.hpp"

namespace caen {

namespace felib {

namespace last_error {

/**
 * @brief Last error detail of the calling thread, as formatted by this binding.
 *
 * Not to be confused with CAEN_FELib_GetLastError, that is the description
 * provided by the native library.
 */
std::string& instance() noexcept(noexcept(std::string()));

/**
 * @brief Store a detail as last error and log it on the default logger.
 *
 * @param func		the function name
 * @param detail	the detail
 */
void store_and_log(std::string_view func, std::string_view detail) noexcept;

/**
 * @brief Convert the exception currently being handled to an error code.
 *
 * Must be invoked only within a catch block.
 * @param func		the function name, used for the log
 * @return the error code closest to the exception type
 */
error_code _handle_exception(std::string_view func) noexcept;

} // namespace last_error

} // namespace felib

} // namespace caen

// macro to automatic put function name
#define CAEN_FELIB_CPP_HANDLE_EXCEPTION() ::caen::felib::last_error::_handle_exception(BOOST_CURRENT_FUNCTION)

#endif /* CAEN_FELIB_CPP_INCLUDE_LAST_ERROR_HPP_ */
