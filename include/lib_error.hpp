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
*	\file		lib_error.hpp
*	\brief		Error codes and exceptions
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_LIB_ERROR_HPP_
#define CAEN_FELIB_CPP_INCLUDE_LIB_ERROR_HPP_

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/static_assert.hpp>

#include <CAEN_FELib.h>

#include "lib_definitions.hpp"

namespace caen {

namespace felib {

/**
 * @brief Error codes returned by CAEN FELib functions.
 *
 * Same values of ::CAEN_FELib_ErrorCode, as scoped enumerator.
 */
enum class error_code : int {
	SUCCESS							= 0,
	GENERIC_ERROR					= -1,
	INVALID_PARAM					= -2,
	DEVICE_ALREADY_OPEN				= -3,
	DEVICE_NOT_FOUND				= -4,
	MAX_DEVICES_ERROR				= -5,
	COMMAND_ERROR					= -6,
	INTERNAL_ERROR					= -7,
	NOT_IMPLEMENTED					= -8,
	INVALID_HANDLE					= -9,
	DEVICE_LIBRARY_NOT_AVAILABLE	= -10,
	TIMEOUT							= -11,
	STOP							= -12,
	DISABLED						= -13,
	BAD_LIBRARY_VERSION				= -14,
	COMMUNICATION_ERROR				= -15,
};

BOOST_STATIC_ASSERT(static_cast<int>(error_code::SUCCESS) == ::CAEN_FELib_Success);
BOOST_STATIC_ASSERT(static_cast<int>(error_code::GENERIC_ERROR) == ::CAEN_FELib_GenericError);
BOOST_STATIC_ASSERT(static_cast<int>(error_code::INVALID_PARAM) == ::CAEN_FELib_InvalidParam);
BOOST_STATIC_ASSERT(static_cast<int>(error_code::INVALID_HANDLE) == ::CAEN_FELib_InvalidHandle);
BOOST_STATIC_ASSERT(static_cast<int>(error_code::TIMEOUT) == ::CAEN_FELib_Timeout);
BOOST_STATIC_ASSERT(static_cast<int>(error_code::STOP) == ::CAEN_FELib_Stop);
BOOST_STATIC_ASSERT(static_cast<int>(error_code::COMMUNICATION_ERROR) == ::CAEN_FELib_CommunicationError);

/**
 * @brief Name of an error code, as defined by this library.
 *
 * @param code	the error code
 * @return		a string like "TIMEOUT", or "UNKNOWN" if not a valid code
 */
constexpr std::string_view to_string(error_code code) noexcept {
	switch (code) {
	case error_code::SUCCESS:						return "SUCCESS";
	case error_code::GENERIC_ERROR:					return "GENERIC_ERROR";
	case error_code::INVALID_PARAM:					return "INVALID_PARAM";
	case error_code::DEVICE_ALREADY_OPEN:			return "DEVICE_ALREADY_OPEN";
	case error_code::DEVICE_NOT_FOUND:				return "DEVICE_NOT_FOUND";
	case error_code::MAX_DEVICES_ERROR:				return "MAX_DEVICES_ERROR";
	case error_code::COMMAND_ERROR:					return "COMMAND_ERROR";
	case error_code::INTERNAL_ERROR:				return "INTERNAL_ERROR";
	case error_code::NOT_IMPLEMENTED:				return "NOT_IMPLEMENTED";
	case error_code::INVALID_HANDLE:				return "INVALID_HANDLE";
	case error_code::DEVICE_LIBRARY_NOT_AVAILABLE:	return "DEVICE_LIBRARY_NOT_AVAILABLE";
	case error_code::TIMEOUT:						return "TIMEOUT";
	case error_code::STOP:							return "STOP";
	case error_code::DISABLED:						return "DISABLED";
	case error_code::BAD_LIBRARY_VERSION:			return "BAD_LIBRARY_VERSION";
	case error_code::COMMUNICATION_ERROR:			return "COMMUNICATION_ERROR";
	}
	return "UNKNOWN";
}

/**
 * @brief Timeout and stop are the only codes a read loop is expected to handle.
 *
 * Timeout means no data before the deadline (read again), stop means that the
 * acquisition has been stopped (exit the loop). Anything else is fatal.
 */
constexpr bool is_retryable(error_code code) noexcept {
	return code == error_code::TIMEOUT || code == error_code::STOP;
}

// stop is retryable but a read loop must exit instead of reading again
constexpr bool is_read_loop_exit(error_code code) noexcept {
	return code == error_code::STOP;
}

namespace ex {

using namespace std::string_literals;

struct runtime_error : public std::runtime_error {
	using std::runtime_error::runtime_error;
};

struct invalid_argument : public std::invalid_argument {
	using std::invalid_argument::invalid_argument;
};

/**
 * @brief Raised when a CAEN FELib function returns a negative value.
 *
 * Holds the error code, the last error description provided by the library
 * and the name of the failed function.
 */
struct library_error : public ex::runtime_error {

	library_error(error_code code, std::string description, std::string function);

	error_code code() const noexcept { return _code; }
	const std::string& description() const noexcept { return _description; }
	const std::string& function() const noexcept { return _function; }

private:
	const error_code _code;
	const std::string _description;
	const std::string _function;
};

struct timeout : public ex::library_error {
	explicit timeout(std::string function) : library_error(error_code::TIMEOUT, "timeout"s, std::move(function)) {}
};

struct stop : public ex::library_error {
	explicit stop(std::string function) : library_error(error_code::STOP, "stop"s, std::move(function)) {}
};

/**
 * @brief Raised when a node is used after its digitizer has been closed.
 *
 * Never generated by CAEN FELib: the check is performed before calling the library.
 */
struct invalid_handle : public std::invalid_argument {
	explicit invalid_handle(handle_t handle) : invalid_argument("invalid handle "s + std::to_string(handle)), _handle{handle} {}
	handle_t handle() const noexcept { return _handle; }
private:
	const handle_t _handle;
};

struct unsupported_type : public ex::invalid_argument {
	using ex::invalid_argument::invalid_argument;
};

struct shape_mismatch : public ex::invalid_argument {
	using ex::invalid_argument::invalid_argument;
};

struct library_not_available : public ex::runtime_error {
	using ex::runtime_error::runtime_error;
};

} // namespace ex

/**
 * @brief UDL to generate ex::runtime_error with compile-time defined message.
 *
 * Example:
 * @code
 * throw "generic error"_ex;
 * @endcode
 */
inline auto operator""_ex(const char* str, std::size_t len) {
	return ex::runtime_error(std::string(str, len));
}

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_LIB_ERROR_HPP_ */
