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
*	\file		last_error.cpp
*	\brief
*
******************************************************************************/

#include "last_error.hpp"

#include <exception>
#include <new>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "lib_error.hpp"

using namespace std::literals;

namespace caen {

namespace felib {

namespace last_error {

std::string& instance() noexcept(noexcept(std::string())) {
	// std::string default constructor is noexcept(std::allocator()), and std::allocator() noexcept
	thread_local std::string s;
	return s;
}

void store_and_log(std::string_view func, std::string_view detail) noexcept {
	try {
		instance() = std::string(detail);
	} catch (const std::bad_alloc&) {
		instance().clear();
	}
	try {
		spdlog::error("[{}] {}", func, detail);
	} catch (const std::exception&) {
		// logging failures are not reported
		return;
	}
}

namespace {

void store_and_log(std::string_view func, std::string_view type, const std::exception& ex) noexcept try {
	const auto detail = fmt::format("{}: {}", type, ex.what());
	store_and_log(func, detail);
} catch (const std::exception&) {
	store_and_log(func, type);
}

} // unnamed namespace

error_code _handle_exception(std::string_view func) noexcept try {
	// this throw usage is allowed when an exception is presently being handled, it calls std::terminate if used otherwise
	throw;
}
catch (const ex::timeout&) {
	// no log message to increase performance
	return error_code::TIMEOUT;
}
catch (const ex::stop&) {
	// no log message to increase performance
	return error_code::STOP;
}
catch (const ex::library_error& ex) {
	// already logged by native_api::check
	return ex.code();
}
catch (const ex::invalid_handle& ex) {
	store_and_log(func, "invalid handle"sv, ex);
	return error_code::INVALID_HANDLE;
}
catch (const std::invalid_argument& ex) {
	store_and_log(func, "invalid argument"sv, ex);
	return error_code::INVALID_PARAM;
}
catch (const ex::library_not_available& ex) {
	store_and_log(func, "library not available"sv, ex);
	return error_code::DEVICE_LIBRARY_NOT_AVAILABLE;
}
catch (const ex::runtime_error& ex) {
	store_and_log(func, "generic runtime error"sv, ex);
	return error_code::INTERNAL_ERROR;
}
catch (const std::exception& ex) {
	store_and_log(func, "generic error"sv, ex);
	return error_code::GENERIC_ERROR;
}
catch (...) {
	store_and_log(func, "unknown exception type"sv);
	return error_code::GENERIC_ERROR;
}

} // namespace last_error

} // namespace felib

} // namespace caen
