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
*	\file		native_api.cpp
*	\brief
*
******************************************************************************/

#include "native_api.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/string.hpp"
#include "last_error.hpp"
#include "lib_error.hpp"

namespace caen {

namespace felib {

namespace {

// empty path is passed as nullptr, meaning the node itself
const char* path_or_null(const std::string& path) noexcept {
	return path.empty() ? nullptr : path.c_str();
}

template <std::size_t Size>
std::string to_string(const std::array<char, Size>& buffer) {
	return string::buffer_to_string(buffer.data(), buffer.size());
}

} // unnamed namespace

int native_api::check(int res, std::string_view function) {
	if (res >= 0)
		return res;
	const auto code = static_cast<error_code>(res);
	switch (code) {
	case error_code::TIMEOUT:
		// no log message to increase performance
		throw ex::timeout(std::string(function));
	case error_code::STOP:
		// no log message to increase performance
		throw ex::stop(std::string(function));
	default:
		break;
	}
	std::array<char, max_size::str::last_error_description> last_error_buffer{};
	std::string description;
	if (do_get_last_error(last_error_buffer.data()) == 0)
		description = to_string(last_error_buffer);
	else
		description = std::string(caen::felib::to_string(code));
	last_error::store_and_log(function, description);
	throw ex::library_error(code, std::move(description), std::string(function));
}

/*
 * Functions filling a string of user defined size return the required size
 * excluding the terminator: when the result is not smaller than the buffer
 * size, the string has been truncated and the call is repeated once with the
 * exact size.
 */
template <typename RawFunction>
std::string native_api::grow_and_retry(std::size_t initial_size, std::string_view function, RawFunction f) {
	std::vector<char> buffer(std::max<std::size_t>(initial_size, 1));
	auto res = static_cast<std::size_t>(check(f(buffer.data(), buffer.size()), function));
	if (res >= buffer.size()) {
		SPDLOG_DEBUG("{} requires {} bytes, retrying", function, res + 1);
		buffer.assign(res + 1, '\0');
		res = static_cast<std::size_t>(check(f(buffer.data(), buffer.size()), function));
		if (res >= buffer.size())
			throw ex::runtime_error(fmt::format("{} returned an unexpected size", function));
	}
	return string::buffer_to_string(buffer.data(), buffer.size());
}

std::string native_api::get_lib_info(std::size_t initial_size) {
	return grow_and_retry(initial_size, "CAEN_FELib_GetLibInfo", [this](char* data, std::size_t size) {
		return do_get_lib_info(data, size);
	});
}

std::string native_api::get_lib_version() {
	std::array<char, max_size::str::version> value{};
	check(do_get_lib_version(value.data()), "CAEN_FELib_GetLibVersion");
	return to_string(value);
}

std::string native_api::get_error_name(error_code code) {
	std::array<char, max_size::str::error_name> value{};
	check(do_get_error_name(static_cast<int>(code), value.data()), "CAEN_FELib_GetErrorName");
	return to_string(value);
}

std::string native_api::get_error_description(error_code code) {
	std::array<char, max_size::str::error_description> value{};
	check(do_get_error_description(static_cast<int>(code), value.data()), "CAEN_FELib_GetErrorDescription");
	return to_string(value);
}

std::string native_api::get_last_error() {
	std::array<char, max_size::str::last_error_description> value{};
	check(do_get_last_error(value.data()), "CAEN_FELib_GetLastError");
	return to_string(value);
}

std::string native_api::devices_discovery(int timeout, std::size_t initial_size) {
	return grow_and_retry(initial_size, "CAEN_FELib_DevicesDiscovery", [this, timeout](char* data, std::size_t size) {
		return do_devices_discovery(data, size, timeout);
	});
}

handle_t native_api::open(const std::string& url) {
	handle_t handle{};
	check(do_open(url.c_str(), &handle), "CAEN_FELib_Open");
	return handle;
}

void native_api::close(handle_t handle) {
	check(do_close(handle), "CAEN_FELib_Close");
}

std::string native_api::get_device_tree(handle_t handle, std::size_t initial_size) {
	return grow_and_retry(initial_size, "CAEN_FELib_GetDeviceTree", [this, handle](char* data, std::size_t size) {
		return do_get_device_tree(handle, data, size);
	});
}

std::vector<handle_t> native_api::get_child_handles(handle_t handle, const std::string& path, std::size_t initial_size) {
	std::vector<handle_t> handles(initial_size);
	auto res = static_cast<std::size_t>(check(do_get_child_handles(handle, path_or_null(path), handles.data(), handles.size()), "CAEN_FELib_GetChildHandles"));
	// result is the number of children, that can be larger than the provided size
	if (res > handles.size()) {
		handles.resize(res);
		res = static_cast<std::size_t>(check(do_get_child_handles(handle, path_or_null(path), handles.data(), handles.size()), "CAEN_FELib_GetChildHandles"));
		if (res > handles.size())
			throw ex::runtime_error("CAEN_FELib_GetChildHandles returned an unexpected size");
	}
	handles.resize(res);
	return handles;
}

handle_t native_api::get_handle(handle_t handle, const std::string& path) {
	handle_t value{};
	check(do_get_handle(handle, path_or_null(path), &value), "CAEN_FELib_GetHandle");
	return value;
}

handle_t native_api::get_parent_handle(handle_t handle, const std::string& path) {
	handle_t value{};
	check(do_get_parent_handle(handle, path_or_null(path), &value), "CAEN_FELib_GetParentHandle");
	return value;
}

std::string native_api::get_path(handle_t handle) {
	std::array<char, max_size::str::path> value{};
	check(do_get_path(handle, value.data()), "CAEN_FELib_GetPath");
	return to_string(value);
}

node_properties native_api::get_node_properties(handle_t handle, const std::string& path) {
	std::array<char, max_size::str::node_name> name{};
	node_type type{::CAEN_FELib_UNKNOWN};
	check(do_get_node_properties(handle, path_or_null(path), name.data(), &type), "CAEN_FELib_GetNodeProperties");
	return { to_string(name), type };
}

std::string native_api::get_value(handle_t handle, const std::string& path, const std::string& arg) {
	// the optional argument is passed in the same buffer used for the result
	std::array<char, max_size::str::value> value{};
	if (arg.size() >= value.size())
		throw ex::invalid_argument(fmt::format("argument of {} characters exceeds the value buffer ({})", arg.size(), value.size()));
	string::string_to_buffer(value.data(), arg, value.size());
	check(do_get_value(handle, path_or_null(path), value.data()), "CAEN_FELib_GetValue");
	return to_string(value);
}

void native_api::set_value(handle_t handle, const std::string& path, const std::string& value) {
	check(do_set_value(handle, path_or_null(path), value.c_str()), "CAEN_FELib_SetValue");
}

void native_api::send_command(handle_t handle, const std::string& path) {
	check(do_send_command(handle, path_or_null(path)), "CAEN_FELib_SendCommand");
}

std::uint32_t native_api::get_user_register(handle_t handle, std::uint32_t address) {
	std::uint32_t value{};
	check(do_get_user_register(handle, address, &value), "CAEN_FELib_GetUserRegister");
	return value;
}

void native_api::set_user_register(handle_t handle, std::uint32_t address, std::uint32_t value) {
	check(do_set_user_register(handle, address, value), "CAEN_FELib_SetUserRegister");
}

void native_api::set_read_data_format(handle_t handle, const std::string& format) {
	check(do_set_read_data_format(handle, format.c_str()), "CAEN_FELib_SetReadDataFormat");
}

void native_api::read_data(handle_t handle, int timeout, const address_list& args) {
	check(do_read_data(handle, timeout, args), "CAEN_FELib_ReadData");
}

bool native_api::has_data(handle_t handle, int timeout) {
	try {
		check(do_has_data(handle, timeout), "CAEN_FELib_HasData");
	} catch (const ex::timeout&) {
		return false;
	}
	return true;
}

} // namespace felib

} // namespace caen
