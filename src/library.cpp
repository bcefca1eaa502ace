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
*	\file		library.cpp
*	\brief
*
******************************************************************************/

#include "library.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "cpp-utility/dll.hpp"
#include "cpp-utility/variadic_call.hpp"
#include "library_logger.hpp"

namespace caen {

namespace felib {

namespace {

std::string library_path() {
	const auto env = std::getenv("CAEN_FELIB_CPP_LIBRARY");
	if (env != nullptr && *env != '\0')
		return env;
	return dll::shared_library::get_library_name("CAEN_FELib");
}

} // unnamed namespace

struct library::impl {

	explicit impl(std::string path)
	: _lib(std::move(path))
	, _get_lib_info{load<decltype(&::CAEN_FELib_GetLibInfo)>("CAEN_FELib_GetLibInfo")}
	, _get_lib_version{load<decltype(&::CAEN_FELib_GetLibVersion)>("CAEN_FELib_GetLibVersion")}
	, _get_error_name{load<decltype(&::CAEN_FELib_GetErrorName)>("CAEN_FELib_GetErrorName")}
	, _get_error_description{load<decltype(&::CAEN_FELib_GetErrorDescription)>("CAEN_FELib_GetErrorDescription")}
	, _get_last_error{load<decltype(&::CAEN_FELib_GetLastError)>("CAEN_FELib_GetLastError")}
	, _devices_discovery{load<decltype(&::CAEN_FELib_DevicesDiscovery)>("CAEN_FELib_DevicesDiscovery")}
	, _open{load<decltype(&::CAEN_FELib_Open)>("CAEN_FELib_Open")}
	, _close{load<decltype(&::CAEN_FELib_Close)>("CAEN_FELib_Close")}
	, _get_device_tree{load<decltype(&::CAEN_FELib_GetDeviceTree)>("CAEN_FELib_GetDeviceTree")}
	, _get_child_handles{load<decltype(&::CAEN_FELib_GetChildHandles)>("CAEN_FELib_GetChildHandles")}
	, _get_handle{load<decltype(&::CAEN_FELib_GetHandle)>("CAEN_FELib_GetHandle")}
	, _get_parent_handle{load<decltype(&::CAEN_FELib_GetParentHandle)>("CAEN_FELib_GetParentHandle")}
	, _get_path{load<decltype(&::CAEN_FELib_GetPath)>("CAEN_FELib_GetPath")}
	, _get_node_properties{load<decltype(&::CAEN_FELib_GetNodeProperties)>("CAEN_FELib_GetNodeProperties")}
	, _get_value{load<decltype(&::CAEN_FELib_GetValue)>("CAEN_FELib_GetValue")}
	, _set_value{load<decltype(&::CAEN_FELib_SetValue)>("CAEN_FELib_SetValue")}
	, _send_command{load<decltype(&::CAEN_FELib_SendCommand)>("CAEN_FELib_SendCommand")}
	, _get_user_register{load<decltype(&::CAEN_FELib_GetUserRegister)>("CAEN_FELib_GetUserRegister")}
	, _set_user_register{load<decltype(&::CAEN_FELib_SetUserRegister)>("CAEN_FELib_SetUserRegister")}
	, _set_read_data_format{load<decltype(&::CAEN_FELib_SetReadDataFormat)>("CAEN_FELib_SetReadDataFormat")}
	, _read_data{load<decltype(&::CAEN_FELib_ReadData)>("CAEN_FELib_ReadData")}
	, _has_data{load<decltype(&::CAEN_FELib_HasData)>("CAEN_FELib_HasData")} {
	}

	template <typename FunctionType>
	FunctionType load(const char* name) const {
		return _lib.symbol<FunctionType>(name);
	}

	// must be declared first, to be unloaded after the function pointers are gone
	const dll::shared_library _lib;

	const decltype(&::CAEN_FELib_GetLibInfo) _get_lib_info;
	const decltype(&::CAEN_FELib_GetLibVersion) _get_lib_version;
	const decltype(&::CAEN_FELib_GetErrorName) _get_error_name;
	const decltype(&::CAEN_FELib_GetErrorDescription) _get_error_description;
	const decltype(&::CAEN_FELib_GetLastError) _get_last_error;
	const decltype(&::CAEN_FELib_DevicesDiscovery) _devices_discovery;
	const decltype(&::CAEN_FELib_Open) _open;
	const decltype(&::CAEN_FELib_Close) _close;
	const decltype(&::CAEN_FELib_GetDeviceTree) _get_device_tree;
	const decltype(&::CAEN_FELib_GetChildHandles) _get_child_handles;
	const decltype(&::CAEN_FELib_GetHandle) _get_handle;
	const decltype(&::CAEN_FELib_GetParentHandle) _get_parent_handle;
	const decltype(&::CAEN_FELib_GetPath) _get_path;
	const decltype(&::CAEN_FELib_GetNodeProperties) _get_node_properties;
	const decltype(&::CAEN_FELib_GetValue) _get_value;
	const decltype(&::CAEN_FELib_SetValue) _set_value;
	const decltype(&::CAEN_FELib_SendCommand) _send_command;
	const decltype(&::CAEN_FELib_GetUserRegister) _get_user_register;
	const decltype(&::CAEN_FELib_SetUserRegister) _set_user_register;
	const decltype(&::CAEN_FELib_SetReadDataFormat) _set_read_data_format;
	const decltype(&::CAEN_FELib_ReadData) _read_data;
	const decltype(&::CAEN_FELib_HasData) _has_data;

};

library::library(std::string path) {
	library_logger::init();
	try {
		_pimpl = std::make_unique<impl>(std::move(path));
	} catch (const std::runtime_error& e) {
		spdlog::error("cannot load CAEN FELib: {}", e.what());
		throw ex::library_not_available(e.what());
	}
	spdlog::info("CAEN FELib loaded from {}", _pimpl->_lib.path());
}

library::~library() = default;

std::shared_ptr<library> library::instance() {
	static std::mutex mtx;
	static std::shared_ptr<library> instance;
	std::lock_guard<std::mutex> lock(mtx);
	if (!instance)
		instance = std::make_shared<library>(library_path());
	return instance;
}

const std::string& library::path() const noexcept {
	return _pimpl->_lib.path();
}

int library::do_get_lib_info(char* json_string, std::size_t size) {
	return _pimpl->_get_lib_info(json_string, size);
}

int library::do_get_lib_version(char* version) {
	return _pimpl->_get_lib_version(version);
}

int library::do_get_error_name(int error, char* error_name) {
	return _pimpl->_get_error_name(static_cast<::CAEN_FELib_ErrorCode>(error), error_name);
}

int library::do_get_error_description(int error, char* error_description) {
	return _pimpl->_get_error_description(static_cast<::CAEN_FELib_ErrorCode>(error), error_description);
}

int library::do_get_last_error(char* last_error) {
	return _pimpl->_get_last_error(last_error);
}

int library::do_devices_discovery(char* json_string, std::size_t size, int timeout) {
	return _pimpl->_devices_discovery(json_string, size, timeout);
}

int library::do_open(const char* url, handle_t* handle) {
	return _pimpl->_open(url, handle);
}

int library::do_close(handle_t handle) {
	return _pimpl->_close(handle);
}

int library::do_get_device_tree(handle_t handle, char* json_string, std::size_t size) {
	return _pimpl->_get_device_tree(handle, json_string, size);
}

int library::do_get_child_handles(handle_t handle, const char* path, handle_t* handles, std::size_t size) {
	return _pimpl->_get_child_handles(handle, path, handles, size);
}

int library::do_get_handle(handle_t handle, const char* path, handle_t* path_handle) {
	return _pimpl->_get_handle(handle, path, path_handle);
}

int library::do_get_parent_handle(handle_t handle, const char* path, handle_t* parent_handle) {
	return _pimpl->_get_parent_handle(handle, path, parent_handle);
}

int library::do_get_path(handle_t handle, char* path) {
	return _pimpl->_get_path(handle, path);
}

int library::do_get_node_properties(handle_t handle, const char* path, char* name, node_type* type) {
	return _pimpl->_get_node_properties(handle, path, name, type);
}

int library::do_get_value(handle_t handle, const char* path, char* value) {
	return _pimpl->_get_value(handle, path, value);
}

int library::do_set_value(handle_t handle, const char* path, const char* value) {
	return _pimpl->_set_value(handle, path, value);
}

int library::do_send_command(handle_t handle, const char* path) {
	return _pimpl->_send_command(handle, path);
}

int library::do_get_user_register(handle_t handle, std::uint32_t address, std::uint32_t* value) {
	return _pimpl->_get_user_register(handle, address, value);
}

int library::do_set_user_register(handle_t handle, std::uint32_t address, std::uint32_t value) {
	return _pimpl->_set_user_register(handle, address, value);
}

int library::do_set_read_data_format(handle_t handle, const char* json_string) {
	return _pimpl->_set_read_data_format(handle, json_string);
}

int library::do_read_data(handle_t handle, int timeout, const address_list& args) {
	// addresses are untyped: CAEN FELib knows the actual types from the format set on the handle
	return variadic::call_expanded<max_size::read_data_args>(_pimpl->_read_data, args, handle, timeout);
}

int library::do_has_data(handle_t handle, int timeout) {
	return _pimpl->_has_data(handle, timeout);
}

namespace lib {

std::string version() {
	return library::instance()->get_lib_version();
}

nlohmann::json info() {
	return nlohmann::json::parse(library::instance()->get_lib_info());
}

std::string error_name(error_code code) {
	return library::instance()->get_error_name(code);
}

std::string error_description(error_code code) {
	return library::instance()->get_error_description(code);
}

std::string last_error() {
	return library::instance()->get_last_error();
}

nlohmann::json devices_discovery(int timeout) {
	return nlohmann::json::parse(library::instance()->devices_discovery(timeout));
}

} // namespace lib

} // namespace felib

} // namespace caen
