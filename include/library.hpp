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
*	\file		library.hpp
*	\brief		Runtime loaded CAEN FELib
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_LIBRARY_HPP_
#define CAEN_FELIB_CPP_INCLUDE_LIBRARY_HPP_

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "lib_error.hpp"
#include "native_api.hpp"

namespace caen {

namespace felib {

/**
 * @brief CAEN FELib loaded at runtime.
 *
 * Function pointers are resolved once, at construction, with the exact types
 * declared by CAEN_FELib.h.
 */
class library final : public native_api {
public:

	/**
	 * @brief Load a library from a path.
	 *
	 * @param path	file name or path of the library
	 * @throws ex::library_not_available if the library or any entry point cannot be loaded
	 */
	explicit library(std::string path);
	~library() override;

	/**
	 * @brief Shared instance, loaded on first call.
	 *
	 * The library path is the value of CAEN_FELIB_CPP_LIBRARY environment
	 * variable, if set, or the platform specific name of CAEN_FELib.
	 * A failed load is retried on next call.
	 */
	static std::shared_ptr<library> instance();

	const std::string& path() const noexcept;

protected:

	int do_get_lib_info(char* json_string, std::size_t size) override;
	int do_get_lib_version(char* version) override;
	int do_get_error_name(int error, char* error_name) override;
	int do_get_error_description(int error, char* error_description) override;
	int do_get_last_error(char* last_error) override;
	int do_devices_discovery(char* json_string, std::size_t size, int timeout) override;
	int do_open(const char* url, handle_t* handle) override;
	int do_close(handle_t handle) override;
	int do_get_device_tree(handle_t handle, char* json_string, std::size_t size) override;
	int do_get_child_handles(handle_t handle, const char* path, handle_t* handles, std::size_t size) override;
	int do_get_handle(handle_t handle, const char* path, handle_t* path_handle) override;
	int do_get_parent_handle(handle_t handle, const char* path, handle_t* parent_handle) override;
	int do_get_path(handle_t handle, char* path) override;
	int do_get_node_properties(handle_t handle, const char* path, char* name, node_type* type) override;
	int do_get_value(handle_t handle, const char* path, char* value) override;
	int do_set_value(handle_t handle, const char* path, const char* value) override;
	int do_send_command(handle_t handle, const char* path) override;
	int do_get_user_register(handle_t handle, std::uint32_t address, std::uint32_t* value) override;
	int do_set_user_register(handle_t handle, std::uint32_t address, std::uint32_t value) override;
	int do_set_read_data_format(handle_t handle, const char* json_string) override;
	int do_read_data(handle_t handle, int timeout, const address_list& args) override;
	int do_has_data(handle_t handle, int timeout) override;

private:

	struct impl;
	std::unique_ptr<impl> _pimpl;

};

/*
 * Library scope functions, on the shared instance.
 */
namespace lib {

std::string version();

nlohmann::json info();

std::string error_name(error_code code);

std::string error_description(error_code code);

// last error description provided by CAEN FELib for the calling thread
std::string last_error();

/**
 * @brief Discover devices on the network.
 *
 * @param timeout	timeout in seconds
 * @return the list of devices, as returned by CAEN FELib
 */
nlohmann::json devices_discovery(int timeout);

} // namespace lib

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_LIBRARY_HPP_ */
