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
*	\file		native_api.hpp
*	\brief		Checked interface to the CAEN FELib entry points
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_NATIVE_API_HPP_
#define CAEN_FELIB_CPP_INCLUDE_NATIVE_API_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/noncopyable.hpp>

#include <CAEN_FELib.h>

#include "lib_definitions.hpp"
#include "lib_error.hpp"

namespace caen {

namespace felib {

using node_type = ::CAEN_FELib_NodeType_t;

// name and type of a node
using node_properties = std::pair<std::string, node_type>;

/**
 * @brief Typed access to the CAEN FELib entry points.
 *
 * Public functions check the returned status and convert the C buffers to
 * C++ types. Negative status are converted to exceptions:
 * - ex::timeout for CAEN_FELib_Timeout
 * - ex::stop for CAEN_FELib_Stop
 * - ex::library_error for all other codes, with the description returned by
 *   CAEN_FELib_GetLastError, logged at error level
 *
 * Raw entry points are the protected pure virtual functions, implemented by
 * the runtime loaded library (see library) or by a fake in tests.
 */
class native_api : private boost::noncopyable {
public:

	virtual ~native_api() = default;

	// library scope functions

	std::string get_lib_info(std::size_t initial_size = initial_size::lib_info);
	std::string get_lib_version();
	std::string get_error_name(error_code code);
	std::string get_error_description(error_code code);
	std::string get_last_error();
	std::string devices_discovery(int timeout, std::size_t initial_size = initial_size::devices_discovery);

	// connection

	handle_t open(const std::string& url);
	void close(handle_t handle);

	// navigation

	std::string get_device_tree(handle_t handle, std::size_t initial_size = initial_size::device_tree);
	std::vector<handle_t> get_child_handles(handle_t handle, const std::string& path, std::size_t initial_size = initial_size::child_handles);
	handle_t get_handle(handle_t handle, const std::string& path);
	handle_t get_parent_handle(handle_t handle, const std::string& path);
	std::string get_path(handle_t handle);
	node_properties get_node_properties(handle_t handle, const std::string& path);

	// parameters and commands

	std::string get_value(handle_t handle, const std::string& path, const std::string& arg = std::string());
	void set_value(handle_t handle, const std::string& path, const std::string& value);
	void send_command(handle_t handle, const std::string& path);
	std::uint32_t get_user_register(handle_t handle, std::uint32_t address);
	void set_user_register(handle_t handle, std::uint32_t address, std::uint32_t value);

	// data

	void set_read_data_format(handle_t handle, const std::string& format);

	/**
	 * @brief Read data into the addresses.
	 *
	 * Addresses are passed to the variadic CAEN_FELib_ReadData in the same
	 * order, and must match the format previously set on the handle.
	 * @throws ex::timeout	if no data is available within timeout
	 * @throws ex::stop		if the acquisition has been stopped and all data has been read
	 */
	void read_data(handle_t handle, int timeout, const address_list& args);

	/**
	 * @brief Check if data is available on an endpoint.
	 *
	 * @return false if no data is available within timeout
	 * @throws ex::stop		if the acquisition has been stopped and all data has been read
	 */
	bool has_data(handle_t handle, int timeout);

protected:

	/*
	 * Raw entry points, with the same semantic of the C functions.
	 * Strings passed as nullptr are the empty path.
	 */
	virtual int do_get_lib_info(char* json_string, std::size_t size) = 0;
	virtual int do_get_lib_version(char* version) = 0;
	virtual int do_get_error_name(int error, char* error_name) = 0;
	virtual int do_get_error_description(int error, char* error_description) = 0;
	virtual int do_get_last_error(char* last_error) = 0;
	virtual int do_devices_discovery(char* json_string, std::size_t size, int timeout) = 0;
	virtual int do_open(const char* url, handle_t* handle) = 0;
	virtual int do_close(handle_t handle) = 0;
	virtual int do_get_device_tree(handle_t handle, char* json_string, std::size_t size) = 0;
	virtual int do_get_child_handles(handle_t handle, const char* path, handle_t* handles, std::size_t size) = 0;
	virtual int do_get_handle(handle_t handle, const char* path, handle_t* path_handle) = 0;
	virtual int do_get_parent_handle(handle_t handle, const char* path, handle_t* parent_handle) = 0;
	virtual int do_get_path(handle_t handle, char* path) = 0;
	virtual int do_get_node_properties(handle_t handle, const char* path, char* name, node_type* type) = 0;
	virtual int do_get_value(handle_t handle, const char* path, char* value) = 0;
	virtual int do_set_value(handle_t handle, const char* path, const char* value) = 0;
	virtual int do_send_command(handle_t handle, const char* path) = 0;
	virtual int do_get_user_register(handle_t handle, std::uint32_t address, std::uint32_t* value) = 0;
	virtual int do_set_user_register(handle_t handle, std::uint32_t address, std::uint32_t value) = 0;
	virtual int do_set_read_data_format(handle_t handle, const char* json_string) = 0;
	virtual int do_read_data(handle_t handle, int timeout, const address_list& args) = 0;
	virtual int do_has_data(handle_t handle, int timeout) = 0;

private:

	int check(int res, std::string_view function);

	template <typename RawFunction>
	std::string grow_and_retry(std::size_t initial_size, std::string_view function, RawFunction f);

};

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_NATIVE_API_HPP_ */
