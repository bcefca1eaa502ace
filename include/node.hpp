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
*	\file		node.hpp
*	\brief		Device tree node
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_NODE_HPP_
#define CAEN_FELIB_CPP_INCLUDE_NODE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "data_format.hpp"
#include "lib_definitions.hpp"
#include "lib_error.hpp"
#include "native_api.hpp"

namespace caen {

namespace felib {

class session; // forward declaration

/**
 * @brief Name of a node type, like "CHANNEL".
 */
std::string to_string(node_type type);

/**
 * @brief A node of the device tree.
 *
 * Nodes are lightweight values: a handle and a weak reference to the session
 * of the digitizer they come from. They never close the device. Using a node
 * after its digitizer has been closed or destroyed throws ex::invalid_handle.
 *
 * Paths are relative to the node; the empty path means the node itself.
 *
 * @warning The read data format is a property of the endpoint handle:
 * set_read_data_format on an endpoint replaces the format used by any other
 * format_set previously registered on the same endpoint, and read_data rejects
 * the replaced ones.
 */
class node {
public:

	node(std::weak_ptr<session> s, handle_t handle) noexcept;

	handle_t handle() const noexcept { return _handle; }

	// navigation

	std::vector<node> get_child_nodes(const std::string& path = std::string()) const;
	node get_node(const std::string& path) const;
	node get_parent_node(const std::string& path = std::string()) const;
	std::string get_path() const;
	node_properties get_node_properties(const std::string& path = std::string()) const;

	/**
	 * @brief Device tree of the node, as JSON.
	 */
	nlohmann::json get_device_tree() const;

	// values and commands

	std::string get_value(const std::string& path = std::string()) const;

	/**
	 * @brief Get value of parameters that require an argument.
	 *
	 * @param path	relative path
	 * @param arg	argument, e.g. the index of a lookup table
	 */
	std::string get_value_with_arg(const std::string& path, const std::string& arg) const;
	void set_value(const std::string& path, const std::string& value) const;
	void send_command(const std::string& path = std::string()) const;
	std::uint32_t get_user_register(std::uint32_t address) const;
	void set_user_register(std::uint32_t address, std::uint32_t value) const;

	// data

	/**
	 * @brief Set the read data format of an endpoint.
	 *
	 * @param fields	ordered list of fields
	 * @return the buffers to be used with read_data
	 * @throws ex::invalid_argument if the format is not valid, before any call to the library
	 */
	format_set set_read_data_format(std::vector<field_descriptor> fields) const;

	/**
	 * @brief Same of set_read_data_format, from a JSON list of {name, type, dim, shape}.
	 *
	 * @overload
	 */
	format_set set_read_data_format(std::string_view json_format) const;

	/**
	 * @brief Read an event into the buffers.
	 *
	 * @param timeout	timeout in milliseconds, or infinite_timeout
	 * @param data		a format set returned by set_read_data_format on this node
	 * @throws ex::timeout	if no data is available within timeout
	 * @throws ex::stop		if the acquisition has been stopped and all data has been read
	 * @throws ex::invalid_argument	if data belongs to another node or has been replaced
	 * by a later set_read_data_format
	 */
	void read_data(int timeout, format_set& data) const;

	/**
	 * @brief Non throwing version of read_data for read loops.
	 *
	 * @return error_code::SUCCESS, error_code::TIMEOUT, error_code::STOP or
	 * the code of the error, that is logged
	 */
	error_code try_read_data(int timeout, format_set& data) const noexcept;

	/**
	 * @brief Check if data is available.
	 *
	 * @return false if no data is available within timeout
	 */
	bool has_data(int timeout) const;

	// named accessors

	std::string name() const;
	node_type type() const;
	std::string path() const { return get_path(); }
	node parent_node() const { return get_parent_node(); }
	std::vector<node> child_nodes() const { return get_child_nodes(); }
	std::string value() const { return get_value(); }
	void set_value(const std::string& value) const { set_value(std::string(), value); }
	node get(const std::string& path) const { return get_node(path); }

	/**
	 * @brief Child lookup by name, e.g. `dig["par"]["numch"]`.
	 *
	 * @param name	child name, without leading slash
	 */
	node operator[](std::string_view name) const;

	friend bool operator==(const node& lhs, const node& rhs) noexcept { return lhs._handle == rhs._handle; }
	friend bool operator!=(const node& lhs, const node& rhs) noexcept { return !(lhs == rhs); }

protected:

	// the session, if still open
	std::shared_ptr<session> lock() const;

private:
	std::weak_ptr<session> _session;
	handle_t _handle;
};

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_NODE_HPP_ */
