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
*	\file		node.cpp
*	\brief
*
******************************************************************************/

#include "node.hpp"

#include <iterator>
#include <utility>

#include <boost/range/algorithm/transform.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include "json/json_node_type.hpp"
#include "last_error.hpp"
#include "session.hpp"

namespace caen {

namespace felib {

std::string to_string(node_type type) {
	if (type == ::CAEN_FELib_UNKNOWN)
		return "UNKNOWN";
	const nlohmann::json j(type);
	return j.is_string() ? j.get<std::string>() : fmt::format("UNKNOWN ({})", static_cast<int>(type));
}

node::node(std::weak_ptr<session> s, handle_t handle) noexcept
	: _session{std::move(s)}
	, _handle{handle} {
}

std::shared_ptr<session> node::lock() const {
	auto s = _session.lock();
	if (!s)
		throw ex::invalid_handle(_handle);
	s->check_open(_handle);
	return s;
}

std::vector<node> node::get_child_nodes(const std::string& path) const {
	const auto s = lock();
	const auto handles = s->api().get_child_handles(_handle, path, s->options().child_handles_initial_size);
	std::vector<node> nodes;
	nodes.reserve(handles.size());
	boost::transform(handles, std::back_inserter(nodes), [this](handle_t h) { return node(_session, h); });
	return nodes;
}

node node::get_node(const std::string& path) const {
	const auto s = lock();
	return node(_session, s->get_handle(_handle, path));
}

node node::get_parent_node(const std::string& path) const {
	const auto s = lock();
	return node(_session, s->get_parent_handle(_handle, path));
}

std::string node::get_path() const {
	return lock()->get_path(_handle);
}

node_properties node::get_node_properties(const std::string& path) const {
	return lock()->get_node_properties(_handle, path);
}

nlohmann::json node::get_device_tree() const {
	const auto s = lock();
	const auto tree = s->api().get_device_tree(_handle, s->options().device_tree_initial_size);
	return nlohmann::json::parse(tree);
}

std::string node::get_value(const std::string& path) const {
	return lock()->api().get_value(_handle, path);
}

std::string node::get_value_with_arg(const std::string& path, const std::string& arg) const {
	return lock()->api().get_value(_handle, path, arg);
}

void node::set_value(const std::string& path, const std::string& value) const {
	const auto s = lock();
	s->logger()->debug("set {}{} = {}", s->get_path(_handle), path, value);
	s->api().set_value(_handle, path, value);
}

void node::send_command(const std::string& path) const {
	const auto s = lock();
	s->logger()->debug("send {}{}", s->get_path(_handle), path);
	s->api().send_command(_handle, path);
}

std::uint32_t node::get_user_register(std::uint32_t address) const {
	return lock()->api().get_user_register(_handle, address);
}

void node::set_user_register(std::uint32_t address, std::uint32_t value) const {
	const auto s = lock();
	s->logger()->debug("set user register {:#x} = {:#x}", address, value);
	s->api().set_user_register(_handle, address, value);
}

format_set node::set_read_data_format(std::vector<field_descriptor> fields) const {
	const auto s = lock();
	const auto generation = s->new_format_generation();
	auto data = compile(s->api(), _handle, std::move(fields), generation);
	// previous format sets on this endpoint become stale only if registration succeeded
	s->register_format(_handle, generation);
	return data;
}

format_set node::set_read_data_format(std::string_view json_format) const {
	auto fields = parse_data_format(json_format);
	return set_read_data_format(std::move(fields));
}

void node::read_data(int timeout, format_set& data) const {
	if (data.handle() != _handle)
		throw ex::invalid_argument(fmt::format("format set registered on handle {}, not on {}", data.handle(), _handle));
	const auto s = lock();
	if (!s->is_current_format(_handle, data.generation()))
		throw ex::invalid_argument(fmt::format("format set replaced by a later set_read_data_format on handle {}", _handle));
	read(s->api(), timeout, data);
}

error_code node::try_read_data(int timeout, format_set& data) const noexcept {
	try {
		read_data(timeout, data);
	} catch (const std::exception&) {
		return CAEN_FELIB_CPP_HANDLE_EXCEPTION();
	}
	return error_code::SUCCESS;
}

bool node::has_data(int timeout) const {
	return lock()->api().has_data(_handle, timeout);
}

std::string node::name() const {
	return get_node_properties().first;
}

node_type node::type() const {
	return get_node_properties().second;
}

node node::operator[](std::string_view name) const {
	return get_node(fmt::format("/{}", name));
}

} // namespace felib

} // namespace caen
