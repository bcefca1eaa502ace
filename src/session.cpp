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
*	\file		session.cpp
*	\brief
*
******************************************************************************/

#include "session.hpp"

#include <utility>

#include "last_error.hpp"
#include "lib_error.hpp"

namespace caen {

namespace felib {

session::session(std::shared_ptr<native_api> api, handle_t handle, url_data url, const open_options& options, std::shared_ptr<spdlog::logger> logger)
	: _api{std::move(api)}
	, _root_handle{handle}
	, _url{std::move(url)}
	, _options{options}
	, _logger{std::move(logger)}
	, _open{true}
	, _cache{options.cache_capacity}
	, _last_format_generation{0} {
}

session::~session() {
	if (!is_open())
		return;
	try {
		close();
	} catch (const std::exception&) {
		const auto ec = CAEN_FELIB_CPP_HANDLE_EXCEPTION();
		_logger->error("close failed on destruction: {}", to_string(ec));
	}
}

bool session::is_open() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _open;
}

void session::close() {
	{
		std::lock_guard<std::mutex> lock(_mtx);
		if (!_open)
			throw ex::invalid_handle(_root_handle);
		_open = false;
		_cache.clear();
		_format_generations.clear();
	}
	_logger->info("closing handle {}", _root_handle);
	_api->close(_root_handle);
}

void session::check_open(handle_t handle) const {
	std::lock_guard<std::mutex> lock(_mtx);
	if (!_open)
		throw ex::invalid_handle(handle);
}

std::size_t session::cache_size() const {
	std::lock_guard<std::mutex> lock(_mtx);
	return _cache.size();
}

std::uint64_t session::new_format_generation() {
	std::lock_guard<std::mutex> lock(_mtx);
	return ++_last_format_generation;
}

void session::register_format(handle_t handle, std::uint64_t generation) {
	std::lock_guard<std::mutex> lock(_mtx);
	_format_generations[handle] = generation;
}

bool session::is_current_format(handle_t handle, std::uint64_t generation) const {
	std::lock_guard<std::mutex> lock(_mtx);
	const auto it = _format_generations.find(handle);
	// format sets not registered through a node have generation 0
	const auto current = (it == _format_generations.end()) ? std::uint64_t{0} : it->second;
	return current == generation;
}

/*
 * Lookup is done with the lock held, the native call without it: concurrent
 * misses on the same key can call the library more than once, with the same
 * result.
 */
template <typename T, typename Function>
T session::memoize(query q, handle_t handle, const std::string& path, Function&& f) {
	cache_key key{q, handle, path};
	{
		std::lock_guard<std::mutex> lock(_mtx);
		if (!_open)
			throw ex::invalid_handle(handle);
		if (const auto cached = _cache.find(key)) {
			_logger->trace("cache hit on handle {} path '{}'", handle, path);
			return std::get<T>(*cached);
		}
	}
	T result = std::forward<Function>(f)();
	std::lock_guard<std::mutex> lock(_mtx);
	// not inserted if closed meanwhile, the cache must be empty after close
	if (_open)
		_cache.insert(std::move(key), result);
	return result;
}

handle_t session::get_handle(handle_t handle, const std::string& path) {
	return memoize<handle_t>(query::handle, handle, path, [&] {
		return _api->get_handle(handle, path);
	});
}

handle_t session::get_parent_handle(handle_t handle, const std::string& path) {
	return memoize<handle_t>(query::parent_handle, handle, path, [&] {
		return _api->get_parent_handle(handle, path);
	});
}

std::string session::get_path(handle_t handle) {
	return memoize<std::string>(query::path, handle, std::string(), [&] {
		return _api->get_path(handle);
	});
}

node_properties session::get_node_properties(handle_t handle, const std::string& path) {
	return memoize<node_properties>(query::node_properties, handle, path, [&] {
		return _api->get_node_properties(handle, path);
	});
}

} // namespace felib

} // namespace caen
