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
*	\file		session.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_SESSION_HPP_
#define CAEN_FELIB_CPP_INCLUDE_SESSION_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

#include <boost/container_hash/hash.hpp>
#include <boost/noncopyable.hpp>
#include <spdlog/spdlog.h>

#include "cpp-utility/lru_cache.hpp"
#include "lib_definitions.hpp"
#include "native_api.hpp"
#include "url.hpp"

namespace caen {

namespace felib {

/**
 * @brief Options used when opening a digitizer.
 */
struct open_options {
	std::size_t cache_capacity{default_value::cache_capacity};
	std::size_t child_handles_initial_size{initial_size::child_handles};
	std::size_t device_tree_initial_size{initial_size::device_tree};
};

/**
 * @brief State shared by a digitizer and all the nodes derived from it.
 *
 * Owned by the digitizer; nodes keep a weak reference. After close() any
 * operation fails with ex::invalid_handle. Open flag and cache are protected
 * by a mutex, native calls are not serialized.
 */
class session : private boost::noncopyable {
public:

	/**
	 * @param api		the native library
	 * @param handle	the handle returned by CAEN_FELib_Open, closed by this session
	 * @param url		the URL used to open the device
	 * @param options	the options
	 * @param logger	the device logger
	 */
	session(std::shared_ptr<native_api> api, handle_t handle, url_data url, const open_options& options, std::shared_ptr<spdlog::logger> logger);

	// close, if still open, and log errors
	~session();

	native_api& api() const noexcept { return *_api; }
	handle_t root_handle() const noexcept { return _root_handle; }
	const url_data& url() const noexcept { return _url; }
	const open_options& options() const noexcept { return _options; }
	const std::shared_ptr<spdlog::logger>& logger() const noexcept { return _logger; }

	bool is_open() const;

	/**
	 * @brief Close the device and invalidate the cache.
	 *
	 * The session is marked as closed even if CAEN_FELib_Close fails.
	 * @throws ex::invalid_handle if already closed
	 * @throws ex::library_error if CAEN_FELib_Close fails
	 */
	void close();

	/**
	 * @brief Throw if the session has been closed.
	 *
	 * @param handle	the handle being used, reported in the exception
	 * @throws ex::invalid_handle if closed
	 */
	void check_open(handle_t handle) const;

	// cached versions of the native_api functions with the same name
	handle_t get_handle(handle_t handle, const std::string& path);
	handle_t get_parent_handle(handle_t handle, const std::string& path);
	std::string get_path(handle_t handle);
	node_properties get_node_properties(handle_t handle, const std::string& path);

	std::size_t cache_size() const;

	/*
	 * Read data formats registered on each endpoint. A format set is valid
	 * only if its generation is the last one registered on its handle.
	 */

	// a new unique generation, not yet registered
	std::uint64_t new_format_generation();
	void register_format(handle_t handle, std::uint64_t generation);
	bool is_current_format(handle_t handle, std::uint64_t generation) const;

private:

	enum class query {
		handle,
		parent_handle,
		path,
		node_properties,
	};

	struct cache_key {
		query _query;
		handle_t _handle;
		std::string _path;

		friend bool operator==(const cache_key& lhs, const cache_key& rhs) noexcept {
			return lhs._query == rhs._query && lhs._handle == rhs._handle && lhs._path == rhs._path;
		}

		friend std::size_t hash_value(const cache_key& key) {
			std::size_t seed{};
			boost::hash_combine(seed, static_cast<int>(key._query));
			boost::hash_combine(seed, key._handle);
			boost::hash_combine(seed, key._path);
			return seed;
		}
	};

	using cache_value = std::variant<handle_t, std::string, node_properties>;

	template <typename T, typename Function>
	T memoize(query q, handle_t handle, const std::string& path, Function&& f);

	const std::shared_ptr<native_api> _api;
	const handle_t _root_handle;
	const url_data _url;
	const open_options _options;
	const std::shared_ptr<spdlog::logger> _logger;

	mutable std::mutex _mtx;
	bool _open;
	lru_cache<cache_key, cache_value> _cache;
	std::uint64_t _last_format_generation;
	std::unordered_map<handle_t, std::uint64_t> _format_generations;

};

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_SESSION_HPP_ */
