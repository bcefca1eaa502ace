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
*	\file		lru_cache.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_LRU_CACHE_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_LRU_CACHE_HPP_

#include <cstddef>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

#include <boost/container_hash/hash.hpp>

namespace caen {

namespace felib {

/**
 * @brief Bounded cache with least recently used eviction policy.
 *
 * Not thread safe. A capacity of zero disables the cache.
 * @tparam Key		key type, hashed with boost::hash
 * @tparam Value	value type
 */
template <typename Key, typename Value, typename Hash = boost::hash<Key>>
class lru_cache {
public:

	explicit lru_cache(std::size_t capacity)
		: _capacity{capacity} {}

	/**
	 * @brief Find a value, and mark it as most recently used.
	 */
	std::optional<Value> find(const Key& key) {
		const auto it = _map.find(key);
		if (it == _map.end())
			return std::nullopt;
		_list.splice(_list.begin(), _list, it->second);
		return it->second->second;
	}

	/**
	 * @brief Insert or replace a value, evicting the least recently used if full.
	 */
	void insert(const Key& key, Value value) {
		if (_capacity == 0)
			return;
		const auto it = _map.find(key);
		if (it != _map.end()) {
			it->second->second = std::move(value);
			_list.splice(_list.begin(), _list, it->second);
			return;
		}
		if (_map.size() == _capacity) {
			_map.erase(_list.back().first);
			_list.pop_back();
		}
		_list.emplace_front(key, std::move(value));
		_map.emplace(key, _list.begin());
	}

	void clear() noexcept {
		_map.clear();
		_list.clear();
	}

	std::size_t size() const noexcept { return _map.size(); }
	std::size_t capacity() const noexcept { return _capacity; }

private:
	using list_type = std::list<std::pair<Key, Value>>;

	const std::size_t _capacity;
	list_type _list;
	std::unordered_map<Key, typename list_type::iterator, Hash> _map;
};

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_LRU_CACHE_HPP_ */
