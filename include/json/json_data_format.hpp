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
*	\file		json_data_format.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_JSON_JSON_DATA_FORMAT_HPP_
#define CAEN_FELIB_CPP_INCLUDE_JSON_JSON_DATA_FORMAT_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include <spdlog/fmt/fmt.h>

#include "json/json_utilities.hpp"
#include "lib_error.hpp"
#include "scalar_type.hpp"

namespace caen {

namespace felib {

/**
 * @brief Element of the JSON read data format.
 *
 * Unknown type strings are decoded as scalar_type::UNKNOWN. The shape is
 * known only by this binding: it is decoded but never encoded, so that the
 * JSON sent to CAEN FELib contains only name, type and dim.
 */
struct json_data_format {

	/**
	 * Default constructor needed by nlohmann's JSON.
	 */
	json_data_format()
		: _type{scalar_type::UNKNOWN} {
	}

	json_data_format(std::string name, scalar_type type, std::size_t dim)
		: _name{std::move(name)}
		, _type{type}
		, _dim{dim} {
	}

	const auto& get_name() const noexcept { return _name; }
	auto get_type() const noexcept { return _type; }
	auto get_dim() const noexcept { return _dim.value_or(0); }
	const auto& get_shape() const noexcept { return _shape; }

	static constexpr auto& key_name() noexcept { return "name"; }
	static constexpr auto& key_type() noexcept { return "type"; }
	static constexpr auto& key_dim() noexcept { return "dim"; }
	static constexpr auto& key_shape() noexcept { return "shape"; }

	friend void from_json(const nlohmann::json& j, json_data_format& e) {
		json::get(j, key_name(), e._name);
		json::get_if_not_null(j, key_type(), e._type);
		// decoded as signed, since nlohmann's JSON would silently wrap negative values
		std::optional<std::int64_t> dim;
		json::get_if_not_null(j, key_dim(), dim);
		if (dim && *dim < 0)
			throw ex::invalid_argument(fmt::format("negative dim in {}", j.dump()));
		e._dim = dim ? std::optional<std::size_t>(static_cast<std::size_t>(*dim)) : std::nullopt;
		std::optional<std::vector<std::int64_t>> shape;
		json::get_if_not_null(j, key_shape(), shape);
		e._shape.reset();
		if (shape) {
			auto& extents = e._shape.emplace();
			for (const auto extent : *shape) {
				if (extent < 0)
					throw ex::invalid_argument(fmt::format("negative extent in {}", j.dump()));
				extents.push_back(static_cast<std::size_t>(extent));
			}
		}
	}

	friend void to_json(nlohmann::json& j, const json_data_format& e) {
		json::set(j, key_name(), e._name);
		json::set(j, key_type(), e._type);
		json::set(j, key_dim(), e.get_dim());
	}

private:

	std::string _name;
	scalar_type _type;
	std::optional<std::size_t> _dim;
	std::optional<std::vector<std::size_t>> _shape;

};

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_JSON_JSON_DATA_FORMAT_HPP_ */
