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
*	\file		data_format.cpp
*	\brief
*
******************************************************************************/

#include "data_format.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include <boost/assert.hpp>
#include <boost/range/algorithm/transform.hpp>
#include <boost/static_assert.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/ranges.h>

#include "json/json_data_format.hpp"
#include "native_api.hpp"

namespace caen {

namespace felib {

namespace {

constexpr std::size_t max_dim{2};

std::size_t checked_multiply(std::size_t lhs, std::size_t rhs) {
	if (rhs != 0 && lhs > std::numeric_limits<std::size_t>::max() / rhs)
		throw ex::invalid_argument(fmt::format("buffer size overflow ({} * {})", lhs, rhs));
	return lhs * rhs;
}

std::size_t element_count(const std::vector<std::size_t>& shape) {
	std::size_t count{1};
	for (const auto extent : shape)
		count = checked_multiply(count, extent);
	return count;
}

// number of storage blocks, at least one to always have a valid address even for empty buffers
std::size_t storage_blocks(const std::vector<std::size_t>& shape, std::size_t element_size) {
	constexpr auto block_size = sizeof(std::max_align_t);
	const auto bytes = checked_multiply(element_count(shape), element_size);
	if (bytes > std::numeric_limits<std::size_t>::max() - block_size)
		throw ex::invalid_argument(fmt::format("buffer size overflow ({} bytes)", bytes));
	return std::max<std::size_t>(1, (bytes + block_size - 1) / block_size);
}

} // unnamed namespace

field_descriptor::field_descriptor(std::string name, scalar_type type, std::size_t dim, std::vector<std::size_t> shape)
	: _name{std::move(name)}
	, _type{type}
	, _dim{dim}
	, _shape{std::move(shape)} {
	if (_type == scalar_type::UNKNOWN)
		throw ex::unsupported_type(fmt::format("unsupported type for field {}", _name));
	if (_dim > max_dim)
		throw ex::invalid_argument(fmt::format("invalid dim {} for field {} (max {})", _dim, _name, max_dim));
	if (_shape.size() != _dim)
		throw ex::shape_mismatch(fmt::format("invalid shape [{}] for field {} (dim is {})", fmt::join(_shape, ", "), _name, _dim));
}

buffer::buffer(scalar_type type, std::vector<std::size_t> shape)
	: _type{type}
	, _shape(std::move(shape))
	, _element_size{element_size(type)}
	, _size{}
	, _row_pointers_base{nullptr} {
	if (dim() > max_dim)
		throw ex::invalid_argument(fmt::format("invalid dim {} (max {})", dim(), max_dim));
	allocate();
}

void buffer::allocate() {
	BOOST_STATIC_ASSERT(alignof(std::max_align_t) >= alignof(long double));
	BOOST_ASSERT(element_alignment(_type) <= alignof(std::max_align_t));
	std::vector<std::max_align_t> storage(storage_blocks(_shape, _element_size));
	_size = element_count(_shape);
	_storage = std::move(storage);
	_row_pointers.clear();
	_row_pointers_base = nullptr;
	if (dim() == 2)
		update_row_pointers();
}

void buffer::update_row_pointers() {
	BOOST_ASSERT(dim() == 2);
	const auto n_rows = _shape[0];
	const auto row_size_bytes = _shape[1] * _element_size;
	auto base = static_cast<char*>(data());
	_row_pointers.resize(n_rows);
	for (std::size_t i = 0; i < n_rows; ++i)
		_row_pointers[i] = base + i * row_size_bytes;
	_row_pointers_base = data();
}

const std::vector<void*>& buffer::row_pointers() {
	check_dim(2);
	if (_row_pointers_base != data()) {
		SPDLOG_TRACE("storage moved, updating row pointers");
		update_row_pointers();
	}
	return _row_pointers;
}

void* buffer::argument() {
	if (dim() == 2)
		return const_cast<void**>(row_pointers().data());
	return data();
}

void buffer::reshape(std::vector<std::size_t> shape) {
	if (shape.size() != dim())
		throw ex::shape_mismatch(fmt::format("invalid shape [{}] (dim is {})", fmt::join(shape, ", "), dim()));
	// validate the new size before touching the current storage
	storage_blocks(shape, _element_size);
	_shape = std::move(shape);
	allocate();
}

void buffer::check_dim(std::size_t dim) const {
	if (this->dim() != dim)
		throw ex::invalid_argument(fmt::format("invalid access: buffer dim is {}, not {}", this->dim(), dim));
}

void buffer::check_index(std::size_t i, std::size_t extent) {
	if (i >= extent)
		throw std::out_of_range(fmt::format("index {} out of range (extent is {})", i, extent));
}

format_set::format_set(handle_t handle, std::vector<field_descriptor> fields, std::uint64_t generation)
	: _handle{handle}
	, _generation{generation} {
	_fields.reserve(fields.size());
	for (auto& d : fields) {
		buffer b(d.type(), d.shape());
		_fields.push_back(field{std::move(d), std::move(b)});
	}
	_args.reserve(_fields.size());
}

format_set::field& format_set::at(std::string_view name) {
	const auto it = std::find_if(_fields.begin(), _fields.end(), [name](const field& f) { return f.descriptor.name() == name; });
	if (it == _fields.end())
		throw ex::invalid_argument(fmt::format("field {} not found", name));
	return *it;
}

const format_set::field& format_set::at(std::string_view name) const {
	return const_cast<format_set&>(*this).at(name);
}

const address_list& format_set::argument_list() {
	_args.clear();
	for (auto& f : _fields)
		_args.push_back(f.data.argument());
	return _args;
}

std::vector<field_descriptor> parse_data_format(const nlohmann::json& format) {
	if (!format.is_array())
		throw ex::invalid_argument(fmt::format("data format must be a list: {}", format.dump()));
	std::vector<field_descriptor> fields;
	fields.reserve(format.size());
	boost::transform(format, std::back_inserter(fields), [](const nlohmann::json& element) {
		json_data_format f;
		try {
			f = element.get<json_data_format>(); // json to object
		} catch (const nlohmann::json::exception& e) {
			throw ex::invalid_argument(fmt::format("invalid data format element {}: {}", element.dump(), e.what()));
		}
		if (f.get_type() == scalar_type::UNKNOWN)
			throw ex::unsupported_type(fmt::format("invalid type in {}", element.dump()));
		return field_descriptor(f.get_name(), f.get_type(), f.get_dim(), f.get_shape().value_or(std::vector<std::size_t>{}));
	});
	return fields;
}

std::vector<field_descriptor> parse_data_format(std::string_view format) {
	nlohmann::json j;
	try {
		j = nlohmann::json::parse(format.begin(), format.end());
	} catch (const nlohmann::json::parse_error& e) {
		throw ex::invalid_argument(fmt::format("invalid data format: {}", e.what()));
	}
	return parse_data_format(j);
}

std::string dump_data_format(const std::vector<field_descriptor>& fields) {
	auto j = nlohmann::json::array();
	for (const auto& f : fields)
		j.push_back(nlohmann::json(json_data_format(f.name(), f.type(), f.dim())));
	return j.dump();
}

format_set compile(native_api& api, handle_t handle, std::vector<field_descriptor> fields, std::uint64_t generation) {
	if (fields.size() > max_size::read_data_args)
		throw ex::invalid_argument(fmt::format("too many fields: {} (max {})", fields.size(), max_size::read_data_args));
	std::unordered_set<std::string> names;
	for (const auto& f : fields)
		if (!names.insert(f.name()).second)
			throw ex::invalid_argument(fmt::format("duplicated field {}", f.name()));
	const auto format = dump_data_format(fields);
	SPDLOG_DEBUG("setting read data format on handle {}: {}", handle, format);
	api.set_read_data_format(handle, format);
	return format_set(handle, std::move(fields), generation);
}

const address_list& build_argument_list(format_set& fs) {
	return fs.argument_list();
}

void read(native_api& api, int timeout, format_set& fs) {
	api.read_data(fs.handle(), timeout, build_argument_list(fs));
}

} // namespace felib

} // namespace caen
