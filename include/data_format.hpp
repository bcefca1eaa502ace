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
*	\file		data_format.hpp
*	\brief		Read data format and buffers
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_DATA_FORMAT_HPP_
#define CAEN_FELIB_CPP_INCLUDE_DATA_FORMAT_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

#include "lib_definitions.hpp"
#include "lib_error.hpp"
#include "scalar_type.hpp"

namespace caen {

namespace felib {

class native_api; // forward declaration

/**
 * @brief Description of a field of the read data format.
 *
 * The shape is used only to allocate the buffer, and must have one extent
 * per dimension. For 2-D fields the first extent is the number of rows
 * (e.g. the number of probes), the second the number of columns (e.g. the
 * maximum waveform size).
 */
class field_descriptor {
public:

	/**
	 * @param name		field name, as defined by the endpoint
	 * @param type		element type
	 * @param dim		dimension, 0 for scalars, 1 for arrays, 2 for matrices
	 * @param shape		one extent per dimension
	 * @throws ex::unsupported_type if type is UNKNOWN
	 * @throws ex::shape_mismatch if shape size is different from dim
	 * @throws ex::invalid_argument if dim is larger than 2
	 */
	field_descriptor(std::string name, scalar_type type, std::size_t dim = 0, std::vector<std::size_t> shape = {});

	const std::string& name() const noexcept { return _name; }
	scalar_type type() const noexcept { return _type; }
	std::size_t dim() const noexcept { return _dim; }
	const std::vector<std::size_t>& shape() const noexcept { return _shape; }

private:
	std::string _name;
	scalar_type _type;
	std::size_t _dim;
	std::vector<std::size_t> _shape;
};

/**
 * @brief Native memory of a field, filled in place by CAEN_FELib_ReadData.
 *
 * Storage is contiguous, zero-initialized and aligned for any scalar type.
 * 2-D buffers also own an array of pointers to the rows, that is the
 * argument expected by CAEN FELib for matrices: it is rebuilt if the
 * storage has been reallocated.
 */
class buffer {
public:

	buffer(scalar_type type, std::vector<std::size_t> shape);

	buffer(buffer&&) noexcept = default;
	buffer& operator=(buffer&&) noexcept = default;
	buffer(const buffer&) = delete;
	buffer& operator=(const buffer&) = delete;

	scalar_type type() const noexcept { return _type; }
	const std::vector<std::size_t>& shape() const noexcept { return _shape; }
	std::size_t dim() const noexcept { return _shape.size(); }

	// number of elements
	std::size_t size() const noexcept { return _size; }
	std::size_t element_size() const noexcept { return _element_size; }
	std::size_t size_bytes() const noexcept { return _size * _element_size; }

	void* data() noexcept { return _storage.data(); }
	const void* data() const noexcept { return _storage.data(); }

	/**
	 * @brief Typed pointer to the first element.
	 *
	 * @tparam T	must be exactly the type bound to the scalar type
	 * @throws ex::invalid_argument on type mismatch
	 */
	template <typename T>
	T* data() {
		check_type<T>();
		return static_cast<T*>(data());
	}

	template <typename T>
	const T* data() const {
		check_type<T>();
		return static_cast<const T*>(data());
	}

	// value of a scalar field
	template <typename T>
	T& value() {
		check_dim(0);
		return *data<T>();
	}

	template <typename T>
	const T& value() const {
		check_dim(0);
		return *data<T>();
	}

	// element of an array field
	template <typename T>
	T& at(std::size_t i) {
		check_dim(1);
		check_index(i, _shape[0]);
		return data<T>()[i];
	}

	template <typename T>
	const T& at(std::size_t i) const {
		check_dim(1);
		check_index(i, _shape[0]);
		return data<T>()[i];
	}

	// element of a matrix field
	template <typename T>
	T& at(std::size_t row, std::size_t column) {
		check_dim(2);
		check_index(row, _shape[0]);
		check_index(column, _shape[1]);
		return data<T>()[row * _shape[1] + column];
	}

	template <typename T>
	const T& at(std::size_t row, std::size_t column) const {
		check_dim(2);
		check_index(row, _shape[0]);
		check_index(column, _shape[1]);
		return data<T>()[row * _shape[1] + column];
	}

	/**
	 * @brief Array of row addresses of a 2-D buffer.
	 *
	 * Entry i is the address of the element (i, 0).
	 * @throws ex::invalid_argument if the buffer is not 2-D
	 */
	const std::vector<void*>& row_pointers();

	/**
	 * @brief Address to be passed to CAEN_FELib_ReadData.
	 *
	 * The storage address for scalars and arrays, the row pointer array
	 * address for matrices.
	 */
	void* argument();

	/**
	 * @brief Reallocate the storage for a new shape with the same dimension.
	 *
	 * Content is reset to zero. To be used only if the new shape is
	 * compatible with the format registered on the device.
	 */
	void reshape(std::vector<std::size_t> shape);

private:

	template <typename T>
	void check_type() const {
		if (!is_bound_type<T>(_type))
			throw ex::invalid_argument(fmt::format("type mismatch: field type is {}", to_string(_type)));
	}

	void check_dim(std::size_t dim) const;
	static void check_index(std::size_t i, std::size_t extent);
	void allocate();
	void update_row_pointers();

	scalar_type _type;
	std::vector<std::size_t> _shape;
	std::size_t _element_size;
	std::size_t _size;
	std::vector<std::max_align_t> _storage;
	std::vector<void*> _row_pointers;
	const void* _row_pointers_base;
};

/**
 * @brief Data format registered on an endpoint, with its buffers.
 *
 * Fields are ordered as the variadic arguments of CAEN_FELib_ReadData.
 * Not copyable, since buffers are filled by the library in place.
 */
class format_set {
public:

	struct field {
		field_descriptor descriptor;
		buffer data;
	};

	/**
	 * @param handle		the endpoint handle
	 * @param fields		the fields
	 * @param generation	identifier of the registration, used to detect formats replaced on the same endpoint
	 */
	format_set(handle_t handle, std::vector<field_descriptor> fields, std::uint64_t generation = 0);

	format_set(format_set&&) noexcept = default;
	format_set& operator=(format_set&&) noexcept = default;
	format_set(const format_set&) = delete;
	format_set& operator=(const format_set&) = delete;

	// handle of the endpoint where the format has been registered
	handle_t handle() const noexcept { return _handle; }
	std::uint64_t generation() const noexcept { return _generation; }

	std::size_t size() const noexcept { return _fields.size(); }
	bool empty() const noexcept { return _fields.empty(); }

	field& operator[](std::size_t i) { return _fields[i]; }
	const field& operator[](std::size_t i) const { return _fields[i]; }

	/**
	 * @brief Field by name.
	 *
	 * @throws ex::invalid_argument if not found
	 */
	field& at(std::string_view name);
	const field& at(std::string_view name) const;

	auto begin() noexcept { return _fields.begin(); }
	auto end() noexcept { return _fields.end(); }
	auto begin() const noexcept { return _fields.begin(); }
	auto end() const noexcept { return _fields.end(); }

	/**
	 * @brief Ordered list of addresses for CAEN_FELib_ReadData.
	 *
	 * Row pointer arrays are rebuilt if the storage has been reallocated.
	 */
	const address_list& argument_list();

private:
	handle_t _handle;
	std::uint64_t _generation;
	std::vector<field> _fields;
	address_list _args;
};

/**
 * @brief Parse a JSON data format.
 *
 * The input is a list of objects with keys "name", "type", "dim" (optional,
 * default 0) and "shape" (required if dim is not 0).
 * @throws ex::unsupported_type on unknown or unsupported type
 * @throws ex::shape_mismatch if shape size is different from dim
 * @throws ex::invalid_argument on invalid JSON
 */
std::vector<field_descriptor> parse_data_format(const nlohmann::json& format);
std::vector<field_descriptor> parse_data_format(std::string_view format);

/**
 * @brief JSON data format as expected by CAEN_FELib_SetReadDataFormat.
 *
 * Shape is not included.
 */
std::string dump_data_format(const std::vector<field_descriptor>& fields);

/**
 * @brief Register a data format on an endpoint and allocate its buffers.
 *
 * Validation is completed before the format is sent to the library.
 * @param generation	stored in the returned format set
 * @throws ex::invalid_argument on duplicated names or too many fields
 * @throws ex::library_error if the format is rejected by the library
 */
format_set compile(native_api& api, handle_t handle, std::vector<field_descriptor> fields, std::uint64_t generation = 0);

/**
 * @brief Same of format_set::argument_list.
 */
const address_list& build_argument_list(format_set& fs);

/**
 * @brief Read an event into the buffers.
 *
 * @param timeout	timeout in milliseconds, or infinite_timeout
 * @throws ex::timeout	if no data is available within timeout
 * @throws ex::stop		if the acquisition has been stopped and all data has been read
 */
void read(native_api& api, int timeout, format_set& fs);

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_DATA_FORMAT_HPP_ */
