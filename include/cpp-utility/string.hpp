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
*	\file		string.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_STRING_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_STRING_HPP_

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <boost/algorithm/string.hpp>

namespace caen {

namespace felib {

namespace string {

/**
 * @brief Same of `boost::iequals`, with a fast path on size mismatch.
 *
 * @param[in] input		input string
 * @param[in] test		test string
 * @return true if strings are equal (case insensitive)
 */
inline bool iequals(std::string_view input, std::string_view test) {
	return (test.size() == input.size()) && boost::iequals(input, test);
}

/**
 * @brief Convert a C buffer filled by the native library to string.
 *
 * The string ends at the first null terminator, or at the end of the buffer
 * if the library did not write any terminator.
 * @param[in] src		buffer
 * @param[in] max_size	size of the buffer
 * @return the string
 */
inline std::string buffer_to_string(const char* src, std::size_t max_size) {
	if (src == nullptr)
		return std::string{};
	const auto end = std::find(src, src + max_size, '\0');
	return std::string(src, end);
}

/**
 * @brief Copy a string into a C buffer, including the null terminator.
 *
 * @param[out] dst		buffer
 * @param[in] src		input string
 * @param[in] max_size	size of the buffer
 * @throws std::invalid_argument if the string does not fit
 */
inline void string_to_buffer(char* dst, std::string_view src, std::size_t max_size) {
	if (src.size() >= max_size)
		throw std::invalid_argument("string too long to be copied");
	const auto n = src.copy(dst, max_size - 1);
	dst[n] = '\0';
}

/**
 * @brief Split a string on any of the delimiters.
 *
 * @param[in] value		input string
 * @param[in] delimiters	a set of characters to be recognized as delimiters
 * @return split input string as a container
 */
inline std::vector<std::string> split(const std::string& value, const char* delimiters) {
	std::vector<std::string> ret;
	boost::split(ret, value, boost::is_any_of(delimiters));
	return ret;
}

} // namespace string

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_STRING_HPP_ */
