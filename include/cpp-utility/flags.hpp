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
*	\file		flags.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_FLAGS_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_FLAGS_HPP_

#include <type_traits>

namespace caen {

namespace felib {

/**
 * @brief Same of C++23 `std::to_underlying`.
 *
 * @tparam Enum		enumerator type
 * @param value		enumerator value
 * @return			the value, static-casted to its underlying type
 */
template <typename Enum>
constexpr auto to_underlying(Enum value) noexcept {
	using underlying_type = std::underlying_type_t<Enum>;
	return static_cast<underlying_type>(value);
}

/**
 * @brief Check if a flag is set on a raw value read from the device.
 *
 * @tparam Value	unsigned integer type of the field
 * @tparam Flag		flag enumerator
 * @param value		raw value
 * @param flag		the flag, possibly with more than one bit set
 * @return true if all the bits of the flag are set
 */
template <typename Value, typename Flag>
constexpr bool has_flag(Value value, Flag flag) noexcept {
	static_assert(std::is_enum<Flag>::value, "flag must be an enumerator");
	static_assert(std::is_unsigned<Value>::value, "value must be unsigned");
	const auto mask = static_cast<Value>(to_underlying(flag));
	return (value & mask) == mask;
}

/**
 * @brief Bitwise or of flags of the same type, as raw value.
 */
template <typename Flag, typename... Flags>
constexpr auto combine_flags(Flag flag, Flags... flags) noexcept {
	static_assert(std::is_enum<Flag>::value, "flag must be an enumerator");
	static_assert(std::conjunction<std::is_same<Flag, Flags>...>::value, "flags must have the same type");
	return static_cast<std::underlying_type_t<Flag>>((to_underlying(flag) | ... | to_underlying(flags)));
}

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_FLAGS_HPP_ */
