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
*	\file		variadic_call.hpp
*	\brief		Call of C variadic functions with runtime arity
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_VARIADIC_CALL_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_VARIADIC_CALL_HPP_

#include <array>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

#include <spdlog/fmt/fmt.h>

namespace caen {

namespace felib {

namespace variadic {

namespace detail {

/*
 * @brief Table of callers, one for each arity.
 *
 * Each entry expands the first N addresses as trailing arguments of the
 * C variadic function, after the fixed arguments.
 */
template <typename Result, typename Function, typename... Fixed>
struct caller {

	using entry_type = Result (*)(Function, void* const*, Fixed...);

	template <std::size_t... I>
	static Result invoke(Function f, void* const* args, Fixed... fixed, std::index_sequence<I...>) {
		return f(fixed..., args[I]...);
	}

	template <std::size_t N>
	static Result entry(Function f, void* const* args, Fixed... fixed) {
		return invoke(f, args, fixed..., std::make_index_sequence<N>{});
	}

	template <std::size_t... N>
	static constexpr std::array<entry_type, sizeof...(N)> make_table(std::index_sequence<N...>) noexcept {
		return {{ &entry<N>... }};
	}

};

} // namespace detail

/**
 * @brief Call a C variadic function with a runtime sized list of addresses.
 *
 * The number of variadic arguments of a C function must be known at compile
 * time: the call is dispatched to a table of instantiations, one for each
 * arity from zero to MaxArgs.
 * @tparam MaxArgs		maximum number of variadic arguments
 * @param f				the function pointer
 * @param args			the addresses, passed after the fixed arguments
 * @param fixed			the fixed arguments
 * @return the value returned by the function
 * @throws std::invalid_argument if the addresses are more than MaxArgs
 */
template <std::size_t MaxArgs, typename Function, typename... Fixed>
decltype(auto) call_expanded(Function f, const std::vector<void*>& args, Fixed... fixed) {
	using result_type = decltype(f(fixed...));
	using caller_type = detail::caller<result_type, Function, Fixed...>;
	static constexpr auto table = caller_type::make_table(std::make_index_sequence<MaxArgs + 1>{});
	if (args.size() > MaxArgs)
		throw std::invalid_argument(fmt::format("too many arguments: {} (max {})", args.size(), MaxArgs));
	return table[args.size()](f, args.data(), fixed...);
}

} // namespace variadic

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_VARIADIC_CALL_HPP_ */
