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
*	\file		scope_exit.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_

#include <type_traits>
#include <utility>

namespace caen {

namespace felib {

/**
 * @brief Invoke a function on scope exit, unless released.
 *
 * Used to undo partially completed operations when an exception is thrown.
 * The function must not throw.
 */
template <typename Function>
class scope_exit {
public:

	explicit scope_exit(Function f) noexcept(std::is_nothrow_move_constructible<Function>::value)
		: _f(std::move(f))
		, _active{true} {}

	scope_exit(scope_exit&& other) noexcept(std::is_nothrow_move_constructible<Function>::value)
		: _f(std::move(other._f))
		, _active{std::exchange(other._active, false)} {}

	scope_exit(const scope_exit&) = delete;
	scope_exit& operator=(const scope_exit&) = delete;
	scope_exit& operator=(scope_exit&&) = delete;

	~scope_exit() {
		if (_active)
			_f();
	}

	void release() noexcept {
		_active = false;
	}

private:
	Function _f;
	bool _active;
};

template <typename Function>
scope_exit<Function> make_scope_exit(Function f) {
	return scope_exit<Function>(std::move(f));
}

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_SCOPE_EXIT_HPP_ */
