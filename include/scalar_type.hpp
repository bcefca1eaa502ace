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
*	\file		scalar_type.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_SCALAR_TYPE_HPP_
#define CAEN_FELIB_CPP_INCLUDE_SCALAR_TYPE_HPP_

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <type_traits>

#include <boost/static_assert.hpp>
#include <nlohmann/json.hpp>

#include "json/json_utilities.hpp"

namespace caen {

namespace felib {

/**
 * @brief Element types supported by CAEN_FELib_ReadData.
 *
 * PTRDIFF_T is not supported by any known device, and is then rejected.
 */
enum class scalar_type {
	UNKNOWN,
	U64,
	U32,
	U16,
	U8,
	I64,
	I32,
	I16,
	I8,
	CHAR,
	BOOL,
	SIZE_T,
	FLOAT,
	DOUBLE,
	LONG_DOUBLE,
};

using namespace std::string_literals;

NLOHMANN_JSON_SERIALIZE_ENUM(scalar_type, {
	{ scalar_type::UNKNOWN,			nullptr				},
	{ scalar_type::U64,				"U64"s				},
	{ scalar_type::U32,				"U32"s				},
	{ scalar_type::U16,				"U16"s				},
	{ scalar_type::U8,				"U8"s				},
	{ scalar_type::I64,				"I64"s				},
	{ scalar_type::I32,				"I32"s				},
	{ scalar_type::I16,				"I16"s				},
	{ scalar_type::I8,				"I8"s				},
	{ scalar_type::CHAR,			"CHAR"s				},
	{ scalar_type::BOOL,			"BOOL"s				},
	{ scalar_type::SIZE_T,			"SIZE_T"s			},
	{ scalar_type::FLOAT,			"FLOAT"s			},
	{ scalar_type::DOUBLE,			"DOUBLE"s			},
	{ scalar_type::LONG_DOUBLE,		"LONG DOUBLE"s		}, // deliberately using space instead of underscore
})

namespace detail {

using st = scalar_type;

template <st> struct ref_type {}; // default case (compile time error)
template <> struct ref_type<st::U8>				{ using type = std::uint8_t;	};
template <> struct ref_type<st::U16>			{ using type = std::uint16_t;	};
template <> struct ref_type<st::U32>			{ using type = std::uint32_t;	};
template <> struct ref_type<st::U64>			{ using type = std::uint64_t;	};
template <> struct ref_type<st::I8>				{ using type = std::int8_t;		};
template <> struct ref_type<st::I16>			{ using type = std::int16_t;	};
template <> struct ref_type<st::I32>			{ using type = std::int32_t;	};
template <> struct ref_type<st::I64>			{ using type = std::int64_t;	};
template <> struct ref_type<st::CHAR>			{ using type = char;			};
template <> struct ref_type<st::BOOL>			{ using type = bool;			};
template <> struct ref_type<st::SIZE_T>			{ using type = std::size_t;		};
template <> struct ref_type<st::FLOAT>			{ using type = float;			};
template <> struct ref_type<st::DOUBLE>			{ using type = double;			};
template <> struct ref_type<st::LONG_DOUBLE>	{ using type = long double;		};

} // namespace detail

/**
 * @brief C++ type bound to a scalar type.
 */
template <scalar_type Type>
using ref_type_t = typename detail::ref_type<Type>::type;

/**
 * @brief Invoke a generic function with a value-initialized instance of
 * the C++ type bound to a scalar type.
 *
 * @param t		the scalar type
 * @param f		a generic function, like `[](auto tag) { ... }`
 * @return the value returned by the function
 * @throws std::invalid_argument if the type is UNKNOWN
 */
template <typename Function>
decltype(auto) visit_type(scalar_type t, Function&& f) {
	switch (t) {
		using st = scalar_type;
	case st::U64:			return f(ref_type_t<st::U64>{});
	case st::U32:			return f(ref_type_t<st::U32>{});
	case st::U16:			return f(ref_type_t<st::U16>{});
	case st::U8:			return f(ref_type_t<st::U8>{});
	case st::I64:			return f(ref_type_t<st::I64>{});
	case st::I32:			return f(ref_type_t<st::I32>{});
	case st::I16:			return f(ref_type_t<st::I16>{});
	case st::I8:			return f(ref_type_t<st::I8>{});
	case st::CHAR:			return f(ref_type_t<st::CHAR>{});
	case st::BOOL:			return f(ref_type_t<st::BOOL>{});
	case st::SIZE_T:		return f(ref_type_t<st::SIZE_T>{});
	case st::FLOAT:			return f(ref_type_t<st::FLOAT>{});
	case st::DOUBLE:		return f(ref_type_t<st::DOUBLE>{});
	case st::LONG_DOUBLE:	return f(ref_type_t<st::LONG_DOUBLE>{});
	default:				throw std::invalid_argument("invalid type");
	}
}

/**
 * @brief Size in bytes of an element.
 */
inline std::size_t element_size(scalar_type t) {
	return visit_type(t, [](auto tag) { return sizeof(tag); });
}

/**
 * @brief Alignment of an element.
 */
inline std::size_t element_alignment(scalar_type t) {
	return visit_type(t, [](auto tag) { return alignof(decltype(tag)); });
}

/**
 * @brief Check if T is exactly the C++ type bound to a scalar type.
 */
template <typename T>
bool is_bound_type(scalar_type t) {
	return (t != scalar_type::UNKNOWN) && visit_type(t, [](auto tag) { return std::is_same<decltype(tag), T>::value; });
}

/**
 * @brief Name of the type, as used in the JSON format.
 */
inline std::string to_string(scalar_type t) {
	if (t == scalar_type::UNKNOWN)
		return "UNKNOWN"s;
	return json::to_json_string(t);
}

BOOST_STATIC_ASSERT(sizeof(ref_type_t<scalar_type::U8>) == 1);
BOOST_STATIC_ASSERT(sizeof(ref_type_t<scalar_type::I64>) == 8);

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_SCALAR_TYPE_HPP_ */
