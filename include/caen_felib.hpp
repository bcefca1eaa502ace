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
*	\file		caen_felib.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CAEN_FELIB_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CAEN_FELIB_HPP_

#include "lib_definitions.hpp"
#include "lib_error.hpp"
#include "data_format.hpp"
#include "digitizer.hpp"
#include "library.hpp"
#include "node.hpp"
#include "dig1_types.hpp"
#include "dig2_types.hpp"

#endif /* CAEN_FELIB_CPP_INCLUDE_CAEN_FELIB_HPP_ */
