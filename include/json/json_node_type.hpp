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
*	\file		json_node_type.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_JSON_JSON_NODE_TYPE_HPP_
#define CAEN_FELIB_CPP_INCLUDE_JSON_JSON_NODE_TYPE_HPP_

#include <nlohmann/json.hpp>

#include <CAEN_FELib.h>

// To be defined in global namespace, as CAEN_FELib_NodeType_t is in a C header
NLOHMANN_JSON_SERIALIZE_ENUM(::CAEN_FELib_NodeType_t, {
	{ ::CAEN_FELib_UNKNOWN,		nullptr			},
	{ ::CAEN_FELib_PARAMETER,	"PARAMETER"		},
	{ ::CAEN_FELib_COMMAND,		"COMMAND"		},
	{ ::CAEN_FELib_FEATURE,		"FEATURE"		},
	{ ::CAEN_FELib_ATTRIBUTE,	"ATTRIBUTE"		},
	{ ::CAEN_FELib_ENDPOINT,	"ENDPOINT"		},
	{ ::CAEN_FELib_CHANNEL,		"CHANNEL"		},
	{ ::CAEN_FELib_DIGITIZER,	"DIGITIZER"		},
	{ ::CAEN_FELib_FOLDER,		"FOLDER"		},
	{ ::CAEN_FELib_LVDS,		"LVDS"			},
	{ ::CAEN_FELib_VGA,			"VGA"			},
	{ ::CAEN_FELib_HV_CHANNEL,	"HV_CHANNEL"	},
	{ ::CAEN_FELib_MONOUT,		"MONOUT"		},
	{ ::CAEN_FELib_VTRACE,		"VTRACE"		},
	{ ::CAEN_FELib_GROUP,		"GROUP"			},
})

#endif /* CAEN_FELIB_CPP_INCLUDE_JSON_JSON_NODE_TYPE_HPP_ */
