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
*	\file		dig2_types.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_DIG2_TYPES_HPP_
#define CAEN_FELIB_CPP_INCLUDE_DIG2_TYPES_HPP_

#include <cstdint>

#include "cpp-utility/flags.hpp"

namespace caen {

namespace felib {

/*
 * Values of fields read from the DPP-PHA and DPP-PSD endpoints of Dig2
 * digitizers (ANALOG_PROBES_TYPE, DIGITAL_PROBES_TYPE, FLAGS_HIGH_PRIORITY
 * and FLAGS_LOW_PRIORITY).
 */
namespace dig2 {

enum struct dpp_analog_probe_type : std::uint8_t {
	unknown							= 0xff,
	// common
	adc_input						= 0b0000,
	// PHA specific
	time_filter						= 0b0001,
	energy_filter					= 0b0010,
	energy_filter_baseline			= 0b0011,
	energy_filter_minus_baseline	= 0b0100,
	// PSD specific
	baseline						= 0b1001,
	cfd								= 0b1010,
};

enum struct dpp_digital_probe_type : std::uint8_t {
	unknown							= 0xff,
	// common
	trigger							= 0b00000,
	time_filter_armed				= 0b00001,
	re_trigger_guard				= 0b00010,
	energy_filter_baseline_freeze	= 0b00011,
	event_pile_up					= 0b00111,
	// PHA specific
	energy_filter_peaking			= 0b00100,
	energy_filter_peak_ready		= 0b00101,
	energy_filter_pile_up_guard		= 0b00110,
	adc_saturation					= 0b01000,
	adc_saturation_protection		= 0b01001,
	post_saturation_event			= 0b01010,
	energy_filter_saturation		= 0b01011,
	signal_inhibit					= 0b01100,
	// PSD specific
	over_threshold					= 0b10100,
	charge_ready					= 0b10101,
	long_gate						= 0b10110,
	short_gate						= 0b11000,
	input_saturation				= 0b11001,
	charge_over_range				= 0b11010,
	negative_over_threshold			= 0b11011,
};

enum struct high_priority_flags_pha : std::uint8_t {
	pile_up							= 0x01,
	pile_up_rejector_guard			= 0x02,
	event_saturation				= 0x04,
	post_saturation					= 0x08,
	trapezoid_saturation			= 0x10,
	sca_selected					= 0x20,
};

enum struct high_priority_flags_psd : std::uint8_t {
	pile_up							= 0x01,
	event_saturation				= 0x04,
	post_saturation					= 0x08,
	charge_overflow					= 0x10,
	sca_selected					= 0x20,
	fine_timestamp					= 0x40,
};

enum struct low_priority_flags : std::uint16_t {
	wave_on_ext_inhibit				= 0x001,
	wave_under_saturation			= 0x002,
	wave_over_saturation			= 0x004,
	external_trigger				= 0x008,
	global_trigger					= 0x010,
	software_trigger				= 0x020,
	self_trigger					= 0x040,
	lvds_trigger					= 0x080,
	ch64_trigger					= 0x100,
	itla_trigger					= 0x200,
	itlb_trigger					= 0x400,
};

// convert a raw probe type, unknown if not a valid probe
constexpr dpp_analog_probe_type to_analog_probe_type(std::uint8_t value) noexcept {
	switch (static_cast<dpp_analog_probe_type>(value)) {
	case dpp_analog_probe_type::adc_input:
	case dpp_analog_probe_type::time_filter:
	case dpp_analog_probe_type::energy_filter:
	case dpp_analog_probe_type::energy_filter_baseline:
	case dpp_analog_probe_type::energy_filter_minus_baseline:
	case dpp_analog_probe_type::baseline:
	case dpp_analog_probe_type::cfd:
		return static_cast<dpp_analog_probe_type>(value);
	default:
		return dpp_analog_probe_type::unknown;
	}
}

} // namespace dig2

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_DIG2_TYPES_HPP_ */
