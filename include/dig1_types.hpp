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
*	\file		dig1_types.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_DIG1_TYPES_HPP_
#define CAEN_FELIB_CPP_INCLUDE_DIG1_TYPES_HPP_

#include <cstdint>

#include "cpp-utility/flags.hpp"

namespace caen {

namespace felib {

/*
 * Values of fields read from the DPP endpoint of Dig1 digitizers
 * (ANALOG_PROBES_TYPE, DIGITAL_PROBES_TYPE and FLAGS).
 */
namespace dig1 {

enum struct dpp_probe_type : std::int32_t {
	invalid							= -1,
	none							= 0,
	input							= 1,
	delta							= 2,
	delta2							= 3,
	trapezoid						= 4,
	baseline						= 5,
	threshold						= 6,
	cfd								= 7,
	trap_corrected					= 8,
	rt_disc_wid						= 9,
	armed							= 10,
	pk_run							= 11,
	peaking							= 12,
	trg_val_win						= 13,
	bl_hold_off						= 14,
	trg_hold_off					= 15,
	trg_val							= 16,
	acq_veto						= 17,
	bfm_veto						= 18,
	ext_trg							= 19,
	over_threshold					= 20,
	trg_out							= 21,
	coincidence						= 22,
	pile_up							= 23,
	gate							= 24,
	gate_short						= 25,
	trigger							= 26,
	busy							= 27,
	pile_up_trig					= 28,
	is_neutron						= 29,
	trigger_accept					= 30,
	trg_win							= 31,
	coinc_win						= 32,
	fast_triang						= 33,
	slow_triang						= 34,
	bsl_freeze						= 35,
	inhibit_flag					= 36,
	peak_ready						= 37,
	armed_st						= 38,
	gate_inh						= 39,
	test_wave						= 40,
	smooth_input					= 41,
	adc_sat							= 42,
	adc_sat_protect					= 43,
	post_sat						= 44,
	energy_sat						= 45,
	pile_up_guard					= 46,
	crg_ready						= 47,
	charge_sat						= 48,
	neg_over_thr					= 49,
	trap_baseline					= 50,
};

enum struct dpp_flags : std::uint32_t {
	dead_time						= 0x0000001, // first event after a dead time
	tt_roll_over					= 0x0000002, // time stamp roll-over occurred before this event
	tt_reset						= 0x0000004, // time stamp reset forced from external signals
	evt_fake						= 0x0000008, // fake event
	mem_full						= 0x0000010,
	trg_lost						= 0x0000020, // first event after a trigger lost
	n_trg_lost						= 0x0000040, // high every N lost events
	over_rng						= 0x0000080, // energy overranged
	f1024_trg						= 0x0000100, // high every 1024 counted events
	lost_evt						= 0x0000200, // first event after events lost due to memory full
	input_sat						= 0x0000400, // input dynamics saturated
	n_trg_tot						= 0x0000800, // high every N total events
	old_sort						= 0x0001000,
	eor								= 0x0002000, // fake event at the end of run
	fine_tt							= 0x0004000,
	pile_up							= 0x0008000,
	time_value						= 0x0010000, // fake event on time stamp roll-over
	energy_skim						= 0x0020000,
	sat_rej							= 0x0040000, // detector inhibited due to saturation
	pll_lock_loss					= 0x0080000,
	over_temp						= 0x0100000,
	shutdown						= 0x0200000,
	memory_sort						= 0x0400000,
	mcs								= 0x0800000,
	stop_cond						= 0x1000000, // first event after a stop condition
};

} // namespace dig1

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_DIG1_TYPES_HPP_ */
