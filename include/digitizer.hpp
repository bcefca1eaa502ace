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
*	\file		digitizer.hpp
*	\brief		Root node of an open device
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_DIGITIZER_HPP_
#define CAEN_FELIB_CPP_INCLUDE_DIGITIZER_HPP_

#include <memory>
#include <string>

#include "native_api.hpp"
#include "node.hpp"
#include "session.hpp"
#include "url.hpp"

namespace caen {

namespace felib {

/**
 * @brief Root node of a device, owning the connection.
 *
 * The device is closed by close() or on destruction. Nodes obtained from a
 * digitizer become invalid when it is closed.
 *
 * Example:
 * @code
 * caen::felib::digitizer dig("dig2://caendgtz-usb-12345");
 * const auto n_channels = dig["par"]["numch"].value();
 * @endcode
 */
class digitizer : public node {
public:

	/**
	 * @brief Open a device using the shared CAEN FELib instance.
	 *
	 * @param url		the connection URL
	 * @param options	the options
	 * @throws ex::invalid_argument if the URL is not valid
	 * @throws ex::library_not_available if CAEN FELib cannot be loaded
	 * @throws ex::library_error if CAEN_FELib_Open fails
	 */
	explicit digitizer(const std::string& url, const open_options& options = open_options{});

	/**
	 * @brief Open a device using a custom native library.
	 *
	 * @overload
	 */
	digitizer(std::shared_ptr<native_api> api, const std::string& url, const open_options& options = open_options{});

	digitizer(digitizer&&) noexcept = default;
	digitizer& operator=(digitizer&&) = delete;
	digitizer(const digitizer&) = delete;
	digitizer& operator=(const digitizer&) = delete;

	// close, if still open
	~digitizer();

	/**
	 * @brief Close the device.
	 *
	 * @throws ex::invalid_handle if already closed
	 * @throws ex::library_error if CAEN_FELib_Close fails
	 */
	void close();

	bool is_open() const;

	const url_data& url() const;

private:

	explicit digitizer(std::shared_ptr<session> s);

	static std::shared_ptr<session> open_session(std::shared_ptr<native_api> api, const std::string& url, const open_options& options);

	std::shared_ptr<session> _session;

};

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_DIGITIZER_HPP_ */
