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
*	\file		digitizer.cpp
*	\brief
*
******************************************************************************/

#include "digitizer.hpp"

#include <utility>

#include <spdlog/spdlog.h>

#include "cpp-utility/scope_exit.hpp"
#include "last_error.hpp"
#include "library.hpp"
#include "library_logger.hpp"

namespace caen {

namespace felib {

std::shared_ptr<session> digitizer::open_session(std::shared_ptr<native_api> api, const std::string& url, const open_options& options) {

	library_logger::init();

	auto data = parse_url(url);

	auto logger = library_logger::create_logger(data._authority.empty() ? data._scheme : data._authority, data._log_level);

	logger->info("opening {}", url);
	const auto handle = api->open(url);

	// close the device if the session cannot be created
	auto cleanup = make_scope_exit([&api, &logger, handle]() noexcept {
		try {
			api->close(handle);
		} catch (const std::exception&) {
			const auto ec = CAEN_FELIB_CPP_HANDLE_EXCEPTION();
			logger->error("close failed on cleanup: {}", to_string(ec));
		}
	});

	auto s = std::make_shared<session>(api, handle, std::move(data), options, logger);
	cleanup.release();

	logger->info("opened with handle {}", handle);
	return s;
}

digitizer::digitizer(const std::string& url, const open_options& options)
	: digitizer(library::instance(), url, options) {
}

digitizer::digitizer(std::shared_ptr<native_api> api, const std::string& url, const open_options& options)
	: digitizer(open_session(std::move(api), url, options)) {
}

digitizer::digitizer(std::shared_ptr<session> s)
	: node(s, s->root_handle())
	, _session{std::move(s)} {
}

digitizer::~digitizer() {
	// moved-from instances have no session
	if (!_session || !_session->is_open())
		return;
	try {
		_session->close();
	} catch (const std::exception&) {
		const auto ec = CAEN_FELIB_CPP_HANDLE_EXCEPTION();
		_session->logger()->error("close failed on destruction: {}", to_string(ec));
	}
}

void digitizer::close() {
	if (!_session)
		throw ex::invalid_handle(handle());
	_session->close();
}

bool digitizer::is_open() const {
	return _session && _session->is_open();
}

const url_data& digitizer::url() const {
	if (!_session)
		throw ex::invalid_handle(handle());
	return _session->url();
}

} // namespace felib

} // namespace caen
