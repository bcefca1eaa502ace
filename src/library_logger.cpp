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
*	\file		library_logger.cpp
*	\brief
*
******************************************************************************/

#include "library_logger.hpp"

#include <array>
#include <cstdlib>
#include <mutex>
#include <string_view>
#include <utility>

#include <boost/config.hpp>
#include <boost/predef/os.h>
#include <boost/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#if BOOST_OS_WINDOWS
#include <spdlog/sinks/msvc_sink.h>
#endif
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>
#include <nlohmann/json.hpp>

#include <CAEN_FELib.h>

#include "lib_definitions.hpp"

using namespace std::literals;

namespace caen {

namespace felib {

namespace library_logger {

namespace {

void log_library_versions() {

	auto int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 10000), (v / 100) % 100, v % 100 }; };
	auto boost_int_to_triplet = [](int v) -> std::array<int, 3> { return { (v / 100000), (v / 100) % 1000, v % 100 }; };

	static constexpr auto caen_felib_cpp_version = CAEN_FELIB_CPP_VERSION_STRING ""sv;
	static constexpr auto caen_fe_version = CAEN_FELIB_VERSION_STRING ""sv;
	static constexpr auto compiler_version = BOOST_COMPILER ""sv;
	static constexpr auto platform_name = BOOST_PLATFORM ""sv;
	static constexpr auto stdlib_version = BOOST_STDLIB ""sv;
	static constexpr std::array<int, 3> json_version{ NLOHMANN_JSON_VERSION_MAJOR, NLOHMANN_JSON_VERSION_MINOR, NLOHMANN_JSON_VERSION_PATCH };
	static constexpr std::array<int, 3> spdlog_version{ SPDLOG_VER_MAJOR, SPDLOG_VER_MINOR, SPDLOG_VER_PATCH };

	spdlog::info("built on {} {}", __DATE__, __TIME__);
	spdlog::info("compiled with {} on {}", compiler_version, platform_name);
	spdlog::info("stdlib version: {}", stdlib_version);
	spdlog::info("caen-felib-cpp version: {}", caen_felib_cpp_version);
	spdlog::info("caen-fe header version: {}", caen_fe_version);
	spdlog::info("JSON for Modern C++ version: {}", fmt::join(json_version, "."));
	spdlog::info("spdlog version: {}", fmt::join(spdlog_version, "."));
	spdlog::info("{{fmt}} version: {}", fmt::join(int_to_triplet(FMT_VERSION), "."));
	spdlog::info("Boost version: {}", fmt::join(boost_int_to_triplet(BOOST_VERSION), "."));

}

// main sink, shared by all loggers; the actual sinks are added by init()
std::shared_ptr<spdlog::sinks::dist_sink_mt> main_sink() {
	static auto sink_instance = std::make_shared<spdlog::sinks::dist_sink_mt>();
	return sink_instance;
}

std::shared_ptr<spdlog::sinks::sink> file_sink() {
	using sink_type = spdlog::sinks::basic_file_sink_mt;
#if BOOST_OS_WINDOWS
	const auto appdata_env = std::getenv("APPDATA");
	if (appdata_env == nullptr)
		return nullptr;
	const auto filename = fmt::format(SPDLOG_FILENAME_T("{}/CAEN/caen_felib_cpp.log"), appdata_env);
#else
	const auto home_env = std::getenv("HOME");
	if (home_env == nullptr)
		return nullptr;
	const auto filename = fmt::format(SPDLOG_FILENAME_T("{}/.CAEN/caen_felib_cpp.log"), home_env);
#endif
	static constexpr bool truncate{true};
	return std::make_shared<sink_type>(filename, truncate);
}

void init_once() {

	/*
	 * Important notes about logger:
	 * - async loggers are not supported in a dynamic library
	 * - SPDLOG_LOGGER_TRACE and SPDLOG_LOGGER_DEBUG are not even compiled unless macro SPDLOG_ACTIVE_LEVEL is redefined at compile time
	 */

	// loggers are not registered, so that more devices can share the same logger name
	spdlog::set_automatic_registration(false);

	// set a default level to off and then invoke load_env_levels to override the default value using SPDLOG_LEVEL
	spdlog::set_level(spdlog::level::off);
	spdlog::cfg::load_env_levels();

	// flush is always set on active level, since log is for debug only
	spdlog::flush_on(spdlog::get_level());

	// file sink is created only if logging is enabled, to avoid creating empty files
	if (spdlog::get_level() != spdlog::level::off) {
		try {
			if (auto sink = file_sink())
				main_sink()->add_sink(std::move(sink));
		} catch (const spdlog::spdlog_ex& ex) {
			// e.g. missing ~/.CAEN directory: log is disabled, library still usable
			spdlog::warn("cannot create log file: {}", ex.what());
		}
	}
#if BOOST_OS_WINDOWS
	main_sink()->add_sink(std::make_shared<spdlog::sinks::msvc_sink_mt>());
#endif

	// create the default logger with these settings
	spdlog::set_default_logger(create_logger("default"s));

	log_library_versions();
}

} // unnamed namespace

void init() {
	static std::once_flag flag;
	std::call_once(flag, init_once);
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name) {
	auto logger = std::make_shared<spdlog::logger>(name, main_sink());
	logger->set_level(spdlog::get_level());
	logger->flush_on(spdlog::get_level());
	return logger;
}

std::shared_ptr<spdlog::logger> create_logger(const std::string& name, const std::optional<spdlog::level::level_enum>& level) {
	const auto logger = create_logger(name);
	if (level) {
		logger->set_level(*level);
		logger->flush_on(*level);
	}
	return logger;
}

} // namespace library_logger

} // namespace felib

} // namespace caen
