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
*	\file		dll.hpp
*	\brief
*
******************************************************************************/

#ifndef CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_DLL_HPP_
#define CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_DLL_HPP_

#include <stdexcept>
#include <string>
#include <string_view>

#include <boost/noncopyable.hpp>
#include <boost/predef/os.h>
#include <spdlog/fmt/fmt.h>

#if BOOST_OS_WINDOWS
#include <system_error>
#include <boost/winapi/get_last_error.hpp>
#include <boost/winapi/dll.hpp>
#else
#include <dlfcn.h>
#endif

namespace caen {

namespace felib {

namespace dll {

namespace detail {
#if BOOST_OS_WINDOWS
inline std::string windows_get_last_error() {
	const auto id = boost::winapi::GetLastError();
	const auto ec = std::system_category().default_error_condition(id);
	return fmt::format("{} error: {} ({})", ec.category().name(), ec.message(), ec.value());
}
#endif
} // namespace detail

/**
 * @brief Shared library loaded at runtime.
 *
 * The library is unloaded on destruction, so every function pointer
 * returned by symbol() must not outlive this object.
 */
class shared_library : private boost::noncopyable {
public:

#if BOOST_OS_WINDOWS
	using handle_t = boost::winapi::HMODULE_;
#else
	using handle_t = void*;
#endif

	/**
	 * @brief Load a library from a file name or a path.
	 *
	 * @param path	passed as is to dlopen/LoadLibrary
	 * @throws std::runtime_error if the library cannot be loaded
	 */
	explicit shared_library(std::string path)
	: _path{std::move(path)}
	, _h{load_library(_path)} {}

	~shared_library() {
		// unload errors cannot be reported and are ignored
		close_library(_h);
	}

	/**
	 * @brief Platform specific file name of a library.
	 *
	 * @param name	the name without prefix and extension, like "CAEN_FELib"
	 * @return "libCAEN_FELib.so", "libCAEN_FELib.dylib" or "CAEN_FELib.dll"
	 */
	static std::string get_library_name(std::string_view name) {
#if BOOST_OS_WINDOWS
		return fmt::format("{}.dll", name);
#elif BOOST_OS_MACOS
		return fmt::format("lib{}.dylib", name);
#else
		return fmt::format("lib{}.so", name);
#endif
	}

	/**
	 * @brief Get a function pointer.
	 *
	 * @tparam FunctionType	a function pointer type, e.g. decltype(&::function_name)
	 * @param api_name		the exported symbol name, must be null terminated
	 * @throws std::runtime_error if the symbol is not found
	 */
	template <typename FunctionType>
	FunctionType symbol(std::string_view api_name) const {
		FunctionType p;
#if BOOST_OS_WINDOWS
		p = reinterpret_cast<FunctionType>(boost::winapi::get_proc_address(_h, api_name.data()));
		if (p == nullptr)
			throw std::runtime_error(fmt::format("GetProcAddress({}) failed: {}", api_name, detail::windows_get_last_error()));
#else
		// error detection based on https://linux.die.net/man/3/dlsym
		::dlerror();
		p = reinterpret_cast<FunctionType>(::dlsym(_h, api_name.data()));
		const auto msg = ::dlerror();
		if (msg != nullptr)
			throw std::runtime_error(fmt::format("dlsym failed: {}", msg));
#endif
		return p;
	}

	const std::string& path() const noexcept { return _path; }

private:

	static void close_library(handle_t handle) noexcept {
#if BOOST_OS_WINDOWS
		boost::winapi::FreeLibrary(handle);
#else
		::dlclose(handle);
#endif
	}

	static handle_t load_library(const std::string& library_name) {
		handle_t p;
#if BOOST_OS_WINDOWS
		p = boost::winapi::load_library(library_name.c_str());
		if (p == nullptr)
			throw std::runtime_error(fmt::format("LoadLibrary({}) failed: {}", library_name, detail::windows_get_last_error()));
#else
		p = ::dlopen(library_name.c_str(), RTLD_NOW);
		if (p == nullptr)
			throw std::runtime_error(fmt::format("dlopen failed: {}", ::dlerror()));
#endif
		return p;
	}

	const std::string _path;
	const handle_t _h;
};

} // namespace dll

} // namespace felib

} // namespace caen

#endif /* CAEN_FELIB_CPP_INCLUDE_CPP_UTILITY_DLL_HPP_ */
