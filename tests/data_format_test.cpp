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
*	\file		data_format_test.cpp
*	\brief
*
******************************************************************************/

#include <gtest/gtest.h>

#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "data_format.hpp"
#include "digitizer.hpp"
#include "fake_native_api.hpp"

using namespace caen::felib;

namespace {

constexpr auto url = "dig2://caendgtz-usb-1234";

} // unnamed namespace

TEST(DataFormatTest, ElementWidthsMatchNativeTypes) {
	EXPECT_EQ(element_size(scalar_type::U8), sizeof(std::uint8_t));
	EXPECT_EQ(element_size(scalar_type::U16), sizeof(std::uint16_t));
	EXPECT_EQ(element_size(scalar_type::U32), sizeof(std::uint32_t));
	EXPECT_EQ(element_size(scalar_type::U64), sizeof(std::uint64_t));
	EXPECT_EQ(element_size(scalar_type::I8), sizeof(std::int8_t));
	EXPECT_EQ(element_size(scalar_type::I16), sizeof(std::int16_t));
	EXPECT_EQ(element_size(scalar_type::I32), sizeof(std::int32_t));
	EXPECT_EQ(element_size(scalar_type::I64), sizeof(std::int64_t));
	EXPECT_EQ(element_size(scalar_type::CHAR), sizeof(char));
	EXPECT_EQ(element_size(scalar_type::BOOL), sizeof(bool));
	EXPECT_EQ(element_size(scalar_type::SIZE_T), sizeof(std::size_t));
	EXPECT_EQ(element_size(scalar_type::FLOAT), sizeof(float));
	EXPECT_EQ(element_size(scalar_type::DOUBLE), sizeof(double));
	EXPECT_EQ(element_size(scalar_type::LONG_DOUBLE), sizeof(long double));
}

TEST(DataFormatTest, UnsupportedTypeStrings) {
	EXPECT_THROW(parse_data_format(R"([{"name": "A", "type": "PTRDIFF_T"}])"), ex::unsupported_type);
	EXPECT_THROW(parse_data_format(R"([{"name": "A", "type": "U128"}])"), ex::unsupported_type);
	EXPECT_THROW(parse_data_format(R"([{"name": "A", "type": "LONG_DOUBLE"}])"), ex::unsupported_type);
	EXPECT_THROW(parse_data_format(R"([{"name": "A"}])"), ex::unsupported_type);
	EXPECT_THROW(field_descriptor("A", scalar_type::UNKNOWN), ex::unsupported_type);
}

TEST(DataFormatTest, LongDoubleUsesSpaceOnTheWire) {
	const auto fields = parse_data_format(R"([{"name": "X", "type": "LONG DOUBLE"}])");
	ASSERT_EQ(fields.size(), 1);
	EXPECT_EQ(fields[0].type(), scalar_type::LONG_DOUBLE);
	EXPECT_NE(dump_data_format(fields).find("\"LONG DOUBLE\""), std::string::npos);
}

TEST(DataFormatTest, InvalidJson) {
	EXPECT_THROW(parse_data_format("[{"), ex::invalid_argument);
	EXPECT_THROW(parse_data_format(R"({"name": "A", "type": "U8"})"), ex::invalid_argument);
	EXPECT_THROW(parse_data_format(R"([{"type": "U8"}])"), ex::invalid_argument);
}

TEST(DataFormatTest, ShapeMustMatchDim) {
	EXPECT_THROW(field_descriptor("W", scalar_type::U16, 1), ex::shape_mismatch);
	EXPECT_THROW(field_descriptor("W", scalar_type::U16, 2, {4}), ex::shape_mismatch);
	EXPECT_THROW(field_descriptor("W", scalar_type::U16, 0, {4}), ex::shape_mismatch);
	EXPECT_THROW(field_descriptor("W", scalar_type::U16, 3, {1, 2, 3}), ex::invalid_argument);
	EXPECT_NO_THROW(field_descriptor("E", scalar_type::U64));
	EXPECT_THROW(parse_data_format(R"([{"name": "W", "type": "U16", "dim": 1}])"), ex::shape_mismatch);
}

TEST(DataFormatTest, ShapeMismatchDetectedBeforeRegistration) {
	auto api = std::make_shared<test::fake_native_api>();
	digitizer dig(api, url);
	const auto scope = dig.get_node("/endpoint/scope");
	EXPECT_THROW(scope.set_read_data_format(R"([
		{"name": "TIMESTAMP", "type": "U64"},
		{"name": "WAVEFORM", "type": "U16", "dim": 2, "shape": [4]}
	])"), ex::shape_mismatch);
	EXPECT_EQ(api->count("SetReadDataFormat"), 0);
}

TEST(DataFormatTest, DuplicatedNamesRejectedBeforeRegistration) {
	auto api = std::make_shared<test::fake_native_api>();
	digitizer dig(api, url);
	const auto scope = dig.get_node("/endpoint/scope");
	EXPECT_THROW(scope.set_read_data_format({
		field_descriptor("E", scalar_type::U16),
		field_descriptor("E", scalar_type::U32),
	}), ex::invalid_argument);
	EXPECT_EQ(api->count("SetReadDataFormat"), 0);
}

TEST(DataFormatTest, TooManyFields) {
	auto api = std::make_shared<test::fake_native_api>();
	std::vector<field_descriptor> fields;
	for (std::size_t i = 0; i <= max_size::read_data_args; ++i)
		fields.emplace_back("F" + std::to_string(i), scalar_type::U8);
	EXPECT_THROW(compile(*api, api->scope_handle, std::move(fields)), ex::invalid_argument);
	EXPECT_EQ(api->count("SetReadDataFormat"), 0);
}

TEST(DataFormatTest, RegisteredFormatHasNoShape) {
	auto api = std::make_shared<test::fake_native_api>();
	digitizer dig(api, url);
	const auto data = dig.get_node("/endpoint/scope").set_read_data_format(R"([
		{"name": "TIMESTAMP", "type": "U64"},
		{"name": "WAVEFORM", "type": "I16", "dim": 2, "shape": [2, 16]}
	])");
	EXPECT_EQ(api->count("SetReadDataFormat"), 1);
	const auto registered = nlohmann::json::parse(api->last_format);
	ASSERT_EQ(registered.size(), 2);
	EXPECT_EQ(registered[0]["name"], "TIMESTAMP");
	EXPECT_EQ(registered[0]["type"], "U64");
	EXPECT_EQ(registered[0]["dim"], 0);
	EXPECT_EQ(registered[1]["type"], "I16");
	EXPECT_EQ(registered[1]["dim"], 2);
	EXPECT_FALSE(registered[1].contains("shape"));
	EXPECT_EQ(data.size(), 2);
	EXPECT_EQ(data.handle(), api->scope_handle);
}

TEST(DataFormatTest, ScalarAllocatesOneElement) {
	buffer b(scalar_type::U32, {});
	EXPECT_EQ(b.size(), 1);
	EXPECT_EQ(b.size_bytes(), sizeof(std::uint32_t));
	EXPECT_EQ(b.value<std::uint32_t>(), 0u);
	EXPECT_EQ(b.argument(), b.data());
}

TEST(DataFormatTest, ZeroExtentIsLegal) {
	buffer b(scalar_type::U16, {0});
	EXPECT_EQ(b.size(), 0);
	EXPECT_EQ(b.size_bytes(), 0);
	EXPECT_NE(b.data(), nullptr);
	EXPECT_THROW(b.at<std::uint16_t>(0), std::out_of_range);

	buffer m(scalar_type::U16, {0, 8});
	EXPECT_TRUE(m.row_pointers().empty());
}

TEST(DataFormatTest, NegativeExtentsRejected) {
	EXPECT_THROW(parse_data_format(R"([{"name": "A", "type": "U8", "dim": 1, "shape": [-1]}])"), ex::invalid_argument);
	EXPECT_THROW(parse_data_format(R"([{"name": "A", "type": "U8", "dim": 2, "shape": [4, -2]}])"), ex::invalid_argument);
	EXPECT_THROW(parse_data_format(R"([{"name": "A", "type": "U8", "dim": -1}])"), ex::invalid_argument);
}

TEST(DataFormatTest, OversizedBufferRejected) {
	EXPECT_THROW(buffer(scalar_type::U64, {2, std::size_t{1} << 61}), ex::invalid_argument);
	EXPECT_THROW(buffer(scalar_type::U8, {std::numeric_limits<std::size_t>::max(), 2}), ex::invalid_argument);
	EXPECT_THROW(buffer(scalar_type::U16, {std::numeric_limits<std::size_t>::max()}), ex::invalid_argument);
}

TEST(DataFormatTest, OversizedReshapeKeepsBuffer) {
	buffer b(scalar_type::U32, {2, 3});
	b.at<std::uint32_t>(1, 2) = 42;
	EXPECT_THROW(b.reshape({std::numeric_limits<std::size_t>::max(), 3}), ex::invalid_argument);
	EXPECT_EQ(b.shape(), (std::vector<std::size_t>{2, 3}));
	EXPECT_EQ(b.size(), 6);
	EXPECT_EQ(b.row_pointers().size(), 2);
	EXPECT_EQ(b.at<std::uint32_t>(1, 2), 42u);
}

TEST(DataFormatTest, BufferIsZeroInitialized) {
	buffer b(scalar_type::DOUBLE, {3, 5});
	const auto p = b.data<double>();
	for (std::size_t i = 0; i < b.size(); ++i)
		EXPECT_EQ(p[i], 0.);
}

TEST(DataFormatTest, RowProxyPointsToRows) {
	buffer b(scalar_type::U16, {3, 5});
	const auto& rows = b.row_pointers();
	ASSERT_EQ(rows.size(), 3);
	for (std::size_t i = 0; i < rows.size(); ++i)
		EXPECT_EQ(rows[i], static_cast<void*>(&b.at<std::uint16_t>(i, 0)));
	EXPECT_EQ(b.argument(), static_cast<const void*>(rows.data()));
}

TEST(DataFormatTest, RowProxyRebuiltOnReshape) {
	buffer b(scalar_type::I32, {2, 4});
	b.reshape({4, 8});
	const auto& rows = b.row_pointers();
	ASSERT_EQ(rows.size(), 4);
	for (std::size_t i = 0; i < rows.size(); ++i)
		EXPECT_EQ(rows[i], static_cast<void*>(&b.at<std::int32_t>(i, 0)));
	EXPECT_THROW(b.reshape({4}), ex::shape_mismatch);
}

TEST(DataFormatTest, RowProxyValidAfterMove) {
	std::vector<buffer> buffers;
	for (int i = 0; i < 8; ++i)
		buffers.emplace_back(scalar_type::U8, std::vector<std::size_t>{2, 3});
	for (auto& b : buffers) {
		const auto& rows = b.row_pointers();
		ASSERT_EQ(rows.size(), 2);
		EXPECT_EQ(rows[0], b.data());
		EXPECT_EQ(rows[1], static_cast<void*>(static_cast<std::uint8_t*>(b.data()) + 3));
	}
}

TEST(DataFormatTest, TypedAccessRequiresExactType) {
	buffer b(scalar_type::U32, {4});
	EXPECT_NO_THROW(b.data<std::uint32_t>());
	EXPECT_THROW(b.data<std::int32_t>(), ex::invalid_argument);
	EXPECT_THROW(b.data<std::uint64_t>(), ex::invalid_argument);
	EXPECT_THROW(b.value<std::uint32_t>(), ex::invalid_argument);
	EXPECT_THROW(b.at<std::uint32_t>(0, 0), ex::invalid_argument);
	EXPECT_THROW(b.at<std::uint32_t>(4), std::out_of_range);
}

TEST(DataFormatTest, MemoryIsTransparent) {
	buffer s(scalar_type::FLOAT, {});
	const float f = 1.5f;
	std::memcpy(s.data(), &f, sizeof(f));
	EXPECT_EQ(s.value<float>(), 1.5f);

	buffer v(scalar_type::I16, {3});
	const std::int16_t values[] = { -1, 2, -3 };
	std::memcpy(v.data(), values, sizeof(values));
	EXPECT_EQ(v.at<std::int16_t>(0), -1);
	EXPECT_EQ(v.at<std::int16_t>(2), -3);

	buffer m(scalar_type::U64, {2, 2});
	const std::uint64_t matrix[] = { 10, 11, 20, 21 };
	std::memcpy(m.data(), matrix, sizeof(matrix));
	EXPECT_EQ(m.at<std::uint64_t>(1, 0), 20u);
	EXPECT_EQ(*static_cast<std::uint64_t*>(m.row_pointers()[1]), 20u);
}

TEST(DataFormatTest, ArgumentListOrder) {
	auto api = std::make_shared<test::fake_native_api>();
	api->open_flag = true;
	auto fs = compile(*api, api->scope_handle, {
		field_descriptor("E", scalar_type::U16),
		field_descriptor("V", scalar_type::U8, 1, {10}),
		field_descriptor("W", scalar_type::I32, 2, {2, 4}),
	});
	const auto& args = build_argument_list(fs);
	ASSERT_EQ(args.size(), 3);
	EXPECT_EQ(args[0], fs[0].data.data());
	EXPECT_EQ(args[1], fs[1].data.data());
	EXPECT_EQ(args[2], static_cast<const void*>(fs[2].data.row_pointers().data()));
}

TEST(DataFormatTest, FieldLookupByName) {
	auto api = std::make_shared<test::fake_native_api>();
	api->open_flag = true;
	auto fs = compile(*api, api->scope_handle, {
		field_descriptor("E", scalar_type::U16),
	});
	EXPECT_EQ(fs.at("E").descriptor.type(), scalar_type::U16);
	EXPECT_THROW(fs.at("X"), ex::invalid_argument);
}

TEST(DataFormatTest, ReadScenario) {
	auto api = std::make_shared<test::fake_native_api>();
	digitizer dig(api, url);
	auto data = dig.get_node("/endpoint/scope").set_read_data_format({
		field_descriptor("E", scalar_type::U16),
		field_descriptor("W", scalar_type::U16, 2, {2, 4}),
	});
	api->on_read = [](const address_list& args) {
		// same access pattern of CAEN FELib: scalar by address, matrix by row pointers
		*static_cast<std::uint16_t*>(args.at(0)) = 7;
		auto rows = static_cast<std::uint16_t**>(args.at(1));
		for (int i = 0; i < 2; ++i)
			for (int j = 0; j < 4; ++j)
				rows[i][j] = static_cast<std::uint16_t>(i * 4 + j + 1);
	};
	dig.get_node("/endpoint/scope").read_data(100, data);
	EXPECT_EQ(api->count("ReadData"), 1);
	EXPECT_EQ(data.at("E").data.value<std::uint16_t>(), 7u);
	const auto& w = data.at("W").data;
	const std::uint16_t expected[2][4] = { { 1, 2, 3, 4 }, { 5, 6, 7, 8 } };
	for (std::size_t i = 0; i < 2; ++i)
		for (std::size_t j = 0; j < 4; ++j)
			EXPECT_EQ(w.at<std::uint16_t>(i, j), expected[i][j]);
}
