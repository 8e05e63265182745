/**********************************************************************
This file is part of the Seimei AI Project:
	https://github.com/Acharvak/Seimei-AI

Copyright 2020 Fedor Uvarov

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

   http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
**********************************************************************/
// SPDX-License-Identifier: Apache-2.0

/**
 * Parameter buffers: combination, delta application, serialization and
 * storage.
 */

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <H5Cpp.h>

#include "nnet.hpp"

namespace dagnn::nnet {
// ===== COMBINATION =====
TEST(Weight_Gradients, Combine_Extends_With_Zeros) {
	WeightGradient a({1.0, 2.0, 3.0});
	WeightGradient b({10.0});
	auto sum = combine({a, b});
	EXPECT_EQ(sum.values(), (std::vector<FLOAT>{11.0, 2.0, 3.0}));
	EXPECT_EQ(a + b, sum);
	EXPECT_EQ(b + a, sum);
}

TEST(Weight_Gradients, Empty_Combination_Is_Neutral) {
	auto none = combine({});
	EXPECT_TRUE(none.empty());
	WeightGradient a({1.5, -2.5});
	EXPECT_EQ(none + a, a);
	EXPECT_EQ(a + none, a);
	EXPECT_EQ(combine({none, none}).size(), 0);
}

TEST(Weight_Gradients, Combine_Is_Associative) {
	WeightGradient a({0.5, 0.25});
	WeightGradient b({1.0, 2.0, 4.0});
	WeightGradient c({8.0});
	EXPECT_EQ((a + b) + c, a + (b + c));
	EXPECT_EQ(combine({a, b, c}), (a + b) + c);
	EXPECT_EQ(combine({c, b, a}).values(), (std::vector<FLOAT>{9.5, 2.25, 4.0}));
}

// ===== DELTA APPLICATION =====
TEST(Parameter_Buffer, Apply_Delta) {
	auto params = packWeights({1.0, 2.0, 3.0});
	auto result = applyDelta(0.5, params, WeightGradient({2.0, -4.0, 1.0}));
	EXPECT_EQ(result.values(), (std::vector<FLOAT>{2.0, 0.0, 3.5}));
	// The input is untouched
	EXPECT_EQ(params.values(), (std::vector<FLOAT>{1.0, 2.0, 3.0}));
}

TEST(Parameter_Buffer, Apply_Delta_Identities) {
	auto params = packWeights({1.0, -2.0, 0.125});
	EXPECT_EQ(applyDelta(0.0, params, WeightGradient({5.0, 6.0, 7.0})), params);
	EXPECT_EQ(applyDelta(0.0, params, WeightGradient({std::numeric_limits<FLOAT>::infinity()})), params);
	EXPECT_EQ(applyDelta(3.0, params, WeightGradient()), params);
}

TEST(Parameter_Buffer, Apply_Delta_Extends_With_Zeros) {
	auto shorter = applyDelta(2.0, packWeights({1.0}), WeightGradient({1.0, 1.0, 1.0}));
	EXPECT_EQ(shorter.values(), (std::vector<FLOAT>{3.0, 2.0, 2.0}));
	auto longer = applyDelta(2.0, packWeights({1.0, 1.0, 1.0}), WeightGradient({1.0}));
	EXPECT_EQ(longer.values(), (std::vector<FLOAT>{3.0, 1.0, 1.0}));
}

TEST(Parameter_Buffer, Accessors) {
	auto params = packWeights({1.0, 2.0});
	EXPECT_EQ(params.size(), 2);
	EXPECT_EQ(params.at(1), 2.0);
	EXPECT_THROW(params.at(2), std::out_of_range);
	EXPECT_EQ(params.padded(1), 2.0);
	EXPECT_EQ(params.padded(2), 0.0);
	EXPECT_EQ(unpackWeights(params), (std::vector<FLOAT>{1.0, 2.0}));
	EXPECT_TRUE(unpackWeights(packWeights({})).empty());
	auto copy = params;
	EXPECT_EQ(copy.data(), params.data());
}

// ===== BINARY SERIALIZATION =====
TEST(Serialization, Native_Doubles) {
	std::vector<FLOAT> values {0.0, -0.0, 1.0, -2.5, 1e-300, std::numeric_limits<FLOAT>::max(),
			std::numeric_limits<FLOAT>::denorm_min(), std::numeric_limits<FLOAT>::infinity()};
	auto bytes = serializeWeights(packWeights(values));
	ASSERT_EQ(bytes.size(), 8 * values.size());
	// Same bytes as the values in memory
	EXPECT_EQ(std::memcmp(bytes.data(), values.data(), bytes.size()), 0);
	EXPECT_EQ(serializeWeights(deserializeWeights(bytes)), bytes);
	EXPECT_TRUE(serializeWeights(ParameterBuffer()).empty());
}

TEST(Serialization, Unaligned_Source) {
	std::vector<FLOAT> values {3.25, -7.0};
	auto bytes = serializeWeights(packWeights(values));
	std::vector<uint8_t> shifted(bytes.size() + 3);
	std::memcpy(shifted.data() + 3, bytes.data(), bytes.size());
	EXPECT_EQ(unpackWeights(deserializeWeights(shifted.data() + 3, bytes.size())), values);
}

TEST(Serialization, NaN_Payload_Survives) {
	auto nan = std::numeric_limits<FLOAT>::quiet_NaN();
	auto bytes = serializeWeights(packWeights({nan}));
	auto restored = deserializeWeights(bytes);
	ASSERT_EQ(restored.size(), 1);
	EXPECT_TRUE(std::isnan(restored.at(0)));
	EXPECT_EQ(serializeWeights(restored), bytes);
}

TEST(Serialization, Length_Must_Be_Whole_Doubles) {
	std::vector<uint8_t> bytes(12, 0);
	EXPECT_THROW(deserializeWeights(bytes), SizeMismatch);
	EXPECT_TRUE(deserializeWeights(std::vector<uint8_t>()).empty());
}

// ===== TEXT FORMAT =====
TEST(Text_Format, Printing) {
	EXPECT_EQ(toString(packWeights({})), "{}");
	EXPECT_EQ(toString(packWeights({1.0, -2.5, 0.5})), "{1, -2.5, 0.5}");
	EXPECT_EQ(toString(packWeights({0.1, 1e-7, 123456789.125})), "{0.1, 1e-07, 123456789.125}");
	// 15 digits are not enough for these
	EXPECT_EQ(toString(packWeights({0.1 + 0.2})), "{0.30000000000000004}");
	EXPECT_EQ(toString(packWeights({1.0 / 3.0})), "{0.33333333333333331}");
	std::ostringstream out;
	out.precision(3);
	out << WeightGradient({0.1}) << ' ' << 0.123456;
	// The stream precision is neither used nor changed
	EXPECT_EQ(out.str(), "{0.1} 0.123");
}

namespace {
class CommaDecimal : public std::numpunct<char> {
protected:
	char do_decimal_point() const override {
		return ',';
	}
};
}

TEST(Text_Format, Ignores_Locale) {
	std::ostringstream out;
	out.imbue(std::locale(out.getloc(), new CommaDecimal));
	out << packWeights({0.5, -2.25});
	EXPECT_EQ(out.str(), "{0.5, -2.25}");

	auto previous = std::locale::global(std::locale(std::locale::classic(), new CommaDecimal));
	auto parsed = unpackWeights(parseWeights("{0.5, -2.25}"));
	std::locale::global(previous);
	EXPECT_EQ(parsed, (std::vector<FLOAT>{0.5, -2.25}));
}

TEST(Text_Format, Parsing) {
	EXPECT_TRUE(parseWeights("{}").empty());
	EXPECT_TRUE(parseWeights("  { }\n").empty());
	EXPECT_EQ(unpackWeights(parseWeights("{1, -2.5,0.5 ,1e3}")), (std::vector<FLOAT>{1.0, -2.5, 0.5, 1000.0}));
	std::vector<FLOAT> values {0.1, 1.0 / 3.0, 0.1 + 0.2, -1e-200, 123456789.125, -0.0,
			std::numeric_limits<FLOAT>::max(), std::numeric_limits<FLOAT>::denorm_min()};
	EXPECT_EQ(unpackWeights(parseWeights(toString(packWeights(values)))), values);
}

TEST(Text_Format, Non_Finite_Values) {
	auto inf = std::numeric_limits<FLOAT>::infinity();
	auto text = toString(packWeights({inf, -inf, std::numeric_limits<FLOAT>::quiet_NaN()}));
	auto parsed = unpackWeights(parseWeights(text));
	ASSERT_EQ(parsed.size(), 3) << text;
	EXPECT_EQ(parsed[0], inf);
	EXPECT_EQ(parsed[1], -inf);
	EXPECT_TRUE(std::isnan(parsed[2]));
}

TEST(Text_Format, Malformed) {
	for(const char * text : {"", "1, 2", "{1, 2", "{1,, 2}", "{1 2}", "{,}", "{1,}", "{x}", "{1} 2", "[1]",
			"{1e999}"}) {
		EXPECT_THROW(parseWeights(text), std::invalid_argument) << text;
	}
}

// ===== INITIAL WEIGHTS =====
TEST(Initial_Weights, Range_and_Determinism) {
	RandomState state {1, 2, 3, 4};
	auto replay = state;
	auto weights = initialWeights(1000, state, {-0.5, 0.25});
	ASSERT_EQ(weights.size(), 1000);
	FLOAT low {1}, high {-1};
	for(FLOAT w : weights.values()) {
		EXPECT_GE(w, -0.5);
		EXPECT_LT(w, 0.25);
		low = std::min(low, w);
		high = std::max(high, w);
	}
	EXPECT_LT(low, -0.4);
	EXPECT_GT(high, 0.15);
	EXPECT_NE(state, replay);
	EXPECT_EQ(initialWeights(1000, replay, {-0.5, 0.25}), weights);
	EXPECT_NE(initialWeights(1000, replay, {-0.5, 0.25}), weights);
}

TEST(Initial_Weights, Sized_For_Structure) {
	NetworkBuilder builder;
	auto in = builder.addInputs(3);
	builder.addOutputs(*builder.standardLayer({{in, builder.addBaseWeights(3, 5)}}, activations::tanh()));
	auto structure = builder.finalize();
	RandomState state {5, 6, 7, 8};
	auto weights = initialWeights(structure, state, {-1.0, 1.0});
	EXPECT_EQ(weights.size(), 15);
	EXPECT_NO_THROW(feedForward(structure, weights, {1.0, 2.0, 3.0}));
}

// ===== HDF5 STORAGE =====
TEST(HDF5_Storage, Save_and_Load) {
	auto path = ::testing::TempDir() + "dagnn-weights-test.h5";
	std::vector<FLOAT> values {0.5, -1.25, 1e-12, 3.0};
	{
		H5::H5File file(path, H5F_ACC_TRUNC);
		auto group = file.createGroup("network");
		saveWeights(group, "weights", packWeights(values));
		saveWeights(group, "empty", ParameterBuffer());
		// Saving again replaces the dataset
		saveWeights(group, "replaced", packWeights({1.0, 2.0, 3.0}));
		saveWeights(group, "replaced", packWeights({4.0}));
	}
	H5::H5File file(path, H5F_ACC_RDONLY);
	auto group = file.openGroup("network");
	EXPECT_EQ(unpackWeights(loadWeights(group, "weights")), values);
	EXPECT_TRUE(loadWeights(group, "empty").empty());
	EXPECT_EQ(unpackWeights(loadWeights(group, "replaced")), std::vector<FLOAT>{4.0});
	EXPECT_THROW(loadWeights(group, "missing"), std::runtime_error);
}
}
