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
 * Tests that train small networks the way an embedding training loop
 * would: evaluate, back-propagate, combine the gradients and apply them.
 */

#include <gtest/gtest.h>
#include <cmath>
#include <iostream>
#include <utility>
#include <vector>

#include <H5Cpp.h>

#include "nnet.hpp"

namespace dagnn::nnet {
using Sample = std::pair<std::vector<FLOAT>, std::vector<FLOAT>>;

class TrainingTests : public ::testing::Test {
protected:
	static FLOAT totalLoss(const NetworkStructure& structure, const ParameterBuffer& weights,
			const std::vector<Sample>& samples) {
		FLOAT result {0};
		for(const auto& [inputs, targets] : samples) {
			auto outputs = feedForward(structure, weights, inputs).values();
			for(size_t k {0}; k < outputs.size(); ++k) {
				result += (targets[k] - outputs[k]) * (targets[k] - outputs[k]) / 2;
			}
		}
		return result;
	}

	/// One step of full-batch gradient descent
	static ParameterBuffer step(const NetworkStructure& structure, const ParameterBuffer& weights,
			const std::vector<Sample>& samples, FLOAT rate) {
		std::vector<WeightGradient> gradients;
		for(const auto& [inputs, targets] : samples) {
			gradients.push_back(backPropagateTargets(feedForward(structure, weights, inputs), targets).first);
		}
		return applyDelta(rate / samples.size(), weights, combine(gradients));
	}

	static std::vector<Sample> xorSamples() {
		return {
			{{0, 0}, {0}},
			{{0, 1}, {1}},
			{{1, 0}, {1}},
			{{1, 1}, {0}},
		};
	}

	static NetworkStructure xorNetwork() {
		NetworkBuilder builder;
		auto in = builder.addInputs(2);
		auto hidden = builder.standardLayer({{in, builder.addBaseWeights(2, 4)},
				{bias(), builder.addBaseWeights(1, 4)}}, activations::tanh());
		auto out = builder.standardLayer({{*hidden, builder.addBaseWeights(4, 1)},
				{bias(), builder.addBaseWeights(1, 1)}}, activations::sigmoid());
		builder.addOutputs(*out);
		return builder.finalize();
	}
};

TEST_F(TrainingTests, Linear_Regression_Converges) {
	NetworkBuilder builder;
	auto in = builder.addInputs(2);
	auto out = builder.standardLayer({{in, builder.addBaseWeights(2, 1)},
			{bias(), builder.addBaseWeights(1, 1)}}, activations::identity());
	builder.addOutputs(*out);
	auto structure = builder.finalize();

	std::vector<Sample> samples;
	for(int a {-2}; a <= 2; ++a) {
		for(int b {-2}; b <= 2; ++b) {
			FLOAT x1 {a / FCAST(2)}, x2 {b / FCAST(2)};
			samples.push_back({{x1, x2}, {2 * x1 - 3 * x2 + 0.5}});
		}
	}

	RandomState state {1, 2, 3, 4};
	auto weights = initialWeights(structure, state, {-0.5, 0.5});
	for(int epoch {0}; epoch < 1000; ++epoch) {
		weights = step(structure, weights, samples, 0.1);
	}
	std::cerr << "LINEAR WEIGHTS: " << weights << std::endl;
	EXPECT_NEAR(weights.at(0), 2.0, 1e-6);
	EXPECT_NEAR(weights.at(1), -3.0, 1e-6);
	EXPECT_NEAR(weights.at(2), 0.5, 1e-6);
	EXPECT_LT(totalLoss(structure, weights, samples), 1e-10);
}

TEST_F(TrainingTests, Small_Step_Decreases_Loss) {
	auto structure = xorNetwork();
	auto samples = xorSamples();
	RandomState state {5, 6, 7, 8};
	for(int trial {0}; trial < 5; ++trial) {
		auto weights = initialWeights(structure, state, {-1.0, 1.0});
		auto before = totalLoss(structure, weights, samples);
		auto after = totalLoss(structure, step(structure, weights, samples, 1e-3), samples);
		EXPECT_LT(after, before) << "trial " << trial;
	}
}

TEST_F(TrainingTests, XOR_Loss_Goes_Down) {
	auto structure = xorNetwork();
	auto samples = xorSamples();
	RandomState state {9, 10, 11, 12};
	auto weights = initialWeights(structure, state, {-1.0, 1.0});
	auto initial = totalLoss(structure, weights, samples);
	for(int epoch {0}; epoch < 500; ++epoch) {
		weights = step(structure, weights, samples, 0.05);
	}
	auto final_loss = totalLoss(structure, weights, samples);
	std::cerr << "XOR LOSS: " << initial << " -> " << final_loss << std::endl;
	EXPECT_LT(final_loss, initial);
}

TEST_F(TrainingTests, Checkpoint_and_Resume) {
	auto structure = xorNetwork();
	auto samples = xorSamples();
	RandomState state {13, 14, 15, 16};
	auto weights = initialWeights(structure, state, {-1.0, 1.0});
	for(int epoch {0}; epoch < 20; ++epoch) {
		weights = step(structure, weights, samples, 0.1);
	}

	auto path = ::testing::TempDir() + "dagnn-checkpoint-test.h5";
	auto description = structure.serializeAsString();
	{
		H5::H5File file(path, H5F_ACC_TRUNC);
		auto group = file.createGroup("xor");
		saveWeights(group, "weights", weights);
	}
	H5::H5File file(path, H5F_ACC_RDONLY);
	auto group = file.openGroup("xor");
	auto restored_structure = NetworkStructure::deserialize(description);
	auto restored_weights = loadWeights(group, "weights");
	EXPECT_EQ(restored_weights, weights);

	auto continued = step(structure, weights, samples, 0.1);
	auto resumed = step(restored_structure, restored_weights, samples, 0.1);
	EXPECT_EQ(resumed, continued);
}
}
