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

#ifndef DAGNN_NNET_PROPAGATION_HPP_
#define DAGNN_NNET_PROPAGATION_HPP_

#include "common.hpp"
#include "xoshiropp.hpp"
#include "nnet/framework.hpp"
#include "nnet/weights.hpp"

#include <utility>
#include <vector>

namespace dagnn::nnet {
/**
 * The result of one evaluation of a network: the value and the local
 * derivative of every node, together with the structure and parameters
 * that produced them. Read-only once created.
 */
class FeedForward {
#ifdef DAGNN_TESTER_NNET_FRIEND
	friend class DAGNN_TESTER_NNET_FRIEND;
#endif
	friend FeedForward feedForward(const NetworkStructure& structure,
			const ParameterBuffer& parameters, const vector<FLOAT>& inputs);
	friend FeedForward stochasticFeedForward(const NetworkStructure& structure,
			const ParameterBuffer& parameters, const vector<FLOAT>& inputs, RandomState& state);
public:
	/// Value of the output with the given index, or 0 if there is no such output
	FLOAT value(size_t output_index) const;

	/// Values of all outputs, in order
	vector<FLOAT> values() const;

	/**
	 * @throw std::out_of_range if node >= getStructure().getNodeCount()
	 */
	FLOAT nodeValue(size_t node) const;
	FLOAT nodeDerivative(size_t node) const;

	const NetworkStructure& getStructure() const;
	const ParameterBuffer& getWeights() const;
	const vector<FLOAT>& getNodeOutputs() const;
	const vector<FLOAT>& getNodeDerivatives() const;

private:
	NetworkStructure structure;
	ParameterBuffer weights;
	vector<FLOAT> outputs, derivatives;

	FeedForward(const NetworkStructure& structure, const ParameterBuffer& weights);

	/// Load the inputs and run every operation. `state` may be nullptr if deterministic.
	void run(const vector<FLOAT>& inputs, RandomState * state);
};

/**
 * Evaluate a deterministic network.
 *
 * Inputs are matched to the input nodes in order. Missing inputs are 0,
 * extra ones are ignored.
 *
 * @throw SizeMismatch if the parameters are not exactly as long as the
 *     structure's weight count
 * @throw std::logic_error if the structure is stochastic
 */
FeedForward feedForward(const NetworkStructure& structure,
		const ParameterBuffer& parameters, const vector<FLOAT>& inputs);

/// Evaluate any network, drawing random numbers from `state`
FeedForward stochasticFeedForward(const NetworkStructure& structure,
		const ParameterBuffer& parameters, const vector<FLOAT>& inputs, RandomState& state);

/**
 * Propagate `errors` (one per output, padded and truncated like inputs)
 * back through the weighted connections of the network.
 *
 * The errors are the negated derivative of the loss with respect to the
 * outputs, e.g. target - output for a squared error. Then the returned
 * gradient points downhill and applyDelta with a positive rate improves
 * the network.
 *
 * Only weight patches carry the error; other operations contribute their
 * local derivative but don't propagate anything further.
 */
std::pair<WeightGradient, InputSensitivity> backPropagate(const FeedForward& forward,
		const vector<FLOAT>& errors);

/// backPropagate with errors = targets - outputs
std::pair<WeightGradient, InputSensitivity> backPropagateTargets(const FeedForward& forward,
		const vector<FLOAT>& targets);
}

#endif
