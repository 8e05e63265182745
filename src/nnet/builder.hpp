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

#ifndef DAGNN_NNET_BUILDER_HPP_
#define DAGNN_NNET_BUILDER_HPP_

#include "common.hpp"
#include "nnet/framework.hpp"
#include "nnet/sequence.hpp"

#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace dagnn::nnet {
/**
 * Assembles a NetworkStructure. Every builder is its own construction
 * session: the Layers and allocated WeightSelectors it hands out can only
 * be passed back to it, anything else throws ForeignHandle.
 *
 * Layer constructors return an absent value if the shapes of their
 * arguments don't fit together. In that case the builder is left exactly
 * as it was.
 *
 * Operations are recorded in the order of the calls, which is also the
 * order they are evaluated in.
 *
 * If `Stochastic` is false, stochasticLayer does not compile.
 */
template<bool Stochastic>
class BasicNetworkBuilder {
public:
	/// A source layer together with the weights connecting it to a new layer
	using Parent = std::pair<Layer, WeightSelector>;

	static constexpr bool stochastic {Stochastic};

	BasicNetworkBuilder();
	BasicNetworkBuilder(const BasicNetworkBuilder&) = delete;
	BasicNetworkBuilder& operator=(const BasicNetworkBuilder&) = delete;

	/**
	 * The handles of `other` now belong to this builder. `other` starts over
	 * as a new, empty session.
	 */
	BasicNetworkBuilder(BasicNetworkBuilder&& other);
	BasicNetworkBuilder& operator=(BasicNetworkBuilder&& other);

	/**
	 * Allocate `count` input nodes. They are fed, in order, from the values
	 * passed to feedForward. `count` may be 0, the result is then an empty
	 * layer.
	 */
	Layer addInputs(size_t count);

	/**
	 * Reserve a fresh block of input_width * output_width trainable weights.
	 * Using the returned selector for several layers ties their weights.
	 *
	 * @throw std::runtime_error if the block is too big
	 */
	WeightSelector addBaseWeights(size_t input_width, size_t output_width);

	/// A non-trainable selector that always reads `constant`
	WeightSelector fixedWeights(size_t input_width, size_t output_width, FLOAT constant) const;

	/**
	 * Add a layer whose raw value is the sum of the weighted parents, then
	 * apply `activation` to it.
	 *
	 * Absent if `parents` is empty, a parent's width differs from its
	 * selector's input width, or the selectors disagree on the output width.
	 *
	 * @throw ForeignHandle if a handle belongs to another builder
	 */
	std::optional<Layer> standardLayer(const std::vector<Parent>& parents, const Activation& activation);

	/// Like standardLayer, then resample every node with `randomization`
	std::optional<Layer> stochasticLayer(const std::vector<Parent>& parents,
			const Activation& activation, const Randomization& randomization);

	/// A new layer with the softmax of `layer`
	std::optional<Layer> softMaxLayer(const Layer& layer);

	/// Elementwise sum of layers of the same width. Absent if empty or widths differ.
	std::optional<Layer> pointwiseSumLayer(const std::vector<Layer>& layers);

	/// Elementwise product of layers of the same width. Absent if empty or widths differ.
	std::optional<Layer> pointwiseProductLayer(const std::vector<Layer>& layers);

	/// A new layer with `activation` applied to a copy of `layer`
	std::optional<Layer> pointwiseUnaryLayer(const Layer& layer, const Activation& activation);

	/// Append the nodes of `layer`, in order, to the outputs
	void addOutputs(const Layer& layer);

	size_t getNodeCount() const;
	size_t getWeightCount() const;

	/// Snapshot everything added so far as a NetworkStructure
	NetworkStructure finalize() const;

private:
	shared_ptr<const Session> session;
	size_t nodeCount {1};
	size_t weightCount {0};
	AppendSequence<size_t> inputNodes {};
	AppendSequence<size_t> outputNodes {};
	AppendSequence<Operation> operations {};

	void checkOwner(const Layer& layer) const;
	void checkOwner(const WeightSelector& selector) const;
	Layer allocate(size_t width);
	std::optional<Layer> weightedLayer(const std::vector<Parent>& parents);
	std::optional<Layer> combinedLayer(const std::vector<Layer>& layers, OperationType type);
};

using NetworkBuilder = BasicNetworkBuilder<false>;
using StochasticNetworkBuilder = BasicNetworkBuilder<true>;

/**
 * Run `program` against a fresh builder and finalize it.
 *
 * If the program returns nothing, the result is the NetworkStructure.
 * Otherwise it is a pair of the NetworkStructure and the program's result.
 */
template<bool Stochastic = false, class Program>
auto runNetworkBuilder(Program&& program) {
	BasicNetworkBuilder<Stochastic> builder;
	using Result = std::invoke_result_t<Program, BasicNetworkBuilder<Stochastic>&>;
	if constexpr (std::is_void_v<Result>) {
		std::forward<Program>(program)(builder);
		return builder.finalize();
	} else {
		Result result = std::forward<Program>(program)(builder);
		return std::make_pair(builder.finalize(), std::move(result));
	}
}
}

#include "nnet/builder.tpp"
#endif
