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
// BasicNetworkBuilder implementation - template class

#ifndef DAGNN_NNET_BUILDER_HPP_
#include "nnet/builder.hpp"
#endif

#include <limits>
#include <stdexcept>
#include <utility>

namespace dagnn::nnet {
template<bool Stochastic>
BasicNetworkBuilder<Stochastic>::BasicNetworkBuilder() : session(std::make_shared<const Session>()) {
}

template<bool Stochastic>
BasicNetworkBuilder<Stochastic>::BasicNetworkBuilder(BasicNetworkBuilder&& other) :
		session(std::exchange(other.session, std::make_shared<const Session>())),
		nodeCount(std::exchange(other.nodeCount, 1)),
		weightCount(std::exchange(other.weightCount, 0)),
		inputNodes(std::exchange(other.inputNodes, AppendSequence<size_t>())),
		outputNodes(std::exchange(other.outputNodes, AppendSequence<size_t>())),
		operations(std::exchange(other.operations, AppendSequence<Operation>())) {
}

template<bool Stochastic>
BasicNetworkBuilder<Stochastic>& BasicNetworkBuilder<Stochastic>::operator=(BasicNetworkBuilder&& other) {
	if(this != &other) {
		session = std::exchange(other.session, std::make_shared<const Session>());
		nodeCount = std::exchange(other.nodeCount, 1);
		weightCount = std::exchange(other.weightCount, 0);
		inputNodes = std::exchange(other.inputNodes, AppendSequence<size_t>());
		outputNodes = std::exchange(other.outputNodes, AppendSequence<size_t>());
		operations = std::exchange(other.operations, AppendSequence<Operation>());
	}
	return *this;
}

template<bool Stochastic>
void BasicNetworkBuilder<Stochastic>::checkOwner(const Layer& layer) const {
	if(layer.session ? layer.session != session : !layer.isBias()) {
		throw ForeignHandle("The layer was created by a different network builder");
	}
}

template<bool Stochastic>
void BasicNetworkBuilder<Stochastic>::checkOwner(const WeightSelector& selector) const {
	if(selector.getType() == SelectorType::ALLOCATED && selector.session != session) {
		throw ForeignHandle("The weights were allocated by a different network builder");
	}
}

template<bool Stochastic>
Layer BasicNetworkBuilder<Stochastic>::allocate(size_t width) {
	if(width > std::numeric_limits<size_t>::max() - nodeCount) {
		throw std::runtime_error("Too many nodes in the network");
	}
	Layer result(session, nodeCount, width);
	nodeCount += width;
	return result;
}

template<bool Stochastic>
Layer BasicNetworkBuilder<Stochastic>::addInputs(size_t count) {
	auto result = allocate(count);
	inputNodes += AppendSequence<size_t>::range(result.first(), count);
	return result;
}

template<bool Stochastic>
WeightSelector BasicNetworkBuilder<Stochastic>::addBaseWeights(size_t input_width, size_t output_width) {
	assertSZMUL(input_width, output_width);
	size_t span {input_width * output_width};
	if(span > std::numeric_limits<size_t>::max() - weightCount) {
		throw std::runtime_error("Too many weights in the network");
	}
	WeightSelector result(session, SelectorType::ALLOCATED, input_width, output_width, weightCount, 0);
	weightCount += span;
	return result;
}

template<bool Stochastic>
WeightSelector BasicNetworkBuilder<Stochastic>::fixedWeights(size_t input_width, size_t output_width,
		FLOAT constant) const {
	return WeightSelector::fixed(input_width, output_width, constant);
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::weightedLayer(const std::vector<Parent>& parents) {
	for(const auto& parent : parents) {
		checkOwner(parent.first);
		checkOwner(parent.second);
	}
	if(parents.empty()) {
		return std::nullopt;
	}
	size_t output_width {parents.front().second.outputs()};
	for(const auto& [layer, selector] : parents) {
		if(layer.size() != selector.inputs() || selector.outputs() != output_width) {
			return std::nullopt;
		}
	}
	auto result = allocate(output_width);
	for(const auto& [layer, selector] : parents) {
		operations.push(Operation::weightPatch(layer.first(), result.first(), selector));
	}
	return result;
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::standardLayer(const std::vector<Parent>& parents,
		const Activation& activation) {
	auto result = weightedLayer(parents);
	if(result) {
		operations.push(Operation::applyActivation(result->first(), result->size(), activation));
	}
	return result;
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::stochasticLayer(const std::vector<Parent>& parents,
		const Activation& activation, const Randomization& randomization) {
	static_assert(Stochastic, "stochasticLayer requires a StochasticNetworkBuilder");
	auto result = standardLayer(parents, activation);
	if(result) {
		operations.push(Operation::applyRandomization(result->first(), result->size(), randomization));
	}
	return result;
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::softMaxLayer(const Layer& layer) {
	checkOwner(layer);
	auto result = allocate(layer.size());
	operations.push(Operation::softMax(result.first(), layer.first(), layer.size()));
	return result;
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::combinedLayer(const std::vector<Layer>& layers,
		OperationType type) {
	for(const auto& layer : layers) {
		checkOwner(layer);
	}
	if(layers.empty()) {
		return std::nullopt;
	}
	size_t width {layers.front().size()};
	vector<size_t> sources;
	sources.reserve(layers.size());
	for(const auto& layer : layers) {
		if(layer.size() != width) {
			return std::nullopt;
		}
		sources.push_back(layer.first());
	}
	auto result = allocate(width);
	if(type == OperationType::POINTWISE_SUM) {
		operations.push(Operation::pointwiseSum(result.first(), sources, width));
	} else {
		operations.push(Operation::pointwiseProduct(result.first(), sources, width));
	}
	return result;
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::pointwiseSumLayer(const std::vector<Layer>& layers) {
	return combinedLayer(layers, OperationType::POINTWISE_SUM);
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::pointwiseProductLayer(const std::vector<Layer>& layers) {
	return combinedLayer(layers, OperationType::POINTWISE_PRODUCT);
}

template<bool Stochastic>
std::optional<Layer> BasicNetworkBuilder<Stochastic>::pointwiseUnaryLayer(const Layer& layer,
		const Activation& activation) {
	checkOwner(layer);
	auto result = allocate(layer.size());
	operations.push(Operation::pointwiseUnary(result.first(), layer.first(), layer.size(), activation));
	return result;
}

template<bool Stochastic>
void BasicNetworkBuilder<Stochastic>::addOutputs(const Layer& layer) {
	checkOwner(layer);
	outputNodes += AppendSequence<size_t>::range(layer.first(), layer.size());
}

template<bool Stochastic>
size_t BasicNetworkBuilder<Stochastic>::getNodeCount() const {
	return nodeCount;
}

template<bool Stochastic>
size_t BasicNetworkBuilder<Stochastic>::getWeightCount() const {
	return weightCount;
}

template<bool Stochastic>
NetworkStructure BasicNetworkBuilder<Stochastic>::finalize() const {
	NetworkStructure::Contents contents;
	contents.nodeCount = nodeCount;
	contents.weightCount = weightCount;
	contents.stochastic = Stochastic;
	contents.inputNodes = inputNodes.flatten();
	contents.outputNodes = outputNodes.flatten();
	contents.operations = operations.flatten();
	return NetworkStructure(std::move(contents));
}
}
