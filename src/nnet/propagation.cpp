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

#include "blas.hpp"
#include "nnet/propagation.hpp"

#include <algorithm>
#include <stdexcept>
#include <tuple>

namespace dagnn::nnet {
namespace {
void writePairs(const Operation& op, const ActivationPairs& pairs, FLOAT * o, FLOAT * d) {
	if(pairs.size() != op.width) {
		throw SizeMismatch(string("Function returned ") + std::to_string(pairs.size())
				+ string(" values for ") + std::to_string(op.width) + string(" nodes"));
	}
	for(size_t k {0}; k < op.width; ++k) {
		o[op.start + k] = pairs[k].first;
		d[op.start + k] = pairs[k].second;
	}
}

void forwardPatch(const Operation& op, const FLOAT * w, FLOAT * o) {
	const auto& sel = op.selector;
	const size_t source {op.sources[0]};
	if(!sel.inputs() || !sel.outputs()) {
		return;
	}
	if(sel.getType() == SelectorType::ALLOCATED) {
		gemv(w + sel.base(), sel.outputs(), sel.inputs(), false, F1, o + source, F1, o + op.start);
	} else {
		FLOAT total {0};
		for(size_t i {0}; i < sel.inputs(); ++i) {
			total += o[source + i] * sel.constant();
		}
		for(size_t j {0}; j < sel.outputs(); ++j) {
			o[op.start + j] += total;
		}
	}
}

void backwardPatch(const Operation& op, const FLOAT * w, const FLOAT * o, const FLOAT * d,
		FLOAT * acc, FLOAT * grad) {
	const auto& sel = op.selector;
	const size_t source {op.sources[0]};
	if(!sel.inputs() || !sel.outputs()) {
		return;
	}
	vector<FLOAT> e(sel.outputs());
	for(size_t j {0}; j < sel.outputs(); ++j) {
		e[j] = acc[op.start + j] * d[op.start + j];
	}
	if(sel.getType() == SelectorType::ALLOCATED) {
		ger(F1, grad + sel.base(), sel.outputs(), sel.inputs(), e.data(), o + source);
		gemv(w + sel.base(), sel.outputs(), sel.inputs(), true, F1, e.data(), F1, acc + source);
	} else {
		FLOAT total {0};
		for(FLOAT ej : e) {
			total += ej;
		}
		for(size_t i {0}; i < sel.inputs(); ++i) {
			acc[source + i] += sel.constant() * total;
		}
	}
}
}

FeedForward::FeedForward(const NetworkStructure& structure, const ParameterBuffer& weights) :
		structure(structure), weights(weights),
		outputs(structure.getNodeCount(), FCAST(0)),
		derivatives(structure.getNodeCount(), FCAST(0)) {
	outputs.at(0) = F1;
	derivatives.at(0) = F1;
}

void FeedForward::run(const vector<FLOAT>& inputs, RandomState * state) {
	if(weights.size() != structure.getWeightCount()) {
		throw SizeMismatch(string("The network needs ") + std::to_string(structure.getWeightCount())
				+ string(" weights, got ") + std::to_string(weights.size()));
	}
	const auto& input_nodes = structure.getInputNodes();
	for(size_t k {0}; k < input_nodes.size() && k < inputs.size(); ++k) {
		outputs[input_nodes[k]] = inputs[k];
	}

	const FLOAT * w {weights.data()};
	FLOAT * o {outputs.data()};
	FLOAT * d {derivatives.data()};
	for(const auto& op : structure.getOperations()) {
		switch(op.type) {
		case OperationType::WEIGHT_PATCH:
			forwardPatch(op, w, o);
			break;
		case OperationType::APPLY_ACTIVATION:
			writePairs(op, op.activation.function(
					vector<FLOAT>(o + op.start, o + op.start + op.width)), o, d);
			break;
		case OperationType::APPLY_RANDOMIZATION:
			if(!state) {
				throw std::logic_error("A stochastic operation needs a random state");
			}
			for(size_t n {op.start}; n < op.start + op.width; ++n) {
				std::tie(o[n], d[n]) = op.randomization.function(*state, o[n], d[n]);
			}
			break;
		case OperationType::SOFT_MAX: {
			const size_t source {op.sources.at(0)};
			writePairs(op, activations::Softmax::apply(
					vector<FLOAT>(o + source, o + source + op.width)), o, d);
			break;
		}
		case OperationType::POINTWISE_SUM:
			for(size_t k {0}; k < op.width; ++k) {
				FLOAT total {0};
				for(auto source : op.sources) {
					total += o[source + k];
				}
				o[op.start + k] = total;
				d[op.start + k] = F1;
			}
			break;
		case OperationType::POINTWISE_PRODUCT:
			for(size_t k {0}; k < op.width; ++k) {
				// Derivative with respect to the first source
				FLOAT rest {F1};
				for(size_t s {1}; s < op.sources.size(); ++s) {
					rest *= o[op.sources[s] + k];
				}
				o[op.start + k] = o[op.sources.at(0) + k] * rest;
				d[op.start + k] = rest;
			}
			break;
		case OperationType::POINTWISE_UNARY: {
			const size_t source {op.sources.at(0)};
			writePairs(op, op.activation.function(
					vector<FLOAT>(o + source, o + source + op.width)), o, d);
			break;
		}
		default:
			unreachable("FeedForward::run");
		}
	}
}

FLOAT FeedForward::value(size_t output_index) const {
	const auto& output_nodes = structure.getOutputNodes();
	if(output_index >= output_nodes.size()) {
		return 0;
	}
	return outputs[output_nodes[output_index]];
}

vector<FLOAT> FeedForward::values() const {
	vector<FLOAT> result;
	result.reserve(structure.getOutputSize());
	for(auto node : structure.getOutputNodes()) {
		result.push_back(outputs[node]);
	}
	return result;
}

FLOAT FeedForward::nodeValue(size_t node) const {
	return outputs.at(node);
}

FLOAT FeedForward::nodeDerivative(size_t node) const {
	return derivatives.at(node);
}

const NetworkStructure& FeedForward::getStructure() const {
	return structure;
}

const ParameterBuffer& FeedForward::getWeights() const {
	return weights;
}

const vector<FLOAT>& FeedForward::getNodeOutputs() const {
	return outputs;
}

const vector<FLOAT>& FeedForward::getNodeDerivatives() const {
	return derivatives;
}

FeedForward feedForward(const NetworkStructure& structure,
		const ParameterBuffer& parameters, const vector<FLOAT>& inputs) {
	if(structure.isStochastic()) {
		throw std::logic_error("A stochastic network must be evaluated with stochasticFeedForward");
	}
	FeedForward result(structure, parameters);
	result.run(inputs, nullptr);
	return result;
}

FeedForward stochasticFeedForward(const NetworkStructure& structure,
		const ParameterBuffer& parameters, const vector<FLOAT>& inputs, RandomState& state) {
	FeedForward result(structure, parameters);
	result.run(inputs, &state);
	return result;
}

std::pair<WeightGradient, InputSensitivity> backPropagate(const FeedForward& forward,
		const vector<FLOAT>& errors) {
	const auto& structure = forward.getStructure();
	vector<FLOAT> acc(structure.getNodeCount(), FCAST(0));
	const auto& output_nodes = structure.getOutputNodes();
	for(size_t k {0}; k < output_nodes.size() && k < errors.size(); ++k) {
		acc[output_nodes[k]] = errors[k];
	}
	vector<FLOAT> grad(structure.getWeightCount(), FCAST(0));

	const FLOAT * w {forward.getWeights().data()};
	const FLOAT * o {forward.getNodeOutputs().data()};
	const FLOAT * d {forward.getNodeDerivatives().data()};
	const auto& operations = structure.getOperations();
	for(auto it = operations.rbegin(); it != operations.rend(); ++it) {
		if(it->type == OperationType::WEIGHT_PATCH) {
			backwardPatch(*it, w, o, d, acc.data(), grad.data());
		}
	}

	vector<FLOAT> sensitivity;
	sensitivity.reserve(structure.getInputSize());
	for(auto node : structure.getInputNodes()) {
		sensitivity.push_back(acc[node]);
	}
	return {WeightGradient(std::move(grad)), InputSensitivity(std::move(sensitivity))};
}

std::pair<WeightGradient, InputSensitivity> backPropagateTargets(const FeedForward& forward,
		const vector<FLOAT>& targets) {
	auto outputs = forward.values();
	vector<FLOAT> errors(std::min(outputs.size(), targets.size()));
	for(size_t k {0}; k < errors.size(); ++k) {
		errors[k] = targets[k] - outputs[k];
	}
	return backPropagate(forward, errors);
}
}
