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
#include "nnet/framework.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <new>
#include <stdexcept>
#include <utility>

namespace dagnn::nnet {
namespace {
enum class NodeState {
	FREE, ACCUMULATING, COMPLETE
};

OperationType parseOperationType(const string& name) {
	for(auto type : {OperationType::WEIGHT_PATCH, OperationType::APPLY_ACTIVATION,
			OperationType::APPLY_RANDOMIZATION, OperationType::SOFT_MAX,
			OperationType::POINTWISE_SUM, OperationType::POINTWISE_PRODUCT,
			OperationType::POINTWISE_UNARY}) {
		if(name == operationTypeName(type)) {
			return type;
		}
	}
	throw std::runtime_error(string("Invalid operation type \"") + name + string("\""));
}

// JSON has no literals for non-finite numbers, so those are written as strings
nlohmann::json serializeConstant(FLOAT value) {
	if(std::isnan(value)) {
		return "nan";
	} else if(std::isinf(value)) {
		return value > 0 ? "inf" : "-inf";
	} else {
		return value;
	}
}

FLOAT deserializeConstant(const nlohmann::json& json) {
	if(!json.is_string()) {
		return json.get<FLOAT>();
	}
	auto text = json.get<string>();
	if(text == "nan") {
		return std::numeric_limits<FLOAT>::quiet_NaN();
	} else if(text == "inf") {
		return std::numeric_limits<FLOAT>::infinity();
	} else if(text == "-inf") {
		return -std::numeric_limits<FLOAT>::infinity();
	} else {
		throw std::runtime_error(string("Invalid weight constant \"") + text + string("\""));
	}
}

nlohmann::json serializeSelector(const WeightSelector& selector) {
	nlohmann::json out {
		{"inputs", selector.inputs()},
		{"outputs", selector.outputs()},
	};
	if(selector.getType() == SelectorType::ALLOCATED) {
		out["type"] = "allocated";
		out["base"] = selector.base();
	} else {
		out["type"] = "fixed";
		out["constant"] = serializeConstant(selector.constant());
	}
	return out;
}

string describe(const Operation& op, size_t index) {
	return string("Operation ") + std::to_string(index) + string(" (") + operationTypeName(op.type)
			+ string(")");
}
}

void assertSZMUL(size_t a, size_t b) {
	if(!a || !b) {
		return;
	}
	bool toobig {false};
	if constexpr (static_cast<size_t>(std::numeric_limits<blasint>::max()) < std::numeric_limits<size_t>::max()) {
		if(static_cast<size_t>(std::numeric_limits<blasint>::max()) / a < b) {
			toobig = true;
		}
	}
	if(std::numeric_limits<size_t>::max() / sizeof(FLOAT) / a < b) {
		toobig = true;
	}
	if(toobig) {
		throw std::runtime_error(
				string("The dimensions ") + std::to_string(a) + string(" x ") + std::to_string(b)
						+ string(" are too big"));
	}
}

Layer::Layer(shared_ptr<const Session> session, size_t first_node, size_t width) :
		session(std::move(session)), firstNode(first_node), width(width) {
}

Layer Layer::bias() {
	return Layer(nullptr, 0, 1);
}

size_t Layer::first() const {
	return firstNode;
}

size_t Layer::last() const {
	return firstNode + width - 1;
}

size_t Layer::size() const {
	return width;
}

bool Layer::isBias() const {
	return !session && firstNode == 0 && width == 1;
}

Layer bias() {
	return Layer::bias();
}

size_t layerSize(const Layer& layer) {
	return layer.size();
}

WeightSelector::WeightSelector(shared_ptr<const Session> session, SelectorType type,
		size_t input_width, size_t output_width, size_t base_offset, FLOAT value) :
				session(std::move(session)), type(type), inputWidth(input_width),
				outputWidth(output_width), baseOffset(base_offset), value(value) {
}

WeightSelector::WeightSelector() : WeightSelector(nullptr, SelectorType::FIXED, 0, 0, 0, 0) {
}

WeightSelector WeightSelector::fixed(size_t input_width, size_t output_width, FLOAT constant) {
	return WeightSelector(nullptr, SelectorType::FIXED, input_width, output_width, 0, constant);
}

SelectorType WeightSelector::getType() const {
	return type;
}

size_t WeightSelector::inputs() const {
	return inputWidth;
}

size_t WeightSelector::outputs() const {
	return outputWidth;
}

size_t WeightSelector::base() const {
	return baseOffset;
}

FLOAT WeightSelector::constant() const {
	return value;
}

bool WeightSelector::isTrainable() const {
	return type == SelectorType::ALLOCATED;
}

size_t WeightSelector::span() const {
	return type == SelectorType::ALLOCATED ? inputWidth * outputWidth : 0;
}

size_t WeightSelector::addressOf(size_t i, size_t j) const {
	if(type != SelectorType::ALLOCATED) {
		throw std::logic_error("A fixed weight selector has no address");
	}
	return baseOffset + i + inputWidth * j;
}

FLOAT WeightSelector::read(const FLOAT * weights, size_t i, size_t j) const {
	if(type == SelectorType::ALLOCATED) {
		return weights[baseOffset + i + inputWidth * j];
	} else {
		return value;
	}
}

void WeightSelector::write(FLOAT * buffer, size_t i, size_t j, FLOAT delta) const {
	if(type == SelectorType::ALLOCATED) {
		buffer[baseOffset + i + inputWidth * j] += delta;
	}
}

WeightSelector fixedWeights(size_t input_width, size_t output_width, FLOAT constant) {
	return WeightSelector::fixed(input_width, output_width, constant);
}

Operation Operation::weightPatch(size_t source, size_t destination, const WeightSelector& selector) {
	Operation op;
	op.type = OperationType::WEIGHT_PATCH;
	op.start = destination;
	op.width = selector.outputs();
	op.sources = {source};
	op.selector = selector;
	return op;
}

Operation Operation::applyActivation(size_t start, size_t width, const Activation& activation) {
	Operation op;
	op.type = OperationType::APPLY_ACTIVATION;
	op.start = start;
	op.width = width;
	op.activation = activation;
	return op;
}

Operation Operation::applyRandomization(size_t start, size_t width, const Randomization& randomization) {
	Operation op;
	op.type = OperationType::APPLY_RANDOMIZATION;
	op.start = start;
	op.width = width;
	op.randomization = randomization;
	return op;
}

Operation Operation::softMax(size_t destination, size_t source, size_t width) {
	Operation op;
	op.type = OperationType::SOFT_MAX;
	op.start = destination;
	op.width = width;
	op.sources = {source};
	return op;
}

Operation Operation::pointwiseSum(size_t destination, const vector<size_t>& sources, size_t width) {
	Operation op;
	op.type = OperationType::POINTWISE_SUM;
	op.start = destination;
	op.width = width;
	op.sources = sources;
	return op;
}

Operation Operation::pointwiseProduct(size_t destination, const vector<size_t>& sources, size_t width) {
	Operation op;
	op.type = OperationType::POINTWISE_PRODUCT;
	op.start = destination;
	op.width = width;
	op.sources = sources;
	return op;
}

Operation Operation::pointwiseUnary(size_t destination, size_t source, size_t width,
		const Activation& activation) {
	Operation op;
	op.type = OperationType::POINTWISE_UNARY;
	op.start = destination;
	op.width = width;
	op.sources = {source};
	op.activation = activation;
	return op;
}

const char * operationTypeName(OperationType type) {
	switch(type) {
	case OperationType::WEIGHT_PATCH:
		return "weight_patch";
	case OperationType::APPLY_ACTIVATION:
		return "activation";
	case OperationType::APPLY_RANDOMIZATION:
		return "randomization";
	case OperationType::SOFT_MAX:
		return "softmax";
	case OperationType::POINTWISE_SUM:
		return "pointwise_sum";
	case OperationType::POINTWISE_PRODUCT:
		return "pointwise_product";
	case OperationType::POINTWISE_UNARY:
		return "pointwise_unary";
	default:
		unreachable("operationTypeName");
	}
}

NetworkStructure::NetworkStructure(Contents&& contents) :
		contents(std::make_shared<const Contents>(std::move(contents))) {
}

size_t NetworkStructure::getNodeCount() const {
	return contents->nodeCount;
}

size_t NetworkStructure::getWeightCount() const {
	return contents->weightCount;
}

const vector<size_t>& NetworkStructure::getInputNodes() const {
	return contents->inputNodes;
}

const vector<size_t>& NetworkStructure::getOutputNodes() const {
	return contents->outputNodes;
}

const vector<Operation>& NetworkStructure::getOperations() const {
	return contents->operations;
}

size_t NetworkStructure::getInputSize() const {
	return contents->inputNodes.size();
}

size_t NetworkStructure::getOutputSize() const {
	return contents->outputNodes.size();
}

bool NetworkStructure::isStochastic() const {
	return contents->stochastic;
}

nlohmann::json NetworkStructure::serialize() const {
	nlohmann::json out {
		{"node_count", contents->nodeCount},
		{"weight_count", contents->weightCount},
		{"stochastic", contents->stochastic},
		{"inputs", contents->inputNodes},
		{"outputs", contents->outputNodes},
	};
	auto operations = nlohmann::json::array();
	for(const auto& op : contents->operations) {
		nlohmann::json op_json {
			{"type", operationTypeName(op.type)},
			{"start", op.start},
			{"width", op.width},
		};
		switch(op.type) {
		case OperationType::WEIGHT_PATCH:
			op_json["source"] = op.sources.at(0);
			op_json["selector"] = serializeSelector(op.selector);
			break;
		case OperationType::APPLY_ACTIVATION:
			op_json["activation"] = op.activation.name;
			break;
		case OperationType::APPLY_RANDOMIZATION:
			op_json["randomization"] = op.randomization.name;
			break;
		case OperationType::SOFT_MAX:
			op_json["source"] = op.sources.at(0);
			break;
		case OperationType::POINTWISE_SUM:
		case OperationType::POINTWISE_PRODUCT:
			op_json["sources"] = op.sources;
			break;
		case OperationType::POINTWISE_UNARY:
			op_json["source"] = op.sources.at(0);
			op_json["activation"] = op.activation.name;
			break;
		default:
			unreachable("NetworkStructure::serialize");
		}
		operations.push_back(std::move(op_json));
	}
	out["operations"] = std::move(operations);
	return out;
}

string NetworkStructure::serializeAsString() const {
	return serialize().dump();
}

NetworkStructure NetworkStructure::deserialize(const string& json) {
	nlohmann::json json_object;
	try {
		json_object = nlohmann::json::parse(json);
	} catch(nlohmann::json::parse_error& e) {
		throw std::runtime_error(string("Malformed structure description: ") + e.what());
	}
	return deserialize(json_object);
}

NetworkStructure NetworkStructure::deserialize(const nlohmann::json& json) {
	Contents result;
	try {
		result.nodeCount = json.at("node_count").get<size_t>();
		result.weightCount = json.at("weight_count").get<size_t>();
		result.stochastic = json.at("stochastic").get<bool>();
		result.inputNodes = json.at("inputs").get<vector<size_t>>();
		result.outputNodes = json.at("outputs").get<vector<size_t>>();
		for(const auto& op_json : json.at("operations")) {
			auto type = parseOperationType(op_json.at("type").get<string>());
			auto start = op_json.at("start").get<size_t>();
			auto width = op_json.at("width").get<size_t>();
			switch(type) {
			case OperationType::WEIGHT_PATCH: {
				const auto& sel_json = op_json.at("selector");
				auto sel_type = sel_json.at("type").get<string>();
				auto inputs = sel_json.at("inputs").get<size_t>();
				auto outputs = sel_json.at("outputs").get<size_t>();
				WeightSelector selector;
				if(sel_type == "allocated") {
					selector = WeightSelector(nullptr, SelectorType::ALLOCATED, inputs, outputs,
							sel_json.at("base").get<size_t>(), 0);
				} else if(sel_type == "fixed") {
					selector = WeightSelector::fixed(inputs, outputs, deserializeConstant(sel_json.at("constant")));
				} else {
					throw std::runtime_error(string("Invalid weight selector type \"") + sel_type + string("\""));
				}
				if(width != outputs) {
					throw ShapeMismatch(string("Weight patch at ") + std::to_string(start)
							+ string(" is wider than its weights"));
				}
				result.operations.push_back(Operation::weightPatch(op_json.at("source").get<size_t>(), start, selector));
				break;
			}
			case OperationType::APPLY_ACTIVATION:
				result.operations.push_back(Operation::applyActivation(start, width,
						activations::byName(op_json.at("activation").get<string>())));
				break;
			case OperationType::APPLY_RANDOMIZATION:
				result.operations.push_back(Operation::applyRandomization(start, width,
						randomizations::byName(op_json.at("randomization").get<string>())));
				break;
			case OperationType::SOFT_MAX:
				result.operations.push_back(Operation::softMax(start, op_json.at("source").get<size_t>(), width));
				break;
			case OperationType::POINTWISE_SUM:
				result.operations.push_back(Operation::pointwiseSum(start,
						op_json.at("sources").get<vector<size_t>>(), width));
				break;
			case OperationType::POINTWISE_PRODUCT:
				result.operations.push_back(Operation::pointwiseProduct(start,
						op_json.at("sources").get<vector<size_t>>(), width));
				break;
			case OperationType::POINTWISE_UNARY:
				result.operations.push_back(Operation::pointwiseUnary(start, op_json.at("source").get<size_t>(),
						width, activations::byName(op_json.at("activation").get<string>())));
				break;
			default:
				unreachable("NetworkStructure::deserialize");
			}
		}
	} catch(nlohmann::json::exception& e) {
		throw std::runtime_error(string("Malformed structure description: ") + e.what());
	}
	NetworkStructure structure(std::move(result));
	structure.validate();
	return structure;
}

void NetworkStructure::validate() const {
	const auto& c = *contents;
	if(c.nodeCount < 1) {
		throw std::runtime_error("A structure must contain the bias node");
	}
	vector<NodeState> states;
	try {
		states.assign(c.nodeCount, NodeState::FREE);
	} catch(std::length_error& e) {
		throw std::runtime_error(string("Malformed structure description: too many nodes: ") + e.what());
	} catch(std::bad_alloc& e) {
		throw std::runtime_error(string("Malformed structure description: too many nodes: ") + e.what());
	}
	states.at(0) = NodeState::COMPLETE;
	for(auto node : c.inputNodes) {
		if(node == 0 || node >= c.nodeCount) {
			throw ShapeMismatch(string("Input node out of range: ") + std::to_string(node));
		} else if(states.at(node) != NodeState::FREE) {
			throw std::runtime_error(string("Input node declared twice: ") + std::to_string(node));
		}
		states.at(node) = NodeState::COMPLETE;
	}

	auto check_span = [&c](size_t start, size_t width, const string& what) {
		if(start > c.nodeCount || width > c.nodeCount - start) {
			throw ShapeMismatch(what + string(" refers to nodes out of range"));
		}
	};
	auto check_complete = [&states, &check_span](size_t start, size_t width, const string& what) {
		check_span(start, width, what);
		for(size_t n {start}; n < start + width; ++n) {
			if(states[n] != NodeState::COMPLETE) {
				throw std::runtime_error(what + string(" reads node ") + std::to_string(n)
						+ string(" before it is complete"));
			}
		}
	};
	auto check_writable = [&states, &check_span](size_t start, size_t width, bool accumulate, const string& what) {
		check_span(start, width, what);
		for(size_t n {start}; n < start + width; ++n) {
			if(states[n] == NodeState::COMPLETE || (!accumulate && states[n] != NodeState::FREE)) {
				throw std::runtime_error(what + string(" writes to node ") + std::to_string(n)
						+ string(", which is already in use"));
			}
		}
	};
	auto mark = [&states](size_t start, size_t width, NodeState state) {
		std::fill(states.begin() + static_cast<std::ptrdiff_t>(start),
				states.begin() + static_cast<std::ptrdiff_t>(start + width), state);
	};

	for(size_t index {0}; index < c.operations.size(); ++index) {
		const auto& op = c.operations[index];
		auto what = describe(op, index);
		switch(op.type) {
		case OperationType::WEIGHT_PATCH: {
			const auto& sel = op.selector;
			if(op.sources.size() != 1 || op.width != sel.outputs()) {
				throw ShapeMismatch(what + string(" does not match its weights"));
			}
			if(sel.getType() == SelectorType::ALLOCATED) {
				assertSZMUL(sel.inputs(), sel.outputs());
				if(sel.base() > c.weightCount || sel.span() > c.weightCount - sel.base()) {
					throw ShapeMismatch(what + string(" addresses weights out of range"));
				}
			}
			check_complete(op.sources[0], sel.inputs(), what);
			check_writable(op.start, op.width, true, what);
			mark(op.start, op.width, NodeState::ACCUMULATING);
			break;
		}
		case OperationType::APPLY_ACTIVATION:
			check_span(op.start, op.width, what);
			for(size_t n {op.start}; n < op.start + op.width; ++n) {
				if(states[n] == NodeState::FREE) {
					throw std::runtime_error(what + string(" applies to node ") + std::to_string(n)
							+ string(", which has no value"));
				}
			}
			mark(op.start, op.width, NodeState::COMPLETE);
			break;
		case OperationType::APPLY_RANDOMIZATION:
			if(!c.stochastic) {
				throw std::runtime_error(what + string(" in a structure without stochastic units"));
			}
			check_complete(op.start, op.width, what);
			break;
		case OperationType::SOFT_MAX:
		case OperationType::POINTWISE_SUM:
		case OperationType::POINTWISE_PRODUCT:
		case OperationType::POINTWISE_UNARY:
			if(op.sources.empty() || ((op.type == OperationType::SOFT_MAX
					|| op.type == OperationType::POINTWISE_UNARY) && op.sources.size() != 1)) {
				throw ShapeMismatch(what + string(" has the wrong number of sources"));
			}
			for(auto source : op.sources) {
				check_complete(source, op.width, what);
			}
			check_writable(op.start, op.width, false, what);
			mark(op.start, op.width, NodeState::COMPLETE);
			break;
		default:
			unreachable("NetworkStructure::validate");
		}
	}

	for(auto node : c.outputNodes) {
		if(node >= c.nodeCount) {
			throw ShapeMismatch(string("Output node out of range: ") + std::to_string(node));
		}
	}
}
}
