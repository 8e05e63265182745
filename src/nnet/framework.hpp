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
 * This file contains the data model of a network: layer handles, weight
 * selectors, operations and the finalized NetworkStructure.
 *
 * To create a new neural network:
 *
 * 1. Construct a NetworkBuilder (or a StochasticNetworkBuilder if the
 *     network needs stochastic units), see nnet/builder.hpp.
 * 2. Add inputs with addInputs, weight blocks with addBaseWeights or
 *     fixedWeights, and layers with standardLayer and friends.
 * 3. Mark the outputs with addOutputs.
 * 4. Call finalize to get a NetworkStructure.
 * 5. Get a ParameterBuffer, e.g. from initialWeights (nnet/weights.hpp).
 * 6. Run the network with feedForward, train it with backPropagate and
 *     applyDelta (nnet/propagation.hpp).
 *
 * To serialize a structure, call NetworkStructure.serialize. To deserialize
 * it, call NetworkStructure::deserialize. Parameters are serialized
 * separately, see nnet/weights.hpp.
 */

#ifndef DAGNN_NNET_FRAMEWORK_HPP_
#define DAGNN_NNET_FRAMEWORK_HPP_

#include "common.hpp"
#include "nnet/activations.hpp"
#include "nnet/randomizations.hpp"

#include <cstddef>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace dagnn::nnet {
using std::shared_ptr;
using std::string;
using std::vector;

/**
 * Throw std::runtime_error if a * b * sizeof(FLOAT) is not representable as
 * size_t or a * b is not representable as a blasint.
 */
void assertSZMUL(size_t a, size_t b);

template<bool Stochastic> class BasicNetworkBuilder;
class NetworkStructure;

/// Identifies one construction session. Handles keep their session alive.
class Session {
};

/**
 * A contiguous span of nodes allocated together. Layers are handed out by
 * a builder and can only be used with that builder, except for the bias
 * layer, which is valid everywhere.
 */
class Layer {
	template<bool Stochastic> friend class BasicNetworkBuilder;
public:
	/// The bias layer: node 0, whose value is always 1
	static Layer bias();

	/// First node of the span
	size_t first() const;

	/// Last node of the span. Meaningless if the span is empty.
	size_t last() const;

	/// Number of nodes in the span
	size_t size() const;

	bool isBias() const;

private:
	shared_ptr<const Session> session;
	size_t firstNode, width;

	Layer(shared_ptr<const Session> session, size_t first_node, size_t width);
};

/// The bias layer
Layer bias();

/// Number of nodes in a layer
size_t layerSize(const Layer& layer);

enum class SelectorType {
	ALLOCATED, FIXED
};

/**
 * Maps a pair (input index, output index) to a weight.
 *
 * An ALLOCATED selector addresses a block of the parameter buffer: the
 * weight for (i, j) is at base + i + inputs * j. The same selector may be
 * used for several layers, in which case they share (tie) the weights.
 *
 * A FIXED selector always reads the same constant and is not trainable.
 */
class WeightSelector {
	template<bool Stochastic> friend class BasicNetworkBuilder;
	friend NetworkStructure;
public:
	/// A non-trainable selector that always reads `constant`
	static WeightSelector fixed(size_t input_width, size_t output_width, FLOAT constant);

	WeightSelector();

	SelectorType getType() const;
	size_t inputs() const;
	size_t outputs() const;

	/// Offset of the block in the parameter buffer (0 for FIXED)
	size_t base() const;

	/// The constant weight of a FIXED selector (0 for ALLOCATED)
	FLOAT constant() const;

	bool isTrainable() const;

	/// Number of parameter slots the selector addresses
	size_t span() const;

	/// Index in the parameter buffer of weight (i, j). ALLOCATED only.
	size_t addressOf(size_t i, size_t j) const;

	/// Read weight (i, j) from a parameter buffer
	FLOAT read(const FLOAT * weights, size_t i, size_t j) const;

	/// Add `delta` to the slot of weight (i, j). No-op for FIXED.
	void write(FLOAT * buffer, size_t i, size_t j, FLOAT delta) const;

private:
	shared_ptr<const Session> session;
	SelectorType type;
	size_t inputWidth, outputWidth, baseOffset;
	FLOAT value;

	WeightSelector(shared_ptr<const Session> session, SelectorType type,
			size_t input_width, size_t output_width, size_t base_offset, FLOAT value);
};

/// A non-trainable selector that always reads `constant`
WeightSelector fixedWeights(size_t input_width, size_t output_width, FLOAT constant);

enum class OperationType {
	WEIGHT_PATCH,
	APPLY_ACTIVATION,
	APPLY_RANDOMIZATION,
	SOFT_MAX,
	POINTWISE_SUM,
	POINTWISE_PRODUCT,
	POINTWISE_UNARY,
};

/**
 * One step of a network. `start` and `width` always describe the span the
 * operation writes to; `sources` holds the first node of every span it
 * reads from (each of them `width` nodes long, except for WEIGHT_PATCH
 * where the source is selector.inputs() nodes long).
 */
struct Operation {
	OperationType type {OperationType::WEIGHT_PATCH};
	size_t start {0};
	size_t width {0};
	vector<size_t> sources {};
	WeightSelector selector {};
	Activation activation {};
	Randomization randomization {};

	static Operation weightPatch(size_t source, size_t destination, const WeightSelector& selector);
	static Operation applyActivation(size_t start, size_t width, const Activation& activation);
	static Operation applyRandomization(size_t start, size_t width, const Randomization& randomization);
	static Operation softMax(size_t destination, size_t source, size_t width);
	static Operation pointwiseSum(size_t destination, const vector<size_t>& sources, size_t width);
	static Operation pointwiseProduct(size_t destination, const vector<size_t>& sources, size_t width);
	static Operation pointwiseUnary(size_t destination, size_t source, size_t width,
			const Activation& activation);
};

/// Name of an operation type as used in structure descriptions
const char * operationTypeName(OperationType type);

/**
 * The directed acyclic graph and activation functions making up a neural
 * network. Actual weights are stored in the corresponding ParameterBuffer.
 *
 * A structure is immutable. Copies share their contents.
 */
class NetworkStructure {
	template<bool Stochastic> friend class BasicNetworkBuilder;
#ifdef DAGNN_TESTER_NNET_FRIEND
	friend class DAGNN_TESTER_NNET_FRIEND;
#endif
public:
	/**
	 * Rebuild a structure from a description produced by serialize.
	 * Activations and randomizations are looked up by name in the built-in
	 * catalogues.
	 *
	 * @throw std::runtime_error if the description is malformed or names an
	 *     unknown activation or randomization
	 * @throw ShapeMismatch if spans or weight blocks are inconsistent
	 */
	static NetworkStructure deserialize(const nlohmann::json& json);
	/// Deserialize a JSON description of the structure, provided as a string.
	static NetworkStructure deserialize(const string& json);

	/// Total number of nodes, including the bias node
	size_t getNodeCount() const;

	/// Number of trainable weights, i.e. the length of a ParameterBuffer
	size_t getWeightCount() const;

	const vector<size_t>& getInputNodes() const;
	const vector<size_t>& getOutputNodes() const;
	const vector<Operation>& getOperations() const;

	size_t getInputSize() const;
	size_t getOutputSize() const;

	/// Whether the structure may contain stochastic operations
	bool isStochastic() const;

	/// Serialize the structure as a JSON object.
	nlohmann::json serialize() const;

	/// Serialize the structure as a JSON object, then convert it into a string.
	string serializeAsString() const;

private:
	struct Contents {
		size_t nodeCount {1};
		size_t weightCount {0};
		bool stochastic {false};
		vector<size_t> inputNodes {};
		vector<size_t> outputNodes {};
		vector<Operation> operations {};
	};

	shared_ptr<const Contents> contents;

	explicit NetworkStructure(Contents&& contents);

	/**
	 * Check that every span is in range, every operation only reads nodes
	 * that are complete by then, and every weight block fits in the
	 * parameter buffer.
	 *
	 * @throw ShapeMismatch or std::runtime_error if not
	 */
	void validate() const;
};
}

#endif
