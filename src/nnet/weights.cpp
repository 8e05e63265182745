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
#include "nnet/weights.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <limits>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace dagnn::nnet {
namespace {
bool littleEndianHost() {
	const uint16_t probe {1};
	uint8_t first;
	std::memcpy(&first, &probe, 1);
	return first == 1;
}

void skipSpace(const string& text, size_t& pos) {
	while(pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
		++pos;
	}
}

/// Read one value in the classic locale. False unless the whole token is a number.
bool readValue(const string& token, FLOAT& value) {
	if(token == "inf" || token == "+inf") {
		value = std::numeric_limits<FLOAT>::infinity();
		return true;
	} else if(token == "-inf") {
		value = -std::numeric_limits<FLOAT>::infinity();
		return true;
	} else if(token == "nan" || token == "-nan") {
		value = std::numeric_limits<FLOAT>::quiet_NaN();
		return true;
	}
	std::istringstream in(token);
	in.imbue(std::locale::classic());
	in >> value;
	if(token.empty() || in.fail()) {
		return false;
	}
	in.peek();
	return in.eof();
}

/// The shortest of 15 or 17 significant digits that reads back as `value`
string formatValue(FLOAT value) {
	std::ostringstream out;
	out.imbue(std::locale::classic());
	out.precision(15);
	out << value;
	FLOAT check;
	if(!std::isfinite(value) || (readValue(out.str(), check) && check == value)) {
		return out.str();
	}
	out.str("");
	out.precision(std::numeric_limits<FLOAT>::max_digits10);
	out << value;
	return out.str();
}

[[noreturn]] void malformed(const string& text, size_t pos) {
	throw std::invalid_argument(string("Malformed weights at offset ") + std::to_string(pos)
			+ string(": \"") + text + string("\""));
}
}

ValueBuffer::ValueBuffer() : storage(std::make_shared<const vector<FLOAT>>()) {
}

ValueBuffer::ValueBuffer(vector<FLOAT> values) :
		storage(std::make_shared<const vector<FLOAT>>(std::move(values))) {
}

size_t ValueBuffer::size() const {
	return storage->size();
}

bool ValueBuffer::empty() const {
	return storage->empty();
}

FLOAT ValueBuffer::at(size_t index) const {
	return storage->at(index);
}

FLOAT ValueBuffer::padded(size_t index) const {
	return index < storage->size() ? (*storage)[index] : FCAST(0);
}

const vector<FLOAT>& ValueBuffer::values() const {
	return *storage;
}

const FLOAT * ValueBuffer::data() const {
	return storage->data();
}

bool operator==(const ValueBuffer& a, const ValueBuffer& b) {
	return a.values() == b.values();
}

bool operator!=(const ValueBuffer& a, const ValueBuffer& b) {
	return !(a == b);
}

WeightGradient combine(const vector<WeightGradient>& updates) {
	size_t length {0};
	for(const auto& u : updates) {
		length = std::max(length, u.size());
	}
	vector<FLOAT> result(length, FCAST(0));
	for(const auto& u : updates) {
		if(!u.empty()) {
			axpy(F1, u.data(), result.data(), u.size());
		}
	}
	return WeightGradient(std::move(result));
}

WeightGradient operator+(const WeightGradient& a, const WeightGradient& b) {
	return combine({a, b});
}

ParameterBuffer applyDelta(FLOAT rate, const ParameterBuffer& parameters, const WeightGradient& update) {
	vector<FLOAT> result(std::max(parameters.size(), update.size()), FCAST(0));
	std::copy(parameters.values().begin(), parameters.values().end(), result.begin());
	if(!update.empty() && rate != 0) {
		axpy(rate, update.data(), result.data(), update.size());
	}
	return ParameterBuffer(std::move(result));
}

ParameterBuffer packWeights(const vector<FLOAT>& values) {
	return ParameterBuffer(values);
}

vector<FLOAT> unpackWeights(const ParameterBuffer& buffer) {
	return buffer.values();
}

vector<uint8_t> serializeWeights(const ParameterBuffer& buffer) {
	const bool little {littleEndianHost()};
	vector<uint8_t> result;
	result.reserve(buffer.size() * 8);
	for(FLOAT v : buffer.values()) {
		uint64_t bits;
		std::memcpy(&bits, &v, 8);
		for(unsigned k {0}; k < 8; ++k) {
			unsigned shift {little ? 8 * k : 8 * (7 - k)};
			result.push_back(static_cast<uint8_t>((bits >> shift) & 0xffu));
		}
	}
	return result;
}

ParameterBuffer deserializeWeights(const uint8_t * bytes, size_t size) {
	if(size % 8) {
		throw SizeMismatch(string("Serialized weights must be a multiple of 8 bytes long, got ")
				+ std::to_string(size));
	}
	const bool little {littleEndianHost()};
	vector<FLOAT> result(size / 8);
	for(size_t n {0}; n < result.size(); ++n) {
		uint64_t bits {0};
		for(unsigned k {0}; k < 8; ++k) {
			unsigned shift {little ? 8 * k : 8 * (7 - k)};
			bits |= static_cast<uint64_t>(bytes[n * 8 + k]) << shift;
		}
		std::memcpy(&result[n], &bits, 8);
	}
	return ParameterBuffer(std::move(result));
}

ParameterBuffer deserializeWeights(const vector<uint8_t>& bytes) {
	return deserializeWeights(bytes.data(), bytes.size());
}

std::ostream& operator<<(std::ostream& out, const ValueBuffer& buffer) {
	out << '{';
	bool first {true};
	for(FLOAT v : buffer.values()) {
		if(!first) {
			out << ", ";
		}
		out << formatValue(v);
		first = false;
	}
	out << '}';
	return out;
}

string toString(const ValueBuffer& buffer) {
	std::ostringstream out;
	out << buffer;
	return out.str();
}

ParameterBuffer parseWeights(const string& text) {
	vector<FLOAT> result;
	size_t pos {0};
	skipSpace(text, pos);
	if(pos >= text.size() || text[pos] != '{') {
		malformed(text, pos);
	}
	++pos;
	skipSpace(text, pos);
	if(pos < text.size() && text[pos] == '}') {
		++pos;
	} else {
		while(true) {
			skipSpace(text, pos);
			size_t end {pos};
			while(end < text.size() && text[end] != ',' && text[end] != '}'
					&& !std::isspace(static_cast<unsigned char>(text[end]))) {
				++end;
			}
			FLOAT v;
			if(!readValue(text.substr(pos, end - pos), v)) {
				malformed(text, pos);
			}
			result.push_back(v);
			pos = end;
			skipSpace(text, pos);
			if(pos >= text.size()) {
				malformed(text, pos);
			} else if(text[pos] == ',') {
				++pos;
			} else if(text[pos] == '}') {
				++pos;
				break;
			} else {
				malformed(text, pos);
			}
		}
	}
	skipSpace(text, pos);
	if(pos != text.size()) {
		malformed(text, pos);
	}
	return ParameterBuffer(std::move(result));
}

ParameterBuffer initialWeights(size_t count, RandomState& state, std::pair<FLOAT, FLOAT> range) {
	vector<FLOAT> result(count);
	for(FLOAT& w : result) {
		w = uniform(state, range.first, range.second);
	}
	return ParameterBuffer(std::move(result));
}

ParameterBuffer initialWeights(const NetworkStructure& structure, RandomState& state,
		std::pair<FLOAT, FLOAT> range) {
	return initialWeights(structure.getWeightCount(), state, range);
}

void saveWeights(H5::Group& group, const string& name, const ParameterBuffer& buffer) {
	try {
		if(H5Lexists(group.getId(), name.c_str(), H5P_DEFAULT) > 0
				&& H5Ldelete(group.getId(), name.c_str(), H5P_DEFAULT) < 0) {
			throw std::runtime_error(string("Could not replace the dataset \"") + name + string("\""));
		}
		hsize_t dims[1] {static_cast<hsize_t>(buffer.size())};
		H5::DataSpace space(1, dims);
		auto dataset = group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, space);
		if(!buffer.empty()) {
			dataset.write(buffer.data(), H5::PredType::NATIVE_DOUBLE);
		}
	} catch(H5::Exception& e) {
		throw std::runtime_error(string("Could not save weights to \"") + name + string("\": ")
				+ e.getDetailMsg());
	}
}

ParameterBuffer loadWeights(H5::Group& group, const string& name) {
	try {
		if(H5Lexists(group.getId(), name.c_str(), H5P_DEFAULT) <= 0) {
			throw std::runtime_error(string("No weights called \"") + name + string("\""));
		}
		auto dataset = group.openDataSet(name);
		auto space = dataset.getSpace();
		if(space.getSimpleExtentNdims() != 1) {
			throw std::runtime_error(string("The weights \"") + name + string("\" are not one-dimensional"));
		}
		hsize_t dims[1];
		space.getSimpleExtentDims(dims);
		vector<FLOAT> values(static_cast<size_t>(dims[0]));
		if(!values.empty()) {
			dataset.read(values.data(), H5::PredType::NATIVE_DOUBLE);
		}
		return ParameterBuffer(std::move(values));
	} catch(H5::Exception& e) {
		throw std::runtime_error(string("Could not load weights from \"") + name + string("\": ")
				+ e.getDetailMsg());
	}
}
}
