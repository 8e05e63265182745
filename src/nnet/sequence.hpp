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

#ifndef DAGNN_NNET_SEQUENCE_HPP_
#define DAGNN_NNET_SEQUENCE_HPP_

#include "common.hpp"

#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

namespace dagnn::nnet {
/**
 * An ordered container that is built by concatenation and then flattened
 * once. NetworkBuilder keeps its input, output and operation lists in
 * these.
 *
 * Order is the only thing that matters: flattening always yields the
 * elements in the order in which they were appended, and size() is
 * always the sum of the sizes of the appended parts.
 *
 * This is a plain growable array; appending k elements costs amortized
 * O(k) regardless of how long the sequence already is.
 */
template<class T>
class AppendSequence {
public:
	using value_type = T;
	using const_iterator = typename std::vector<T>::const_iterator;

	AppendSequence() = default;
	AppendSequence(std::initializer_list<T> elements) : items(elements) {
	}

	/// A sequence with a single element
	static AppendSequence singleton(T element) {
		AppendSequence result;
		result.items.push_back(std::move(element));
		return result;
	}

	/// A sequence of `count` copies of `element`
	static AppendSequence run(size_t count, const T& element) {
		AppendSequence result;
		result.items.assign(count, element);
		return result;
	}

	/// Consecutive values first, first + 1, ..., first + count - 1
	template<class U = T, class = std::enable_if_t<std::is_integral_v<U>>>
	static AppendSequence range(T first, size_t count) {
		AppendSequence result;
		result.items.reserve(count);
		for(size_t i {0}; i < count; ++i) {
			result.items.push_back(static_cast<T>(first + i));
		}
		return result;
	}

	size_t size() const {
		return items.size();
	}

	bool empty() const {
		return items.empty();
	}

	const_iterator begin() const {
		return items.cbegin();
	}

	const_iterator end() const {
		return items.cend();
	}

	/// Append one element in place
	AppendSequence& push(T element) {
		items.push_back(std::move(element));
		return *this;
	}

	/// Append another sequence in place
	AppendSequence& append(const AppendSequence& other) {
		items.insert(items.end(), other.items.begin(), other.items.end());
		return *this;
	}

	AppendSequence& operator+=(const AppendSequence& other) {
		return append(other);
	}

	/// Return the concatenation of this sequence and `other`
	AppendSequence concat(const AppendSequence& other) const {
		AppendSequence result;
		result.items.reserve(items.size() + other.items.size());
		result.items.insert(result.items.end(), items.begin(), items.end());
		result.items.insert(result.items.end(), other.items.begin(), other.items.end());
		return result;
	}

	friend AppendSequence operator+(const AppendSequence& a, const AppendSequence& b) {
		return a.concat(b);
	}

	/**
	 * Split the sequence in two at the given offset. The first part has
	 * min(offset, size()) elements.
	 */
	std::pair<AppendSequence, AppendSequence> split(size_t offset) const {
		auto middle = items.begin() + static_cast<std::ptrdiff_t>(std::min(offset, items.size()));
		std::pair<AppendSequence, AppendSequence> result;
		result.first.items.assign(items.begin(), middle);
		result.second.items.assign(middle, items.end());
		return result;
	}

	/// Apply `f` to every element, keeping the order
	template<class F>
	auto map(F f) const -> AppendSequence<std::decay_t<decltype(f(std::declval<const T&>()))>> {
		AppendSequence<std::decay_t<decltype(f(std::declval<const T&>()))>> result;
		for(const auto& item : items) {
			result.push(f(item));
		}
		return result;
	}

	/// Left fold in order: f(...f(f(init, x0), x1)..., xn)
	template<class A, class F>
	A fold(A init, F f) const {
		for(const auto& item : items) {
			init = f(std::move(init), item);
		}
		return init;
	}

	/// Call `f(index, element)` for every element in order
	template<class F>
	void visit(F f) const {
		for(size_t i {0}; i < items.size(); ++i) {
			f(i, items[i]);
		}
	}

	/// Copy the elements into a fixed array
	std::vector<T> flatten() const {
		return items;
	}

	friend bool operator==(const AppendSequence& a, const AppendSequence& b) {
		return a.items == b.items;
	}

	friend bool operator!=(const AppendSequence& a, const AppendSequence& b) {
		return !(a == b);
	}

private:
	std::vector<T> items {};
};
}

#endif
