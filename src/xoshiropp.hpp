/*  Written in 2019 by David Blackman and Sebastiano Vigna

To the extent possible under law, the author has dedicated all copyright
and related and neighboring rights to this software to the public domain
worldwide. This software is distributed without any warranty.

See <http://creativecommons.org/publicdomain/zero/1.0/>.

Adapted from the original code by Fedor Uvarov, 2019
Original code at:
    http://prng.di.unimi.it/xoshiro256plusplus.c

The same permissions as declared above apply to the modified code. */
// SPDX-License-Identifier: CC0-1.0

/**
 * This is the xoshiro256++ 1.0 random number generator, used wherever
 * the engine needs randomness: stochastic units and weight initialization.
 * The generator has no hidden state; callers own a RandomState and pass it
 * by reference, and every draw advances it.
 */

#ifndef DAGNN_XOSHIROPP_HPP_
#define DAGNN_XOSHIROPP_HPP_

#include "common.hpp"

#include <array>
#include <cstdint>

namespace dagnn {
using RandomState = std::array<uint64_t, 4>;

namespace {
	namespace {
		inline uint64_t _xoshiropp_rotl(const uint64_t x, int k) {
			return (x << k) | (x >> (64 - k));
		}
	}

/// Return the next uint64_t and change the generator state
inline uint64_t xoshiropp(RandomState& state) {
	const uint64_t result = _xoshiropp_rotl(state[0] + state[3], 23) + state[0];

	const uint64_t t = state[1] << 17;

	state[2] ^= state[0];
	state[3] ^= state[1];
	state[1] ^= state[2];
	state[0] ^= state[3];

	state[2] ^= t;

	state[3] = _xoshiropp_rotl(state[3], 45);

	return result;
}

/// Convert a random int to a value in [0, 1)
inline FLOAT from_int(uint64_t value) {
	// 53 bits, the full mantissa of a double
	return static_cast<FLOAT>(value >> 11) * FCAST(0x1.0p-53);
}

/// Draw a value uniformly from [low, high)
inline FLOAT uniform(RandomState& state, FLOAT low, FLOAT high) {
	return low + (high - low) * from_int(xoshiropp(state));
}
}
}

#endif
