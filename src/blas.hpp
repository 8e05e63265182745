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

// A C++ wrapper for OpenBLAS or, potentially, other BLAS implementations.
// Only the double-precision routines are wrapped: the engine has no other use.

#ifndef DAGNN_BLAS_HPP_
#define DAGNN_BLAS_HPP_

#include <cblas.h>
#include <cstddef>
#include <cstdint>

namespace dagnn {
namespace {
/**
 * BLAS GEMV for a row-major matrix of doubles
 *
 * @param    matrix          A matrix
 * @param    rows            Number of rows in the matrix
 * @param    cols            Number of columns in the matrix
 * @param    transpose       Whether to transpose the matrix
 * @param    alpha           A scalar
 * @param    vector          A vector with M elements. If NOT transpose,
 *     M = cols, else M = rows
 * @param    beta            Another scalar
 * @param    result          A vector with N elements. If NOT transpose,
 *     N = rows, else N = cols
 *
 * WARNING: all pointer parameters are assumed to be `restrict`, and
 * neither dimension may be 0.
 *
 * When the call returns, if NOT transpose,
 *
 * * result = alpha * matrix @ vector + beta * result
 *
 * Else:
 *
 * * result = alpha * matrix transposed @ vector + beta * result
 */
inline void gemv(const double * matrix, size_t rows, size_t cols, bool transpose,
		double alpha, const double * vector, double beta, double * result) {
	cblas_dgemv(CblasRowMajor, transpose ? CblasTrans : CblasNoTrans,
			static_cast<blasint>(rows), static_cast<blasint>(cols), alpha, matrix,
			static_cast<blasint>(cols), vector, 1, beta, result, 1);
}

/**
 * BLAS AXPY for doubles
 *
 * When the call returns:
 *
 * * Y = alpha * X + Y
 */
inline void axpy(double alpha, const double * X, double * Y, size_t size) {
	cblas_daxpy(static_cast<blasint>(size), alpha, X, 1, Y, 1);
}

/**
 * BLAS GER for a row-major matrix of doubles.
 *
 * @param    alpha           A scalar
 * @param    matrix          A matrix
 * @param    rows            Number of rows in the matrix
 * @param    cols            Number of columns in the matrix
 * @param    X               A vector with `rows` elements
 * @param    Y               A vector with `cols` elements
 *
 * When the call returns:
 *
 * * matrix = alpha * X @ Y transposed + matrix
 */
inline void ger(double alpha, double * matrix, size_t rows, size_t cols,
		const double * X, const double * Y) {
	cblas_dger(CblasRowMajor, static_cast<blasint>(rows), static_cast<blasint>(cols),
			alpha, X, 1, Y, 1, matrix, static_cast<blasint>(cols));
}
}
}

#endif
