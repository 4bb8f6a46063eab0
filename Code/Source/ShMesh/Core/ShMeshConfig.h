/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject
 * to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included
 * in all copies or substantial portions of the Software.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS
 * IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A
 * PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER
 * OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
 * LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef SHMESH_CONFIG_H
#define SHMESH_CONFIG_H

/**
 * @file ShMeshConfig.h
 * @brief Compile-time configuration for the shared particle mesh library
 *
 * Settings can be overridden via CMake or compiler flags.
 */

#include <cstddef>

// ============================================================================
// Build Configuration Detection
// ============================================================================

#if !defined(NDEBUG) || defined(DEBUG) || defined(_DEBUG)
    #define SHMESH_DEBUG_MODE 1
#else
    #define SHMESH_DEBUG_MODE 0
#endif

// ============================================================================
// Compiler Hints
// ============================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define SHMESH_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define SHMESH_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
    #define SHMESH_LIKELY(x)   (x)
    #define SHMESH_UNLIKELY(x) (x)
#endif

namespace shmesh {
namespace config {

/**
 * @brief Grid cells per axis used when the caller does not choose one
 */
#ifndef SHMESH_DEFAULT_RESOLUTION
    constexpr int DEFAULT_GRID_RESOLUTION = 32;
#else
    constexpr int DEFAULT_GRID_RESOLUTION = SHMESH_DEFAULT_RESOLUTION;
#endif

/**
 * @brief Largest resolution whose R^3 cell count still fits an MPI count (int)
 */
constexpr int MAX_GRID_RESOLUTION = 1290;

/**
 * @brief Rank that aggregates and writes the per-cell arrays
 */
constexpr int DEFAULT_ROOT_RANK = 0;

/**
 * @brief Number of spatial components of a particle position
 */
constexpr std::size_t SPATIAL_DIM = 3;

} // namespace config
} // namespace shmesh

#endif // SHMESH_CONFIG_H
