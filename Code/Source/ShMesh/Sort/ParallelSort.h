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

#ifndef SHMESH_PARALLEL_SORT_H
#define SHMESH_PARALLEL_SORT_H

#include "../Core/ShMeshComm.h"
#include "../Core/ShMeshTypes.h"

#include <cstdint>
#include <limits>
#include <span>
#include <vector>

namespace shmesh {
namespace sort {

/**
 * @brief This rank's slice of a globally sorted distributed sequence
 *
 * Rank r receives global sorted positions [start, start + n_r) where n_r is
 * the number of keys rank r passed in and start is the exclusive prefix sum
 * of the input sizes, so the output distribution mirrors the input one.
 */
struct ParallelSortResult {
  std::vector<int64_t> sorted_keys;   // key at each sorted position of the slice
  std::vector<gid_t> source_index;    // global input index of that key
};

/**
 * @brief Distributed sample sort returning the sorting permutation
 *
 * The input is the concatenation over ranks (in rank order) of each rank's
 * `keys`; the global index of `keys[i]` on rank r is
 * `exscan(sizes)_r + i`. Equal keys are ordered by global index, so the
 * result is deterministic and stable.
 *
 * Collective over comm. Ranks may pass empty spans. At most
 * detail::MAX_SORT_ITEMS keys may be sorted in total; larger inputs throw
 * InvalidArgumentException on every rank.
 */
ParallelSortResult parallel_sort(const ShMeshComm& comm, std::span<const int64_t> keys);

namespace detail {

// Items travel as (key, index) int64 pairs, so MPI counts are twice the item count
constexpr offset_t MAX_SORT_ITEMS = std::numeric_limits<int>::max() / 2;

/// n as an MPI count; throws InvalidArgumentException if it does not fit in an int
int checked_count(size_t n, const char* what);

/// Exclusive prefix sum of MPI counts; the total must also fit in an int
std::vector<int> exclusive_displs(const std::vector<int>& counts);

} // namespace detail

} // namespace sort
} // namespace shmesh

#endif // SHMESH_PARALLEL_SORT_H
