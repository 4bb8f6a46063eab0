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

#include "ParallelSort.h"
#include "../Core/ShMeshException.h"

#include <algorithm>
#include <limits>
#include <string>

namespace shmesh {
namespace sort {

namespace detail {

int checked_count(size_t n, const char* what) {
  SHMESH_CHECK_ARG(n <= static_cast<size_t>(std::numeric_limits<int>::max()),
                   std::string("parallel_sort: too many ") + what + " to communicate");
  return static_cast<int>(n);
}

// The last displacement plus the last count must also fit in an int
std::vector<int> exclusive_displs(const std::vector<int>& counts) {
  std::vector<int> displs(counts.size(), 0);
  size_t total = 0;
  for (size_t r = 0; r < counts.size(); ++r) {
    displs[r] = checked_count(total, "values");
    total += static_cast<size_t>(counts[r]);
  }
  checked_count(total, "values");
  return displs;
}

} // namespace detail

namespace {

using detail::checked_count;
using detail::exclusive_displs;

struct SortItem {
  int64_t key;
  gid_t gid;

  bool operator<(const SortItem& other) const noexcept {
    return key < other.key || (key == other.key && gid < other.gid);
  }
};

/**
 * @brief Send items[i] ranges to ranks according to per-rank item counts
 *
 * Items are packed as (key, gid) int64 pairs. Received items are returned
 * in source rank order.
 */
std::vector<SortItem> exchange_items(const ShMeshComm& comm,
                                     const std::vector<SortItem>& items,
                                     const std::vector<int>& send_items) {
  const int n_ranks = comm.size();

  std::vector<int> send_counts(static_cast<size_t>(n_ranks), 0);
  for (int r = 0; r < n_ranks; ++r) {
    send_counts[static_cast<size_t>(r)] =
        checked_count(2 * static_cast<size_t>(send_items[static_cast<size_t>(r)]), "values");
  }

  std::vector<int> recv_counts(static_cast<size_t>(n_ranks), 0);
  SHMESH_CHECK_MPI(MPI_Alltoall(send_counts.data(), 1, MPI_INT,
                                recv_counts.data(), 1, MPI_INT, comm.native()),
                   "MPI_Alltoall");

  const std::vector<int> send_displs = exclusive_displs(send_counts);
  const std::vector<int> recv_displs = exclusive_displs(recv_counts);
  const size_t total_recv = static_cast<size_t>(recv_displs.back()) +
                            static_cast<size_t>(recv_counts.back());

  std::vector<int64_t> send_buf;
  send_buf.reserve(2 * items.size());
  for (const auto& item : items) {
    send_buf.push_back(item.key);
    send_buf.push_back(item.gid);
  }

  std::vector<int64_t> recv_buf(total_recv);
  SHMESH_CHECK_MPI(MPI_Alltoallv(send_buf.data(), send_counts.data(), send_displs.data(), MPI_INT64_T,
                                 recv_buf.data(), recv_counts.data(), recv_displs.data(), MPI_INT64_T,
                                 comm.native()),
                   "MPI_Alltoallv");

  SHMESH_THROW_IF(total_recv % 2 != 0, "parallel_sort: receive buffer malformed");
  std::vector<SortItem> received(total_recv / 2);
  for (size_t i = 0; i < received.size(); ++i) {
    received[i] = SortItem{recv_buf[2 * i], recv_buf[2 * i + 1]};
  }
  return received;
}

/**
 * @brief Global splitters chosen from regular samples of every rank
 */
std::vector<SortItem> choose_splitters(const ShMeshComm& comm,
                                       const std::vector<SortItem>& local_sorted) {
  const int n_ranks = comm.size();
  const size_t n_local = local_sorted.size();

  std::vector<int64_t> samples;
  if (n_local > 0) {
    samples.reserve(2 * static_cast<size_t>(n_ranks - 1));
    for (int s = 1; s < n_ranks; ++s) {
      const size_t idx = (static_cast<size_t>(s) * n_local) / static_cast<size_t>(n_ranks);
      const auto& item = local_sorted[std::min(idx, n_local - 1)];
      samples.push_back(item.key);
      samples.push_back(item.gid);
    }
  }

  const int n_send = checked_count(samples.size(), "samples");
  std::vector<int> counts(static_cast<size_t>(n_ranks), 0);
  SHMESH_CHECK_MPI(MPI_Allgather(&n_send, 1, MPI_INT, counts.data(), 1, MPI_INT, comm.native()),
                   "MPI_Allgather");
  const std::vector<int> displs = exclusive_displs(counts);
  const size_t total = static_cast<size_t>(displs.back()) + static_cast<size_t>(counts.back());

  std::vector<int64_t> gathered(total);
  SHMESH_CHECK_MPI(MPI_Allgatherv(samples.data(), n_send, MPI_INT64_T,
                                  gathered.data(), counts.data(), displs.data(), MPI_INT64_T,
                                  comm.native()),
                   "MPI_Allgatherv");

  std::vector<SortItem> all_samples(total / 2);
  for (size_t i = 0; i < all_samples.size(); ++i) {
    all_samples[i] = SortItem{gathered[2 * i], gathered[2 * i + 1]};
  }
  std::sort(all_samples.begin(), all_samples.end());

  std::vector<SortItem> splitters;
  if (all_samples.empty()) {
    return splitters;
  }
  splitters.reserve(static_cast<size_t>(n_ranks - 1));
  for (int j = 1; j < n_ranks; ++j) {
    const size_t idx = (static_cast<size_t>(j) * all_samples.size()) / static_cast<size_t>(n_ranks);
    splitters.push_back(all_samples[std::min(idx, all_samples.size() - 1)]);
  }
  return splitters;
}

} // anonymous namespace

ParallelSortResult parallel_sort(const ShMeshComm& comm, std::span<const int64_t> keys) {
  const int n_ranks = comm.size();
  const size_t n_local = keys.size();

  const gid_t base = comm.exscan_sum(static_cast<offset_t>(n_local));
  const offset_t n_global = comm.allreduce_sum(static_cast<offset_t>(n_local));
  SHMESH_CHECK_ARG(n_global <= detail::MAX_SORT_ITEMS,
                   "parallel_sort: " + std::to_string(n_global) + " keys exceed the limit of " +
                   std::to_string(detail::MAX_SORT_ITEMS));

  ParallelSortResult result;
  if (n_global == 0) {
    return result;
  }

  std::vector<SortItem> items(n_local);
  for (size_t i = 0; i < n_local; ++i) {
    items[i] = SortItem{keys[i], base + static_cast<gid_t>(i)};
  }
  std::sort(items.begin(), items.end());

  if (n_ranks > 1) {
    // ---------------------------------------------------------------------
    // Phase 1: partition by global splitters and exchange buckets
    // ---------------------------------------------------------------------
    const std::vector<SortItem> splitters = choose_splitters(comm, items);

    std::vector<int> send_items(static_cast<size_t>(n_ranks), 0);
    auto first = items.begin();
    for (int r = 0; r < n_ranks; ++r) {
      auto last = items.end();
      if (r < static_cast<int>(splitters.size())) {
        last = std::lower_bound(first, items.end(), splitters[static_cast<size_t>(r)]);
      }
      send_items[static_cast<size_t>(r)] = checked_count(static_cast<size_t>(last - first), "items");
      first = last;
    }

    items = exchange_items(comm, items, send_items);
    std::sort(items.begin(), items.end());

    // ---------------------------------------------------------------------
    // Phase 2: rebalance so each rank holds as many outputs as it had inputs
    // ---------------------------------------------------------------------
    const std::vector<offset_t> wanted = comm.allgather(static_cast<offset_t>(n_local));
    const offset_t held_start = comm.exscan_sum(static_cast<offset_t>(items.size()));
    const offset_t held_end = held_start + static_cast<offset_t>(items.size());

    std::fill(send_items.begin(), send_items.end(), 0);
    offset_t target_start = 0;
    for (int r = 0; r < n_ranks; ++r) {
      const offset_t target_end = target_start + wanted[static_cast<size_t>(r)];
      const offset_t lo = std::max(held_start, target_start);
      const offset_t hi = std::min(held_end, target_end);
      if (hi > lo) {
        send_items[static_cast<size_t>(r)] = checked_count(static_cast<size_t>(hi - lo), "items");
      }
      target_start = target_end;
    }

    items = exchange_items(comm, items, send_items);
  }

  SHMESH_THROW_IF(items.size() != n_local,
                  "parallel_sort: rank " + std::to_string(comm.rank()) + " received " +
                  std::to_string(items.size()) + " sorted items, expected " +
                  std::to_string(n_local));

  result.sorted_keys.resize(n_local);
  result.source_index.resize(n_local);
  for (size_t i = 0; i < n_local; ++i) {
    result.sorted_keys[i] = items[i].key;
    result.source_index[i] = items[i].gid;
  }
  return result;
}

} // namespace sort
} // namespace shmesh
