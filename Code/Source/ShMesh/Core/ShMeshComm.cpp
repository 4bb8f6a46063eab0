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

#include "ShMeshComm.h"
#include "ShMeshException.h"
#include "Logger.h"

#include <limits>
#include <string>

namespace shmesh {

ShMeshComm::ShMeshComm(MPI_Comm comm) : comm_(comm) {
  int initialized = 0;
  MPI_Initialized(&initialized);
  SHMESH_THROW_IF(!initialized, ContractViolationException,
                  "ShMeshComm requires MPI_Init to have been called");
  SHMESH_CHECK_ARG(comm_ != MPI_COMM_NULL, "ShMeshComm: communicator is MPI_COMM_NULL");
  check(MPI_Comm_rank(comm_, &rank_), "MPI_Comm_rank");
  check(MPI_Comm_size(comm_, &size_), "MPI_Comm_size");
}

ShMeshComm ShMeshComm::split_shared() const {
  MPI_Comm node_comm = MPI_COMM_NULL;
  check(MPI_Comm_split_type(comm_, MPI_COMM_TYPE_SHARED, rank_, MPI_INFO_NULL, &node_comm),
        "MPI_Comm_split_type");

  ShMeshComm result(node_comm);
  result.owned_ = std::shared_ptr<MPI_Comm>(new MPI_Comm(node_comm), [](MPI_Comm* c) {
    int finalized = 0;
    MPI_Finalized(&finalized);
    if (!finalized && *c != MPI_COMM_NULL) {
      MPI_Comm_free(c);
    }
    delete c;
  });

  SHMESH_LOG_DEBUG("split_shared: rank " + std::to_string(rank_) + " -> node rank " +
                   std::to_string(result.rank()) + " of " + std::to_string(result.size()));
  return result;
}

void ShMeshComm::barrier() const {
  check(MPI_Barrier(comm_), "MPI_Barrier");
}

Vec3 ShMeshComm::allreduce_min(const Vec3& local) const {
  Vec3 global = local;
  check(MPI_Allreduce(local.data(), global.data(), 3, MPI_DOUBLE, MPI_MIN, comm_),
        "MPI_Allreduce(MIN)");
  return global;
}

Vec3 ShMeshComm::allreduce_max(const Vec3& local) const {
  Vec3 global = local;
  check(MPI_Allreduce(local.data(), global.data(), 3, MPI_DOUBLE, MPI_MAX, comm_),
        "MPI_Allreduce(MAX)");
  return global;
}

void ShMeshComm::reduce_sum(std::span<const offset_t> local, std::span<offset_t> global,
                            rank_t root) const {
  SHMESH_CHECK_ARG(local.size() <= static_cast<size_t>(std::numeric_limits<int>::max()),
                   "reduce_sum: array too large for a single MPI call");
  if (rank_ == root) {
    SHMESH_CHECK_ARG(global.size() == local.size(),
                     "reduce_sum: root output size " + std::to_string(global.size()) +
                     " != input size " + std::to_string(local.size()));
  }
  check(MPI_Reduce(local.data(), rank_ == root ? global.data() : nullptr,
                   static_cast<int>(local.size()), MPI_INT64_T, MPI_SUM, root, comm_),
        "MPI_Reduce(SUM)");
}

offset_t ShMeshComm::exscan_sum(offset_t local) const {
  offset_t result = 0;
  check(MPI_Exscan(&local, &result, 1, MPI_INT64_T, MPI_SUM, comm_), "MPI_Exscan");
  // MPI leaves the receive buffer of rank 0 undefined
  if (rank_ == 0) {
    result = 0;
  }
  return result;
}

std::vector<offset_t> ShMeshComm::allgather(offset_t local) const {
  std::vector<offset_t> gathered(static_cast<size_t>(size_), 0);
  check(MPI_Allgather(&local, 1, MPI_INT64_T, gathered.data(), 1, MPI_INT64_T, comm_),
        "MPI_Allgather");
  return gathered;
}

void ShMeshComm::check(int rc, const char* op) {
  SHMESH_CHECK_MPI(rc, op);
}

} // namespace shmesh
