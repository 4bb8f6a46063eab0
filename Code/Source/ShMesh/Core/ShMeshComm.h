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

#ifndef SHMESH_COMM_H
#define SHMESH_COMM_H

#include "ShMeshTypes.h"

#include <memory>
#include <span>
#include <vector>

#include <mpi.h>

namespace shmesh {

/**
 * @brief MPI datatype matching a C++ scalar type
 */
template <typename T> MPI_Datatype mpi_datatype();
template <> inline MPI_Datatype mpi_datatype<int>() { return MPI_INT; }
template <> inline MPI_Datatype mpi_datatype<int64_t>() { return MPI_INT64_T; }
template <> inline MPI_Datatype mpi_datatype<uint64_t>() { return MPI_UINT64_T; }
template <> inline MPI_Datatype mpi_datatype<double>() { return MPI_DOUBLE; }

/**
 * @brief Communicator wrapper carrying the collectives used by the index
 *
 * Wraps an `MPI_Comm` with cached rank and size. Communicators created by
 * split_shared() are owned and released with the last copy of the wrapper;
 * wrapped user communicators are never freed.
 *
 * Every member except rank(), size() and native() is collective.
 */
class ShMeshComm {
public:
  ShMeshComm() = default;

  explicit ShMeshComm(MPI_Comm comm);

  static ShMeshComm self() { return ShMeshComm(MPI_COMM_SELF); }
  static ShMeshComm world() { return ShMeshComm(MPI_COMM_WORLD); }

  /**
   * @brief Node-local communicator (ranks able to share memory with this one)
   */
  ShMeshComm split_shared() const;

  rank_t rank() const noexcept { return rank_; }
  int size() const noexcept { return size_; }
  bool is_parallel() const noexcept { return size_ > 1; }
  MPI_Comm native() const noexcept { return comm_; }

  void barrier() const;

  Vec3 allreduce_min(const Vec3& local) const;
  Vec3 allreduce_max(const Vec3& local) const;

  template <typename T>
  T allreduce(T local, MPI_Op op) const {
    T global{};
    check(MPI_Allreduce(&local, &global, 1, mpi_datatype<T>(), op, comm_), "MPI_Allreduce");
    return global;
  }

  template <typename T> T allreduce_min(T local) const { return allreduce(local, MPI_MIN); }
  template <typename T> T allreduce_max(T local) const { return allreduce(local, MPI_MAX); }
  template <typename T> T allreduce_sum(T local) const { return allreduce(local, MPI_SUM); }

  /**
   * @brief Element-wise sum of equally sized arrays into `global` on `root`
   *
   * `global` is only written (and only needs to be sized) on the root.
   */
  void reduce_sum(std::span<const offset_t> local, std::span<offset_t> global,
                  rank_t root) const;

  /**
   * @brief Exclusive prefix sum over ranks (0 on rank 0)
   */
  offset_t exscan_sum(offset_t local) const;

  std::vector<offset_t> allgather(offset_t local) const;

private:
  static void check(int rc, const char* op);

  MPI_Comm comm_ = MPI_COMM_SELF;
  rank_t rank_ = 0;
  int size_ = 1;
  std::shared_ptr<MPI_Comm> owned_;
};

} // namespace shmesh

#endif // SHMESH_COMM_H
