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

#include "SharedArray.h"
#include "../Core/ShMeshException.h"
#include "../Core/Logger.h"

#include <string>
#include <utility>

namespace shmesh {

namespace detail {

void throw_unsynced_read() {
  SHMESH_THROW(ContractViolationException,
               "SharedArray::full() read before the first sync(); "
               "writers must barrier and sync() before the global view is read");
}

} // namespace detail

SharedWindow::SharedWindow(const ShMeshComm& comm, size_t local_count, size_t elem_size)
    : comm_(comm),
      local_count_(local_count),
      elem_size_(elem_size) {
  SHMESH_CHECK_ARG(elem_size_ > 0, "SharedWindow: element size must be positive");

  const MPI_Aint local_bytes = static_cast<MPI_Aint>(local_count_ * elem_size_);
  void* base = nullptr;
  SHMESH_CHECK_MPI(MPI_Win_allocate_shared(local_bytes, static_cast<int>(elem_size_),
                                           MPI_INFO_NULL, comm_.native(), &base, &win_),
                   "MPI_Win_allocate_shared");
  state_ = State::Allocated;
  local_base_ = local_count_ > 0 ? base : nullptr;

  SHMESH_CHECK_MPI(MPI_Win_lock_all(MPI_MODE_NOCHECK, win_), "MPI_Win_lock_all");

  offset_ = static_cast<size_t>(comm_.exscan_sum(static_cast<offset_t>(local_count_)));
  total_count_ = static_cast<size_t>(comm_.allreduce_sum(static_cast<offset_t>(local_count_)));

  if (total_count_ > 0) {
    // MPI_PROC_NULL yields the segment of the lowest rank with a nonzero size,
    // which is the start of the contiguous allocation.
    MPI_Aint seg_bytes = 0;
    int disp_unit = 0;
    void* first = nullptr;
    SHMESH_CHECK_MPI(MPI_Win_shared_query(win_, MPI_PROC_NULL, &seg_bytes, &disp_unit, &first),
                     "MPI_Win_shared_query");
    full_base_ = first;

    if (local_count_ > 0) {
      const auto expected = static_cast<char*>(full_base_) + offset_ * elem_size_;
      SHMESH_THROW_IF(static_cast<char*>(local_base_) != expected, ShMeshException,
                      "SharedWindow: segments are not contiguous in rank order (rank " +
                      std::to_string(comm_.rank()) + ")");
    }
  }

  SHMESH_LOG_DEBUG("SharedWindow: allocated " + std::to_string(local_count_) +
                   " local / " + std::to_string(total_count_) + " total elements of " +
                   std::to_string(elem_size_) + " bytes");
}

SharedWindow::~SharedWindow() {
  if (state_ == State::Allocated) {
    // MPI_Win_free is collective and cannot be issued safely from a destructor
    SHMESH_LOG_WARNING("SharedWindow destroyed without free(); " +
                       std::to_string(total_count_ * elem_size_) +
                       " bytes of shared memory are held until MPI_Finalize");
  }
}

SharedWindow::SharedWindow(SharedWindow&& other) noexcept
    : comm_(std::move(other.comm_)),
      win_(std::exchange(other.win_, MPI_WIN_NULL)),
      local_base_(std::exchange(other.local_base_, nullptr)),
      full_base_(std::exchange(other.full_base_, nullptr)),
      local_count_(std::exchange(other.local_count_, 0)),
      total_count_(std::exchange(other.total_count_, 0)),
      offset_(std::exchange(other.offset_, 0)),
      elem_size_(std::exchange(other.elem_size_, 0)),
      synced_(std::exchange(other.synced_, false)),
      state_(std::exchange(other.state_, State::Empty)) {}

SharedWindow& SharedWindow::operator=(SharedWindow&& other) noexcept {
  if (this != &other) {
    if (state_ == State::Allocated) {
      SHMESH_LOG_WARNING("SharedWindow overwritten without free(); shared memory leaked");
    }
    comm_ = std::move(other.comm_);
    win_ = std::exchange(other.win_, MPI_WIN_NULL);
    local_base_ = std::exchange(other.local_base_, nullptr);
    full_base_ = std::exchange(other.full_base_, nullptr);
    local_count_ = std::exchange(other.local_count_, 0);
    total_count_ = std::exchange(other.total_count_, 0);
    offset_ = std::exchange(other.offset_, 0);
    elem_size_ = std::exchange(other.elem_size_, 0);
    synced_ = std::exchange(other.synced_, false);
    state_ = std::exchange(other.state_, State::Empty);
  }
  return *this;
}

void* SharedWindow::local_base() const {
  require_allocated("local view");
  return local_base_;
}

void* SharedWindow::full_base() const {
  require_allocated("full view");
  return full_base_;
}

void SharedWindow::sync() {
  require_allocated("sync()");
  SHMESH_CHECK_MPI(MPI_Win_sync(win_), "MPI_Win_sync");
  comm_.barrier();
  SHMESH_CHECK_MPI(MPI_Win_sync(win_), "MPI_Win_sync");
  synced_ = true;
}

void SharedWindow::free() {
  require_allocated("free()");
  SHMESH_CHECK_MPI(MPI_Win_unlock_all(win_), "MPI_Win_unlock_all");
  SHMESH_CHECK_MPI(MPI_Win_free(&win_), "MPI_Win_free");
  local_base_ = nullptr;
  full_base_ = nullptr;
  synced_ = false;
  state_ = State::Freed;
}

void SharedWindow::require_allocated(const char* what) const {
  if (state_ == State::Freed) {
    SHMESH_THROW(ContractViolationException,
                 std::string("SharedWindow: ") + what + " after free()");
  }
  if (state_ == State::Empty) {
    SHMESH_THROW(ContractViolationException,
                 std::string("SharedWindow: ") + what + " on an unallocated window");
  }
}

} // namespace shmesh
