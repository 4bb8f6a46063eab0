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

#ifndef SHMESH_SHARED_ARRAY_H
#define SHMESH_SHARED_ARRAY_H

#include "../Core/ShMeshComm.h"
#include "../Core/ShMeshTypes.h"

#include <cstddef>
#include <span>
#include <type_traits>

#include <mpi.h>

namespace shmesh {

/**
 * @brief Untyped MPI-3 shared memory window
 *
 * Each rank of a shared-memory communicator contributes a segment of
 * `local_count` elements. Segments are allocated contiguously in rank order,
 * so the concatenation of all segments is addressable from every rank
 * through full_base().
 *
 * The window stays in a passive-target epoch (lock_all) for its whole life;
 * sync() is the publish fence between writers and readers.
 */
class SharedWindow {
public:
  SharedWindow() = default;

  /**
   * @brief Collectively allocate the window
   * @throws MPIException if the communicator cannot share memory
   */
  SharedWindow(const ShMeshComm& comm, size_t local_count, size_t elem_size);

  ~SharedWindow();

  SharedWindow(const SharedWindow&) = delete;
  SharedWindow& operator=(const SharedWindow&) = delete;
  SharedWindow(SharedWindow&& other) noexcept;
  SharedWindow& operator=(SharedWindow&& other) noexcept;

  void* local_base() const;
  void* full_base() const;

  size_t local_count() const noexcept { return local_count_; }
  size_t total_count() const noexcept { return total_count_; }

  /**
   * @brief Element offset of this rank's segment within the full window
   */
  size_t offset() const noexcept { return offset_; }

  size_t elem_size() const noexcept { return elem_size_; }

  /**
   * @brief Collective publish: memory fence, barrier, memory fence
   *
   * After sync() returns on every rank, all writes made before the call by
   * any rank are visible to every rank.
   */
  void sync();

  /**
   * @brief Collective one-shot release
   * @throws ContractViolationException if already released or never allocated
   */
  void free();

  bool is_allocated() const noexcept { return state_ == State::Allocated; }
  bool is_synced() const noexcept { return synced_; }

  const ShMeshComm& comm() const noexcept { return comm_; }

private:
  enum class State { Empty, Allocated, Freed };

  void require_allocated(const char* what) const;

  ShMeshComm comm_;
  MPI_Win win_ = MPI_WIN_NULL;
  void* local_base_ = nullptr;
  void* full_base_ = nullptr;
  size_t local_count_ = 0;
  size_t total_count_ = 0;
  size_t offset_ = 0;
  size_t elem_size_ = 0;
  bool synced_ = false;
  State state_ = State::Empty;
};

/**
 * @brief Typed row-major array in a shared memory window
 *
 * Holds `rows x n_components` values of T. Each rank owns `local_rows`
 * consecutive rows (its local write region); the full read view spans the
 * rows of all ranks in rank order, so global row `row_offset() + i` is local
 * row `i` of this rank.
 *
 * Write discipline: write through local() (or full_mutable() on a single
 * designated writer), barrier, then sync(). full() throws until the first
 * sync().
 */
template <typename T>
class SharedArray {
  static_assert(std::is_trivially_copyable_v<T>, "SharedArray requires trivially copyable T");

public:
  SharedArray() = default;

  SharedArray(const ShMeshComm& comm, size_t local_rows, size_t n_components = 1)
      : window_(comm, local_rows * n_components, sizeof(T)),
        n_components_(n_components) {}

  SharedArray(SharedArray&&) noexcept = default;
  SharedArray& operator=(SharedArray&&) noexcept = default;

  std::span<T> local() {
    return {static_cast<T*>(window_.local_base()), window_.local_count()};
  }

  std::span<const T> local() const {
    return {static_cast<const T*>(window_.local_base()), window_.local_count()};
  }

  /**
   * @brief Global read view; valid after sync()
   */
  std::span<const T> full() const;

  /**
   * @brief Global write view for a designated single writer
   */
  std::span<T> full_mutable() {
    return {static_cast<T*>(window_.full_base()), window_.total_count()};
  }

  /**
   * @brief Components of global row i (read view)
   */
  std::span<const T> row(gid_t i) const {
    return full().subspan(static_cast<size_t>(i) * n_components_, n_components_);
  }

  size_t rows() const noexcept {
    return n_components_ > 0 ? window_.total_count() / n_components_ : 0;
  }
  size_t local_rows() const noexcept {
    return n_components_ > 0 ? window_.local_count() / n_components_ : 0;
  }
  size_t n_components() const noexcept { return n_components_; }

  /**
   * @brief Global row index of this rank's first local row
   */
  gid_t row_offset() const noexcept {
    return n_components_ > 0 ? static_cast<gid_t>(window_.offset() / n_components_) : 0;
  }

  size_t bytes() const noexcept { return window_.total_count() * sizeof(T); }

  void sync() { window_.sync(); }
  void free() { window_.free(); }

  bool is_valid() const noexcept { return window_.is_allocated(); }
  bool is_synced() const noexcept { return window_.is_synced(); }

  const ShMeshComm& comm() const noexcept { return window_.comm(); }

private:
  SharedWindow window_;
  size_t n_components_ = 1;
};

namespace detail {
[[noreturn]] void throw_unsynced_read();
} // namespace detail

template <typename T>
std::span<const T> SharedArray<T>::full() const {
  const void* base = window_.full_base();
  if (!window_.is_synced()) {
    detail::throw_unsynced_read();
  }
  return {static_cast<const T*>(base), window_.total_count()};
}

} // namespace shmesh

#endif // SHMESH_SHARED_ARRAY_H
