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

#ifndef SHMESH_SHARED_MESH_H
#define SHMESH_SHARED_MESH_H

#include "../Core/ShMeshConfig.h"
#include "../Core/ShMeshComm.h"
#include "../Core/ShMeshTypes.h"
#include "../Grid/GridGeometry.h"
#include "../Memory/SharedArray.h"

#include <span>
#include <vector>

namespace shmesh {

/**
 * @brief Options for SharedMesh construction
 *
 * Every rank must pass identical values.
 */
struct SharedMeshOptions {
  int resolution = config::DEFAULT_GRID_RESOLUTION;  // Grid cells per axis
  rank_t root_rank = config::DEFAULT_ROOT_RANK;       // Writer of the per-cell arrays
  bool validate_collective = true;  // Reduce and compare the options across ranks first
  bool log_timing = true;           // INFO summary on the root after the build
};

/**
 * @brief Build statistics
 */
struct SharedMeshStats {
  double build_time_ms = 0.0;
  gid_t n_particles = 0;
  int n_cells = 0;
  int n_nonempty_cells = 0;
  size_t shared_bytes = 0;          // CellCount + CellOffset + SortIndex
};

/**
 * @brief Uniform-grid bucket index over particles in shared memory
 *
 * Construction is collective over a shared-memory communicator. The root
 * rank reduces the per-cell particle counts and writes CellCount and
 * CellOffset; a distributed sort of the cell indices produces SortIndex, the
 * global particle indices grouped by cell, which every rank writes for its
 * own slice. After construction the three arrays are immutable and every
 * rank can query them independently, without further communication.
 *
 * Lifetime: free() must be called collectively. Any use after free(),
 * including a second free(), throws ContractViolationException.
 */
class SharedMesh {
public:
  SharedMesh() = default;

  /**
   * @brief Build the index (collective)
   *
   * @param comm shared-memory communicator the positions were allocated on
   * @param positions N x 3 particle coordinates; only the local rows are read
   * @param options grid and aggregation options, identical on every rank
   * @throws InvalidArgumentException on bad or rank-inconsistent options
   */
  static SharedMesh build(const ShMeshComm& comm,
                          const SharedArray<real_t>& positions,
                          const SharedMeshOptions& options);

  static SharedMesh build(const ShMeshComm& comm,
                          const SharedArray<real_t>& positions,
                          int resolution);

  SharedMesh(SharedMesh&& other) noexcept;
  SharedMesh& operator=(SharedMesh&& other) noexcept;

  SharedMesh(const SharedMesh&) = delete;
  SharedMesh& operator=(const SharedMesh&) = delete;

  // ---- Queries (local, read-only) ----

  /**
   * @brief Candidate particles for the box [box_min, box_max]
   *
   * Returns every particle of every grid cell the box overlaps, so no
   * particle inside the box is missed, but particles outside it that share a
   * cell with it are returned too. Filter the result for exact membership.
   * A box with box_min > box_max or a NaN bound on any axis is empty.
   */
  std::vector<gid_t> query_box(const Vec3& box_min, const Vec3& box_max) const;

  /**
   * @brief Particles with |x - centre|^2 <= radius^2 (exact)
   *
   * A negative or NaN radius selects nothing and returns an empty result,
   * the same as an inverted box in query_box().
   *
   * @param positions the array the index was built from, synced
   */
  std::vector<gid_t> query_radius(const Vec3& centre, real_t radius,
                                  const SharedArray<real_t>& positions) const;

  /**
   * @brief SortIndex slice holding the particles of one cell
   */
  std::span<const gid_t> cell_particles(int cell) const;

  // ---- Published arrays ----

  std::span<const offset_t> cell_count() const;
  std::span<const offset_t> cell_offset() const;
  std::span<const gid_t> sort_index() const;

  const GridGeometry& geometry() const;
  gid_t n_particles() const;
  const SharedMeshStats& stats() const;

  bool is_valid() const noexcept { return valid_; }

  /**
   * @brief Release the shared arrays (collective, once)
   */
  void free();

private:
  void require_valid(const char* what) const;

  template <typename Visitor>
  void for_each_cell(const CellRange& range, Visitor&& visit) const;

  GridGeometry geometry_;
  SharedArray<offset_t> cell_count_;
  SharedArray<offset_t> cell_offset_;
  SharedArray<gid_t> sort_index_;
  gid_t n_particles_ = 0;
  SharedMeshStats stats_;
  bool valid_ = false;
};

} // namespace shmesh

#endif // SHMESH_SHARED_MESH_H
