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

#include "SharedMesh.h"
#include "../Core/Logger.h"
#include "../Core/ShMeshException.h"
#include "../Sort/ParallelSort.h"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

namespace shmesh {

namespace {

/**
 * @brief Fail on every rank if the ranks disagree on the build options
 */
void validate_collective_options(const ShMeshComm& comm, const SharedMeshOptions& options) {
  const int res_min = comm.allreduce_min(options.resolution);
  const int res_max = comm.allreduce_max(options.resolution);
  SHMESH_THROW_IF(res_min != res_max, InvalidArgumentException,
                  "SharedMesh: resolution differs across ranks (min " +
                  std::to_string(res_min) + ", max " + std::to_string(res_max) + ")");

  const int root_min = comm.allreduce_min(static_cast<int>(options.root_rank));
  const int root_max = comm.allreduce_max(static_cast<int>(options.root_rank));
  SHMESH_THROW_IF(root_min != root_max, InvalidArgumentException,
                  "SharedMesh: root rank differs across ranks");
}

} // anonymous namespace

// ---- Building ----

SharedMesh SharedMesh::build(const ShMeshComm& comm,
                             const SharedArray<real_t>& positions,
                             int resolution) {
  SharedMeshOptions options;
  options.resolution = resolution;
  return build(comm, positions, options);
}

SharedMesh SharedMesh::build(const ShMeshComm& comm,
                             const SharedArray<real_t>& positions,
                             const SharedMeshOptions& options) {
  Timer timer;

  SHMESH_CHECK_ARG(positions.is_valid(), "SharedMesh: position array is not allocated");
  SHMESH_CHECK_ARG(positions.n_components() == config::SPATIAL_DIM,
                   "SharedMesh: positions must have 3 components, got " +
                   std::to_string(positions.n_components()));

  int comm_cmp = MPI_UNEQUAL;
  SHMESH_CHECK_MPI(MPI_Comm_compare(positions.comm().native(), comm.native(), &comm_cmp),
                   "MPI_Comm_compare");
  SHMESH_CHECK_ARG(comm_cmp == MPI_IDENT || comm_cmp == MPI_CONGRUENT,
                   "SharedMesh: positions were allocated on a different communicator");

  if (options.validate_collective) {
    validate_collective_options(comm, options);
  }
  SHMESH_CHECK_ARG(options.root_rank >= 0 && options.root_rank < comm.size(),
                   "SharedMesh: root rank " + std::to_string(options.root_rank) +
                   " outside communicator of size " + std::to_string(comm.size()));

  const rank_t root = options.root_rank;
  const bool is_root = comm.rank() == root;
  const std::span<const real_t> pos_local = positions.local();
  const size_t n_local = positions.local_rows();

  SharedMesh mesh;
  mesh.n_particles_ = static_cast<gid_t>(positions.rows());

  // Bounding box and cell size
  mesh.geometry_ = GridGeometry::build(comm, pos_local, options.resolution);
  const int nr_cells = mesh.geometry_.n_cells();

  SHMESH_LOG_DEBUG("SharedMesh: bounds [" +
                   std::to_string(mesh.geometry_.bounds().min[0]) + ", " +
                   std::to_string(mesh.geometry_.bounds().max[0]) + "] x ... with " +
                   std::to_string(nr_cells) + " cells");

  // Cell of each local particle
  std::vector<int64_t> cell_idx(n_local);
  for (size_t p = 0; p < n_local; ++p) {
    const Vec3 x = {pos_local[3 * p], pos_local[3 * p + 1], pos_local[3 * p + 2]};
    cell_idx[p] = mesh.geometry_.cell_index_of(x);
  }

  // Count local particles per cell
  std::vector<offset_t> local_count(static_cast<size_t>(nr_cells), 0);
  for (const int64_t c : cell_idx) {
    ++local_count[static_cast<size_t>(c)];
  }

  // Global count, written by the root only
  const size_t root_cells = is_root ? static_cast<size_t>(nr_cells) : 0;
  mesh.cell_count_ = SharedArray<offset_t>(comm, root_cells);
  std::vector<offset_t> global_count(root_cells, 0);
  comm.reduce_sum(local_count, global_count, root);
  if (is_root) {
    std::copy(global_count.begin(), global_count.end(), mesh.cell_count_.full_mutable().begin());
  }
  comm.barrier();
  mesh.cell_count_.sync();
  SHMESH_LOG_DEBUG("SharedMesh: cell counts published");

  // Offset to each cell
  mesh.cell_offset_ = SharedArray<offset_t>(comm, root_cells);
  if (is_root) {
    const auto counts = mesh.cell_count_.full();
    auto offsets = mesh.cell_offset_.full_mutable();
    offsets[0] = 0;
    for (size_t c = 1; c < offsets.size(); ++c) {
      offsets[c] = offsets[c - 1] + counts[c - 1];
    }
  }
  comm.barrier();
  mesh.cell_offset_.sync();
  SHMESH_LOG_DEBUG("SharedMesh: cell offsets published");

  // Sorting index putting particles in order of cell. Each rank's slice of
  // the sorted order lines up with its rows of the position array.
  sort::ParallelSortResult sorted = sort::parallel_sort(comm, cell_idx);
  std::vector<int64_t>().swap(cell_idx);

  mesh.sort_index_ = SharedArray<gid_t>(comm, n_local);
  std::copy(sorted.source_index.begin(), sorted.source_index.end(),
            mesh.sort_index_.local().begin());
  comm.barrier();
  mesh.sort_index_.sync();
  SHMESH_LOG_DEBUG("SharedMesh: sort index published");

  mesh.valid_ = true;

  const double build_seconds = timer.elapsed();
  mesh.stats_.build_time_ms = 1000.0 * build_seconds;
  mesh.stats_.n_particles = mesh.n_particles_;
  mesh.stats_.n_cells = nr_cells;
  const auto counts = mesh.cell_count_.full();
  mesh.stats_.n_nonempty_cells = static_cast<int>(
      std::count_if(counts.begin(), counts.end(), [](offset_t c) { return c > 0; }));
  mesh.stats_.shared_bytes = mesh.cell_count_.bytes() + mesh.cell_offset_.bytes() +
                             mesh.sort_index_.bytes();

  if (options.log_timing) {
    log_mpi_stats(comm, "SharedMesh local particles", static_cast<double>(n_local));
    if (is_root) {
      std::ostringstream msg;
      msg << "SharedMesh built: " << mesh.stats_.n_particles << " particles, resolution "
          << options.resolution << ", " << mesh.stats_.n_nonempty_cells << "/" << nr_cells
          << " cells occupied, " << format_memory_size(mesh.stats_.shared_bytes) << " shared";
      Logger::instance().log_timed(LogLevel::INFO, msg.str(), build_seconds);
    }
  }

  return mesh;
}

SharedMesh::SharedMesh(SharedMesh&& other) noexcept
    : geometry_(other.geometry_),
      cell_count_(std::move(other.cell_count_)),
      cell_offset_(std::move(other.cell_offset_)),
      sort_index_(std::move(other.sort_index_)),
      n_particles_(std::exchange(other.n_particles_, 0)),
      stats_(other.stats_),
      valid_(std::exchange(other.valid_, false)) {}

SharedMesh& SharedMesh::operator=(SharedMesh&& other) noexcept {
  if (this != &other) {
    geometry_ = other.geometry_;
    cell_count_ = std::move(other.cell_count_);
    cell_offset_ = std::move(other.cell_offset_);
    sort_index_ = std::move(other.sort_index_);
    n_particles_ = std::exchange(other.n_particles_, 0);
    stats_ = other.stats_;
    valid_ = std::exchange(other.valid_, false);
  }
  return *this;
}

void SharedMesh::free() {
  require_valid("free()");
  valid_ = false;
  cell_count_.free();
  cell_offset_.free();
  sort_index_.free();
}

// ---- Queries ----

template <typename Visitor>
void SharedMesh::for_each_cell(const CellRange& range, Visitor&& visit) const {
  if (range.empty()) {
    return;
  }

  const auto counts = cell_count_.full();
  const auto offsets = cell_offset_.full();
  const auto sort_idx = sort_index_.full();

  for (int k = range.lo[2]; k <= range.hi[2]; ++k) {
    for (int j = range.lo[1]; j <= range.hi[1]; ++j) {
      for (int i = range.lo[0]; i <= range.hi[0]; ++i) {
        const auto cell = static_cast<size_t>(geometry_.linear_index(i, j, k));
        const offset_t count = counts[cell];
        if (count > 0) {
          visit(sort_idx.subspan(static_cast<size_t>(offsets[cell]),
                                 static_cast<size_t>(count)));
        }
      }
    }
  }
}

std::vector<gid_t> SharedMesh::query_box(const Vec3& box_min, const Vec3& box_max) const {
  require_valid("query_box()");

  std::vector<gid_t> idx;
  for_each_cell(geometry_.cell_range(box_min, box_max),
                [&idx](std::span<const gid_t> in_cell) {
                  idx.insert(idx.end(), in_cell.begin(), in_cell.end());
                });
  return idx;
}

std::vector<gid_t> SharedMesh::query_radius(const Vec3& centre, real_t radius,
                                            const SharedArray<real_t>& positions) const {
  require_valid("query_radius()");
  SHMESH_CHECK_ARG(positions.n_components() == config::SPATIAL_DIM &&
                   static_cast<gid_t>(positions.rows()) == n_particles_,
                   "SharedMesh::query_radius: positions do not match the indexed particles (" +
                   std::to_string(positions.rows()) + " rows, index holds " +
                   std::to_string(n_particles_) + ")");

  if (!(radius >= 0.0)) {
    return {};
  }

  const auto pos = positions.full();
  const real_t r2 = radius * radius;

  std::vector<gid_t> idx;
  for_each_cell(geometry_.cell_range(sub3(centre, radius), add3(centre, radius)),
                [&](std::span<const gid_t> in_cell) {
                  for (const gid_t g : in_cell) {
                    const size_t p = 3 * static_cast<size_t>(g);
                    const Vec3 x = {pos[p], pos[p + 1], pos[p + 2]};
                    if (dist2(x, centre) <= r2) {
                      idx.push_back(g);
                    }
                  }
                });
  return idx;
}

std::span<const gid_t> SharedMesh::cell_particles(int cell) const {
  require_valid("cell_particles()");
  SHMESH_CHECK_ARG(cell >= 0 && cell < geometry_.n_cells(),
                   "SharedMesh: cell " + std::to_string(cell) + " out of range [0, " +
                   std::to_string(geometry_.n_cells()) + ")");
  const auto c = static_cast<size_t>(cell);
  return sort_index_.full().subspan(static_cast<size_t>(cell_offset_.full()[c]),
                                    static_cast<size_t>(cell_count_.full()[c]));
}

// ---- Accessors ----

std::span<const offset_t> SharedMesh::cell_count() const {
  require_valid("cell_count()");
  return cell_count_.full();
}

std::span<const offset_t> SharedMesh::cell_offset() const {
  require_valid("cell_offset()");
  return cell_offset_.full();
}

std::span<const gid_t> SharedMesh::sort_index() const {
  require_valid("sort_index()");
  return sort_index_.full();
}

const GridGeometry& SharedMesh::geometry() const {
  require_valid("geometry()");
  return geometry_;
}

gid_t SharedMesh::n_particles() const {
  require_valid("n_particles()");
  return n_particles_;
}

const SharedMeshStats& SharedMesh::stats() const {
  require_valid("stats()");
  return stats_;
}

void SharedMesh::require_valid(const char* what) const {
  SHMESH_THROW_IF(!valid_, ContractViolationException,
                  std::string("SharedMesh: ") + what +
                  " on an index that was never built or has been freed");
}

} // namespace shmesh
