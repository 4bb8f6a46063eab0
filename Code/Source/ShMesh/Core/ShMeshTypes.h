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

#ifndef SHMESH_TYPES_H
#define SHMESH_TYPES_H

#include <array>
#include <cstdint>
#include <span>

namespace shmesh {

// ------------------------
// Fundamental type aliases
// ------------------------
using real_t   = double;       // particle coordinates
using gid_t    = int64_t;      // global particle index across MPI ranks
using offset_t = int64_t;      // per-cell counts and offsets
using rank_t   = int32_t;      // MPI rank

using Vec3 = std::array<real_t,3>;
using CellCoord = std::array<int,3>;

// ---------
// Constants
// ---------
constexpr gid_t INVALID_GID = -1;

// ---------
// Status codes
// ---------
enum class ShMeshStatus : std::uint8_t {
  Success           = 0,
  InvalidArgument   = 1,
  ContractViolation = 2,
  MPIError          = 3,
  NotFound          = 4,
  Unknown           = 255
};

inline const char* status_to_string(ShMeshStatus status) noexcept {
  switch (status) {
    case ShMeshStatus::Success:           return "Success";
    case ShMeshStatus::InvalidArgument:   return "Invalid argument";
    case ShMeshStatus::ContractViolation: return "Contract violation";
    case ShMeshStatus::MPIError:          return "MPI error";
    case ShMeshStatus::NotFound:          return "Not found";
    default:                              return "Unknown error";
  }
}

// --------------------
// Basic data structures
// --------------------
struct BoundingBox {
  Vec3 min { {0.0, 0.0, 0.0} };
  Vec3 max { {0.0, 0.0, 0.0} };

  Vec3 extents() const {
    return {max[0] - min[0], max[1] - min[1], max[2] - min[2]};
  }
};

/**
 * @brief Inclusive range of grid cell coordinates touched by a query
 */
struct CellRange {
  CellCoord lo { {0, 0, 0} };
  CellCoord hi { {-1, -1, -1} };

  bool empty() const noexcept {
    return hi[0] < lo[0] || hi[1] < lo[1] || hi[2] < lo[2];
  }
};

// --------------------
// Query argument conversion
// --------------------

inline const Vec3& to_vec3(const Vec3& v) noexcept { return v; }

/**
 * @brief Convert a 3-component coordinate view to a Vec3
 * @throws InvalidArgumentException if the view does not hold exactly 3 values
 */
Vec3 to_vec3(std::span<const real_t> v);

inline Vec3 add3(const Vec3& a, real_t s) {
  return {a[0] + s, a[1] + s, a[2] + s};
}

inline Vec3 sub3(const Vec3& a, real_t s) {
  return {a[0] - s, a[1] - s, a[2] - s};
}

inline real_t dist2(const Vec3& a, const Vec3& b) {
  const real_t dx = a[0] - b[0];
  const real_t dy = a[1] - b[1];
  const real_t dz = a[2] - b[2];
  return dx * dx + dy * dy + dz * dz;
}

} // namespace shmesh

#endif // SHMESH_TYPES_H
