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

/**
 * @file shmesh_query.cpp
 * @brief Build a shared grid index over random particles and check radius queries
 *
 * Usage: mpiexec -n P shmesh_query <particles_per_rank> <resolution> <n_queries> <radius> [seed]
 */

#include "../Core/Logger.h"
#include "../Core/ShMeshComm.h"
#include "../Core/ShMeshException.h"
#include "../Memory/SharedArray.h"
#include "../Search/SharedMesh.h"

#include <algorithm>
#include <cstdlib>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <mpi.h>

namespace {

struct QueryArgs {
  long particles_per_rank = 0;
  int resolution = 0;
  int n_queries = 0;
  double radius = 0.0;
  unsigned seed = 12345;
};

void print_usage(const char* prog) {
  SHMESH_LOG_ERROR(std::string("Usage: ") + prog +
                   " <particles_per_rank> <resolution> <n_queries> <radius> [seed]");
}

bool parse_args(int argc, char** argv, QueryArgs& args) {
  if (argc < 5 || argc > 6) {
    return false;
  }
  try {
    args.particles_per_rank = std::stol(argv[1]);
    args.resolution = std::stoi(argv[2]);
    args.n_queries = std::stoi(argv[3]);
    args.radius = std::stod(argv[4]);
    if (argc == 6) {
      args.seed = static_cast<unsigned>(std::stoul(argv[5]));
    }
  } catch (const std::exception& e) {
    SHMESH_LOG_ERROR(std::string("Bad argument: ") + e.what());
    return false;
  }
  return args.particles_per_rank >= 0 && args.n_queries >= 0 && args.radius >= 0.0;
}

/**
 * @brief Particles within radius of centre by a full scan of the positions
 */
std::vector<shmesh::gid_t> brute_force_radius(std::span<const shmesh::real_t> pos,
                                              const shmesh::Vec3& centre,
                                              shmesh::real_t radius) {
  std::vector<shmesh::gid_t> idx;
  const size_t n = pos.size() / 3;
  for (size_t p = 0; p < n; ++p) {
    const shmesh::Vec3 x = {pos[3 * p], pos[3 * p + 1], pos[3 * p + 2]};
    if (shmesh::dist2(x, centre) <= radius * radius) {
      idx.push_back(static_cast<shmesh::gid_t>(p));
    }
  }
  return idx;
}

int run(const QueryArgs& args) {
  using namespace shmesh;

  const ShMeshComm node = ShMeshComm::world().split_shared();

  // Random particles in the unit cube, one stream per rank
  SharedArray<real_t> positions(node, static_cast<size_t>(args.particles_per_rank), 3);
  std::mt19937_64 gen(args.seed + static_cast<unsigned>(node.rank()));
  std::uniform_real_distribution<real_t> unit(0.0, 1.0);
  for (auto& x : positions.local()) {
    x = unit(gen);
  }
  node.barrier();
  positions.sync();

  SharedMeshOptions options;
  options.resolution = args.resolution;
  SharedMesh mesh = SharedMesh::build(node, positions, options);

  // Queries are independent per rank
  Timer query_timer;
  long mismatches = 0;
  size_t found = 0;
  for (int q = 0; q < args.n_queries; ++q) {
    const Vec3 centre = {unit(gen), unit(gen), unit(gen)};
    std::vector<shmesh::gid_t> result = mesh.query_radius(centre, args.radius, positions);
    std::vector<shmesh::gid_t> expected = brute_force_radius(positions.full(), centre, args.radius);
    std::sort(result.begin(), result.end());
    if (result != expected) {
      ++mismatches;
      SHMESH_LOG_ERROR("Query " + std::to_string(q) + " returned " +
                       std::to_string(result.size()) + " particles, expected " +
                       std::to_string(expected.size()));
    }
    found += result.size();
  }
  const double query_seconds = query_timer.elapsed();

  log_mpi_stats(node, "query time [s]", query_seconds);
  log_mpi_stats(node, "particles found", static_cast<double>(found));

  const long total_mismatches = node.allreduce_sum(static_cast<int64_t>(mismatches));
  if (node.rank() == 0) {
    std::ostringstream msg;
    msg << args.n_queries << " radius queries per rank on " << node.size() << " ranks, "
        << total_mismatches << " mismatches";
    Logger::instance().log_timed(total_mismatches == 0 ? LogLevel::INFO : LogLevel::ERROR,
                                 msg.str(), query_seconds);
  }

  mesh.free();
  positions.free();
  return total_mismatches == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}

} // anonymous namespace

int main(int argc, char** argv) {
  MPI_Init(&argc, &argv);
  shmesh::MPIErrorHandler::install();

  QueryArgs args;
  int status = EXIT_FAILURE;
  if (!parse_args(argc, argv, args)) {
    print_usage(argv[0]);
  } else {
    status = run(args);
  }

  shmesh::Logger::instance().flush();
  MPI_Finalize();
  return status;
}
