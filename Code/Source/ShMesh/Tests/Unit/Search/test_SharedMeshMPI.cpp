/**
 * @file test_SharedMeshMPI.cpp
 * @brief MPI unit tests for SharedMesh with particles distributed over the ranks of a node
 */

#include <gtest/gtest.h>
#include "ShMesh/Search/SharedMesh.h"
#include "ShMesh/Core/ShMeshException.h"

#include <mpi.h>

#include <algorithm>
#include <random>
#include <set>
#include <vector>

namespace shmesh {
namespace test {

namespace {

ShMeshComm node_comm() {
    return ShMeshComm::world().split_shared();
}

SharedArray<real_t> make_positions(const ShMeshComm& comm, const std::vector<Vec3>& local_points) {
    SharedArray<real_t> pos(comm, local_points.size(), 3);
    auto local = pos.local();
    for (size_t i = 0; i < local_points.size(); ++i) {
        for (size_t d = 0; d < 3; ++d) {
            local[3 * i + d] = local_points[i][d];
        }
    }
    comm.barrier();
    pos.sync();
    return pos;
}

// Uneven per-rank counts; rank 1 holds nothing
std::vector<Vec3> local_random_points(const ShMeshComm& comm) {
    const size_t n = comm.rank() == 1 ? 0 : 120 + 37 * static_cast<size_t>(comm.rank());
    std::mt19937 gen(99u + static_cast<unsigned>(comm.rank()));
    std::uniform_real_distribution<real_t> u(0.0, 10.0);
    std::vector<Vec3> pts(n);
    for (auto& p : pts) {
        p = {u(gen), u(gen), 0.5 * u(gen)};
    }
    return pts;
}

Vec3 row_of(std::span<const real_t> full, gid_t g) {
    const size_t p = 3 * static_cast<size_t>(g);
    return {full[p], full[p + 1], full[p + 2]};
}

SharedMeshOptions quiet(int resolution) {
    SharedMeshOptions options;
    options.resolution = resolution;
    options.log_timing = false;
    return options;
}

} // namespace

TEST(SharedMeshMPI, BucketInvariantsAcrossRanks) {
    const ShMeshComm comm = node_comm();
    SharedArray<real_t> pos = make_positions(comm, local_random_points(comm));
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(7));

    const gid_t n = static_cast<gid_t>(pos.rows());
    EXPECT_EQ(mesh.n_particles(), n);

    const auto counts = mesh.cell_count();
    const auto offsets = mesh.cell_offset();
    ASSERT_EQ(counts.size(), 343u);

    offset_t total = 0;
    for (const offset_t c : counts) {
        total += c;
    }
    EXPECT_EQ(total, n);

    EXPECT_EQ(offsets[0], 0);
    for (size_t c = 1; c < offsets.size(); ++c) {
        EXPECT_EQ(offsets[c], offsets[c - 1] + counts[c - 1]);
    }

    const auto sort_index = mesh.sort_index();
    ASSERT_EQ(static_cast<gid_t>(sort_index.size()), n);
    std::vector<gid_t> perm(sort_index.begin(), sort_index.end());
    std::sort(perm.begin(), perm.end());
    for (gid_t i = 0; i < n; ++i) {
        ASSERT_EQ(perm[static_cast<size_t>(i)], i);
    }

    const auto full = pos.full();
    for (int c = 0; c < mesh.geometry().n_cells(); ++c) {
        for (const gid_t x : mesh.cell_particles(c)) {
            EXPECT_EQ(mesh.geometry().cell_index_of(row_of(full, x)), c);
        }
    }

    mesh.free();
    pos.free();
}

TEST(SharedMeshMPI, QueriesMatchBruteForceOnEveryRank) {
    const ShMeshComm comm = node_comm();
    SharedArray<real_t> pos = make_positions(comm, local_random_points(comm));
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(8));

    const auto full = pos.full();
    std::mt19937 gen(7u * static_cast<unsigned>(comm.rank()) + 1u);
    std::uniform_real_distribution<real_t> u(-1.0, 11.0);
    std::uniform_real_distribution<real_t> len(0.0, 3.0);

    for (int q = 0; q < 25; ++q) {
        const Vec3 centre = {u(gen), u(gen), u(gen)};
        const real_t radius = len(gen);

        std::vector<gid_t> expected;
        for (gid_t g = 0; g < static_cast<gid_t>(pos.rows()); ++g) {
            if (dist2(row_of(full, g), centre) <= radius * radius) {
                expected.push_back(g);
            }
        }

        std::vector<gid_t> found = mesh.query_radius(centre, radius, pos);
        std::sort(found.begin(), found.end());
        EXPECT_EQ(found, expected);

        const std::vector<gid_t> candidates = mesh.query_box(sub3(centre, radius), add3(centre, radius));
        const std::set<gid_t> candidate_set(candidates.begin(), candidates.end());
        for (const gid_t g : expected) {
            EXPECT_TRUE(candidate_set.count(g) > 0);
        }
    }

    mesh.free();
    pos.free();
}

TEST(SharedMeshMPI, RepeatedQueriesReturnIdenticalSets) {
    const ShMeshComm comm = node_comm();
    SharedArray<real_t> pos = make_positions(comm, local_random_points(comm));
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(6));

    auto sorted = [](std::vector<gid_t> v) {
        std::sort(v.begin(), v.end());
        return v;
    };

    std::mt19937 gen(31u + static_cast<unsigned>(comm.rank()));
    std::uniform_real_distribution<real_t> u(-1.0, 11.0);
    std::uniform_real_distribution<real_t> len(0.0, 4.0);

    struct Query {
        Vec3 centre;
        real_t radius;
        std::vector<gid_t> in_radius;
        std::vector<gid_t> in_box;
    };
    std::vector<Query> queries(20);

    for (auto& q : queries) {
        q.centre = {u(gen), u(gen), u(gen)};
        q.radius = len(gen);
        q.in_radius = sorted(mesh.query_radius(q.centre, q.radius, pos));
        q.in_box = sorted(mesh.query_box(sub3(q.centre, q.radius), add3(q.centre, q.radius)));

        EXPECT_EQ(sorted(mesh.query_radius(q.centre, q.radius, pos)), q.in_radius);
        EXPECT_EQ(sorted(mesh.query_box(sub3(q.centre, q.radius), add3(q.centre, q.radius))), q.in_box);
    }

    // Every other query has run in between
    for (auto it = queries.rbegin(); it != queries.rend(); ++it) {
        EXPECT_EQ(sorted(mesh.query_radius(it->centre, it->radius, pos)), it->in_radius);
        EXPECT_EQ(sorted(mesh.query_box(sub3(it->centre, it->radius), add3(it->centre, it->radius))),
                  it->in_box);
    }

    mesh.free();
    pos.free();
}

TEST(SharedMeshMPI, ScenarioSplitOverRanks) {
    const ShMeshComm comm = node_comm();
    const std::vector<Vec3> all = {{0.1, 0.1, 0.1}, {1.9, 1.9, 1.9}, {1.1, 0.1, 0.1}};

    // Rank 0 holds particle 0, the last rank the other two
    std::vector<Vec3> mine;
    if (comm.size() == 1) {
        mine = all;
    } else if (comm.rank() == 0) {
        mine = {all[0]};
    } else if (comm.rank() == comm.size() - 1) {
        mine = {all[1], all[2]};
    }

    SharedArray<real_t> pos = make_positions(comm, mine);
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(2));

    ASSERT_EQ(mesh.cell_particles(0).size(), 1u);
    EXPECT_EQ(mesh.cell_particles(0)[0], 0);
    ASSERT_EQ(mesh.cell_particles(1).size(), 1u);
    EXPECT_EQ(mesh.cell_particles(1)[0], 2);
    ASSERT_EQ(mesh.cell_particles(7).size(), 1u);
    EXPECT_EQ(mesh.cell_particles(7)[0], 1);

    EXPECT_EQ(mesh.query_radius({0.15, 0.15, 0.15}, 0.1, pos), (std::vector<gid_t>{0}));

    mesh.free();
    pos.free();
}

TEST(SharedMeshMPI, NonZeroRootGivesSameIndex) {
    const ShMeshComm comm = node_comm();
    if (comm.size() < 2) {
        GTEST_SKIP() << "needs at least 2 ranks";
    }

    SharedArray<real_t> pos = make_positions(comm, local_random_points(comm));
    SharedMesh by_first = SharedMesh::build(comm, pos, quiet(5));

    SharedMeshOptions options = quiet(5);
    options.root_rank = comm.size() - 1;
    SharedMesh by_last = SharedMesh::build(comm, pos, options);

    const auto a = by_first.cell_count();
    const auto b = by_last.cell_count();
    ASSERT_EQ(a.size(), b.size());
    EXPECT_TRUE(std::equal(a.begin(), a.end(), b.begin()));

    const auto sa = by_first.sort_index();
    const auto sb = by_last.sort_index();
    ASSERT_EQ(sa.size(), sb.size());
    EXPECT_TRUE(std::equal(sa.begin(), sa.end(), sb.begin()));

    by_last.free();
    by_first.free();
    pos.free();
}

TEST(SharedMeshMPI, AllParticlesOnOneRank) {
    const ShMeshComm comm = node_comm();
    std::vector<Vec3> mine;
    if (comm.rank() == 0) {
        for (int i = 0; i < 64; ++i) {
            mine.push_back({static_cast<real_t>(i % 4), static_cast<real_t>((i / 4) % 4),
                            static_cast<real_t>(i / 16)});
        }
    }
    SharedArray<real_t> pos = make_positions(comm, mine);
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(4));

    // One particle per cell on a 4x4x4 lattice; the last plane is clipped into cell 3
    EXPECT_EQ(mesh.n_particles(), 64);
    for (const offset_t c : mesh.cell_count()) {
        EXPECT_EQ(c, 1);
    }
    EXPECT_EQ(mesh.cell_particles(mesh.geometry().linear_index(3, 3, 3))[0], 63);

    mesh.free();
    pos.free();
}

TEST(SharedMeshMPI, NoParticlesAnywhere) {
    const ShMeshComm comm = node_comm();
    SharedArray<real_t> pos = make_positions(comm, {});
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(2));

    for (const offset_t c : mesh.cell_count()) {
        EXPECT_EQ(c, 0);
    }
    EXPECT_TRUE(mesh.sort_index().empty());
    EXPECT_TRUE(mesh.query_box({0.0, 0.0, 0.0}, {1.0, 1.0, 1.0}).empty());

    mesh.free();
    pos.free();
}

TEST(SharedMeshMPI, MismatchedResolutionDetected) {
    const ShMeshComm comm = node_comm();
    if (comm.size() < 2) {
        GTEST_SKIP() << "needs at least 2 ranks";
    }

    SharedArray<real_t> pos = make_positions(comm, local_random_points(comm));
    EXPECT_THROW(SharedMesh::build(comm, pos, quiet(4 + comm.rank())), InvalidArgumentException);
    pos.free();
}

TEST(SharedMeshMPI, ReleaseIsCollectiveAndOneShot) {
    const ShMeshComm comm = node_comm();
    SharedArray<real_t> pos = make_positions(comm, local_random_points(comm));
    SharedMesh mesh = SharedMesh::build(comm, pos, quiet(3));

    mesh.free();
    EXPECT_FALSE(mesh.is_valid());
    EXPECT_THROW(mesh.sort_index(), ContractViolationException);
    EXPECT_THROW(mesh.query_radius({1.0, 1.0, 1.0}, 1.0, pos), ContractViolationException);
    EXPECT_THROW(mesh.free(), ContractViolationException);

    pos.free();
}

} // namespace test
} // namespace shmesh
