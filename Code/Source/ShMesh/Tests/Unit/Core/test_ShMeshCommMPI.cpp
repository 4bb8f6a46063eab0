/**
 * @file test_ShMeshCommMPI.cpp
 * @brief MPI unit tests for the communicator wrapper and its collectives
 */

#include <gtest/gtest.h>
#include "ShMesh/Core/ShMeshComm.h"
#include "ShMesh/Core/ShMeshException.h"

#include <mpi.h>

#include <vector>

namespace shmesh {
namespace test {

TEST(ShMeshCommMPI, WorldMatchesMpi) {
    int rank = -1;
    int size = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    MPI_Comm_size(MPI_COMM_WORLD, &size);

    const ShMeshComm comm = ShMeshComm::world();
    EXPECT_EQ(comm.rank(), rank);
    EXPECT_EQ(comm.size(), size);
    EXPECT_EQ(comm.is_parallel(), size > 1);
    EXPECT_EQ(comm.native(), MPI_COMM_WORLD);
}

TEST(ShMeshCommMPI, DefaultIsSelf) {
    const ShMeshComm comm;
    EXPECT_EQ(comm.rank(), 0);
    EXPECT_EQ(comm.size(), 1);
    EXPECT_FALSE(comm.is_parallel());
    EXPECT_EQ(ShMeshComm::self().size(), 1);
}

TEST(ShMeshCommMPI, NullCommunicatorRejected) {
    EXPECT_THROW({ ShMeshComm comm(MPI_COMM_NULL); }, InvalidArgumentException);
}

TEST(ShMeshCommMPI, SplitSharedIsNodeLocal) {
    const ShMeshComm world = ShMeshComm::world();
    const ShMeshComm node = world.split_shared();
    EXPECT_GE(node.size(), 1);
    EXPECT_LE(node.size(), world.size());
    EXPECT_GE(node.rank(), 0);
    EXPECT_LT(node.rank(), node.size());

    // Copies share the owned communicator
    const ShMeshComm copy = node;
    EXPECT_EQ(copy.native(), node.native());
    copy.barrier();
}

TEST(ShMeshCommMPI, VectorReductions) {
    const ShMeshComm comm = ShMeshComm::world();
    const double r = static_cast<double>(comm.rank());
    const Vec3 local = {r, -r, 2.0};

    const Vec3 lo = comm.allreduce_min(local);
    const Vec3 hi = comm.allreduce_max(local);
    EXPECT_DOUBLE_EQ(lo[0], 0.0);
    EXPECT_DOUBLE_EQ(lo[1], -static_cast<double>(comm.size() - 1));
    EXPECT_DOUBLE_EQ(lo[2], 2.0);
    EXPECT_DOUBLE_EQ(hi[0], static_cast<double>(comm.size() - 1));
    EXPECT_DOUBLE_EQ(hi[1], 0.0);
    EXPECT_DOUBLE_EQ(hi[2], 2.0);
}

TEST(ShMeshCommMPI, ScalarReductions) {
    const ShMeshComm comm = ShMeshComm::world();
    const int64_t n = comm.size();
    const int64_t r = comm.rank();

    EXPECT_EQ(comm.allreduce_sum(r + 1), n * (n + 1) / 2);
    EXPECT_EQ(comm.allreduce_min(static_cast<int>(r) + 5), 5);
    EXPECT_EQ(comm.allreduce_max(static_cast<int>(r)), static_cast<int>(n - 1));
}

TEST(ShMeshCommMPI, ExscanAndAllgather) {
    const ShMeshComm comm = ShMeshComm::world();
    const int64_t r = comm.rank();

    EXPECT_EQ(comm.exscan_sum(r + 1), r * (r + 1) / 2);

    const std::vector<offset_t> gathered = comm.allgather(10 * r);
    ASSERT_EQ(gathered.size(), static_cast<size_t>(comm.size()));
    for (int p = 0; p < comm.size(); ++p) {
        EXPECT_EQ(gathered[static_cast<size_t>(p)], 10 * p);
    }
}

TEST(ShMeshCommMPI, ReduceSumToEachRoot) {
    const ShMeshComm comm = ShMeshComm::world();
    const int64_t n = comm.size();
    const std::vector<offset_t> local = {1, comm.rank(), 0, 7};

    for (rank_t root = 0; root < comm.size(); ++root) {
        std::vector<offset_t> global(comm.rank() == root ? local.size() : 0, -1);
        comm.reduce_sum(local, global, root);
        if (comm.rank() == root) {
            EXPECT_EQ(global[0], n);
            EXPECT_EQ(global[1], n * (n - 1) / 2);
            EXPECT_EQ(global[2], 0);
            EXPECT_EQ(global[3], 7 * n);
        }
    }
}

} // namespace test
} // namespace shmesh
