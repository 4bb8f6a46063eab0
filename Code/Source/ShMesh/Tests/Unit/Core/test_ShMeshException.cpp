/**
 * @file test_ShMeshException.cpp
 * @brief Unit tests for the exception hierarchy and throwing macros
 */

#include <gtest/gtest.h>
#include "ShMesh/Core/ShMeshException.h"

#include <mpi.h>

#include <stdexcept>
#include <string>
#include <type_traits>

namespace shmesh {
namespace test {

namespace {

void throw_contract_violation() {
    SHMESH_THROW(ContractViolationException, "index released");
}

int world_rank() {
    int r = 0;
    MPI_Comm_rank(MPI_COMM_WORLD, &r);
    return r;
}

} // namespace

TEST(ShMeshExceptionTest, ThrowCarriesStatusAndLocation) {
    try {
        throw_contract_violation();
        FAIL() << "expected ContractViolationException";
    } catch (const ContractViolationException& e) {
        EXPECT_EQ(e.status(), ShMeshStatus::ContractViolation);
        EXPECT_EQ(e.message(), "index released");
        EXPECT_NE(e.file().find("test_ShMeshException.cpp"), std::string::npos);
        EXPECT_GT(e.line(), 0);
        EXPECT_EQ(e.function(), "throw_contract_violation");
    }
}

TEST(ShMeshExceptionTest, WhatIncludesRankAndMessage) {
    try {
        SHMESH_THROW(InvalidArgumentException, "bad resolution");
    } catch (const ShMeshException& e) {
        const std::string what = e.what();
        const std::string head = "[ShMesh] Invalid argument on rank " +
                                 std::to_string(world_rank()) + ": bad resolution (";
        EXPECT_EQ(what.rfind(head, 0), 0u);
        EXPECT_NE(what.find("test_ShMeshException.cpp:"), std::string::npos);
        EXPECT_EQ(e.mpi_rank(), world_rank());
    }
}

TEST(ShMeshExceptionTest, ThrowIfTwoArgumentFormUsesBaseType) {
    try {
        SHMESH_THROW_IF(true, "plain failure");
        FAIL() << "expected ShMeshException";
    } catch (const InvalidArgumentException&) {
        FAIL() << "two-argument form must throw the base type";
    } catch (const ShMeshException& e) {
        EXPECT_EQ(e.status(), ShMeshStatus::Unknown);
    }
    EXPECT_NO_THROW(SHMESH_THROW_IF(false, "never"));
}

TEST(ShMeshExceptionTest, ThrowIfThreeArgumentForm) {
    EXPECT_THROW(SHMESH_THROW_IF(1 + 1 == 2, NotFoundException, "missing"), NotFoundException);
    EXPECT_NO_THROW(SHMESH_THROW_IF(1 + 1 == 3, NotFoundException, "missing"));
}

TEST(ShMeshExceptionTest, CheckArg) {
    const int resolution = 0;
    EXPECT_THROW(SHMESH_CHECK_ARG(resolution > 0, "resolution must be positive"),
                 InvalidArgumentException);
    EXPECT_NO_THROW(SHMESH_CHECK_ARG(resolution == 0, "unused"));
}

TEST(ShMeshExceptionTest, CheckMpiSuccessDoesNotThrow) {
    EXPECT_NO_THROW(SHMESH_CHECK_MPI(MPI_SUCCESS, "MPI_Barrier"));
}

TEST(ShMeshExceptionTest, CheckMpiFailureReportsErrorString) {
    try {
        SHMESH_CHECK_MPI(MPI_ERR_COMM, "MPI_Allreduce");
        FAIL() << "expected MPIException";
    } catch (const MPIException& e) {
        EXPECT_EQ(e.error_code(), MPI_ERR_COMM);
        EXPECT_EQ(e.status(), ShMeshStatus::MPIError);
        EXPECT_EQ(e.message().rfind("MPI_Allreduce failed: ", 0), 0u);
    }
}

TEST(ShMeshExceptionTest, AddContextPrependsMessage) {
    try {
        try {
            SHMESH_THROW(NotFoundException, "Dataset \"X\" not found");
        } catch (ShMeshException& e) {
            e.add_context("while resolving positions");
            throw;
        }
    } catch (const NotFoundException& e) {
        EXPECT_EQ(e.message(), "while resolving positions: Dataset \"X\" not found");
        EXPECT_NE(std::string(e.what()).find("Dataset \"X\" not found"), std::string::npos);
    }
}

TEST(ShMeshExceptionTest, StatusTypesAreDistinct) {
    EXPECT_FALSE((std::is_same_v<InvalidArgumentException, NotFoundException>));
    EXPECT_TRUE((std::is_base_of_v<ShMeshException, ContractViolationException>));

    const NotFoundException e("no such dataset");
    EXPECT_EQ(e.status(), ShMeshStatus::NotFound);
    EXPECT_TRUE(e.file().empty());
    EXPECT_EQ(std::string(e.what()).find("("), std::string::npos);
}

TEST(ShMeshExceptionTest, AbortCodeFollowsStatus) {
    EXPECT_EQ(MPIErrorHandler::abort_code(ShMeshStatus::InvalidArgument), 1);
    EXPECT_EQ(MPIErrorHandler::abort_code(ShMeshStatus::MPIError), 3);
    EXPECT_EQ(MPIErrorHandler::abort_code(ShMeshStatus::Unknown), 255);
    EXPECT_NE(MPIErrorHandler::abort_code(ShMeshStatus::Success), 0);
}

TEST(ShMeshExceptionTest, CatchableAsStdException) {
    EXPECT_THROW(SHMESH_THROW(InvalidArgumentException, "x"), std::exception);
}

} // namespace test
} // namespace shmesh
