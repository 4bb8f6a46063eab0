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

#ifndef SHMESH_EXCEPTION_H
#define SHMESH_EXCEPTION_H

/**
 * @file ShMeshException.h
 * @brief Exceptions and throwing macros of the shared mesh library
 *
 * Only argument errors, broken caller contracts, failed MPI calls and
 * unknown dataset names throw. Empty cells and empty query ranges are
 * ordinary results.
 */

#include "ShMeshTypes.h"
#include "ShMeshConfig.h"
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

#include <mpi.h>

namespace shmesh {

namespace detail {

/// MPI_COMM_WORLD rank, or -1 before MPI_Init and after MPI_Finalize
inline int initialized_world_rank() noexcept {
    int initialized = 0;
    int finalized = 0;
    MPI_Initialized(&initialized);
    MPI_Finalized(&finalized);
    if (!initialized || finalized) {
        return -1;
    }
    int rank = -1;
    MPI_Comm_rank(MPI_COMM_WORLD, &rank);
    return rank;
}

} // namespace detail

/**
 * @brief Base of every exception the library throws
 *
 * what() reads
 *   "[ShMesh] <status> on rank <r>: <message> (<file>:<line> in <function>)"
 * with the rank omitted outside MPI and the location omitted when unknown.
 */
class ShMeshException : public std::exception {
public:
    explicit ShMeshException(std::string message,
                             ShMeshStatus status = ShMeshStatus::Unknown,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : message_(std::move(message)),
          status_(status),
          file_(file),
          line_(line),
          function_(function),
          mpi_rank_(detail::initialized_world_rank()) {
        build_what();
    }

    ShMeshException(const std::string& message,
                    const char* file,
                    int line,
                    const char* function = "")
        : ShMeshException(message, ShMeshStatus::Unknown, file, line, function) {}

    const char* what() const noexcept override { return what_.c_str(); }

    ShMeshStatus status() const noexcept { return status_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const std::string& function() const noexcept { return function_; }
    int mpi_rank() const noexcept { return mpi_rank_; }

    /**
     * @brief Prefix the message with what the caller was doing
     */
    void add_context(const std::string& context) {
        message_ = context + ": " + message_;
        build_what();
    }

private:
    void build_what() {
        what_ = std::string("[ShMesh] ") + status_to_string(status_);
        if (mpi_rank_ >= 0) {
            what_ += " on rank " + std::to_string(mpi_rank_);
        }
        what_ += ": " + message_;
        if (!file_.empty()) {
            what_ += " (" + file_ + ":" + std::to_string(line_);
            if (!function_.empty()) {
                what_ += " in " + function_;
            }
            what_ += ")";
        }
    }

    std::string message_;
    ShMeshStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    int mpi_rank_;
    std::string what_;
};

/**
 * @brief Exception type tagged with a fixed status
 */
template <ShMeshStatus Status>
class StatusException : public ShMeshException {
public:
    StatusException(const std::string& message,
                    const char* file = "",
                    int line = 0,
                    const char* function = "")
        : ShMeshException(message, Status, file, line, function) {}
};

/// Bad resolution, root, array shape or dataset path
using InvalidArgumentException = StatusException<ShMeshStatus::InvalidArgument>;

/// Use of a released index or array, a second release, or reading unpublished shared memory
using ContractViolationException = StatusException<ShMeshStatus::ContractViolation>;

/// Name the dataset catalog cannot resolve
using NotFoundException = StatusException<ShMeshStatus::NotFound>;

/**
 * @brief A failed MPI call; the message ends with the MPI error string
 */
class MPIException : public ShMeshException {
public:
    MPIException(const std::string& operation,
                 int error_code,
                 const char* file = "",
                 int line = 0,
                 const char* function = "")
        : ShMeshException(describe(operation, error_code), ShMeshStatus::MPIError,
                          file, line, function),
          error_code_(error_code) {}

    int error_code() const noexcept { return error_code_; }

private:
    static std::string describe(const std::string& operation, int code) {
        char text[MPI_MAX_ERROR_STRING];
        int len = 0;
        if (MPI_Error_string(code, text, &len) != MPI_SUCCESS) {
            return operation + " failed with MPI error code " + std::to_string(code);
        }
        return operation + " failed: " + std::string(text, static_cast<size_t>(len));
    }

    int error_code_;
};

#define SHMESH_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define SHMESH_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (SHMESH_UNLIKELY(condition)) { \
            SHMESH_THROW(ExceptionType, message); \
        } \
    } while(0)

#define SHMESH_THROW_IF_2(condition, message) \
    SHMESH_THROW_IF_3(condition, shmesh::ShMeshException, message)

#define SHMESH_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw: (condition, message) throws ShMeshException,
 *        (condition, ExceptionType, message) the given type
 */
#define SHMESH_THROW_IF(...) \
    SHMESH_THROW_IF_SELECT(__VA_ARGS__, SHMESH_THROW_IF_3, SHMESH_THROW_IF_2)(__VA_ARGS__)

#define SHMESH_CHECK_ARG(condition, message) \
    SHMESH_THROW_IF(!(condition), shmesh::InvalidArgumentException, message)

#define SHMESH_CHECK_MPI(rc, op) \
    do { \
        const int shmesh_mpi_rc_ = (rc); \
        if (SHMESH_UNLIKELY(shmesh_mpi_rc_ != MPI_SUCCESS)) { \
            throw shmesh::MPIException(op, shmesh_mpi_rc_, __FILE__, __LINE__, __FUNCTION__); \
        } \
    } while(0)

/**
 * @brief Turns an exception escaping main() into MPI_Abort on every rank
 *
 * Without it, a rank that throws leaves the others blocked in the next
 * collective.
 */
class MPIErrorHandler {
public:
    static void install() {
        std::set_terminate([]() {
            int code = 1;
            if (const std::exception_ptr current = std::current_exception()) {
                try {
                    std::rethrow_exception(current);
                } catch (const ShMeshException& e) {
                    std::cerr << e.what() << std::endl;
                    code = abort_code(e.status());
                } catch (const std::exception& e) {
                    std::cerr << "[ShMesh] unhandled exception: " << e.what() << std::endl;
                } catch (...) {
                    std::cerr << "[ShMesh] unhandled non-standard exception" << std::endl;
                }
            }
            MPI_Abort(MPI_COMM_WORLD, code);
            std::abort();
        });
    }

    /// Exit code passed to MPI_Abort for an exception with this status
    static int abort_code(ShMeshStatus status) noexcept {
        return status == ShMeshStatus::Success ? 1 : static_cast<int>(status);
    }
};

} // namespace shmesh

#endif // SHMESH_EXCEPTION_H
