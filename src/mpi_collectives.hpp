#pragma once

#include "common.hpp"

#include <mpi.h>

#include <cstdint>

namespace occsim
{
    // Allreduce sum for the f64 accumulators of an experiment sweep.
    // Intended to be used as ExperimentConfig::reduceSumF64.
    inline double mpi_allreduce_sum_f64(MPI_Comm comm, double local)
    {
        double out = 0.0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_DOUBLE, MPI_SUM, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 3);
        }
        return out;
    }

    // Allreduce sum for u64 counters (calls, failures, run counts).
    inline std::uint64_t mpi_allreduce_sum_u64(MPI_Comm comm, std::uint64_t local)
    {
        std::uint64_t out = 0;
        const int rc = MPI_Allreduce(&local, &out, 1, MPI_UINT64_T, MPI_SUM, comm);
        if (rc != MPI_SUCCESS)
        {
            MPI_Abort(comm, 4);
        }
        return out;
    }
}
