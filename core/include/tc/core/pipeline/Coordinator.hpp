#pragma once

#include <mpi.h>

namespace tc
{

/**
 * @brief Process topology and the only two collective synchronization points.
 *
 * Every rank runs the same pipeline in lock step. The pipeline blocks in
 * exactly two places, both around the one-time metadata write:
 *
 *  1. layoutFixed(): every rank has loaded its datasets and finished the
 *     setup pass. After it returns the coordinator rank writes the
 *     pipeline metadata.
 *  2. metadataCommitted(): the coordinator has finished writing. After it
 *     returns any rank may read the metadata.
 *
 * The coordinator is the last rank.
 */
class Coordinator
{
public:
    virtual ~Coordinator() = default;

    [[nodiscard]] virtual int rank() const = 0;
    [[nodiscard]] virtual int totalRanks() const = 0;

    [[nodiscard]] int coordinatorRank() const { return totalRanks() - 1; }
    [[nodiscard]] bool isCoordinator() const { return rank() == coordinatorRank(); }

    virtual void layoutFixed() = 0;
    virtual void metadataCommitted() = 0;
};

// Single process; both synchronization points return immediately
class SerialCoordinator final : public Coordinator
{
public:
    [[nodiscard]] int rank() const override { return 0; }
    [[nodiscard]] int totalRanks() const override { return 1; }
    void layoutFixed() override {}
    void metadataCommitted() override {}
};

/**
 * @brief Coordinator over an MPI communicator.
 *
 * MPI must be initialized by the caller for the lifetime of this object.
 * Both synchronization points are MPI_Barrier on the communicator.
 */
class MpiCoordinator final : public Coordinator
{
public:
    explicit MpiCoordinator(MPI_Comm comm = MPI_COMM_WORLD);

    [[nodiscard]] int rank() const override { return rank_; }
    [[nodiscard]] int totalRanks() const override { return size_; }
    void layoutFixed() override;
    void metadataCommitted() override;

    [[nodiscard]] MPI_Comm comm() const { return comm_; }

private:
    void barrier(const char* where);

    MPI_Comm comm_;
    int rank_ = 0;
    int size_ = 1;
};

}  // namespace tc
