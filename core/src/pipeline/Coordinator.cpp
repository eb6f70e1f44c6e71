#include "tc/core/pipeline/Coordinator.hpp"

#include <stdexcept>
#include <string>

#include "tc/core/util/Logging.hpp"

namespace tc
{

namespace
{

void check(int rc, const char* call)
{
    if (rc == MPI_SUCCESS) {
        return;
    }
    char msg[MPI_MAX_ERROR_STRING];
    int len = 0;
    MPI_Error_string(rc, msg, &len);
    throw std::runtime_error(std::string(call) + " failed: " + std::string(msg, len));
}

}  // namespace

MpiCoordinator::MpiCoordinator(MPI_Comm comm) : comm_(comm)
{
    int initialized = 0;
    check(MPI_Initialized(&initialized), "MPI_Initialized");
    if (!initialized) {
        throw std::logic_error("MpiCoordinator requires MPI_Init to have been called");
    }
    check(MPI_Comm_rank(comm_, &rank_), "MPI_Comm_rank");
    check(MPI_Comm_size(comm_, &size_), "MPI_Comm_size");
}

void MpiCoordinator::layoutFixed()
{
    barrier("layout fixed");
}

void MpiCoordinator::metadataCommitted()
{
    barrier("metadata committed");
}

void MpiCoordinator::barrier(const char* where)
{
    Logger()->debug("About to hit the {} barrier", where);
    check(MPI_Barrier(comm_), "MPI_Barrier");
    Logger()->debug("Past the {} barrier", where);
}

}  // namespace tc
