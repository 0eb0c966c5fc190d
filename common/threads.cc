#include <common/threads.hh>

#include <memory>
#include <common/log.hh>
#include "tbb/global_control.h"

static std::unique_ptr<tbb::global_control> tbbGlobalControl;

void configureTBB(int maxthreads)
{
    if (tbbGlobalControl) {
        logging::print(logging::flag::VERBOSE, "ignoring multiple configureTBB calls\n");
        // only allow calling once per process, so we can limit threading in test_main.cc
        // and further attempts to change it will be ignored
        return;
    }

    if (maxthreads > 0) {
        tbbGlobalControl =
            std::make_unique<tbb::global_control>(tbb::global_control::max_allowed_parallelism, maxthreads);

        logging::print(logging::flag::VERBOSE, "running with {} thread(s)\n", maxthreads);
    }
}
