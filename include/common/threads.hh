/* common/threads.hh */

#pragma once

/**
 * Configures TBB to have the given max threads (specify 0 for unlimited).
 */
void configureTBB(int maxthreads);
