/*Common.cpp*/

#include "Common.hpp"

// Atomic flag used for stopping acquisition
std::atomic<bool> stop_acquisition(false);
