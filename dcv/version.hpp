#pragma once

// =============================================================================
// FILE: dcv/version.hpp
// BRIEF: Library version
// =============================================================================

#define DCV_VERSION_MAJOR 0
#define DCV_VERSION_MINOR 3
#define DCV_VERSION_PATCH 1
#define DCV_VERSION_STRING "0.3.1"
