// SPDX-FileCopyrightText: 2026 Intel Corporation
// SPDX-License-Identifier: Apache-2.0

#pragma once

// -----------------------------------------------------------------------------
// Tool version metadata (compile-time constants)
//
// All values are injected by CMake via compile definitions:
//   - TELEGEN_SERVICE_NAME
//   - TELEGEN_SERVICE_VERSION
//   - TELEGEN_GIT_COMMIT
//
// Fallback defaults are provided for IDE/local development without CMake.
// -----------------------------------------------------------------------------

#ifndef TELEGEN_SERVICE_NAME
    #define TELEGEN_SERVICE_NAME "telegen"
#endif

#ifndef TELEGEN_SERVICE_VERSION
    #define TELEGEN_SERVICE_VERSION "dev"
#endif

#ifndef TELEGEN_GIT_COMMIT
    #define TELEGEN_GIT_COMMIT "unknown"
#endif

namespace telegen {

constexpr const char* SERVICE_NAME = TELEGEN_SERVICE_NAME;
constexpr const char* SERVICE_VERSION = TELEGEN_SERVICE_VERSION;
constexpr const char* GIT_COMMIT = TELEGEN_GIT_COMMIT;

} // namespace telegen
