/*
 * Fallback version header for mcp-cmd
 *
 * The build system defines MCPCMD_VERSION_STRING from the CMake project version; these
 * defaults keep the sources compiling when it is not set.
 */

#pragma once

#ifndef MCPCMD_VERSION_STRING
#define MCPCMD_VERSION_STRING "0.0.0+dev"
#endif

namespace mcpcmd {

inline constexpr const char* kVersion = MCPCMD_VERSION_STRING;
inline constexpr const char* kProgramName = "mcp-cmd";

} // namespace mcpcmd
