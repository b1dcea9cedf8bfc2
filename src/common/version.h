#pragma once

// Compile-time version constants for the a2s library and tools.

namespace a2s {

// Build information (can be overridden at compile time)
#ifndef A2S_BUILD_TYPE
#define A2S_BUILD_TYPE "Release"
#endif

constexpr const char* kFullVersionString = "a2s-decode 0.3.0 (" A2S_BUILD_TYPE ")";

}  // namespace a2s
