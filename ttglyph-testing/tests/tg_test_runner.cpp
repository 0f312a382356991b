// This file is part of TTGlyph project
//
// See ttglyph.h or LICENSE.md for license and copyright information
// SPDX-License-Identifier: Zlib

#include <ttglyph/core/api-build_test_p.h>
#include <ttglyph/core/runtime.h>

int main(int argc, const char* argv[]) {
  TGRuntimeBuildInfo build_info;
  TGResult result = TGRuntime::query_build_info(&build_info);

  if (result != TG_SUCCESS) {
    INFO("Failed to query TTGlyph build information (0x%08X)\n", result);
    return 1;
  }

  INFO(
    "TTGlyph Unit Tests [use --help for command line options]\n"
    "  Version    : %u.%u.%u\n"
    "  Build Type : %s\n"
    "  Compiled By: %s\n\n",
    build_info.major_version,
    build_info.minor_version,
    build_info.patch_version,
    build_info.build_type == TG_RUNTIME_BUILD_TYPE_DEBUG ? "Debug" : "Release",
    build_info.compiler_info);

  return BrokenAPI::run(argc, argv);
}
