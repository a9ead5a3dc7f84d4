#pragma once

#include <string>
#include <string_view>

namespace renderplan::extract {

/*
  Replaces the frame number of a filename-like literal with a printf
  padding token of the same width:

    /out/beauty.1001.exr      -> /out/beauty.%04d.exr
    /out/sh010/beauty_v2.exr  -> /out/sh010/beauty_v%01d.exr

  Only the last digit run of the file stem is touched. Literals that
  already carry a padding token, or have no digits in their stem, are
  returned unchanged.
*/
std::string NormalizeFramePadding(std::string_view literal);

bool HasFramePadding(std::string_view literal);

} // namespace renderplan::extract
