// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC

#ifndef TEXTFLOW_UTILS_PATH_HH
#define TEXTFLOW_UTILS_PATH_HH

#include <defs.hh>

#include <filesystem>
namespace fs = std::filesystem;

namespace textflow {

// Get home directory path.
fs::path home_path();

//
// Shell-like expansion of `~' and environment variables; the path is
// returned unchanged when it does not expand to exactly one word:
//
fs::path expand_path(const fs::path &);

} // namespace textflow

#endif // TEXTFLOW_UTILS_PATH_HH
