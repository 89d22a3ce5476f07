// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_RUNFILE_HH
#define TEXTFLOW_TEXTFLOW_RUNFILE_HH

#include <defs.hh>

#include <iosfwd>
#include <string>
#include <vector>

#include <textflow/TextFlowFwd.hh>
#include <textflow/TextPage.hh>

namespace textflow {

struct run_page_t {
    page_context_t context;
    TextRuns runs;
};

//
// Reads a run listing, one tab-separated record per line:
//
//   page  <width> <height>
//   zone  <x> <y> <width> <height>
//   run   <x> <y> <width> <height> <fontSize> <fontName> <text>
//         [<descender> [<charSpacing> [<wordSpacing> [<hScale>]]]]
//
// Records before the first `page' belong to a page of unknown size, as do the
// records after a malformed `page'. Blank lines and lines starting with `#'
// are ignored; other malformed records are reported, with their line number,
// and skipped:
//
std::vector< run_page_t > read_run_file (std::istream&, const std::string& name);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_RUNFILE_HH
