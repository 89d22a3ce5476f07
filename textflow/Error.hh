// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_ERROR_HH
#define TEXTFLOW_TEXTFLOW_ERROR_HH

#include <defs.hh>

#include <string>
#include <utility>

#include <fmt/format.h>

namespace textflow {

enum ErrorCategory {
    errSyntaxWarning, // input has a problem, but can be processed
    errSyntaxError,   // input has a problem the record is dropped for
    errConfig,        // error in the config file
    errCommandLine,   // error in the command line arguments
    errIO,            // error in file I/O
    errInternal       // unexpected failure, e.g. out of memory
};

extern const char* const errorCategoryNames [];

using error_callback_t = void (*) (void*, ErrorCategory, long, const char*);

//
// Intercepts the diagnostics; a null callback restores the default of
// printing them to stderr:
//
void setErrorCallback (error_callback_t, void* data);

//
// Reports, unless quiet, a message at position `pos' (a line number, or -1
// where the position is not known):
//
void report (ErrorCategory, long pos, const std::string&);

template< typename ... Args >
void error (ErrorCategory category, long pos, const char* msg, Args&& ... args) {
    report (
        category, pos,
        fmt::format (fmt::runtime (msg), std::forward< Args > (args)...));
}

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_ERROR_HH
