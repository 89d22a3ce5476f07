// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <iostream>

#include <textflow/Error.hh>
#include <textflow/GlobalParams.hh>

namespace textflow {

const char* const errorCategoryNames [] = {
    "Syntax Warning",
    "Syntax Error",
    "Config Error",
    "Command Line Error",
    "I/O Error",
    "Internal Error"
};

static error_callback_t errorCbk = 0;
static void* errorCbkData = 0;

void setErrorCallback (error_callback_t cbk, void* data) {
    errorCbk = cbk;
    errorCbkData = data;
}

void report (ErrorCategory category, long pos, const std::string& msg) {
    // NB: this can be called before the globalParams object is created
    if (!errorCbk && globalParams && globalParams->getErrQuiet ()) {
        return;
    }

    if (errorCbk) {
        (*errorCbk) (errorCbkData, category, pos, msg.c_str ());
    }
    else {
        if (pos >= 0) {
            std::cerr << errorCategoryNames [category]
                      << " (" << pos << "): " << msg << std::endl;
        }
        else {
            std::cerr << errorCategoryNames [category] << ": "
                      << msg << std::endl;
        }
    }
}

} // namespace textflow
