// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_UTILS_PARSEARGS_HH
#define TEXTFLOW_UTILS_PARSEARGS_HH

#include <cstddef>

enum ArgKind {
    argFlag,  // present or not, [val: bool*]
    argString // [val: char*], of `size' bytes
};

struct ArgDesc {
    const char* arg;
    ArgKind kind;
    void* val;
    size_t size;
    const char* usage;
};

//
// Removes from argv the switches found in the null-terminated `args' table,
// storing their values; stops at, and removes, a "--". Returns false if a
// switch is missing its value:
//
bool parseArgs (const ArgDesc* args, int* argc, char* argv[]);

void printUsage (const char* program, const char* otherArgs, const ArgDesc* args);

#endif // TEXTFLOW_UTILS_PARSEARGS_HH
