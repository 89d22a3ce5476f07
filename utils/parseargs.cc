// -*- mode: c++; -*-
// Copyright 1996-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <cstring>

#include <fmt/format.h>

#include <utils/parseargs.hh>

namespace {

const ArgDesc* find_arg(const ArgDesc* args, const char* s)
{
    for (auto p = args; p->arg; ++p) {
        if (0 == strcmp(p->arg, s))
            return p;
    }

    return 0;
}

void remove_args(int i, int n, int* argc, char* argv[])
{
    *argc -= n;
    std::copy(argv + i + n, argv + *argc + n, argv + i);
}

} // anonymous

bool parseArgs(const ArgDesc* args, int* argc, char* argv[])
{
    bool ok = true;

    for (int i = 1; i < *argc;) {
        if (0 == strcmp(argv[i], "--")) {
            remove_args(i, 1, argc, argv);
            break;
        }

        const auto arg = find_arg(args, argv[i]);

        if (0 == arg) {
            ++i;
            continue;
        }

        switch (arg->kind) {
        case argFlag:
            *static_cast< bool* >(arg->val) = true;
            remove_args(i, 1, argc, argv);
            break;

        case argString:
            if (i + 1 < *argc) {
                auto p = static_cast< char* >(arg->val);

                strncpy(p, argv[i + 1], arg->size - 1);
                p[arg->size - 1] = 0;

                remove_args(i, 2, argc, argv);
            }
            else {
                ok = false;
                remove_args(i, 1, argc, argv);
            }
            break;
        }
    }

    return ok;
}

void printUsage(const char* program, const char* otherArgs, const ArgDesc* args)
{
    size_t w = 0;

    for (auto p = args; p->arg; ++p)
        w = std::max(w, strlen(p->arg));

    fmt::print(stderr, "Usage: {} [options]", program);

    if (otherArgs)
        fmt::print(stderr, " {}", otherArgs);

    fmt::print(stderr, "\n");

    for (auto p = args; p->arg; ++p) {
        const char* typ = argString == p->kind ? " <string>" : "";

        fmt::print(stderr, "  {:<{}}{:<10}", p->arg, w, typ);

        if (p->usage)
            fmt::print(stderr, ": {}", p->usage);

        fmt::print(stderr, "\n");
    }
}
