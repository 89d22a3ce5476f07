// -*- mode: c++; -*-
// Copyright 2001-2007 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>
#include <config.hh>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include <utils/parseargs.hh>

#include <textflow/Error.hh>
#include <textflow/GlobalParams.hh>
#include <textflow/GroupedContext.hh>
#include <textflow/RunFile.hh>
#include <textflow/TextBlock.hh>
#include <textflow/TextPage.hh>
#include <textflow/TextParagraph.hh>

using namespace textflow;

static void printBlocks (const TextBlocks& blocks);
static void printSegments (const block_context_result_t& result);

static char cfgFileName [256] = "";
static bool forceHorizontal = false;
static bool forceVertical = false;
static bool forceLTR = false;
static bool forceRTL = false;
static bool noColumns = false;
static bool segmentContext = false;
static bool quiet = false;
static bool printVersion = false;
static bool printHelp = false;

static ArgDesc argDesc [] = {
    { "-cfg", argString, cfgFileName, sizeof (cfgFileName),
      "configuration file to use in place of .textflowrc" },
    { "-horiz", argFlag, &forceHorizontal, 0, "assume horizontal writing" },
    { "-vert", argFlag, &forceVertical, 0, "assume vertical writing" },
    { "-ltr", argFlag, &forceLTR, 0, "assume left-to-right text" },
    { "-rtl", argFlag, &forceRTL, 0, "assume right-to-left text" },
    { "-nocols", argFlag, &noColumns, 0,
      "do not split lines and blocks into columns" },
    { "-ctx", argFlag, &segmentContext, 0,
      "merge blocks by context and print the segments" },
    { "-q", argFlag, &quiet, 0, "don't print any messages or errors" },
    { "-v", argFlag, &printVersion, 0, "print copyright and version info" },
    { "-h", argFlag, &printHelp, 0, "print usage information" },
    { "-help", argFlag, &printHelp, 0, "print usage information" },
    { "--help", argFlag, &printHelp, 0, "print usage information" },
    { "-?", argFlag, &printHelp, 0, "print usage information" },
    { }
};

int main (int argc, char* argv []) {
    int exitCode = 99;

    // parse args
    bool ok = parseArgs (argDesc, &argc, argv);

    if (forceHorizontal && forceVertical) {
        error (errCommandLine, -1, "Options -horiz and -vert are exclusive");
        ok = false;
    }

    if (forceLTR && forceRTL) {
        error (errCommandLine, -1, "Options -ltr and -rtl are exclusive");
        ok = false;
    }

    if (!ok || argc != 2 || printVersion || printHelp) {
        fprintf (stderr, "txtblocks version %s\n", PACKAGE_VERSION);
        fprintf (stderr, "%s\n", TEXTFLOW_COPYRIGHT);

        if (!printVersion) {
            printUsage ("txtblocks", "<run-file>", argDesc);
        }

        return exitCode;
    }

    const std::string fileName = argv [1];

    // read config file
    globalParams = new GlobalParams (cfgFileName);

    if (quiet) {
        globalParams->setErrQuiet (quiet);
    }

    auto& grouping = globalParams->getGroupingControl ();

    if (forceHorizontal) { grouping.writingMode = writing_mode_t::horizontal; }
    if (forceVertical)   { grouping.writingMode = writing_mode_t::vertical; }

    if (forceLTR) { grouping.inlineDirection = direction_t::ltr; }
    if (forceRTL) { grouping.inlineDirection = direction_t::rtl; }

    if (noColumns) {
        grouping.enableColumnSeparation = false;
    }

    exitCode = 1;

    std::ifstream f (fileName);

    if (!f.is_open ()) {
        error (errIO, -1, "Couldn't open file '{}'", fileName);
    }
    else {
        try {
            const TextPage page (grouping);
            const auto pages = read_run_file (f, fileName);

            const auto& segmentation = globalParams->getSegmentationControl ();

            for (size_t i = 0; i < pages.size (); ++i) {
                const auto& context = pages [i].context;

                if (context.pageWidth && context.pageHeight) {
                    fmt::print (
                        "page {} [{}x{}]\n", i + 1, *context.pageWidth,
                        *context.pageHeight);
                }
                else {
                    fmt::print ("page {}\n", i + 1);
                }

                const auto blocks = page.group (pages [i].runs, context);

                printBlocks (blocks);

                if (segmentContext) {
                    printSegments (
                        segment_blocks_by_context (blocks, segmentation));
                }
            }

            exitCode = 0;
        }
        catch (const std::invalid_argument& e) {
            error (errConfig, -1, "{}", e.what ());
        }
        catch (const std::exception& e) {
            error (errInternal, -1, "{}", e.what ());
        }
    }

    delete globalParams;
    globalParams = 0;

    return exitCode;
}

static void printBlocks (const TextBlocks& blocks) {
    for (size_t i = 0; i < blocks.size (); ++i) {
        const auto& block = *blocks [i];
        const auto& box = block.box;

        fmt::print (
            "block {} [{:.2f} {:.2f} {:.2f} {:.2f}]", i + 1, box.arr [0],
            box.arr [1], box.arr [2], box.arr [3]);

        if (block.layout) {
            const auto& layout = *block.layout;

            fmt::print (
                " {} {} {:.2f} padding {:.2f} {:.2f}", to_string (layout.dir),
                to_string (layout.alignment), layout.confidence,
                layout.startPadding, layout.endPadding);
        }

        fmt::print ("\n");

        for (auto& paragraph : block.paragraphs) {
            fmt::print (
                "  {} {:.2f}", to_string (paragraph->dir), paragraph->baseline);

            if (paragraph->spacing) {
                fmt::print (
                    " +{:.2f}/{:.2f}", paragraph->spacing->baselineDistance,
                    paragraph->spacing->fontSize);
            }

            fmt::print (" \"{}\"\n", paragraph->text ());
        }
    }
}

static void printSegments (const block_context_result_t& result) {
    fmt::print ("threshold {:.4f}\n", result.threshold);

    for (auto& boundary : result.boundaries) {
        fmt::print (
            "boundary {} ncd {:.4f} length {}+{} overlap {:.2f} {} {}\n",
            boundary.index, boundary.ncd, boundary.leftLength,
            boundary.rightLength, boundary.xAxisOverlapRatio,
            boundary.merge ? "merge" : "split", to_string (boundary.reason));
    }

    for (auto& segment : result.segments) {
        const auto& box = segment.box;

        fmt::print (
            "segment {}-{} [{:.2f} {:.2f} {:.2f} {:.2f}]\n", segment.first + 1,
            segment.last + 1, box.arr [0], box.arr [1], box.arr [2],
            box.arr [3]);

        fmt::print ("{}\n", segment.text);
    }
}
