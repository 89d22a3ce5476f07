//========================================================================
//
// GlobalParams.cc
//
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC
//
//========================================================================

#include <defs.hh>
#include <config.hh>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>

#include <utils/path.hh>

#include <textflow/Direction.hh>
#include <textflow/Error.hh>
#include <textflow/GlobalParams.hh>

namespace textflow {

GlobalParams* globalParams = 0;

//------------------------------------------------------------------------

GlobalParams::GlobalParams (const char* cfgFileName) : errQuiet (false) {
    std::ifstream f;
    std::string fileName;

    // look for a user config file, then a system-wide config file
    if (cfgFileName && cfgFileName [0]) {
        fileName = expand_path (cfgFileName).string ();
        f.open (fileName);
    }

    if (!f.is_open ()) {
        fileName = (home_path () / TEXTFLOW_USER_CONFIG_FILE).string ();
        f.open (fileName);
    }

    if (!f.is_open ()) {
        fileName = TEXTFLOW_SYSTEM_CONFIG_FILE;
        f.open (fileName);
    }

    if (f.is_open ()) {
        parseFile (fileName, f);
    }
}

void GlobalParams::parseFile (const std::string& fileName, std::istream& f) {
    parsing.push_back (fileName);

    int line = 1;

    for (std::string buf; std::getline (f, buf); ++line) {
        parseLine (buf, fileName, line);
    }

    parsing.pop_back ();
}

void GlobalParams::parseLine (
    const std::string& buf, const std::string& fileName, int line) {
    tokens_t tokens;

    // break the line into tokens
    for (size_t p1 = 0, p2 = 0; p1 < buf.size (); p1 = p2 < buf.size () ? p2 + 1 : p2) {
        for (; p1 < buf.size () && isspace ((unsigned char) buf [p1]); ++p1)
            ;

        if (p1 == buf.size ()) {
            break;
        }

        if (buf [p1] == '"' || buf [p1] == '\'') {
            for (p2 = p1 + 1; p2 < buf.size () && buf [p2] != buf [p1]; ++p2)
                ;
            ++p1;
        }
        else {
            for (p2 = p1 + 1;
                 p2 < buf.size () && !isspace ((unsigned char) buf [p2]); ++p2)
                ;
        }

        tokens.push_back (buf.substr (p1, p2 - p1));
    }

    // parse the line
    if (tokens.empty () || tokens [0][0] == '#') {
        return;
    }

    const auto& cmd = tokens [0];

    if (cmd == "include") {
        if (tokens.size () == 2) {
            const auto incFile = expand_path (tokens [1]).string ();

            if (parsing.end () != std::find (
                    parsing.begin (), parsing.end (), incFile)) {
                error (
                    errConfig, -1, "Config file include loop: '{}' ({}:{})",
                    incFile, fileName, line);
                return;
            }

            std::ifstream f2 (incFile);

            if (f2.is_open ()) {
                parseFile (incFile, f2);
            }
            else {
                error (
                    errConfig, -1,
                    "Couldn't find included config file: '{}' ({}:{})",
                    incFile, fileName, line);
            }
        }
        else {
            error (
                errConfig, -1, "Bad 'include' config file command ({}:{})",
                fileName, line);
        }
    }
    else if (cmd == "lineToleranceRatio") {
        parseFloat (
            "lineToleranceRatio", &grouping.lineToleranceRatio, tokens,
            fileName, line);
    }
    else if (cmd == "horizontalGapRatio") {
        parseFloat (
            "horizontalGapRatio", &grouping.horizontalGapRatio, tokens,
            fileName, line);
    }
    else if (cmd == "verticalGapRatio") {
        parseFloat (
            "verticalGapRatio", &grouping.verticalGapRatio, tokens, fileName,
            line);
    }
    else if (cmd == "colorMatching") {
        parseColorMatching (tokens, fileName, line);
    }
    else if (cmd == "fontSizeToleranceRatio") {
        parseFloat (
            "fontSizeToleranceRatio", &grouping.fontSizeToleranceRatio, tokens,
            fileName, line);
    }
    else if (cmd == "enableColumnSeparation") {
        parseYesNo (
            "enableColumnSeparation", &grouping.enableColumnSeparation, tokens,
            fileName, line);
    }
    else if (cmd == "columnGapRatio") {
        parseFloat (
            "columnGapRatio", &grouping.columnGapRatio, tokens, fileName, line);
    }
    else if (cmd == "enablePageColumnDetection") {
        parseYesNo (
            "enablePageColumnDetection", &grouping.enablePageColumnDetection,
            tokens, fileName, line);
    }
    else if (cmd == "maxPageColumns") {
        parseInteger (
            "maxPageColumns", &grouping.maxPageColumns, tokens, fileName, line);
    }
    else if (cmd == "fullWidthRatio") {
        parseFloat (
            "fullWidthRatio", &grouping.fullWidthRatio, tokens, fileName, line);
    }
    else if (cmd == "writingMode") {
        parseWritingMode (tokens, fileName, line);
    }
    else if (cmd == "verticalColumnOrder") {
        parseColumnOrder (tokens, fileName, line);
    }
    else if (cmd == "inlineDirection") {
        parseInlineDirection (tokens, fileName, line);
    }
    else if (cmd == "windowSize") {
        parseInteger (
            "windowSize", &segmentation.windowSize, tokens, fileName, line);
    }
    else if (cmd == "mergeThreshold") {
        parseFloat (
            "mergeThreshold", &segmentation.mergeThreshold, tokens, fileName,
            line);
    }
    else if (cmd == "strongMergeThreshold") {
        parseFloat (
            "strongMergeThreshold", &segmentation.strongMergeThreshold, tokens,
            fileName, line);
    }
    else if (cmd == "minCombinedChars") {
        parseInteger (
            "minCombinedChars", &segmentation.minCombinedChars, tokens,
            fileName, line);
    }
    else if (cmd == "boundaryContextChars") {
        parseInteger (
            "boundaryContextChars", &segmentation.boundaryContextChars, tokens,
            fileName, line);
    }
    else if (cmd == "suffixPrefixMergeRatio") {
        parseFloat (
            "suffixPrefixMergeRatio", &segmentation.suffixPrefixMergeRatio,
            tokens, fileName, line);
    }
    else if (cmd == "suffixPrefixMergeMinChars") {
        parseInteger (
            "suffixPrefixMergeMinChars",
            &segmentation.suffixPrefixMergeMinChars, tokens, fileName, line);
    }
    else if (cmd == "adaptiveMergePercentile") {
        parseOptionalFloat (
            "adaptiveMergePercentile", &segmentation.adaptiveMergePercentile,
            tokens, fileName, line);
    }
    else if (cmd == "minXAxisOverlapRatio") {
        parseFloat (
            "minXAxisOverlapRatio", &segmentation.minXAxisOverlapRatio, tokens,
            fileName, line);
    }
    else if (cmd == "contextParagraphEdgeCount") {
        parseInteger (
            "contextParagraphEdgeCount",
            &segmentation.contextParagraphEdgeCount, tokens, fileName, line);
    }
    else if (cmd == "errQuiet") {
        parseYesNo ("errQuiet", &errQuiet, tokens, fileName, line);
    }
    else {
        error (
            errConfig, -1, "Unknown config file command '{}' ({}:{})", cmd,
            fileName, line);
    }
}

void GlobalParams::parseYesNo (
    const char* cmdName, bool* flag, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (tokens.size () != 2 || !parseYesNo2 (tokens [1], flag)) {
        error (
            errConfig, -1, "Bad '{}' config file command ({}:{})", cmdName,
            fileName, line);
    }
}

bool GlobalParams::parseYesNo2 (const std::string& token, bool* flag) {
    if (token == "yes") {
        *flag = true;
    }
    else if (token == "no") {
        *flag = false;
    }
    else {
        return false;
    }
    return true;
}

void GlobalParams::parseInteger (
    const char* cmdName, int* val, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (tokens.size () != 2 || tokens [1].empty ()) {
        error (
            errConfig, -1, "Bad '{}' config file command ({}:{})", cmdName,
            fileName, line);
        return;
    }

    const auto& tok = tokens [1];

    for (size_t i = tok [0] == '-' ? 1 : 0; i < tok.size (); ++i) {
        if (tok [i] < '0' || tok [i] > '9') {
            error (
                errConfig, -1, "Bad '{}' config file command ({}:{})",
                cmdName, fileName, line);
            return;
        }
    }

    char* end = 0;

    errno = 0;
    const long x = strtol (tok.c_str (), &end, 10);

    if (end == tok.c_str () || *end || errno == ERANGE || x < INT_MIN ||
        x > INT_MAX) {
        error (
            errConfig, -1, "Bad '{}' config file command ({}:{})", cmdName,
            fileName, line);
        return;
    }

    *val = int (x);
}

void GlobalParams::parseFloat (
    const char* cmdName, double* val, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (!parseFloat2 (tokens, val)) {
        error (
            errConfig, -1, "Bad '{}' config file command ({}:{})", cmdName,
            fileName, line);
    }
}

bool GlobalParams::parseFloat2 (const tokens_t& tokens, double* val) {
    if (tokens.size () != 2 || tokens [1].empty ()) {
        return false;
    }

    const auto& tok = tokens [1];

    for (size_t i = tok [0] == '-' ? 1 : 0; i < tok.size (); ++i) {
        if (!((tok [i] >= '0' && tok [i] <= '9') || tok [i] == '.')) {
            return false;
        }
    }

    // the whole token, e.g. not `1.2.3' or `-'
    char* end = 0;
    const double x = strtod (tok.c_str (), &end);

    if (end == tok.c_str () || *end || !std::isfinite (x)) {
        return false;
    }

    *val = x;
    return true;
}

void GlobalParams::parseOptionalFloat (
    const char* cmdName, std::optional< double >* val, const tokens_t& tokens,
    const std::string& fileName, int line) {
    if (tokens.size () == 2 && tokens [1] == "none") {
        val->reset ();
        return;
    }

    double x;

    if (parseFloat2 (tokens, &x)) {
        *val = x;
    }
    else {
        error (
            errConfig, -1, "Bad '{}' config file command ({}:{})", cmdName,
            fileName, line);
    }
}

void GlobalParams::parseColorMatching (
    const tokens_t& tokens, const std::string& fileName, int line) {
    const auto value = tokens.size () == 2
        ? color_matching_from (tokens [1]) : std::nullopt;

    if (!value) {
        error (
            errConfig, -1, "Bad 'colorMatching' config file command ({}:{})",
            fileName, line);
        return;
    }

    grouping.colorMatching = *value;
}

void GlobalParams::parseColumnOrder (
    const tokens_t& tokens, const std::string& fileName, int line) {
    const auto value = tokens.size () == 2
        ? column_order_from (tokens [1]) : std::nullopt;

    if (!value) {
        error (
            errConfig, -1,
            "Bad 'verticalColumnOrder' config file command ({}:{})", fileName,
            line);
        return;
    }

    grouping.verticalColumnOrder = *value;
}

void GlobalParams::parseWritingMode (
    const tokens_t& tokens, const std::string& fileName, int line) {
    if (tokens.size () == 2 && tokens [1] == "auto") {
        grouping.writingMode.reset ();
        return;
    }

    const auto value = tokens.size () == 2
        ? writing_mode_from (tokens [1]) : std::nullopt;

    if (!value) {
        error (
            errConfig, -1, "Bad 'writingMode' config file command ({}:{})",
            fileName, line);
        return;
    }

    grouping.writingMode = *value;
}

void GlobalParams::parseInlineDirection (
    const tokens_t& tokens, const std::string& fileName, int line) {
    if (tokens.size () == 2 && tokens [1] == "auto") {
        grouping.inlineDirection.reset ();
        return;
    }

    const auto value = tokens.size () == 2
        ? direction_from (tokens [1]) : std::nullopt;

    if (!value || *value == direction_t::ttb) {
        error (
            errConfig, -1, "Bad 'inlineDirection' config file command ({}:{})",
            fileName, line);
        return;
    }

    grouping.inlineDirection = *value;
}

} // namespace textflow
