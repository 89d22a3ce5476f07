//========================================================================
//
// GlobalParams.hh
//
// Copyright 2001-2003 Glyph & Cog, LLC
// Copyright 2020 Thinkoid, LLC
//
//========================================================================

#ifndef TEXTFLOW_TEXTFLOW_GLOBALPARAMS_HH
#define TEXTFLOW_TEXTFLOW_GLOBALPARAMS_HH

#include <defs.hh>

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include <textflow/GroupingControl.hh>
#include <textflow/SegmentationControl.hh>

namespace textflow {

class GlobalParams;

//------------------------------------------------------------------------

// The global parameters object.
extern GlobalParams* globalParams;

//------------------------------------------------------------------------

class GlobalParams {
public:
    //
    // Initialize the global parameters by attempting to read a config file:
    // the one given, then the user's, then the system-wide one:
    //
    explicit GlobalParams (const char* cfgFileName = 0);

    void parseFile (const std::string& fileName, std::istream&);
    void parseLine (const std::string& buf, const std::string& fileName, int line);

    //----- accessors

    const GroupingControl& getGroupingControl () const { return grouping; }
    GroupingControl& getGroupingControl () { return grouping; }

    const SegmentationControl& getSegmentationControl () const {
        return segmentation;
    }

    SegmentationControl& getSegmentationControl () { return segmentation; }

    bool getErrQuiet () const { return errQuiet; }

    //----- functions to set parameters

    void setErrQuiet (bool errQuietA) { errQuiet = errQuietA; }

private:
    using tokens_t = std::vector< std::string >;

    void parseYesNo (
        const char* cmdName, bool* flag, const tokens_t& tokens,
        const std::string& fileName, int line);
    bool parseYesNo2 (const std::string& token, bool* flag);
    void parseInteger (
        const char* cmdName, int* val, const tokens_t& tokens,
        const std::string& fileName, int line);
    void parseFloat (
        const char* cmdName, double* val, const tokens_t& tokens,
        const std::string& fileName, int line);
    bool parseFloat2 (const tokens_t& tokens, double* val);
    void parseOptionalFloat (
        const char* cmdName, std::optional< double >* val,
        const tokens_t& tokens, const std::string& fileName, int line);
    void parseColorMatching (
        const tokens_t& tokens, const std::string& fileName, int line);
    void parseColumnOrder (
        const tokens_t& tokens, const std::string& fileName, int line);
    void parseWritingMode (
        const tokens_t& tokens, const std::string& fileName, int line);
    void parseInlineDirection (
        const tokens_t& tokens, const std::string& fileName, int line);

    //----- grouping and segmentation

    GroupingControl grouping;
    SegmentationControl segmentation;

    //----- misc

    bool errQuiet; // suppress error messages?

    // files being parsed, outermost first
    std::vector< std::string > parsing;
};

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_GLOBALPARAMS_HH
