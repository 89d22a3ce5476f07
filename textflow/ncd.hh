// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#ifndef TEXTFLOW_TEXTFLOW_NCD_HH
#define TEXTFLOW_TEXTFLOW_NCD_HH

#include <defs.hh>

#include <string>
#include <unordered_map>

namespace textflow {

//
// Compressed sizes by text, owned by one segmentation call:
//
using compression_cache_t = std::unordered_map< std::string, size_t >;

//
// Size of the raw DEFLATE (no zlib header or trailer) stream of the UTF-8
// bytes of the text, at the default compression level:
//
size_t compressed_size (const std::string&);
size_t compressed_size (const std::string&, compression_cache_t&);

//
// Normalized compression distance, (C(ab) - min(C(a), C(b))) / max(C(a),
// C(b)). Two empty texts are at distance 0, an empty and a non-empty text at
// distance 1:
//
double ncd (const std::string&, const std::string&, compression_cache_t&);

} // namespace textflow

#endif // TEXTFLOW_TEXTFLOW_NCD_HH
