// -*- mode: c++; -*-
// Copyright 2020 Thinkoid, LLC

#include <defs.hh>

#include <algorithm>
#include <string>

#include <boost/iostreams/filter/zlib.hpp>
#include <boost/iostreams/filtering_stream.hpp>
namespace io = boost::iostreams;

#include <iostreams/size_sink.hh>

#include <textflow/ncd.hh>

namespace textflow {

size_t compressed_size (const std::string& s) {
    size_t size = 0;

    io::zlib_params params (io::zlib::default_compression);
    params.noheader = true;

    io::filtering_ostream str;

    str.push (io::zlib_compressor (params));
    str.push (iostreams::size_sink_t (size));

    str.write (s.data (), std::streamsize (s.size ()));
    io::close (str);

    return size;
}

size_t compressed_size (const std::string& s, compression_cache_t& cache) {
    auto iter = cache.find (s);

    if (iter == cache.end ()) {
        iter = cache.emplace (s, compressed_size (s)).first;
    }

    return iter->second;
}

double ncd (
    const std::string& lhs, const std::string& rhs, compression_cache_t& cache) {
    if (lhs.empty () && rhs.empty ()) {
        return 0;
    }

    if (lhs.empty () || rhs.empty ()) {
        return 1;
    }

    const auto a = compressed_size (lhs, cache);
    const auto b = compressed_size (rhs, cache);
    const auto ab = compressed_size (lhs + rhs, cache);

    const auto hi = (std::max) (a, b), lo = (std::min) (a, b);

    if (0 == hi) {
        return 0;
    }

    return (double (ab) - double (lo)) / double (hi);
}

} // namespace textflow
