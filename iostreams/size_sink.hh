// -*- mode: c++; -*-
// Copyright 2020- Thinkoid, LLC

#ifndef TEXTFLOW_IOSTREAMS_SIZE_SINK_HH
#define TEXTFLOW_IOSTREAMS_SIZE_SINK_HH

#include <cstddef>

#include <boost/iostreams/concepts.hpp>

namespace textflow {
namespace iostreams {

//
// Discards everything written through the stream, counting the characters,
// e.g., the output of a compressor when only its size matters:
//
struct size_sink_t : public boost::iostreams::sink
{
    explicit size_sink_t(size_t &size) : size_(size) { }

    std::streamsize write(const char *, std::streamsize n)
    {
        return size_ += size_t(n), n;
    }

private:
    size_t &size_;
};

} // namespace iostreams
} // namespace textflow

#endif // TEXTFLOW_IOSTREAMS_SIZE_SINK_HH
