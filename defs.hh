// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_DEFS_HH
#define TEXTFLOW_DEFS_HH

#include <config.hh>

#define TEXTFLOW_DO_CAT(a, b) a ## b
#define TEXTFLOW_CAT(a, b) TEXTFLOW_DO_CAT(a, b)

#include <boost/assert.hpp>

#define TEXTFLOW_ASSERT BOOST_ASSERT

#endif // TEXTFLOW_DEFS_HH
