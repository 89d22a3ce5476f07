// -*- mode: c++; -*-
// Copyright 2019-2020 Thinkoid, LLC.

#ifndef TEXTFLOW_CONFIG_HH
#define TEXTFLOW_CONFIG_HH

// Autoconf-like macros
#define PACKAGE "textflow"
#define PACKAGE_NAME "textflow"
#define PACKAGE_STRING "textflow 0.3.0"
#define PACKAGE_TARNAME "textflow"
#define PACKAGE_URL ""
#define PACKAGE_VERSION "0.3.0"
#define VERSION "0.3.0"

#define TEXTFLOW_COPYRIGHT "Copyright 2019-2020 Thinkoid, LLC"

//------------------------------------------------------------------------
// config file names
//------------------------------------------------------------------------

// per-user config file, relative to the home directory
#define TEXTFLOW_USER_CONFIG_FILE ".textflowrc"

// system-wide config file
#ifndef TEXTFLOW_SYSTEM_CONFIG_FILE
#define TEXTFLOW_SYSTEM_CONFIG_FILE "/usr/local/etc/textflowrc"
#endif

#endif // TEXTFLOW_CONFIG_HH
