#ifndef WSCHECK_VERSION_HPP
#define WSCHECK_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define WSCHECK_VERSION_MAJOR 1
#define WSCHECK_VERSION_MINOR 0
#define WSCHECK_VERSION_PATCH 0

#define WSCHECK_VERSION_STR "1.0.0"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* WSCHECK_VERSION = WSCHECK_VERSION_STR;

#endif /* WSCHECK_VERSION_HPP */
