#ifndef PPLACES_VERSION_HPP
#define PPLACES_VERSION_HPP

/*
 * Release tag. Overridden by the build with -DPPLACES_VERSION_STR=... when
 * packaging.
 */
#ifndef PPLACES_VERSION_STR
#define PPLACES_VERSION_STR "0.1.0"
#endif

/* Human-friendly version string for the C++ codebase */
constexpr const char* PPLACES_VERSION = PPLACES_VERSION_STR;

#endif /* PPLACES_VERSION_HPP */
