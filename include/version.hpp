#ifndef KACHINA_VERSION_HPP
#define KACHINA_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define KACHINA_VERSION_MAJOR 0
#define KACHINA_VERSION_MINOR 3
#define KACHINA_VERSION_PATCH 0

/*
 * Rolling release tag injected by the CI workflow.
 * Example format: "2025.07.31-1".
 */
#define KACHINA_VERSION_STR "rolling"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* KACHINA_VERSION = KACHINA_VERSION_STR;

/* Name used for syslog identity, default file names and log labels */
constexpr const char* KACHINA_APP_NAME = "kachina";

#endif /* KACHINA_VERSION_HPP */
