#ifndef SYNCGUARD_VERSION_HPP
#define SYNCGUARD_VERSION_HPP

/* ------------------------------------------------------------------
   Public numeric version macros                                    */
#define SYNCGUARD_VERSION_MAJOR 0
#define SYNCGUARD_VERSION_MINOR 1
#define SYNCGUARD_VERSION_PATCH 0

/*
 * Rolling release tag injected by the CI workflow.
 * Example format: "2025.07.31-1".
 */
#define SYNCGUARD_VERSION_STR "rolling"
/* ------------------------------------------------------------------ */

/* Human-friendly version string for the C++ codebase */
constexpr const char* SYNCGUARD_VERSION = SYNCGUARD_VERSION_STR;

#endif /* SYNCGUARD_VERSION_HPP */
