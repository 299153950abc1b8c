#pragma once

#include <cstddef>

#if defined(GATECORE_DLL_EXPORT)
#define GATECORE_API __declspec(dllexport)
#elif defined(GATECORE_DLL_IMPORT)
#define GATECORE_API __declspec(dllimport)
#elif defined(GATECORE_LIB_VISIBILITY) && defined(__GNUC__) && (__GNUC__ >= 4)
#define GATECORE_API __attribute__((visibility("default")))
#else
#define GATECORE_API
#endif  // defined(GATECORE_DLL_EXPORT)

#define GATECORE_NON_COPYABLE(type)                                               \
    type(const type&) = delete;                                                   \
    type(type&&) = delete;                 /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(const type&) = delete; /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(type&&) = delete;      /*NOLINT(bugprone-macro-parentheses)*/

#define GATECORE_COPYABLE_DEFAULT(type)                                                \
    type(const type&) = default;                                                       \
    type(type&&) noexcept = default;            /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(const type&) = default;     /*NOLINT(bugprone-macro-parentheses)*/ \
    type& operator=(type&&) noexcept = default; /*NOLINT(bugprone-macro-parentheses)*/
