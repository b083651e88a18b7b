#ifndef MIRRORRANK_API_HPP
#define MIRRORRANK_API_HPP


#ifdef MIRRORRANK_STATIC
// As a static library: no symbol import/export.
#  define MIRRORRANK_API
#else
 // As a shared library: export symbols on build, import symbols on use.
#  ifdef MIRRORRANK_EXPORTS
     // We are building this library
#    ifdef _MSC_VER
#         define MIRRORRANK_API __declspec(dllexport)
#    else
#         define MIRRORRANK_API __attribute__((__visibility__("default")))
#    endif
#  else
     // We are using this library
#    ifdef _MSC_VER
#         define MIRRORRANK_API __declspec(dllimport)
#    else
#         define MIRRORRANK_API // Symbol import is implicit on non-msvc compilers.
#    endif
#  endif
#endif

#endif
