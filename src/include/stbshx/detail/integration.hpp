#pragma once

// ----------------------------------------------
// #define any of these before including stb_shx.hpp to override the defaults.
//
//      STBSHX_assert(x)              debug assertion, defaults to assert.h
//      STBSHX_MAX_SUBSHAPE_DEPTH     deepest chain of nested DRAW_SUBSHAPE calls
//      STBSHX_MAX_SUBSHAPE_CALLS     DRAW_SUBSHAPE splices allowed per glyph
// ----------------------------------------------

#ifndef STBSHX_assert
#   if defined(_DEBUG) || !defined(NDEBUG)
#       include <assert.h>
#       define STBSHX_assert(x) assert(x)
#   else
#       define STBSHX_assert(x) ((void)0)
#   endif
#endif

// subshapes splice into the running tape, so nothing in the file format
// stops a glyph from referencing itself
#ifndef STBSHX_MAX_SUBSHAPE_DEPTH
#   define STBSHX_MAX_SUBSHAPE_DEPTH 16
#endif

#ifndef STBSHX_MAX_SUBSHAPE_CALLS
#   define STBSHX_MAX_SUBSHAPE_CALLS 1024
#endif

static_assert(STBSHX_MAX_SUBSHAPE_DEPTH > 0, "STBSHX_MAX_SUBSHAPE_DEPTH must be positive");
static_assert(STBSHX_MAX_SUBSHAPE_CALLS > 0, "STBSHX_MAX_SUBSHAPE_CALLS must be positive");
