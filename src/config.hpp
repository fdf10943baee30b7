#pragma once

/*compile-time knobs; run-time options live in ~/.xedrc*/

#ifndef XED_WRITE_CHUNK_SIZE
#define XED_WRITE_CHUNK_SIZE (64 * 1024)
#endif

#ifndef XED_STATUS_TIMEOUT_SEC
#define XED_STATUS_TIMEOUT_SEC 5
#endif

#ifndef XED_RC_FILE
#define XED_RC_FILE ".xedrc"
#endif

#ifndef XED_TAB_RENDER
#define XED_TAB_RENDER ' '
#endif

#define XED_VERSION "0.3.0"
