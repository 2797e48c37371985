#pragma once

/*compile-time defaults, each one can be overridden with -D*/

#ifndef VL_DEFAULT_TAB_WIDTH
#define VL_DEFAULT_TAB_WIDTH 4
#endif

/*typed counts saturate here*/
#ifndef VL_MAX_COUNT
#define VL_MAX_COUNT 99999
#endif

#ifndef VL_MAX_TAB_WIDTH
#define VL_MAX_TAB_WIDTH 64
#endif

/*nested macro runs allowed before a replay is treated as failed*/
#ifndef VL_MAX_MACRO_DEPTH
#define VL_MAX_MACRO_DEPTH 1000
#endif

/*rc file looked up under $HOME at startup*/
#ifndef VL_RC_FILE
#define VL_RC_FILE ".vimlayerrc"
#endif

#ifndef VL_WRITE_CHUNK_SIZE
#define VL_WRITE_CHUNK_SIZE (1 << 16)
#endif

#define VL_NAME "vimlayer"
