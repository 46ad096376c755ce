#pragma once

/*compile time defaults, override with -D on the compiler line*/

#ifndef MG_DEFAULT_ROWS
#define MG_DEFAULT_ROWS 20
#endif

#ifndef MG_DEFAULT_COLS
#define MG_DEFAULT_COLS 10
#endif

#ifndef MG_UNDO_LIMIT
#define MG_UNDO_LIMIT 50
#endif

#ifndef MG_DEFAULT_COLUMN_WIDTH
#define MG_DEFAULT_COLUMN_WIDTH 12
#endif

#define MG_MIN_COLUMN_WIDTH 3

#ifndef MG_WRITE_CHUNK_SIZE
#define MG_WRITE_CHUNK_SIZE (1 << 16)
#endif

/*getch timeout; the load mailbox is polled once per tick*/
#ifndef MG_INPUT_POLL_MS
#define MG_INPUT_POLL_MS 100
#endif

#define MG_RC_NAME ".mgridrc"
