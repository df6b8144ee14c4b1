#ifndef __FMBIND_FM_FFI_C_API__
#define __FMBIND_FM_FFI_C_API__

#ifdef __cplusplus
extern "C" {
#endif

#include <stdbool.h>

// Callbacks handed to the on-device model backend.
// Strings are null-terminated UTF-8 owned by the backend; they are only valid for the
// duration of the callback and must be copied before returning.
// user_data is the opaque context passed to the entry point that started the generation.

// Called zero or more times per generation, never after the terminal callback
typedef void (*fm_chunk_callback_t)(const char* chunk, void* user_data);

// Terminal: called when generation completes successfully
typedef void (*fm_done_callback_t)(void* user_data);

// Terminal: called when generation fails; exactly one of done/error fires per call
typedef void (*fm_error_callback_t)(const char* error, void* user_data);

// Returns true if the on-device model can currently serve requests.
// Side-effect free; may be called at any time.
bool fm_check_availability(void);

// Generate a complete response; chunks are delivered before the terminal callback.
// The callbacks may run on a backend-owned thread, before or after this call returns.
void fm_response(const char* prompt,
                 void* user_data,
                 fm_chunk_callback_t on_chunk,
                 fm_done_callback_t on_done,
                 fm_error_callback_t on_error);

// Start streaming a response; chunks are forwarded as they are produced.
void fm_start_stream(const char* prompt,
                     void* user_data,
                     fm_chunk_callback_t on_chunk,
                     fm_done_callback_t on_done,
                     fm_error_callback_t on_error);

// Request that the current stream stops.
// Global and idempotent; a no-op when no stream is active. The stream still
// finishes through its done/error callback.
void fm_stop_stream(void);

#ifdef __cplusplus
}
#endif

#endif  // __FMBIND_FM_FFI_C_API__
