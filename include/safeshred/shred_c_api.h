#pragma once

#include <stddef.h>
#include <stdint.h>

#if defined(_WIN32)
#if defined(SAFESHRED_PLUGIN_BUILD)
#define SAFESHRED_API __declspec(dllexport)
#else
#define SAFESHRED_API __declspec(dllimport)
#endif
#else
#define SAFESHRED_API __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* Status codes match safeshred::ShredStatus. */
#define SHRED_OK 0
#define SHRED_INVALID_ARGUMENT 1
#define SHRED_ACCESS_DENIED 2
#define SHRED_NOT_INITIALIZED 3
#define SHRED_IO_ERROR 4
#define SHRED_UNLINK_FAILED 5
#define SHRED_CANCELLED 6

typedef void (*shred_progress_fn)(int percent, void* user_data);

typedef struct shred_result {
    int status;
    int warning;
    uint64_t bytes_processed;
    uint64_t passes_completed;
} shred_result;

/* Opens shredder.log, or the file named by SAFESHRED_LOG_PATH. Idempotent. */
SAFESHRED_API void init_logger(void);

/* Flushes and closes the log. Idempotent; safe to register with atexit. */
SAFESHRED_API void close_logger(void);

/* Returns a SHRED_* code. SHRED_UNLINK_FAILED means every pass completed
   but the directory entry could not be removed. */
SAFESHRED_API int shred(const char* path, int passes);

/* Same return code as shred(). out_result, when given, carries the failure
   status and the unlink warning in separate fields. */
SAFESHRED_API int shred_with_progress(
    const char* path,
    int passes,
    shred_progress_fn progress,
    void* user_data,
    shred_result* out_result);

SAFESHRED_API const char* shred_status_name(int status);

#ifdef __cplusplus
}
#endif
