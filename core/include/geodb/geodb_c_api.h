/**
 * @file geodb_c_api.h
 * @brief Flat C API over geodb for FFI consumers (Python ctypes, Node, C#...).
 *
 * DESIGN INVARIANTS:
 *   1. All functions are `extern "C"` and return `geodb_error_t`.
 *   2. C++ exceptions NEVER cross the FFI boundary.
 *   3. Caller-allocated buffers only: records and error messages are written
 *      into memory the caller owns. Nothing allocated here is handed out.
 *   4. Opaque pointer pattern: `geodb_t` hides the C++ Database.
 *   5. geodb_close() takes the address of the caller's handle and nulls it,
 *      so closing twice (or closing a handle whose open failed) is a no-op.
 */

#ifndef GEODB_C_API_H
#define GEODB_C_API_H

#include <stddef.h>

#if defined(_WIN32) || defined(_WIN64)
#ifdef GEODB_BUILDING_SHARED
#define GEODB_API __declspec(dllexport)
#else
#define GEODB_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define GEODB_API __attribute__((visibility("default")))
#else
#define GEODB_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

/* ═══════════════════════════════════════════════════════════════════════════
 * ERROR CODES — geodb_error_t
 * ═══════════════════════════════════════════════════════════════════════════
 */
typedef enum {
  GEODB_OK = 0,                    /**< Success */
  GEODB_ERR_NULL_PTR = -1,         /**< A required pointer argument was NULL */
  GEODB_ERR_OPEN = -2,             /**< libGeoIP could not open the file */
  GEODB_ERR_BUFFER_TOO_SMALL = -3, /**< A record string did not fit */
  GEODB_ERR_OUT_OF_MEMORY = -4,    /**< Allocation failed */
  GEODB_ERR_INVALID_ARG = -5,      /**< Argument out of range */
  GEODB_ERR_UNKNOWN = -99          /**< Unknown internal error (catch-all) */
} geodb_error_t;

/** Opaque handle to an open database. */
typedef struct geodb_s geodb_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * OPTIONS
 * ═══════════════════════════════════════════════════════════════════════════
 */
#define GEODB_CACHE_STANDARD 0 /**< No caching */
#define GEODB_CACHE_MEMORY 1   /**< Whole database in memory */
#define GEODB_CACHE_INDEX 2    /**< Most recently used index in memory */

typedef struct {
  int caching;          /**< One of GEODB_CACHE_* */
  int reload_on_update; /**< Non-zero: reload when the file changes */
  int use_mmap;         /**< Non-zero: mmap the file */
} geodb_options_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * RECORD — caller-allocated, fixed layout
 * ═══════════════════════════════════════════════════════════════════════════
 */
#define GEODB_CITY_MAX 256
#define GEODB_NAME_MAX 64

typedef struct {
  char country_code[3];   /**< NUL-terminated, e.g. "US" */
  char country_code3[4];  /**< NUL-terminated, e.g. "USA" */
  char country_name[GEODB_NAME_MAX];
  char region[GEODB_NAME_MAX];
  char city[GEODB_CITY_MAX]; /**< UTF-8 */
  char postal_code[32];
  double latitude;
  double longitude;
  int area_code;
  char continent_code[3];
} geodb_record_t;

/* ═══════════════════════════════════════════════════════════════════════════
 * LIFECYCLE
 * ═══════════════════════════════════════════════════════════════════════════
 */

/** @brief Default options: no caching, reload on update, mmap. */
GEODB_API geodb_options_t geodb_default_options(void);

/**
 * @brief Opens a GeoIP database.
 *
 * @param[in]  path          NUL-terminated file path.
 * @param[in]  opts          Options, or NULL for geodb_default_options().
 * @param[out] out_db        Receives the handle; set to NULL on failure.
 * @param[out] err_buf       Optional buffer for the failure message.
 * @param[in]  err_buf_size  Capacity of err_buf (message is truncated).
 * @return GEODB_OK, GEODB_ERR_OPEN with the native diagnostic in err_buf, or
 *         GEODB_ERR_INVALID_ARG if opts->caching is not a GEODB_CACHE_* value.
 *
 * @note Caller MUST call geodb_close() when done.
 */
GEODB_API geodb_error_t geodb_open(const char *path,
                                   const geodb_options_t *opts,
                                   geodb_t **out_db, char *err_buf,
                                   size_t err_buf_size);

/**
 * @brief Releases a handle and sets *db to NULL.
 *
 * @param[in,out] db Address of the handle. NULL or *db == NULL is a no-op.
 * @return GEODB_OK always.
 */
GEODB_API geodb_error_t geodb_close(geodb_t **db);

/* ═══════════════════════════════════════════════════════════════════════════
 * QUERY
 * ═══════════════════════════════════════════════════════════════════════════
 */

/**
 * @brief Looks up the record for a textual IP address.
 *
 * @param[in]  db         Open handle.
 * @param[in]  ip         NUL-terminated address, passed to libGeoIP as-is.
 * @param[out] out_record Filled only when *out_found is 1.
 * @param[out] out_found  1 if a record was found, 0 otherwise.
 * @return GEODB_OK whether or not a record was found.
 */
GEODB_API geodb_error_t geodb_lookup(const geodb_t *db, const char *ip,
                                     geodb_record_t *out_record,
                                     int *out_found);

/**
 * @brief Copies the database description string into a caller buffer.
 * @param[out] out_len Length of the full string (excluding NUL).
 * @return GEODB_ERR_BUFFER_TOO_SMALL if buf_size <= *out_len.
 */
GEODB_API geodb_error_t geodb_info(const geodb_t *db, char *buf,
                                   size_t buf_size, size_t *out_len);

/** @brief libGeoIP database type id of an open handle. */
GEODB_API geodb_error_t geodb_edition(const geodb_t *db, int *out_edition);

/**
 * @brief The GeoIP_open() flag bitmask for a set of options.
 * @return GEODB_ERR_INVALID_ARG if opts->caching is not a GEODB_CACHE_* value.
 */
GEODB_API geodb_error_t geodb_bitmask(const geodb_options_t *opts,
                                      int *out_bitmask);

/* ═══════════════════════════════════════════════════════════════════════════
 * MISC
 * ═══════════════════════════════════════════════════════════════════════════
 */

GEODB_API const char *geodb_version(void);

/** @brief libGeoIP version (static string). */
GEODB_API const char *geodb_native_version(void);

/** @brief Symbolic name of an error code, e.g. "GEODB_ERR_OPEN". */
GEODB_API const char *geodb_error_string(geodb_error_t err);

/**
 * @brief Sets the library log level.
 * @param level 0=trace 1=debug 2=info 3=warn 4=error 5=critical 6=off
 * @return GEODB_ERR_INVALID_ARG for any other value.
 */
GEODB_API geodb_error_t geodb_set_log_level(int level);

#ifdef __cplusplus
} // extern "C"
#endif

#endif /* GEODB_C_API_H */
