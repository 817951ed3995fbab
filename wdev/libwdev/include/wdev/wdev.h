/**
 * Copyright (c) 2026 The wireless-dev Authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file wdev.h
 * @brief Status codes and defaults shared by libwdev and the wireless-dev CLI.
 **/

#ifndef _WDEV_H_
#define _WDEV_H_

#ifdef __cplusplus
extern "C" {
#endif

#include <stdint.h>
#include <stdbool.h>
#include <stddef.h>
#include <limits.h>


/** @defgroup group_defines wireless-dev definitions
 *  @{
 */

#define WDEV_MAX_ENUM (INT_MAX)
#define WDEV_DEFAULT_TCP_PORT (5555)
#define WDEV_DEFAULT_PROBE_TIMEOUT_MS (500)
#define WDEV_DEFAULT_BRIDGE_TIMEOUT_MS (10000)
#define WDEV_DEFAULT_MAX_CONCURRENT_PROBES (254)
#define WDEV_DEFAULT_SETTLE_DELAY_MS (2000)
#define WDEV_SUBNET_FIRST_HOST (1)
#define WDEV_SUBNET_LAST_HOST (254)
#define WDEV_LOOPBACK_ADDRESS ("127.0.0.1")
#define WDEV_CONNECTION_URI_SCHEME ("adbwireless")
#define WDEV_UNKNOWN_MODEL ("Unknown")

/** wireless-dev return codes */
#define WDEV_STATUS_VARIABLES\
    WDEV_STATUS__X(0,  WDEV_SUCCESS                      /*!< Success - No error */)\
    WDEV_STATUS__X(1,  WDEV_UNINITIALIZED                /*!< No error code was initialized */)\
    WDEV_STATUS__X(2,  WDEV_INVALID_ARGUMENT             /*!< Invalid argument passed to function */)\
    WDEV_STATUS__X(3,  WDEV_OUT_OF_HOST_MEMORY           /*!< Cannot allocate more memory at host */)\
    WDEV_STATUS__X(4,  WDEV_TIMEOUT                      /*!< Received a timeout */)\
    WDEV_STATUS__X(5,  WDEV_INVALID_OPERATION            /*!< Invalid operation */)\
    WDEV_STATUS__X(6,  WDEV_INTERNAL_FAILURE             /*!< Unexpected internal failure */)\
    WDEV_STATUS__X(7,  WDEV_NOT_FOUND                    /*!< Requested item was not found */)\
    WDEV_STATUS__X(8,  WDEV_OPEN_FILE_FAILURE            /*!< Failed to open file */)\
    WDEV_STATUS__X(9,  WDEV_FILE_OPERATION_FAILURE       /*!< File operation failure */)\
    WDEV_STATUS__X(10, WDEV_ETH_FAILURE                  /*!< Network interface query has failed */)\
    WDEV_STATUS__X(11, WDEV_ETH_INTERFACE_NOT_FOUND      /*!< Network interface not found */)\
    WDEV_STATUS__X(12, WDEV_PROCESS_SPAWN_FAILURE        /*!< Failed creating a child process */)\
    WDEV_STATUS__X(13, WDEV_BRIDGE_NOT_INSTALLED         /*!< The bridge executable (adb) was not found */)\
    WDEV_STATUS__X(14, WDEV_BRIDGE_COMMAND_FAILED        /*!< The bridge executable exited with a non-zero code */)\
    WDEV_STATUS__X(15, WDEV_INVALID_BRIDGE_RESPONSE      /*!< Bridge output did not match the expected format */)\
    WDEV_STATUS__X(16, WDEV_DEVICE_NOT_FOUND             /*!< Requested device is not in the current listing */)\
    WDEV_STATUS__X(17, WDEV_CONNECT_FAILURE              /*!< Bridge refused or failed to connect */)\
    WDEV_STATUS__X(18, WDEV_DISCONNECT_FAILURE           /*!< Bridge failed to disconnect */)\
    WDEV_STATUS__X(19, WDEV_WIFI_ADDRESS_NOT_FOUND       /*!< Could not determine the device Wi-Fi address */)\
    WDEV_STATUS__X(20, WDEV_INVALID_CONFIG               /*!< Preference file is malformed */)\
    WDEV_STATUS__X(21, WDEV_ABORTED_BY_USER              /*!< Interactive input was closed by the user */)\
    WDEV_STATUS__X(22, WDEV_NO_DEVICES                   /*!< No suitable device is connected */)\
    WDEV_STATUS__X(23, WDEV_EXTERNAL_COMMAND_FAILED      /*!< An external program exited with a non-zero code */)\

typedef enum {
#define WDEV_STATUS__X(value, name) name = value,
    WDEV_STATUS_VARIABLES
#undef WDEV_STATUS__X

    /** Must be last! */
    WDEV_STATUS_COUNT,

    /** Max enum value to maintain ABI Integrity */
    WDEV_STATUS_MAX_ENUM                       = WDEV_MAX_ENUM
} wdev_status;

/** wireless-dev version */
typedef struct {
    uint32_t major;
    uint32_t minor;
    uint32_t revision;
} wdev_version_t;

/** @} */ // end of group_defines

/**
 * Returns the library version.
 *
 * @param[out] version      Filled with the libwdev version.
 * @return Upon success, returns ::WDEV_SUCCESS. Otherwise, returns a ::wdev_status error.
 */
wdev_status wdev_get_library_version(wdev_version_t *version);

/**
 * Returns a string of the status name, or NULL for an invalid status.
 */
const char* wdev_get_status_message(wdev_status status);

#ifdef __cplusplus
}
#endif

#endif /* _WDEV_H_ */
