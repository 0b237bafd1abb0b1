#pragma once

#include <stdint.h>
#include <stddef.h>
#include <stdbool.h>

#ifdef __cplusplus
extern "C" {
#endif

#if defined(_WIN32) || defined(_WIN64)
    //  Microsoft
    #define EXPORT __declspec(dllexport)
    #define IMPORT __declspec(dllimport)
#elif defined(__GNUC__)
    //  GCC
    #define EXPORT __attribute__((visibility("default")))
    #define IMPORT
#else
    //  do nothing and hope for the best?
    #define EXPORT
    #define IMPORT
    #pragma warning Unknown dynamic link import / export semantics.
#endif

#ifdef CHMD_FINDER_BUILD_STATIC
    #define CHMD_FINDER_API
#else
    #ifdef CHMD_FINDER_BUILD_DYNAMIC
        #define CHMD_FINDER_API EXPORT
    #else
        #define CHMD_FINDER_API IMPORT
    #endif // CHMD_FINDER_BUILD_DYNAMIC
#endif // CHMD_FINDER_BUILD_STATIC

typedef enum _hmd_error_t {
    hmd_error_success = 0,
    hmd_error_invalid_parameter,
    hmd_error_invalid_device,
    hmd_error_internal_error,
    hmd_error_memory,
    hmd_error_no_more_devices,
    hmd_error_none,

    // Keep this at the end
    hmd_error__maxvalue,
} _hmd_error_t;
typedef uint32_t hmd_error_t;

/// Headset family
typedef enum _hmd_type_t {
    hmd_type_unknown,
    hmd_type_vive,
    hmd_type_valve_index,
    hmd_type_bigscreen_beyond,
} _hmd_type_t;
typedef uint32_t hmd_type_t;

/// Which node of a headset a query refers to
typedef enum _hmd_node_t {
    /// The node whose signature identified the headset
    hmd_node_id,
    /// The hub at the root of the headset assembly
    hmd_node_root,

    // Keep this at the end
    hmd_node__maxvalue,
} _hmd_node_t;
typedef uint32_t hmd_node_t;

typedef enum _hmd_stringtype_t {
    hmd_stringtype_name, // "<manufacturer> <product>"
    hmd_stringtype_serial,
    hmd_stringtype_manufacturer,
    hmd_stringtype_product,
    hmd_stringtype_class, // "USB-Hub", "Device" or "Unknown"
    hmd_stringtype_type, // Headset type name, headsets only
    hmd_stringtype_raw, // Internal system path of the USB device

    // Keep this at the end
    hmd_stringtype__maxvalue,
} _hmd_stringtype_t;
typedef uint32_t hmd_stringtype_t;

typedef enum _hmd_inttype_t {
    hmd_inttype_vid,
    hmd_inttype_pid,
    hmd_inttype_bus,
    hmd_inttype_address,
    hmd_inttype_port,

    // Keep this at the end
    hmd_inttype__maxvalue,
} _hmd_inttype_t;
typedef uint32_t hmd_inttype_t;

/**
 * @brief Opaque type for a headset found on the host.
 *
 * The C API keeps every handle it hands out in an internal list until
 * hmd_device_free is called. The list is not synchronized, use the C API
 * from one thread at a time.
 */
typedef struct hmd_device_t hmd_device_t;

/**
 * @brief Finds all supported headsets.
 *
 * Every call returns new handles, handles from earlier calls stay valid until freed.
 *
 * @param[out] devices Pointer to an array of hmd_device_t pointers that will be filled with the found headsets.
 * @param[in,out] count Size of the devices array on input, number of headsets stored on output.
 * @param[out] error_message Buffer for an error message if the operation fails.
 * @param[in,out] error_message_size Size of the error_message buffer, length written on output.
 *
 * @return hmd_error_t
 *
 * @see hmd_device_free
 */
CHMD_FINDER_API hmd_error_t hmd_device_find_all(
    hmd_device_t** devices,
    uint32_t* count,
    char* const error_message,
    uint32_t* error_message_size
);

/**
 * @brief Checks if a headset handle is valid.
 *
 * @param device Pointer to the hmd_device_t to be checked.
 *
 * @return true if the handle was returned by hmd_device_find_all and not freed yet.
 */
CHMD_FINDER_API bool hmd_device_is_valid(hmd_device_t* device);

/**
 * @brief Frees headset handles.
 *
 * @param devices Array of hmd_device_t pointers to be freed, entries are set to NULL.
 * @param count   The number of devices in the array.
 */
CHMD_FINDER_API hmd_error_t hmd_device_free(hmd_device_t** devices, uint32_t count);

/**
 * @brief Retrieves a string value from a headset.
 *
 * @param device     Headset handle.
 * @param node       Node of the headset to query.
 * @param str_type   The type of string to retrieve.
 * @param value      Buffer where the string will be stored.
 * @param value_size Size of the buffer on input, length written including the terminator on output.
 *
 * @return hmd_error_success on success, hmd_error_none if the node has no such string.
 */
CHMD_FINDER_API hmd_error_t hmd_device_get_str(
    hmd_device_t* device,
    hmd_node_t node,
    hmd_stringtype_t str_type,
    char* const value,
    uint32_t* value_size
);

/**
 * @brief Retrieves an integer value from a headset.
 *
 * @param device   Headset handle.
 * @param node     Node of the headset to query.
 * @param int_type The type of integer to retrieve (e.g., VID, PID, bus).
 * @param value    Pointer to a uint32_t where the value will be stored.
 *
 * @return hmd_error_success on success, hmd_error_none if the node has no record.
 */
CHMD_FINDER_API hmd_error_t hmd_device_get_int(
    hmd_device_t* device,
    hmd_node_t node,
    hmd_inttype_t int_type,
    uint32_t* value
);

/**
 * @brief Retrieves the headset type.
 *
 * @param device   Headset handle.
 * @param hmd_type Pointer to a hmd_type_t where the type will be stored.
 *
 * @return hmd_error_success on success, hmd_error_invalid_parameter if a pointer is NULL.
 */
CHMD_FINDER_API hmd_error_t hmd_device_get_type(hmd_device_t* device, hmd_type_t* hmd_type);

/**
 * @brief Retrieves the name of a headset type.
 *
 * @param hmd_type Headset type.
 * @param name[out] Buffer where the name will be stored.
 * @param name_size[in,out] Size of the name buffer, length written on output.
 *
 * @return hmd_error_success on success, or an error code on failure.
 */
CHMD_FINDER_API hmd_error_t
hmd_device_get_type_name(hmd_type_t hmd_type, char* const name, uint32_t* name_size);

/**
 * @brief Get the unique ID of the headset, derived from its bus and root port chain.
 *
 * @param device Headset handle.
 * @param unique_id Pointer to a uint64_t that will be set to the unique ID.
 *
 * @return hmd_error_success on success, hmd_error_invalid_parameter if a pointer is NULL.
 */
CHMD_FINDER_API hmd_error_t hmd_device_unique_id(hmd_device_t* device, uint64_t* unique_id);

/**
 * @brief Retrieves the port chain of the headset root.
 *
 * @param device Headset handle.
 * @param port_chain Buffer where the port chain will be stored.
 * @param port_chain_size Number of entries in the buffer on input, ports written on output.
 *
 * @return hmd_error_success on success, hmd_error_memory if the buffer is too small.
 */
CHMD_FINDER_API hmd_error_t hmd_device_get_port_chain(
    hmd_device_t* device,
    uint32_t* port_chain,
    uint32_t* port_chain_size
);

/**
 * @brief Begins iterating over the wireless receivers attached below the headset root.
 *
 * @param device Headset handle.
 *
 * @return hmd_error_success if there is at least one receiver, hmd_error_no_more_devices otherwise.
 *
 * @see hmd_dongle_next
 * @see hmd_dongle_get_str
 * @see hmd_dongle_get_int
 */
CHMD_FINDER_API hmd_error_t hmd_dongle_begin(hmd_device_t* device);

/**
 * @brief Moves to the next wireless receiver.
 *
 * @param device Headset handle.
 *
 * @return hmd_error_success on success, hmd_error_no_more_devices past the last receiver.
 */
CHMD_FINDER_API hmd_error_t hmd_dongle_next(hmd_device_t* device);

/**
 * @brief Provides the count of wireless receivers attached below the headset root.
 *
 * @param device Headset handle.
 * @param count[out] Number of receivers.
 *
 * @return hmd_error_success on success, or an error code on failure.
 */
CHMD_FINDER_API hmd_error_t hmd_dongle_count(hmd_device_t* device, uint32_t* count);

/**
 * @brief Retrieves a string value from the current wireless receiver.
 *
 * @param device     Headset handle.
 * @param str_type   The type of string to retrieve (e.g., serial).
 * @param value      Buffer where the string will be stored.
 * @param value_size Size of the buffer on input, length written including the terminator on output.
 *
 * @return hmd_error_success on success, or an error code on failure.
 */
CHMD_FINDER_API hmd_error_t hmd_dongle_get_str(
    hmd_device_t* device,
    hmd_stringtype_t str_type,
    char* const value,
    uint32_t* value_size
);

/**
 * @brief Retrieves an integer value from the current wireless receiver.
 *
 * @param device   Headset handle.
 * @param int_type The type of integer to retrieve (e.g., VID, PID, port).
 * @param value    Pointer to a uint32_t where the value will be stored.
 *
 * @return hmd_error_success on success, or an error code on failure.
 */
CHMD_FINDER_API hmd_error_t
hmd_dongle_get_int(hmd_device_t* device, hmd_inttype_t int_type, uint32_t* value);

#ifdef __cplusplus
}
#endif
