/**
 * @file c_api_basic_usage.cpp
 * @brief Basic example demonstrating how to use the hmdfinder C API
 *
 * This example shows how to:
 * - Find all connected headsets using the C API
 * - Display headset information
 * - Iterate over the wireless receivers of each headset
 * - Handle errors properly
 */

#include <chmdfinder.h>
#include <stdio.h>
#include <string.h>

int main(void) {
    printf("HMD Finder C API Example\n");
    printf("========================\n\n");

    char error_message[256] = { 0 };
    uint32_t error_message_size = sizeof(error_message);
    hmd_device_t* devices[16] = { 0 };
    uint32_t device_count = 16;

    // Find all headsets
    hmd_error_t err =
        hmd_device_find_all(devices, &device_count, error_message, &error_message_size);

    if (err != hmd_error_success) {
        fprintf(stderr, "Failed to find headsets: %s\n", error_message);
        return 1;
    }

    printf("Found %u headset(s):\n\n", device_count);

    for (uint32_t i = 0; i < device_count; ++i) {
        if (!hmd_device_is_valid(devices[i])) {
            printf("Headset %u: Invalid device!\n", i + 1);
            continue;
        }

        char name[128] = { 0 };
        uint32_t name_size = sizeof(name);
        err = hmd_device_get_str(devices[i], hmd_node_id, hmd_stringtype_name, name, &name_size);
        if (err != hmd_error_success) {
            printf("Headset %u: Failed to get name\n", i + 1);
            continue;
        }

        char type_name[64] = { 0 };
        uint32_t type_name_size = sizeof(type_name);
        err = hmd_device_get_str(
            devices[i],
            hmd_node_id,
            hmd_stringtype_type,
            type_name,
            &type_name_size
        );
        if (err != hmd_error_success) {
            printf("Headset %u: Failed to get type\n", i + 1);
            continue;
        }

        uint32_t bus = 0;
        err = hmd_device_get_int(devices[i], hmd_node_id, hmd_inttype_bus, &bus);
        if (err != hmd_error_success) {
            printf("Headset %u: Failed to get bus\n", i + 1);
            continue;
        }

        printf("Headset %u: %s\n", i + 1, name);
        printf("  Type: %s\n", type_name);
        printf("  Bus: %u\n", bus);

        uint32_t port_chain[8] = { 0 };
        uint32_t port_chain_size = sizeof(port_chain) / sizeof(port_chain[0]);
        if (hmd_device_get_port_chain(devices[i], port_chain, &port_chain_size)
            == hmd_error_success)
        {
            printf("  Root port chain:");
            for (uint32_t p = 0; p < port_chain_size; ++p) {
                printf(" %u", port_chain[p]);
            }
            printf("\n");
        }

        uint32_t dongle_count = 0;
        err = hmd_dongle_count(devices[i], &dongle_count);
        if (err != hmd_error_success) {
            printf("  Failed to get dongle count\n");
            continue;
        }
        printf("  Dongles: %u\n", dongle_count);

        // Iterate the receivers
        if (hmd_dongle_begin(devices[i]) == hmd_error_success) {
            uint32_t j = 0;
            do {
                char serial[64] = { 0 };
                uint32_t serial_size = sizeof(serial);
                uint32_t pid = 0, port = 0;
                if (hmd_dongle_get_str(devices[i], hmd_stringtype_serial, serial, &serial_size)
                        != hmd_error_success
                    || hmd_dongle_get_int(devices[i], hmd_inttype_pid, &pid) != hmd_error_success
                    || hmd_dongle_get_int(devices[i], hmd_inttype_port, &port) != hmd_error_success)
                {
                    printf("    Dongle %u: Failed to get information\n", j + 1);
                } else {
                    printf("    Dongle %u: %s (PID: 0x%04X, Port: %u)\n", j + 1, serial, pid, port);
                }
                ++j;
            } while (hmd_dongle_next(devices[i]) == hmd_error_success);
        }

        printf("\n");
    }

    // Free the devices
    if (device_count > 0) {
        err = hmd_device_free(devices, device_count);
        if (err != hmd_error_success) {
            fprintf(stderr, "Failed to free devices\n");
        }
    }

    return 0;
}
