#pragma once

#ifdef __cplusplus
extern "C" {
#endif

// Opaque handle owning a provisioning manager and its request API
typedef struct WifiprovManager WifiprovManager;

// Device mode for C API
typedef enum {
    WIFIPROV_MODE_HOTSPOT = 0,
    WIFIPROV_MODE_CLIENT_CONNECTING = 1,
    WIFIPROV_MODE_CLIENT_CONNECTED = 2,
    WIFIPROV_MODE_UNKNOWN = 3
} WifiprovMode;

// Create a manager configured from the process environment.
// Returns NULL if the configuration is invalid.
WifiprovManager* wifiprov_manager_new(void);

// Delete a manager; waits for a running connection attempt to finish
void wifiprov_manager_delete(WifiprovManager* manager);

// Run boot mode selection once, at process start
WifiprovMode wifiprov_manager_boot(WifiprovManager* manager);

/**
 * Handle one API request, e.g. ("POST", "/wifi/connect", "{\"ssid\":\"Home\"}").
 *
 * @param manager The manager instance
 * @param method HTTP method name
 * @param path Request path, optionally prefixed with /api
 * @param body Request body, may be NULL
 * @param http_status Receives the HTTP status for the response, may be NULL
 * @return JSON envelope {success, message, data}; release with wifiprov_free_string.
 *         NULL only if manager, method or path is NULL.
 * @note Connect requests block until the attempt sequence has finished
 */
char* wifiprov_handle_request(WifiprovManager* manager, const char* method, const char* path,
                              const char* body, int* http_status);

// Free a string returned by wifiprov_handle_request
void wifiprov_free_string(char* str);

#ifdef __cplusplus
}
#endif
