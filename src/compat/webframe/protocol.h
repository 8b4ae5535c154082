#pragma once

#ifdef __cplusplus
extern "C"
{
#endif

#include "types.h"

    typedef struct webframe_header
    {
        const char *name;
        const char *value;
    } webframe_header;

    typedef struct webframe_protocol_request
    {
        const char *url;
        const char *method;
        const webframe_header *headers;
        size_t header_count;
        const uint8_t *body;
        size_t body_length;
        uint64_t window_id;
    } webframe_protocol_request;

    typedef struct webframe_protocol_response
    {
        /** 0 is treated as 200. */
        uint16_t status;
        /** Null is treated as `application/octet-stream`. */
        const char *mime_type;
        const webframe_header *headers;
        size_t header_count;
        const uint8_t *body;
        size_t body_length;
        /** Called once the response has been copied, if set. */
        void (*release)(void *user_data);
        void *release_user_data;
    } webframe_protocol_response;

    /**
     * @brief Fills @p response for @p request. Returning false answers the request with 404.
     * @note May be invoked on a thread other than the loop thread.
     */
    typedef bool (*webframe_protocol_handler)(const webframe_protocol_request *request,
                                              webframe_protocol_response *response, void *user_data);

    /**
     * @brief Routes `scheme://` requests of every window created afterwards to @p handler.
     */
    WEBFRAME_EXPORT webframe_result webframe_register_protocol(webframe_app *app, const char *scheme,
                                                               webframe_protocol_handler handler, void *user_data);

    WEBFRAME_EXPORT bool webframe_unregister_protocol(webframe_app *app, const char *scheme);

#ifdef __cplusplus
}
#endif
