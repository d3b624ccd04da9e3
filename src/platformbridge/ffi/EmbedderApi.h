#ifndef PLATFORMBRIDGE_FFI_EMBEDDER_API_H
#define PLATFORMBRIDGE_FFI_EMBEDDER_API_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Opaque per-message reply token owned by the engine. */
typedef struct PBResponseToken PBResponseToken;

/* Answers an inbound message. Called at most once per token. */
typedef void (*PBSendResponseFn)(void* engine_user_data,
                                 const PBResponseToken* token,
                                 const uint8_t* data,
                                 size_t size);

/* Sends a native-initiated message. Returns 0 when the engine accepted it.
 * A correlation id of 0 means no reply is expected; otherwise the engine
 * answers later through PBPlatformMessageReplyCallback with the same id. */
typedef int (*PBSendMessageFn)(void* engine_user_data,
                               const char* channel,
                               size_t channel_size,
                               const uint8_t* data,
                               size_t size,
                               uint64_t correlation_id);

typedef struct PBEngineOutbound {
    void*            engine_user_data;
    PBSendResponseFn send_response;
    PBSendMessageFn  send_message;
} PBEngineOutbound;

/* Inbound platform message. user_data is the PB::PlatformBridge instance.
 * token is null for fire-and-forget messages. Buffers are borrowed for the
 * duration of the call. */
void PBPlatformMessageCallback(const char* channel,
                               size_t channel_size,
                               const uint8_t* message,
                               size_t message_size,
                               const PBResponseToken* token,
                               void* user_data);

/* Reply to a message sent through PBSendMessageFn. Null data is an empty reply. */
void PBPlatformMessageReplyCallback(uint64_t correlation_id,
                                    const uint8_t* data,
                                    size_t size,
                                    void* user_data);

#ifdef __cplusplus
}
#endif

#endif /* PLATFORMBRIDGE_FFI_EMBEDDER_API_H */
