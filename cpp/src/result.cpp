/**
 * @file result.cpp
 * @brief SecretError string conversion
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/result.hpp"

namespace secretchat {

const char* to_string(SecretError error) {
    switch (error) {
        case SecretError::ENTROPY_UNAVAILABLE:     return "EntropyUnavailable";
        case SecretError::STORAGE_UNAVAILABLE:     return "StorageUnavailable";
        case SecretError::INVALID_PEER_KEY:        return "InvalidPeerKey";
        case SecretError::DECRYPTION_FAILED:       return "DecryptionFailed";
        case SecretError::INVALID_KEY_LENGTH:      return "InvalidKeyLength";
        case SecretError::MESSAGE_TOO_LARGE:       return "MessageTooLarge";
        case SecretError::CONSENT_PENDING:         return "ConsentPending";
        case SecretError::LOCAL_KEY_MISSING:       return "LocalKeyMissing";
        case SecretError::INVALID_CONVERSATION:    return "InvalidConversation";
        case SecretError::CONVERSATION_NOT_FOUND:  return "ConversationNotFound";
        case SecretError::NOT_SECRET_CONVERSATION: return "NotSecretConversation";
        case SecretError::NOT_A_MEMBER:            return "NotAMember";
        case SecretError::PUBLIC_KEY_CONFLICT:     return "PublicKeyConflict";
        case SecretError::INVALID_IDENTIFIER:      return "InvalidIdentifier";
        default:                                   return "Unknown";
    }
}

} // namespace secretchat
