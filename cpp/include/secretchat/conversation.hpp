/**
 * @file conversation.hpp
 * @brief Conversation, member and message records plus request bodies
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Field names on the wire follow the chat service API: "pubkey",
 * "user_ids", "subtype", "last_read_message_id".
 */

#pragma once

#include "secretchat/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace secretchat {

/**
 * @brief Conversation type
 */
enum class ConversationType {
    PRIVATE,    ///< Two participants
    GROUP       ///< Named multi-participant conversation
};

/**
 * @brief Private conversation subtype (NONE for groups)
 */
enum class ConversationSubtype {
    NONE,
    NORMAL,     ///< Plaintext content
    SECRET      ///< End-to-end encrypted content
};

/**
 * @brief Membership record; public_key is the consent signal
 */
struct ConversationMember {
    std::string conversation_id;
    std::string user_id;
    std::optional<std::string> public_key;           ///< Hex X25519 key, set on accept
    std::optional<std::string> last_read_message_id;
    uint64_t joined_at = 0;                          ///< Unix timestamp (seconds)

    bool has_public_key() const { return public_key.has_value() && !public_key->empty(); }
};

/**
 * @brief Conversation with its members
 */
struct Conversation {
    std::string conversation_id;
    ConversationType type = ConversationType::PRIVATE;
    ConversationSubtype subtype = ConversationSubtype::NONE;
    std::optional<std::string> name;
    uint64_t created_at = 0;
    std::vector<ConversationMember> members;

    /**
     * @brief True for private conversations with the secret subtype
     */
    bool is_secret() const;

    const ConversationMember* find_member(const std::string& user_id) const;
    ConversationMember* find_member(const std::string& user_id);

    std::string to_json() const;
    static std::optional<Conversation> from_json(const std::string& json);
};

/**
 * @brief Stored chat message; content is opaque (plaintext or wire payload)
 */
struct ChatMessage {
    std::string message_id;
    std::string conversation_id;
    std::string sender_id;
    std::string content;
    uint64_t sent_at = 0;

    std::string to_json() const;
    static std::optional<ChatMessage> from_json(const std::string& json);
};

/**
 * @brief Invited user entry in a creation request
 */
struct MemberInvite {
    std::string user_id;
    std::optional<std::string> public_key;
};

/**
 * @brief Body of POST /conversations
 */
struct CreateConversationRequest {
    ConversationType type = ConversationType::PRIVATE;
    std::optional<std::string> name;
    std::vector<MemberInvite> user_ids;     ///< Invitees; the creator is added by the service
    ConversationSubtype subtype = ConversationSubtype::NONE;
    std::optional<std::string> public_key;  ///< Creator's key for secret conversations

    /**
     * @brief Check shape rules
     *
     * - private: subtype required, name forbidden
     * - group: name required, subtype forbidden
     * - creator key only on private secret conversations, where it is required
     *
     * @return InvalidConversation, InvalidIdentifier or InvalidPeerKey on violation
     */
    Result<Unit> validate() const;

    std::string to_json() const;
    static std::optional<CreateConversationRequest> from_json(const std::string& json);
};

/**
 * @brief Body of POST /conversations/accept-secret
 */
struct AcceptSecretRequest {
    std::string conversation_id;
    std::string public_key;

    std::string to_json() const;
    static std::optional<AcceptSecretRequest> from_json(const std::string& json);
};

/**
 * @brief String conversions for conversation enums
 */
class ConversationHelpers {
public:
    static std::string type_to_string(ConversationType type);
    static std::optional<ConversationType> string_to_type(const std::string& str);

    /// NONE maps to an empty string (null on the wire)
    static std::string subtype_to_string(ConversationSubtype subtype);
    static std::optional<ConversationSubtype> string_to_subtype(const std::string& str);
};

} // namespace secretchat
