/**
 * @file chat_service.hpp
 * @brief Boundary to the chat backend and an in-process implementation
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * The secret conversation core only needs conversation creation, key
 * submission on accept, leaving, lookup and opaque message storage. Transport
 * and persistence behind this interface belong to the chat backend.
 */

#pragma once

#include "secretchat/conversation.hpp"
#include "secretchat/result.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace secretchat {

/**
 * @brief ChatService - conversations and messages as seen by the client
 */
class ChatService {
public:
    virtual ~ChatService() = default;

    /**
     * @brief Create a conversation; the creator is added as a member
     * @param request Creation body (validated by the service)
     * @param creator_user_id Authenticated caller
     * @return Created conversation with members
     */
    virtual Result<Conversation> create_conversation(
        const CreateConversationRequest& request,
        const std::string& creator_user_id
    ) = 0;

    /**
     * @brief Attach the caller's public key to their member record
     * @return Updated conversation
     */
    virtual Result<Conversation> accept_secret_conversation(
        const AcceptSecretRequest& request,
        const std::string& user_id
    ) = 0;

    /**
     * @brief Remove the caller's membership
     */
    virtual Result<Unit> leave_conversation(
        const std::string& conversation_id,
        const std::string& user_id
    ) = 0;

    virtual Result<Conversation> get_conversation(const std::string& conversation_id) const = 0;

    /**
     * @brief Store a message; content is kept exactly as given
     */
    virtual Result<ChatMessage> send_message(
        const std::string& conversation_id,
        const std::string& sender_id,
        const std::string& content
    ) = 0;

    /**
     * @brief Messages visible to user_id, oldest first
     */
    virtual Result<std::vector<ChatMessage>> get_messages(
        const std::string& conversation_id,
        const std::string& user_id
    ) const = 0;
};

/**
 * @brief InMemoryChatService - applies the chat backend's rules in process
 *
 * - creation requests must pass CreateConversationRequest::validate()
 * - only the creator's member record receives the creator key, and only for
 *   private secret conversations
 * - accept requires a private secret conversation, membership and an unset key
 */
class InMemoryChatService : public ChatService {
public:
    InMemoryChatService() = default;
    ~InMemoryChatService() override = default;

    InMemoryChatService(const InMemoryChatService&) = delete;
    InMemoryChatService& operator=(const InMemoryChatService&) = delete;

    Result<Conversation> create_conversation(
        const CreateConversationRequest& request,
        const std::string& creator_user_id
    ) override;

    Result<Conversation> accept_secret_conversation(
        const AcceptSecretRequest& request,
        const std::string& user_id
    ) override;

    Result<Unit> leave_conversation(
        const std::string& conversation_id,
        const std::string& user_id
    ) override;

    Result<Conversation> get_conversation(const std::string& conversation_id) const override;

    Result<ChatMessage> send_message(
        const std::string& conversation_id,
        const std::string& sender_id,
        const std::string& content
    ) override;

    Result<std::vector<ChatMessage>> get_messages(
        const std::string& conversation_id,
        const std::string& user_id
    ) const override;

    /**
     * @brief Conversations user_id belongs to (sidebar listing)
     */
    std::vector<Conversation> list_conversations(const std::string& user_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Conversation> conversations_;
    std::map<std::string, std::vector<ChatMessage>> messages_;
};

} // namespace secretchat
