/**
 * @file chat_service.cpp
 * @brief In-process chat backend
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/chat_service.hpp"
#include "secretchat/key_material.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

namespace secretchat {

namespace {

Failure not_found(const std::string& conversation_id) {
    return Failure{SecretError::CONVERSATION_NOT_FOUND,
                   "Conversation not found: " + conversation_id.substr(0, 80)};
}

} // namespace

// ============================================================================
// Conversations
// ============================================================================

Result<Conversation> InMemoryChatService::create_conversation(
    const CreateConversationRequest& request,
    const std::string& creator_user_id
) {
    if (!security::validate_identifier(creator_user_id)) {
        return Result<Conversation>::fail(SecretError::INVALID_IDENTIFIER, "invalid creator id");
    }

    auto valid = request.validate();
    if (!valid) {
        utilities::log_warn("ChatService: rejected create from " + creator_user_id + ": " + valid.message());
        return valid.failure();
    }

    uint64_t now = utilities::current_timestamp();

    Conversation conversation;
    conversation.conversation_id = utilities::generate_uuid();
    conversation.type = request.type;
    conversation.subtype = request.subtype;
    conversation.name = request.name;
    conversation.created_at = now;

    auto add_member = [&](const std::string& user_id) {
        if (conversation.find_member(user_id)) {
            return;
        }
        ConversationMember member;
        member.conversation_id = conversation.conversation_id;
        member.user_id = user_id;
        member.joined_at = now;
        // Invitee keys in the request are ignored; only the creator may carry one
        if (conversation.is_secret() && user_id == creator_user_id) {
            member.public_key = request.public_key;
        }
        conversation.members.push_back(std::move(member));
    };

    for (const auto& invite : request.user_ids) {
        add_member(invite.user_id);
    }
    add_member(creator_user_id);

    std::lock_guard<std::mutex> lock(mutex_);
    conversations_[conversation.conversation_id] = conversation;

    utilities::log_info("ChatService: created " + ConversationHelpers::type_to_string(conversation.type) +
                        " conversation " + conversation.conversation_id + " by " + creator_user_id);
    return Result<Conversation>::ok(std::move(conversation));
}

Result<Conversation> InMemoryChatService::accept_secret_conversation(
    const AcceptSecretRequest& request,
    const std::string& user_id
) {
    if (!PublicKey::from_hex(request.public_key)) {
        return Result<Conversation>::fail(SecretError::INVALID_PEER_KEY,
                                          "public key is not 64 hex characters");
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conversations_.find(request.conversation_id);
    if (it == conversations_.end()) {
        return not_found(request.conversation_id);
    }

    Conversation& conversation = it->second;

    if (!conversation.is_secret()) {
        return Result<Conversation>::fail(SecretError::NOT_SECRET_CONVERSATION,
                                          "Not a secret private conversation");
    }

    ConversationMember* member = conversation.find_member(user_id);
    if (!member) {
        return Result<Conversation>::fail(SecretError::NOT_A_MEMBER,
                                          "You are not a member of this conversation");
    }

    if (member->has_public_key()) {
        return Result<Conversation>::fail(SecretError::PUBLIC_KEY_CONFLICT, "Pubkey already set");
    }

    member->public_key = request.public_key;

    utilities::log_info("ChatService: " + user_id + " accepted secret conversation " +
                        conversation.conversation_id);
    return Result<Conversation>::ok(conversation);
}

Result<Unit> InMemoryChatService::leave_conversation(
    const std::string& conversation_id,
    const std::string& user_id
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }

    auto& members = it->second.members;
    for (auto member = members.begin(); member != members.end(); ++member) {
        if (member->user_id == user_id) {
            members.erase(member);
            utilities::log_info("ChatService: " + user_id + " left conversation " + conversation_id);
            return Result<Unit>::ok(Unit{});
        }
    }

    return Result<Unit>::fail(SecretError::NOT_A_MEMBER, "You are not a member of this conversation");
}

Result<Conversation> InMemoryChatService::get_conversation(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }
    return Result<Conversation>::ok(it->second);
}

std::vector<Conversation> InMemoryChatService::list_conversations(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Conversation> result;
    for (const auto& entry : conversations_) {
        if (entry.second.find_member(user_id)) {
            result.push_back(entry.second);
        }
    }
    return result;
}

// ============================================================================
// Messages
// ============================================================================

Result<ChatMessage> InMemoryChatService::send_message(
    const std::string& conversation_id,
    const std::string& sender_id,
    const std::string& content
) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }
    if (!it->second.find_member(sender_id)) {
        return Result<ChatMessage>::fail(SecretError::NOT_A_MEMBER,
                                         "User is not a member of this conversation");
    }

    ChatMessage message;
    message.message_id = utilities::generate_uuid();
    message.conversation_id = conversation_id;
    message.sender_id = sender_id;
    message.content = content;
    message.sent_at = utilities::current_timestamp();

    // Appended in arrival order, so history stays oldest first
    messages_[conversation_id].push_back(message);
    return Result<ChatMessage>::ok(std::move(message));
}

Result<std::vector<ChatMessage>> InMemoryChatService::get_messages(
    const std::string& conversation_id,
    const std::string& user_id
) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return not_found(conversation_id);
    }
    if (!it->second.find_member(user_id)) {
        return Result<std::vector<ChatMessage>>::fail(SecretError::NOT_A_MEMBER,
                                                      "User is not a member of this conversation");
    }

    auto messages = messages_.find(conversation_id);
    if (messages == messages_.end()) {
        return Result<std::vector<ChatMessage>>::ok({});
    }
    return Result<std::vector<ChatMessage>>::ok(messages->second);
}

} // namespace secretchat
