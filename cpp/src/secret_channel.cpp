/**
 * @file secret_channel.cpp
 * @brief Implementation of the secret message pipeline
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/secret_channel.hpp"
#include "secretchat/secure_config.hpp"
#include "secretchat/utilities.hpp"

#include <utility>

namespace secretchat {

SecretChannel::SecretChannel(ConsentStateMachine& consent)
    : consent_(consent)
{
}

SecretChannel::SecretChannel(ConsentStateMachine& consent, MessageCipher cipher)
    : consent_(consent)
    , cipher_(std::move(cipher))
{
}

SecretChannel::~SecretChannel() {
    forget_all();
}

// ============================================================================
// Shared Secret Cache
// ============================================================================

Result<SharedSecret> SecretChannel::secret_for(const Conversation& conversation) {
    auto peer_key = ConsentStateMachine::peer_public_key(conversation, consent_.local_user_id());

    auto local_key = consent_.local_public_key(conversation.conversation_id);
    if (!local_key) {
        forget(conversation.conversation_id);
        return local_key.failure();
    }
    if (!local_key->has_value()) {
        forget(conversation.conversation_id);
        return consent_.shared_secret(conversation);
    }

    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(conversation.conversation_id);
        if (it != cache_.end() && peer_key && it->second.peer_public_key == *peer_key &&
            it->second.local_public_key == **local_key) {
            return Result<SharedSecret>::ok(it->second.secret);
        }
    }

    auto secret = consent_.shared_secret(conversation);
    if (!secret) {
        return secret;
    }

    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.erase(conversation.conversation_id);
    cache_.emplace(conversation.conversation_id, CachedSecret{*peer_key, **local_key, *secret});
    return secret;
}

void SecretChannel::forget(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.erase(conversation_id);
}

void SecretChannel::forget_all() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

// ============================================================================
// Outgoing
// ============================================================================

Result<std::string> SecretChannel::prepare_outgoing(const Conversation& conversation,
                                                    const std::string& plaintext) {
    if (!conversation.is_secret()) {
        return Result<std::string>::ok(plaintext);
    }

    ConsentState state = ConsentStateMachine::observe(conversation);
    if (state != ConsentState::ACCEPTED) {
        return Result<std::string>::fail(SecretError::CONSENT_PENDING,
            std::string("secret conversation is ") + to_string(state) + ", not ACCEPTED");
    }

    auto secret = secret_for(conversation);
    if (!secret) {
        return secret.failure();
    }

    return cipher_.encrypt(*secret, plaintext);
}

Result<ChatMessage> SecretChannel::send(const Conversation& conversation, const std::string& plaintext) {
    auto content = prepare_outgoing(conversation, plaintext);
    if (!content) {
        return content.failure();
    }

    return consent_.chat_service().send_message(conversation.conversation_id,
                                                consent_.local_user_id(), *content);
}

// ============================================================================
// History
// ============================================================================

std::future<std::vector<DisplayMessage>> SecretChannel::decrypt_history(
    const Conversation& conversation,
    std::vector<ChatMessage> messages
) {
    bool secret_conversation = conversation.is_secret();

    std::optional<SharedSecret> secret;
    if (secret_conversation) {
        auto derived = secret_for(conversation);
        if (derived) {
            secret = *derived;
        } else {
            utilities::log_warn("SecretChannel: no key for " + conversation.conversation_id +
                                " (" + to_string(derived.error()) + "), history shown as undecryptable");
        }
    }

    MessageCipher cipher = cipher_;

    return std::async(std::launch::async,
        [cipher, secret_conversation, secret = std::move(secret), messages = std::move(messages)]() {
            std::vector<DisplayMessage> display;
            display.reserve(messages.size());

            for (const auto& message : messages) {
                DisplayMessage entry{message, message.content, DisplayStatus::PASS_THROUGH};

                if (secret_conversation) {
                    if (secret) {
                        DisplayContent content = cipher.open_for_display(*secret, message.content);
                        entry.text = std::move(content.text);
                        entry.status = content.status;
                    } else if (MessageCipher::is_ciphertext_candidate(message.content)) {
                        entry.text = security::UNDECRYPTABLE_PLACEHOLDER;
                        entry.status = DisplayStatus::UNDECRYPTABLE;
                    }
                }

                display.push_back(std::move(entry));
            }

            return display;
        });
}

std::string SecretChannel::preview(const Conversation& conversation,
                                   const std::optional<ChatMessage>& last_message) {
    if (conversation.is_secret()) {
        return security::SECRET_PREVIEW_TEXT;
    }
    return last_message ? last_message->content : "";
}

} // namespace secretchat
