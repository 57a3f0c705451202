/**
 * @file secret_channel.hpp
 * @brief Message pipeline glue between consent, key agreement and the cipher
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * History is decrypted in two phases: the caller loads the stored messages,
 * then one asynchronous transform decrypts the whole batch in order. Render
 * the finished list only; a single bad message never blocks the others.
 */

#pragma once

#include "secretchat/consent_state_machine.hpp"
#include "secretchat/conversation.hpp"
#include "secretchat/key_material.hpp"
#include "secretchat/message_cipher.hpp"
#include "secretchat/result.hpp"

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace secretchat {

/**
 * @brief Message ready for rendering
 */
struct DisplayMessage {
    ChatMessage message;        ///< Stored record (content is the wire value)
    std::string text;           ///< What to show
    DisplayStatus status;
};

/**
 * @brief SecretChannel - encrypts outgoing and decrypts incoming content
 */
class SecretChannel {
public:
    explicit SecretChannel(ConsentStateMachine& consent);
    SecretChannel(ConsentStateMachine& consent, MessageCipher cipher);

    /**
     * @brief Zeroes every cached shared secret
     */
    ~SecretChannel();

    SecretChannel(const SecretChannel&) = delete;
    SecretChannel& operator=(const SecretChannel&) = delete;

    /**
     * @brief Content to send for plaintext
     *
     * Normal conversations pass through. Secret conversations must be
     * ACCEPTED and yield the encrypted wire payload.
     */
    Result<std::string> prepare_outgoing(const Conversation& conversation, const std::string& plaintext);

    /**
     * @brief prepare_outgoing, then store through the chat service
     */
    Result<ChatMessage> send(const Conversation& conversation, const std::string& plaintext);

    /**
     * @brief Decrypt a loaded history batch on a worker thread
     * @param conversation Owning conversation (decides interpretation)
     * @param messages Stored messages, oldest first
     * @return Future of display messages in the same order
     */
    std::future<std::vector<DisplayMessage>> decrypt_history(
        const Conversation& conversation,
        std::vector<ChatMessage> messages
    );

    /**
     * @brief Sidebar preview; secret conversations never show content
     */
    static std::string preview(const Conversation& conversation,
                               const std::optional<ChatMessage>& last_message);

    /**
     * @brief Drop the cached secret for one conversation
     */
    void forget(const std::string& conversation_id);

    /**
     * @brief Drop every cached secret
     */
    void forget_all();

private:
    struct CachedSecret {
        std::string peer_public_key;
        PublicKey local_public_key;
        SharedSecret secret;
    };

    ConsentStateMachine& consent_;
    MessageCipher cipher_;

    std::mutex cache_mutex_;
    std::map<std::string, CachedSecret> cache_;

    /**
     * @brief Cached secret for (conversation, current peer key), derived on miss
     *
     * A hit is only served while the key store still holds the same local pair,
     * so a secret never outlives reject or a wipe.
     */
    Result<SharedSecret> secret_for(const Conversation& conversation);
};

} // namespace secretchat
