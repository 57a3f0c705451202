/**
 * @file consent_state_machine.hpp
 * @brief Lifecycle of a secret conversation: propose, accept, reject
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Consent state is never stored. It is read off the member records:
 *
 *   NOT_SECRET  not a private secret conversation
 *   PROPOSED    at least one member has no public key yet
 *   ACCEPTED    every member (two or more) has a public key
 *   LEFT        a single member remains (peer rejected or left)
 */

#pragma once

#include "secretchat/chat_service.hpp"
#include "secretchat/conversation.hpp"
#include "secretchat/key_material.hpp"
#include "secretchat/key_pair_service.hpp"
#include "secretchat/key_store.hpp"
#include "secretchat/result.hpp"

#include <optional>
#include <string>

namespace secretchat {

/**
 * @brief Observed consent state of a conversation
 */
enum class ConsentState {
    NOT_SECRET,
    PROPOSED,
    ACCEPTED,
    LEFT
};

/**
 * @brief Convert ConsentState to string
 */
const char* to_string(ConsentState state);

/**
 * @brief ConsentStateMachine - drives key creation and exchange for one local user
 */
class ConsentStateMachine {
public:
    /**
     * @brief Bind the state machine to a user and its collaborators
     * @param local_user_id User acting on this device
     * @param key_store Device-local key storage
     * @param chat_service Chat backend
     * @param key_pair_service Key generator
     */
    ConsentStateMachine(
        std::string local_user_id,
        KeyStore& key_store,
        ChatService& chat_service,
        const KeyPairService& key_pair_service
    );

    // ========================================================================
    // Observation
    // ========================================================================

    static ConsentState observe(const Conversation& conversation);

    /**
     * @brief Whether user_id is invited to a secret conversation and has not accepted
     */
    static bool has_pending_invitation(const Conversation& conversation, const std::string& user_id);

    /**
     * @brief Public key of the member other than user_id, if that member has accepted
     */
    static std::optional<std::string> peer_public_key(const Conversation& conversation,
                                                      const std::string& user_id);

    // ========================================================================
    // Transitions
    // ========================================================================

    /**
     * @brief Start a secret conversation with peer_user_id
     *
     * Generates a key pair, creates the conversation carrying our public key,
     * then stores the pair under the new id. If the pair cannot be stored the
     * conversation is left again and StorageUnavailable is returned.
     */
    Result<Conversation> propose(const std::string& peer_user_id);

    /**
     * @brief Accept a pending invitation
     *
     * Reuses a key pair already stored for the conversation (a repeated
     * accept), otherwise generates one. The pair the store retains is the one
     * submitted.
     */
    Result<Conversation> accept(const std::string& conversation_id);

    /**
     * @brief Decline (or leave) a secret conversation and drop the local key pair
     */
    Result<Unit> reject(const std::string& conversation_id);

    /**
     * @brief Derive the conversation key from our stored pair and the peer's key
     * @return ConsentPending when the peer has not accepted, LocalKeyMissing
     *         when this device holds no key pair
     */
    Result<SharedSecret> shared_secret(const Conversation& conversation) const;

    /**
     * @brief Public half of the key pair this device holds for conversation_id
     * @return nullopt once the pair has been removed (reject, leave, wipe)
     */
    Result<std::optional<PublicKey>> local_public_key(const std::string& conversation_id) const;

    const std::string& local_user_id() const { return local_user_id_; }
    ChatService& chat_service() { return chat_service_; }

private:
    std::string local_user_id_;
    KeyStore& key_store_;
    ChatService& chat_service_;
    const KeyPairService& key_pair_service_;

    /**
     * @brief Stored pair for conversation_id, generating and storing one if absent
     */
    Result<KeyPair> obtain_key_pair(const std::string& conversation_id);
};

} // namespace secretchat
