/**
 * @file consent_state_machine.cpp
 * @brief Implementation of the secret conversation consent protocol
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/consent_state_machine.hpp"
#include "secretchat/shared_secret_deriver.hpp"
#include "secretchat/utilities.hpp"

#include <utility>

namespace secretchat {

const char* to_string(ConsentState state) {
    switch (state) {
        case ConsentState::NOT_SECRET: return "NOT_SECRET";
        case ConsentState::PROPOSED:   return "PROPOSED";
        case ConsentState::ACCEPTED:   return "ACCEPTED";
        case ConsentState::LEFT:       return "LEFT";
        default:                       return "UNKNOWN";
    }
}

ConsentStateMachine::ConsentStateMachine(
    std::string local_user_id,
    KeyStore& key_store,
    ChatService& chat_service,
    const KeyPairService& key_pair_service
)
    : local_user_id_(std::move(local_user_id))
    , key_store_(key_store)
    , chat_service_(chat_service)
    , key_pair_service_(key_pair_service)
{
}

// ============================================================================
// Observation
// ============================================================================

ConsentState ConsentStateMachine::observe(const Conversation& conversation) {
    if (!conversation.is_secret()) {
        return ConsentState::NOT_SECRET;
    }
    if (conversation.members.size() < 2) {
        return ConsentState::LEFT;
    }
    for (const auto& member : conversation.members) {
        if (!member.has_public_key()) {
            return ConsentState::PROPOSED;
        }
    }
    return ConsentState::ACCEPTED;
}

bool ConsentStateMachine::has_pending_invitation(const Conversation& conversation,
                                                 const std::string& user_id) {
    if (observe(conversation) != ConsentState::PROPOSED) {
        return false;
    }
    const ConversationMember* member = conversation.find_member(user_id);
    return member != nullptr && !member->has_public_key();
}

std::optional<std::string> ConsentStateMachine::peer_public_key(const Conversation& conversation,
                                                                const std::string& user_id) {
    for (const auto& member : conversation.members) {
        if (member.user_id != user_id && member.has_public_key()) {
            return member.public_key;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Transitions
// ============================================================================

Result<KeyPair> ConsentStateMachine::obtain_key_pair(const std::string& conversation_id) {
    auto stored = key_store_.get(conversation_id);
    if (!stored) {
        return stored.failure();
    }
    if (stored->has_value()) {
        return Result<KeyPair>::ok(**stored);
    }

    auto generated = key_pair_service_.generate();
    if (!generated) {
        return generated.failure();
    }

    auto created = key_store_.put_if_absent(conversation_id, *generated);
    if (!created) {
        return created.failure();
    }
    if (*created) {
        return generated;
    }

    // Lost a race with a concurrent accept; use the pair that was kept
    auto retained = key_store_.get(conversation_id);
    if (!retained) {
        return retained.failure();
    }
    if (!retained->has_value()) {
        return Result<KeyPair>::fail(SecretError::STORAGE_UNAVAILABLE,
                                     "key pair vanished after insert for " + conversation_id);
    }
    return Result<KeyPair>::ok(**retained);
}

Result<Conversation> ConsentStateMachine::propose(const std::string& peer_user_id) {
    auto key_pair = key_pair_service_.generate();
    if (!key_pair) {
        return key_pair.failure();
    }

    CreateConversationRequest request;
    request.type = ConversationType::PRIVATE;
    request.subtype = ConversationSubtype::SECRET;
    request.user_ids.push_back(MemberInvite{peer_user_id, std::nullopt});
    request.public_key = key_pair->public_key.to_hex();

    auto conversation = chat_service_.create_conversation(request, local_user_id_);
    if (!conversation) {
        return conversation.failure();
    }

    const std::string& conversation_id = conversation->conversation_id;

    auto stored = key_store_.put_if_absent(conversation_id, *key_pair);
    if (!stored || !*stored) {
        std::string reason = stored ? "a key pair already existed" : stored.message();
        utilities::log_error("Consent: could not store key pair for " + conversation_id +
                             " (" + reason + "), withdrawing proposal");

        auto left = chat_service_.leave_conversation(conversation_id, local_user_id_);
        if (!left) {
            utilities::log_error("Consent: withdrawing " + conversation_id + " failed: " + left.message());
        }

        return Result<Conversation>::fail(SecretError::STORAGE_UNAVAILABLE,
                                          "could not persist key pair: " + reason);
    }

    utilities::log_info("Consent: " + local_user_id_ + " proposed secret conversation " +
                        conversation_id + " to " + peer_user_id + " with key " +
                        fingerprint(key_pair->public_key));
    return conversation;
}

Result<Conversation> ConsentStateMachine::accept(const std::string& conversation_id) {
    auto conversation = chat_service_.get_conversation(conversation_id);
    if (!conversation) {
        return conversation.failure();
    }

    if (!conversation->is_secret()) {
        return Result<Conversation>::fail(SecretError::NOT_SECRET_CONVERSATION,
                                          "Not a secret private conversation");
    }

    const ConversationMember* member = conversation->find_member(local_user_id_);
    if (!member) {
        return Result<Conversation>::fail(SecretError::NOT_A_MEMBER,
                                          "You are not a member of this conversation");
    }

    // A withdrawn proposal stays LEFT, even for a repeated accept
    if (observe(*conversation) == ConsentState::LEFT) {
        utilities::log_warn("Consent: " + conversation_id + " was withdrawn, not accepting");
        return Result<Conversation>::fail(SecretError::INVALID_CONVERSATION,
                                          "secret conversation was withdrawn, nothing to accept");
    }

    if (member->has_public_key()) {
        // Repeated accept from this device succeeds; any other key is another device's
        auto stored = key_store_.get(conversation_id);
        if (!stored) {
            return stored.failure();
        }
        auto server_key = PublicKey::from_hex(*member->public_key);
        if (stored->has_value() && server_key && *server_key == (*stored)->public_key) {
            return conversation;
        }
        utilities::log_warn("Consent: server holds a different key for " + local_user_id_ +
                            " in " + conversation_id);
        return Result<Conversation>::fail(SecretError::PUBLIC_KEY_CONFLICT,
                                          "member record already carries a different public key");
    }

    auto key_pair = obtain_key_pair(conversation_id);
    if (!key_pair) {
        return key_pair.failure();
    }

    auto updated = chat_service_.accept_secret_conversation(
        AcceptSecretRequest{conversation_id, key_pair->public_key.to_hex()}, local_user_id_);
    if (!updated && updated.error() == SecretError::PUBLIC_KEY_CONFLICT) {
        // A concurrent accept on this device may have submitted the same stored key first
        auto current = chat_service_.get_conversation(conversation_id);
        if (current) {
            const ConversationMember* current_member = current->find_member(local_user_id_);
            if (current_member && current_member->has_public_key()) {
                auto server_key = PublicKey::from_hex(*current_member->public_key);
                if (server_key && *server_key == key_pair->public_key) {
                    return current;
                }
            }
        }
    }
    if (!updated) {
        return updated.failure();
    }

    utilities::log_info("Consent: " + local_user_id_ + " accepted secret conversation " +
                        conversation_id + " with key " + fingerprint(key_pair->public_key));
    return updated;
}

Result<Unit> ConsentStateMachine::reject(const std::string& conversation_id) {
    auto left = chat_service_.leave_conversation(conversation_id, local_user_id_);
    if (!left) {
        return left;
    }

    auto removed = key_store_.remove(conversation_id);
    if (!removed) {
        return removed.failure();
    }

    utilities::log_info("Consent: " + local_user_id_ + " rejected secret conversation " +
                        conversation_id + (*removed ? ", local key pair removed" : ""));
    return Result<Unit>::ok(Unit{});
}

// ============================================================================
// Shared Secret
// ============================================================================

Result<SharedSecret> ConsentStateMachine::shared_secret(const Conversation& conversation) const {
    if (!conversation.is_secret()) {
        return Result<SharedSecret>::fail(SecretError::NOT_SECRET_CONVERSATION,
                                          "conversation is not secret");
    }

    auto peer_key = peer_public_key(conversation, local_user_id_);
    if (!peer_key) {
        return Result<SharedSecret>::fail(SecretError::CONSENT_PENDING,
                                          "peer has not accepted the secret conversation");
    }

    auto key_pair = key_store_.get(conversation.conversation_id);
    if (!key_pair) {
        return key_pair.failure();
    }
    if (!key_pair->has_value()) {
        return Result<SharedSecret>::fail(SecretError::LOCAL_KEY_MISSING,
                                          "no local key pair for " + conversation.conversation_id);
    }

    return SharedSecretDeriver::derive((*key_pair)->private_key, *peer_key);
}

Result<std::optional<PublicKey>> ConsentStateMachine::local_public_key(const std::string& conversation_id) const {
    auto key_pair = key_store_.get(conversation_id);
    if (!key_pair) {
        return key_pair.failure();
    }
    if (!key_pair->has_value()) {
        return Result<std::optional<PublicKey>>::ok(std::nullopt);
    }
    return Result<std::optional<PublicKey>>::ok((*key_pair)->public_key);
}

} // namespace secretchat
