/**
 * @file conversation.cpp
 * @brief Conversation records, validation and JSON serialization
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 */

#include "secretchat/conversation.hpp"
#include "secretchat/key_material.hpp"
#include "secretchat/secure_config.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace secretchat {

namespace {

json optional_string(const std::optional<std::string>& value) {
    return value ? json(*value) : json(nullptr);
}

std::optional<std::string> read_optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json member_to_json(const ConversationMember& member) {
    json j;
    j["conversation_id"] = member.conversation_id;
    j["user_id"] = member.user_id;
    j["pubkey"] = optional_string(member.public_key);
    j["last_read_message_id"] = optional_string(member.last_read_message_id);
    j["joined_at"] = member.joined_at;
    return j;
}

ConversationMember member_from_json(const json& j) {
    ConversationMember member;
    member.conversation_id = j.value("conversation_id", "");
    member.user_id = j.at("user_id").get<std::string>();
    member.public_key = read_optional_string(j, "pubkey");
    member.last_read_message_id = read_optional_string(j, "last_read_message_id");
    member.joined_at = j.value("joined_at", static_cast<uint64_t>(0));
    return member;
}

json subtype_to_json(ConversationSubtype subtype) {
    if (subtype == ConversationSubtype::NONE) {
        return nullptr;
    }
    return ConversationHelpers::subtype_to_string(subtype);
}

std::optional<ConversationSubtype> subtype_from_json(const json& j) {
    auto it = j.find("subtype");
    if (it == j.end() || it->is_null()) {
        return ConversationSubtype::NONE;
    }
    return ConversationHelpers::string_to_subtype(it->get<std::string>());
}

Failure invalid(const std::string& message) {
    return Failure{SecretError::INVALID_CONVERSATION, message};
}

} // namespace

// ============================================================================
// Enum String Conversion
// ============================================================================

std::string ConversationHelpers::type_to_string(ConversationType type) {
    switch (type) {
        case ConversationType::PRIVATE: return "private";
        case ConversationType::GROUP: return "group";
        default: return "unknown";
    }
}

std::optional<ConversationType> ConversationHelpers::string_to_type(const std::string& str) {
    if (str == "private") return ConversationType::PRIVATE;
    if (str == "group") return ConversationType::GROUP;
    return std::nullopt;
}

std::string ConversationHelpers::subtype_to_string(ConversationSubtype subtype) {
    switch (subtype) {
        case ConversationSubtype::NORMAL: return "normal";
        case ConversationSubtype::SECRET: return "secret";
        default: return "";
    }
}

std::optional<ConversationSubtype> ConversationHelpers::string_to_subtype(const std::string& str) {
    if (str.empty()) return ConversationSubtype::NONE;
    if (str == "normal") return ConversationSubtype::NORMAL;
    if (str == "secret") return ConversationSubtype::SECRET;
    return std::nullopt;
}

// ============================================================================
// Conversation
// ============================================================================

bool Conversation::is_secret() const {
    return type == ConversationType::PRIVATE && subtype == ConversationSubtype::SECRET;
}

const ConversationMember* Conversation::find_member(const std::string& user_id) const {
    for (const auto& member : members) {
        if (member.user_id == user_id) {
            return &member;
        }
    }
    return nullptr;
}

ConversationMember* Conversation::find_member(const std::string& user_id) {
    for (auto& member : members) {
        if (member.user_id == user_id) {
            return &member;
        }
    }
    return nullptr;
}

std::string Conversation::to_json() const {
    try {
        json j;
        j["conversation_id"] = conversation_id;
        j["type"] = ConversationHelpers::type_to_string(type);
        j["subtype"] = subtype_to_json(subtype);
        j["name"] = optional_string(name);
        j["created_at"] = created_at;

        j["members"] = json::array();
        for (const auto& member : members) {
            j["members"].push_back(member_to_json(member));
        }

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<Conversation> Conversation::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        Conversation conversation;
        conversation.conversation_id = j.at("conversation_id").get<std::string>();

        auto type_opt = ConversationHelpers::string_to_type(j.at("type").get<std::string>());
        auto subtype_opt = subtype_from_json(j);
        if (!type_opt || !subtype_opt) {
            return std::nullopt;
        }
        conversation.type = *type_opt;
        conversation.subtype = *subtype_opt;
        conversation.name = read_optional_string(j, "name");
        conversation.created_at = j.value("created_at", static_cast<uint64_t>(0));

        for (const auto& member_json : j.value("members", json::array())) {
            auto member = member_from_json(member_json);
            if (member.conversation_id.empty()) {
                member.conversation_id = conversation.conversation_id;
            }
            conversation.members.push_back(std::move(member));
        }

        return conversation;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// ChatMessage
// ============================================================================

std::string ChatMessage::to_json() const {
    try {
        json j;
        j["message_id"] = message_id;
        j["conversation_id"] = conversation_id;
        j["sender_id"] = sender_id;
        j["content"] = content;
        j["sent_at"] = sent_at;

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<ChatMessage> ChatMessage::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        ChatMessage message;
        message.message_id = j.at("message_id").get<std::string>();
        message.conversation_id = j.at("conversation_id").get<std::string>();
        message.sender_id = j.at("sender_id").get<std::string>();
        message.content = j.at("content").get<std::string>();
        message.sent_at = j.value("sent_at", static_cast<uint64_t>(0));

        return message;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// CreateConversationRequest
// ============================================================================

Result<Unit> CreateConversationRequest::validate() const {
    bool has_name = name.has_value() && !name->empty();

    if (type == ConversationType::PRIVATE && has_name) {
        return invalid("Private conversations cannot have a name");
    }
    if (type == ConversationType::GROUP && !has_name) {
        return invalid("Group conversations must have a name");
    }
    if (type == ConversationType::PRIVATE && subtype == ConversationSubtype::NONE) {
        return invalid("Private conversations must have a subtype (normal or secret)");
    }
    if (type != ConversationType::PRIVATE && subtype != ConversationSubtype::NONE) {
        return invalid("Only private conversations can have a subtype");
    }
    if (user_ids.empty()) {
        return invalid("Conversation needs at least one invited user");
    }

    for (const auto& invite : user_ids) {
        if (!security::validate_identifier(invite.user_id)) {
            return Failure{SecretError::INVALID_IDENTIFIER,
                           "invalid user id '" + invite.user_id.substr(0, 80) + "'"};
        }
    }

    bool secret = type == ConversationType::PRIVATE && subtype == ConversationSubtype::SECRET;
    bool has_key = public_key.has_value() && !public_key->empty();

    if (has_key && !secret) {
        return invalid("Only private secret conversations carry a public key");
    }
    if (secret) {
        if (!has_key) {
            return invalid("Secret conversations require the creator's public key");
        }
        if (!PublicKey::from_hex(*public_key)) {
            return Failure{SecretError::INVALID_PEER_KEY, "creator public key is not 64 hex characters"};
        }
    }

    return Result<Unit>::ok(Unit{});
}

std::string CreateConversationRequest::to_json() const {
    try {
        json j;
        j["type"] = ConversationHelpers::type_to_string(type);
        if (name) {
            j["name"] = *name;
        }

        j["user_ids"] = json::array();
        for (const auto& invite : user_ids) {
            j["user_ids"].push_back({
                {"user_id", invite.user_id},
                {"pubkey", optional_string(invite.public_key)}
            });
        }

        if (subtype != ConversationSubtype::NONE) {
            j["subtype"] = ConversationHelpers::subtype_to_string(subtype);
        }
        if (public_key) {
            j["pubkey"] = *public_key;
        }

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<CreateConversationRequest> CreateConversationRequest::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        CreateConversationRequest request;

        auto type_opt = ConversationHelpers::string_to_type(j.at("type").get<std::string>());
        auto subtype_opt = subtype_from_json(j);
        if (!type_opt || !subtype_opt) {
            return std::nullopt;
        }
        request.type = *type_opt;
        request.subtype = *subtype_opt;
        request.name = read_optional_string(j, "name");
        request.public_key = read_optional_string(j, "pubkey");

        for (const auto& invite_json : j.at("user_ids")) {
            MemberInvite invite;
            invite.user_id = invite_json.at("user_id").get<std::string>();
            invite.public_key = read_optional_string(invite_json, "pubkey");
            request.user_ids.push_back(std::move(invite));
        }

        return request;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// AcceptSecretRequest
// ============================================================================

std::string AcceptSecretRequest::to_json() const {
    try {
        json j;
        j["conversation_id"] = conversation_id;
        j["pubkey"] = public_key;

        return j.dump();
    } catch (const std::exception&) {
        return "{}";
    }
}

std::optional<AcceptSecretRequest> AcceptSecretRequest::from_json(const std::string& json_str) {
    try {
        json j = json::parse(json_str);

        AcceptSecretRequest request;
        request.conversation_id = j.at("conversation_id").get<std::string>();
        request.public_key = j.at("pubkey").get<std::string>();

        return request;

    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace secretchat
