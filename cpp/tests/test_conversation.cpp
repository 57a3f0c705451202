/**
 * @file test_conversation.cpp
 * @brief Unit tests for conversation records and InMemoryChatService
 *
 * Tests:
 * - Creation request validation rules
 * - JSON bodies use the chat API field names
 * - Server-side key handling on create and accept
 * - Message storage order and membership checks
 */

#include <gtest/gtest.h>
#include "secretchat/chat_service.hpp"
#include "secretchat/conversation.hpp"
#include "secretchat/key_pair_service.hpp"
#include <nlohmann/json.hpp>
#include <string>

using namespace secretchat;
using json = nlohmann::json;

class ConversationTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(SecretCrypto::initialize());

        auto keypair = KeyPairService().generate();
        ASSERT_TRUE(keypair.is_ok());
        creator_key_ = keypair->public_key.to_hex();
    }

    CreateConversationRequest secret_request(const std::string& peer) const {
        CreateConversationRequest request;
        request.type = ConversationType::PRIVATE;
        request.subtype = ConversationSubtype::SECRET;
        request.user_ids.push_back(MemberInvite{peer, std::nullopt});
        request.public_key = creator_key_;
        return request;
    }

    std::string creator_key_;
    InMemoryChatService service_;
};

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConversationTest, ValidSecretRequest) {
    auto valid = secret_request("bob").validate();
    EXPECT_TRUE(valid.is_ok()) << valid.message();
}

TEST_F(ConversationTest, PrivateConversationCannotHaveName) {
    auto request = secret_request("bob");
    request.name = "Secret plans";

    auto valid = request.validate();
    ASSERT_FALSE(valid.is_ok());
    EXPECT_EQ(valid.error(), SecretError::INVALID_CONVERSATION);
}

TEST_F(ConversationTest, PrivateConversationNeedsSubtype) {
    auto request = secret_request("bob");
    request.subtype = ConversationSubtype::NONE;
    request.public_key.reset();

    auto valid = request.validate();
    ASSERT_FALSE(valid.is_ok());
    EXPECT_EQ(valid.error(), SecretError::INVALID_CONVERSATION);
}

TEST_F(ConversationTest, GroupConversationRules) {
    CreateConversationRequest request;
    request.type = ConversationType::GROUP;
    request.user_ids.push_back(MemberInvite{"bob", std::nullopt});
    request.user_ids.push_back(MemberInvite{"carol", std::nullopt});

    EXPECT_EQ(request.validate().error(), SecretError::INVALID_CONVERSATION);

    request.name = "Team";
    EXPECT_TRUE(request.validate().is_ok());

    request.subtype = ConversationSubtype::SECRET;
    EXPECT_EQ(request.validate().error(), SecretError::INVALID_CONVERSATION);
}

TEST_F(ConversationTest, PublicKeyOnlyOnSecretConversations) {
    auto request = secret_request("bob");
    request.subtype = ConversationSubtype::NORMAL;

    EXPECT_EQ(request.validate().error(), SecretError::INVALID_CONVERSATION);
}

TEST_F(ConversationTest, SecretConversationNeedsCreatorKey) {
    auto request = secret_request("bob");
    request.public_key.reset();
    EXPECT_EQ(request.validate().error(), SecretError::INVALID_CONVERSATION);

    request.public_key = "not-a-key";
    EXPECT_EQ(request.validate().error(), SecretError::INVALID_PEER_KEY);
}

TEST_F(ConversationTest, InvalidUserIdRejected) {
    auto request = secret_request("bob smith");
    EXPECT_EQ(request.validate().error(), SecretError::INVALID_IDENTIFIER);
}

// ============================================================================
// JSON Bodies
// ============================================================================

TEST_F(ConversationTest, CreateRequestJsonFields) {
    json body = json::parse(secret_request("bob").to_json());

    EXPECT_EQ(body["type"], "private");
    EXPECT_EQ(body["subtype"], "secret");
    EXPECT_EQ(body["pubkey"], creator_key_);
    EXPECT_FALSE(body.contains("name"));
    ASSERT_EQ(body["user_ids"].size(), 1u);
    EXPECT_EQ(body["user_ids"][0]["user_id"], "bob");
    EXPECT_TRUE(body["user_ids"][0]["pubkey"].is_null());

    auto parsed = CreateConversationRequest::from_json(body.dump());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->subtype, ConversationSubtype::SECRET);
    EXPECT_EQ(parsed->public_key, creator_key_);
    EXPECT_EQ(parsed->user_ids.at(0).user_id, "bob");
}

TEST_F(ConversationTest, AcceptRequestJsonFields) {
    AcceptSecretRequest request{"c0ffee-1", creator_key_};
    json body = json::parse(request.to_json());

    EXPECT_EQ(body["conversation_id"], "c0ffee-1");
    EXPECT_EQ(body["pubkey"], creator_key_);

    auto parsed = AcceptSecretRequest::from_json(body.dump());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->public_key, creator_key_);
}

TEST_F(ConversationTest, ConversationFromServerJson) {
    std::string body = R"({
        "conversation_id": "3f1c",
        "type": "private",
        "subtype": "secret",
        "name": null,
        "members": [
            {"conversation_id": "3f1c", "user_id": "alice", "pubkey": "aa", "last_read_message_id": null},
            {"conversation_id": "3f1c", "user_id": "bob", "pubkey": null, "last_read_message_id": "m-9"}
        ]
    })";

    auto conversation = Conversation::from_json(body);
    ASSERT_TRUE(conversation.has_value());
    EXPECT_TRUE(conversation->is_secret());
    EXPECT_FALSE(conversation->name.has_value());
    ASSERT_EQ(conversation->members.size(), 2u);
    EXPECT_TRUE(conversation->find_member("alice")->has_public_key());
    EXPECT_FALSE(conversation->find_member("bob")->has_public_key());
    EXPECT_EQ(conversation->find_member("bob")->last_read_message_id, "m-9");
    EXPECT_EQ(conversation->find_member("carol"), nullptr);
}

TEST_F(ConversationTest, ConversationJsonRejectsUnknownType) {
    EXPECT_FALSE(Conversation::from_json(R"({"conversation_id": "x", "type": "channel"})").has_value());
    EXPECT_FALSE(Conversation::from_json("not json").has_value());
}

TEST_F(ConversationTest, MessageJson) {
    ChatMessage message;
    message.message_id = "m-1";
    message.conversation_id = "c-1";
    message.sender_id = "alice";
    message.content = "hello";
    message.sent_at = 1731250245;

    auto parsed = ChatMessage::from_json(message.to_json());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->content, "hello");
    EXPECT_EQ(parsed->sent_at, 1731250245u);
}

// ============================================================================
// InMemoryChatService
// ============================================================================

TEST_F(ConversationTest, CreateAddsCreatorWithKey) {
    auto conversation = service_.create_conversation(secret_request("bob"), "alice");
    ASSERT_TRUE(conversation.is_ok()) << conversation.message();

    EXPECT_FALSE(conversation->conversation_id.empty());
    ASSERT_EQ(conversation->members.size(), 2u);

    const ConversationMember* alice = conversation->find_member("alice");
    const ConversationMember* bob = conversation->find_member("bob");
    ASSERT_NE(alice, nullptr);
    ASSERT_NE(bob, nullptr);
    EXPECT_EQ(alice->public_key, creator_key_);
    EXPECT_FALSE(bob->has_public_key());
}

TEST_F(ConversationTest, InviteeKeysInRequestAreIgnored) {
    auto request = secret_request("bob");
    request.user_ids[0].public_key = creator_key_;

    auto conversation = service_.create_conversation(request, "alice");
    ASSERT_TRUE(conversation.is_ok());
    EXPECT_FALSE(conversation->find_member("bob")->has_public_key());
}

TEST_F(ConversationTest, CreateRejectsInvalidRequest) {
    auto request = secret_request("bob");
    request.name = "named";

    auto conversation = service_.create_conversation(request, "alice");
    ASSERT_FALSE(conversation.is_ok());
    EXPECT_EQ(conversation.error(), SecretError::INVALID_CONVERSATION);
}

TEST_F(ConversationTest, AcceptSetsKeyOnce) {
    auto conversation = service_.create_conversation(secret_request("bob"), "alice");
    ASSERT_TRUE(conversation.is_ok());

    std::string bob_key = KeyPairService().generate()->public_key.to_hex();

    auto accepted = service_.accept_secret_conversation(
        AcceptSecretRequest{conversation->conversation_id, bob_key}, "bob");
    ASSERT_TRUE(accepted.is_ok()) << accepted.message();
    EXPECT_EQ(accepted->find_member("bob")->public_key, bob_key);

    auto again = service_.accept_secret_conversation(
        AcceptSecretRequest{conversation->conversation_id, creator_key_}, "bob");
    ASSERT_FALSE(again.is_ok());
    EXPECT_EQ(again.error(), SecretError::PUBLIC_KEY_CONFLICT);
}

TEST_F(ConversationTest, AcceptErrors) {
    std::string key = KeyPairService().generate()->public_key.to_hex();

    auto missing = service_.accept_secret_conversation(AcceptSecretRequest{"no-such-id", key}, "bob");
    EXPECT_EQ(missing.error(), SecretError::CONVERSATION_NOT_FOUND);

    CreateConversationRequest normal;
    normal.type = ConversationType::PRIVATE;
    normal.subtype = ConversationSubtype::NORMAL;
    normal.user_ids.push_back(MemberInvite{"bob", std::nullopt});
    auto plain = service_.create_conversation(normal, "alice");
    ASSERT_TRUE(plain.is_ok());

    auto not_secret = service_.accept_secret_conversation(
        AcceptSecretRequest{plain->conversation_id, key}, "bob");
    EXPECT_EQ(not_secret.error(), SecretError::NOT_SECRET_CONVERSATION);

    auto secret = service_.create_conversation(secret_request("bob"), "alice");
    ASSERT_TRUE(secret.is_ok());

    auto outsider = service_.accept_secret_conversation(
        AcceptSecretRequest{secret->conversation_id, key}, "mallory");
    EXPECT_EQ(outsider.error(), SecretError::NOT_A_MEMBER);

    auto bad_key = service_.accept_secret_conversation(
        AcceptSecretRequest{secret->conversation_id, "zz"}, "bob");
    EXPECT_EQ(bad_key.error(), SecretError::INVALID_PEER_KEY);
}

TEST_F(ConversationTest, LeaveRemovesMember) {
    auto conversation = service_.create_conversation(secret_request("bob"), "alice");
    ASSERT_TRUE(conversation.is_ok());

    ASSERT_TRUE(service_.leave_conversation(conversation->conversation_id, "bob").is_ok());

    auto current = service_.get_conversation(conversation->conversation_id);
    ASSERT_TRUE(current.is_ok());
    EXPECT_EQ(current->members.size(), 1u);
    EXPECT_EQ(current->find_member("bob"), nullptr);

    auto again = service_.leave_conversation(conversation->conversation_id, "bob");
    EXPECT_EQ(again.error(), SecretError::NOT_A_MEMBER);
}

TEST_F(ConversationTest, MessagesKeepOrderAndRequireMembership) {
    auto conversation = service_.create_conversation(secret_request("bob"), "alice");
    ASSERT_TRUE(conversation.is_ok());
    const std::string& id = conversation->conversation_id;

    ASSERT_TRUE(service_.send_message(id, "alice", "first").is_ok());
    ASSERT_TRUE(service_.send_message(id, "bob", "second").is_ok());
    ASSERT_TRUE(service_.send_message(id, "alice", "third").is_ok());

    auto intruder = service_.send_message(id, "mallory", "hi");
    EXPECT_EQ(intruder.error(), SecretError::NOT_A_MEMBER);

    auto messages = service_.get_messages(id, "bob");
    ASSERT_TRUE(messages.is_ok());
    ASSERT_EQ(messages->size(), 3u);
    EXPECT_EQ(messages->at(0).content, "first");
    EXPECT_EQ(messages->at(1).content, "second");
    EXPECT_EQ(messages->at(2).content, "third");

    EXPECT_EQ(service_.get_messages(id, "mallory").error(), SecretError::NOT_A_MEMBER);
}

TEST_F(ConversationTest, ListConversationsForMember) {
    ASSERT_TRUE(service_.create_conversation(secret_request("bob"), "alice").is_ok());
    ASSERT_TRUE(service_.create_conversation(secret_request("carol"), "alice").is_ok());

    EXPECT_EQ(service_.list_conversations("alice").size(), 2u);
    EXPECT_EQ(service_.list_conversations("bob").size(), 1u);
    EXPECT_TRUE(service_.list_conversations("dave").empty());
}
