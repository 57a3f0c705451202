/**
 * @file secret_chat_demo.cpp
 * @brief Secret conversation walkthrough between two local users
 *
 * secretchat - End-to-end encrypted conversation core
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Demonstrates the full lifecycle:
 * - Alice proposes a secret conversation to Bob
 * - Bob accepts, both sides derive the same key
 * - Messages are stored encrypted and decrypted on read
 * - Bob leaves and his key pair is removed
 */

#include "secretchat/chat_service.hpp"
#include "secretchat/consent_state_machine.hpp"
#include "secretchat/key_pair_service.hpp"
#include "secretchat/secret_channel.hpp"
#include "secretchat/secret_crypto.hpp"
#include "secretchat/sqlite_key_store.hpp"
#include "secretchat/utilities.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>

using namespace secretchat;
namespace fs = std::filesystem;

namespace {

template <typename T>
T require(Result<T> result, const std::string& step) {
    if (!result) {
        throw std::runtime_error(step + ": " + to_string(result.error()) + " (" + result.message() + ")");
    }
    return std::move(result).value();
}

void print_history(const std::string& reader, const std::vector<DisplayMessage>& messages) {
    std::cout << "\n" << reader << " reads the conversation:\n";
    for (const auto& entry : messages) {
        std::cout << "  [" << utilities::format_timestamp(entry.message.sent_at) << "] "
                  << entry.message.sender_id << ": " << entry.text
                  << "  (" << to_string(entry.status) << ")\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    fs::path data_dir = argc >= 2 ? fs::path(argv[1])
                                  : fs::temp_directory_path() / "secretchat_demo";

    try {
        std::cout << "\n=== secretchat Secret Conversation Demo ===\n\n";

        if (!SecretCrypto::initialize()) {
            std::cerr << "libsodium initialization failed\n";
            return 1;
        }
        utilities::initialize_logging("", utilities::log_level_from_env());

        // Each device keeps its own key database
        std::cout << "Key stores under: " << data_dir << "\n";
        SqliteKeyStore alice_keys(data_dir / "alice" / "conversation_keys.db");
        SqliteKeyStore bob_keys(data_dir / "bob" / "conversation_keys.db");

        InMemoryChatService chat;
        KeyPairService key_pairs;

        ConsentStateMachine alice("alice", alice_keys, chat, key_pairs);
        ConsentStateMachine bob("bob", bob_keys, chat, key_pairs);
        SecretChannel alice_channel(alice);
        SecretChannel bob_channel(bob);

        // Propose
        Conversation conversation = require(alice.propose("bob"), "propose");
        std::cout << "\nAlice proposed conversation " << conversation.conversation_id << "\n";
        std::cout << "  State: " << to_string(ConsentStateMachine::observe(conversation)) << "\n";
        std::cout << "  Bob has pending invitation: "
                  << (ConsentStateMachine::has_pending_invitation(conversation, "bob") ? "yes" : "no") << "\n";

        auto early = alice_channel.send(conversation, "are you there?");
        if (!early) {
            std::cout << "  Sending before accept refused: " << to_string(early.error()) << "\n";
        }

        // Accept
        conversation = require(bob.accept(conversation.conversation_id), "accept");
        std::cout << "\nBob accepted\n";
        std::cout << "  State: " << to_string(ConsentStateMachine::observe(conversation)) << "\n";

        SharedSecret alice_secret = require(alice.shared_secret(conversation), "alice key");
        SharedSecret bob_secret = require(bob.shared_secret(conversation), "bob key");
        std::cout << "  Keys match: " << (alice_secret == bob_secret ? "yes" : "no") << "\n";

        // Exchange messages
        ChatMessage sent = require(alice_channel.send(conversation, "Meet at the usual place, 7pm."), "send");
        require(bob_channel.send(conversation, "See you there."), "reply");
        require(chat.send_message(conversation.conversation_id, "alice",
                                  "https://cdn.example.com/uploads/map.png"), "attachment");

        std::cout << "\nStored on the server: " << sent.content << "\n";
        std::cout << "Sidebar preview: " << SecretChannel::preview(conversation, sent) << "\n";

        auto stored = require(chat.get_messages(conversation.conversation_id, "bob"), "history");
        print_history("Bob", bob_channel.decrypt_history(conversation, stored).get());

        // Leave
        require(bob.reject(conversation.conversation_id), "reject");
        conversation = require(chat.get_conversation(conversation.conversation_id), "refresh");
        std::cout << "\nBob left\n";
        std::cout << "  State: " << to_string(ConsentStateMachine::observe(conversation)) << "\n";

        auto bob_key = require(bob_keys.get(conversation.conversation_id), "bob lookup");
        std::cout << "  Bob key pair present: " << (bob_key ? "yes" : "no") << "\n";

        auto entries = require(alice_keys.list(), "alice list");
        std::cout << "  Alice still holds " << entries.size() << " key pair(s)\n";

        std::cout << "\nDemo complete.\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
