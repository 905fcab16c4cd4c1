#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <sstream>
#include <thread>
#include <vector>
#include "store/store.hpp"
#include "network/codec.hpp"
#include "test_utils.hpp"

using namespace ghostnet;
using ::testing::HasSubstr;
using namespace ghostnet::store;

class StoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging(boost::log::trivial::warning);
        cipher = std::make_unique<crypto::CipherProvider>(dir / "secret.key");
        store = std::make_unique<Store>(dir / "ghostnet.db", *cipher);
    }

    void TearDown() override {
        store.reset();
        cipher.reset();
    }

    double now() const { return network::Codec::unix_time_now(); }

    // Reads the raw content column, bypassing decryption
    std::vector<std::string> raw_contents() {
        std::vector<std::string> contents;
        sqlite3* db = nullptr;
        if (sqlite3_open((dir / "ghostnet.db").c_str(), &db) != SQLITE_OK) {
            sqlite3_close(db);
            return contents;
        }
        sqlite3_stmt* stmt = nullptr;
        sqlite3_prepare_v2(db, "SELECT content FROM messages", -1, &stmt, nullptr);
        while (sqlite3_step(stmt) == SQLITE_ROW) {
            const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt, 0));
            contents.emplace_back(data, static_cast<size_t>(sqlite3_column_bytes(stmt, 0)));
        }
        sqlite3_finalize(stmt);
        sqlite3_close(db);
        return contents;
    }

    TempDir dir{"store"};
    std::unique_ptr<crypto::CipherProvider> cipher;
    std::unique_ptr<Store> store;
};


// ---- MESSAGES ----

TEST_F(StoreTest, ContentIsEncryptedAtRest) {
    store->insert_message("10.0.0.2", Sender::PEER, "top secret plans", ContentType::TEXT, "", now());

    auto contents = raw_contents();
    ASSERT_EQ(contents.size(), 1u);
    EXPECT_EQ(contents[0].find("top secret"), std::string::npos);
    EXPECT_EQ(cipher->decrypt_from_storage(contents[0]), "top secret plans");
}

TEST_F(StoreTest, HistoryIsOrderedAndLimited) {
    const double base = now() - 100;
    for (int i = 0; i < 5; ++i) {
        store->insert_message("10.0.0.2", i % 2 ? Sender::ME : Sender::PEER, "msg " + std::to_string(i),
                              ContentType::TEXT, "", base + i);
    }
    store->insert_message("10.0.0.3", Sender::PEER, "other peer", ContentType::TEXT, "", base);

    auto ascending = store->get_history("10.0.0.2", 3);
    ASSERT_EQ(ascending.size(), 3u);
    EXPECT_EQ(ascending[0].content, "msg 2");
    EXPECT_EQ(ascending[1].content, "msg 3");
    EXPECT_EQ(ascending[2].content, "msg 4");
    EXPECT_EQ(ascending[1].sender, Sender::ME);
    EXPECT_TRUE(ascending[2].decrypted);

    auto descending = store->get_history("10.0.0.2", 100, SortOrder::DESCENDING);
    ASSERT_EQ(descending.size(), 5u);
    EXPECT_EQ(descending.front().content, "msg 4");
    EXPECT_EQ(descending.back().content, "msg 0");

    EXPECT_TRUE(store->get_history("10.0.0.99").empty());
}

TEST_F(StoreTest, FileMessagesKeepPath) {
    store->insert_message("10.0.0.2", Sender::PEER, "photo.jpg", ContentType::FILE, "/tmp/photo.jpg", now());

    auto history = store->get_history("10.0.0.2");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].type, ContentType::FILE);
    EXPECT_EQ(history[0].content, "photo.jpg");
    EXPECT_EQ(history[0].file_path, "/tmp/photo.jpg");
}

TEST_F(StoreTest, AsyncSavesAreVisibleAfterFlush) {
    for (int i = 0; i < 20; ++i) {
        store->save_message("10.0.0.2", Sender::PEER, "async " + std::to_string(i), ContentType::TEXT);
    }
    store->flush();

    EXPECT_EQ(store->get_history("10.0.0.2", 100).size(), 20u);
}

TEST_F(StoreTest, ConcurrentWritersAreSerialized) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 25; ++i) {
                store->insert_message("10.0.0.2", Sender::PEER, std::to_string(t) + ":" + std::to_string(i),
                                      ContentType::TEXT, "", now());
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store->get_statistics().total_messages, 100u);
}

TEST_F(StoreTest, UndecryptableRowsAreFlagged) {
    store->insert_message("10.0.0.2", Sender::PEER, "written with the first key", ContentType::TEXT, "", now());
    store.reset();

    // Same database, different storage key
    crypto::CipherProvider other_cipher(dir / "other.key");
    Store other(dir / "ghostnet.db", other_cipher);

    auto history = other.get_history("10.0.0.2");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_FALSE(history[0].decrypted);
    EXPECT_EQ(history[0].content, Store::DECRYPTION_FAILED);
}

TEST_F(StoreTest, MissingStorageKeyFailsLoudly) {
    write_file(dir / "blocker", "x");
    crypto::CipherProvider broken(dir / "blocker" / "secret.key");
    Store broken_store(dir / "broken.db", broken);

    EXPECT_THROW(broken_store.insert_message("10.0.0.2", Sender::ME, "hi", ContentType::TEXT, "", now()),
                 crypto::KeyUnavailableError);

    // Queued saves are dropped, never stored in clear text
    broken_store.save_message("10.0.0.2", Sender::ME, "hi", ContentType::TEXT);
    broken_store.flush();
    EXPECT_EQ(broken_store.get_statistics().total_messages, 0u);
}


// ---- RETENTION ----

TEST_F(StoreTest, CleanupRemovesOnlyExpiredMessages) {
    const int retention_hours = 24;
    store->insert_message("10.0.0.2", Sender::PEER, "expired", ContentType::TEXT, "",
                          now() - (retention_hours + 1) * 3600.0);
    store->insert_message("10.0.0.2", Sender::PEER, "current", ContentType::TEXT, "", now());

    EXPECT_EQ(store->cleanup_older_than(retention_hours), 1u);

    auto history = store->get_history("10.0.0.2");
    ASSERT_EQ(history.size(), 1u);
    EXPECT_EQ(history[0].content, "current");

    EXPECT_EQ(store->cleanup_older_than(retention_hours), 0u);
    EXPECT_THROW(store->cleanup_older_than(-1), std::invalid_argument);
}

TEST_F(StoreTest, DeletePeerHistory) {
    store->insert_message("10.0.0.2", Sender::PEER, "a", ContentType::TEXT, "", now());
    store->insert_message("10.0.0.2", Sender::ME, "b", ContentType::TEXT, "", now());
    store->insert_message("10.0.0.3", Sender::PEER, "c", ContentType::TEXT, "", now());

    EXPECT_EQ(store->delete_peer_history("10.0.0.2"), 2u);
    EXPECT_TRUE(store->get_history("10.0.0.2").empty());
    EXPECT_EQ(store->get_history("10.0.0.3").size(), 1u);
}


// ---- PEERS ----

TEST_F(StoreTest, SavePeerUpserts) {
    store->save_peer("10.0.0.2", "Bob", 100.0);
    store->save_peer("10.0.0.3", "Carol", 200.0);
    store->save_peer("10.0.0.2", "Robert", 300.0);

    auto peers = store->get_all_peers();
    ASSERT_EQ(peers.size(), 2u);
    EXPECT_EQ(peers[0].ip, "10.0.0.2");
    EXPECT_EQ(peers[0].username, "Robert");
    EXPECT_DOUBLE_EQ(peers[0].last_seen, 300.0);

    EXPECT_EQ(store->get_peer_username("10.0.0.3"), "Carol");
    EXPECT_FALSE(store->get_peer_username("10.0.0.99").has_value());
}

TEST_F(StoreTest, AsyncPeerSaves) {
    store->save_peer_async("10.0.0.4", "Dave");
    store->flush();
    EXPECT_EQ(store->get_peer_username("10.0.0.4"), "Dave");
}


// ---- EXPORT AND STATISTICS ----

TEST_F(StoreTest, ExportWritesReadableTranscript) {
    store->save_peer("10.0.0.2", "Bob");
    store->insert_message("10.0.0.2", Sender::PEER, "hi there", ContentType::TEXT, "", now() - 10);
    store->insert_message("10.0.0.2", Sender::ME, "notes.txt", ContentType::FILE, "/home/me/notes.txt", now());

    std::ostringstream out;
    EXPECT_EQ(store->export_chat("10.0.0.2", out), 2u);

    const std::string transcript = out.str();
    EXPECT_THAT(transcript, HasSubstr("Ghost Net Chat History"));
    EXPECT_THAT(transcript, HasSubstr("Peer: Bob (10.0.0.2)"));
    EXPECT_THAT(transcript, HasSubstr("Bob: hi there"));
    EXPECT_THAT(transcript, HasSubstr("You: [FILE] notes.txt"));
    EXPECT_THAT(transcript, HasSubstr("Path: /home/me/notes.txt"));
    EXPECT_LT(transcript.find("hi there"), transcript.find("notes.txt"));
}

TEST_F(StoreTest, ExportToFile) {
    store->insert_message("10.0.0.2", Sender::PEER, "saved", ContentType::TEXT, "", now());

    EXPECT_EQ(store->export_chat("10.0.0.2", dir / "chat.txt"), 1u);
    EXPECT_THAT(read_file(dir / "chat.txt"), HasSubstr("10.0.0.2: saved"));
    EXPECT_THROW(store->export_chat("10.0.0.2", dir / "missing" / "dir" / "chat.txt"), StoreError);
}

TEST_F(StoreTest, Statistics) {
    auto empty = store->get_statistics();
    EXPECT_EQ(empty.total_messages, 0u);
    EXPECT_FALSE(empty.oldest_message.has_value());

    store->save_peer("10.0.0.2", "Bob");
    store->insert_message("10.0.0.2", Sender::PEER, "a", ContentType::TEXT, "", 1000.0);
    store->insert_message("10.0.0.2", Sender::PEER, "b", ContentType::TEXT, "", 2000.0);

    auto stats = store->get_statistics();
    EXPECT_EQ(stats.total_messages, 2u);
    EXPECT_EQ(stats.total_peers, 1u);
    ASSERT_TRUE(stats.oldest_message.has_value());
    EXPECT_DOUBLE_EQ(*stats.oldest_message, 1000.0);
    EXPECT_DOUBLE_EQ(*stats.newest_message, 2000.0);

    EXPECT_NO_THROW(store->vacuum());
}

TEST_F(StoreTest, UnopenableDatabaseThrows) {
    write_file(dir / "blocker", "x");
    EXPECT_THROW({ Store bad(dir / "blocker" / "ghostnet.db", *cipher); }, StoreError);
}
