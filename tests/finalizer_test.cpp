#include "finalizer.hpp"
#include "chunk_planner.hpp"
#include "shuttle/digest.hpp"
#include "shuttle/error.hpp"
#include "test_helpers.hpp"
#include "upload_service.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <thread>

namespace shuttle {
namespace {

using test::MiB;

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<uint8_t>(v >> (8 * i)));
    }
}

// Stored ZIP of empty entries: local headers, central directory, end record
std::vector<uint8_t> make_zip(const std::vector<std::string>& names) {
    const uint16_t version = 20;
    const uint16_t dos_date = 0x0021; // 1980-01-01

    std::vector<uint8_t> out;
    std::vector<uint32_t> offsets;
    for (const auto& name : names) {
        offsets.push_back(static_cast<uint32_t>(out.size()));
        put32(out, 0x04034b50);
        put16(out, version);
        put16(out, 0);        // flags
        put16(out, 0);        // stored
        put16(out, 0);        // time
        put16(out, dos_date);
        put32(out, 0);        // crc of no bytes
        put32(out, 0);        // compressed size
        put32(out, 0);        // uncompressed size
        put16(out, static_cast<uint16_t>(name.size()));
        put16(out, 0);        // extra
        out.insert(out.end(), name.begin(), name.end());
    }

    uint32_t cd_offset = static_cast<uint32_t>(out.size());
    for (size_t i = 0; i < names.size(); ++i) {
        const auto& name = names[i];
        put32(out, 0x02014b50);
        put16(out, version);  // made by
        put16(out, version);  // needed
        put16(out, 0);
        put16(out, 0);
        put16(out, 0);
        put16(out, dos_date);
        put32(out, 0);
        put32(out, 0);
        put32(out, 0);
        put16(out, static_cast<uint16_t>(name.size()));
        put16(out, 0);        // extra
        put16(out, 0);        // comment
        put16(out, 0);        // disk
        put16(out, 0);        // internal attrs
        put32(out, 0);        // external attrs
        put32(out, offsets[i]);
        out.insert(out.end(), name.begin(), name.end());
    }
    uint32_t cd_size = static_cast<uint32_t>(out.size()) - cd_offset;

    put32(out, 0x06054b50);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(names.size()));
    put16(out, static_cast<uint16_t>(names.size()));
    put32(out, cd_size);
    put32(out, cd_offset);
    put16(out, 0);
    return out;
}

class FinalizerTest : public ::testing::Test {
protected:
    FinalizerTest() : service_(test::make_config(dir_)) {}

    std::string begin(const std::vector<uint8_t>& content, const std::string& name = "file.bin") {
        content_ = content;
        total_chunks_ = chunk_count(content.size(), CHUNK_SIZE);
        return service_.handshake(HandshakeRequest{
            "fp-" + std::to_string(content.size()), content.size(), total_chunks_, name}).session_id;
    }

    void send(const std::string& id, uint32_t index) {
        ChunkSpan span = chunk_span(index, content_.size(), CHUNK_SIZE);
        service_.upload_chunk(id, index, total_chunks_, content_.data() + span.offset, span.length);
    }

    errc finalize_error(const std::string& id) {
        try {
            service_.finalize(id);
        } catch (const UploadError& e) {
            return static_cast<errc>(e.code().value());
        }
        ADD_FAILURE() << "finalize succeeded";
        return errc::invalid_argument;
    }

    SessionStatus status(const std::string& id) { return service_.registry().get(id).status; }

    test::TempDir dir_;
    UploadService service_;
    std::vector<uint8_t> content_;
    uint32_t total_chunks_ = 0;
};

TEST_F(FinalizerTest, DigestMatchesFileRegardlessOfArrivalOrder) {
    auto id = begin(test::pattern_bytes(12 * MiB));
    send(id, 1);
    send(id, 2);
    send(id, 0);

    auto result = service_.finalize(id);
    EXPECT_EQ(result.final_hash, sha256_hex(content_.data(), content_.size()));
    EXPECT_TRUE(result.preview_entries.empty());
    EXPECT_EQ(status(id), SessionStatus::COMPLETED);
    EXPECT_EQ(service_.registry().get(id).final_hash, result.final_hash);
}

TEST_F(FinalizerTest, SecondFinalizeAnswersFromStoredResult) {
    auto id = begin(make_zip({"a.txt", "b.txt"}), "bundle.zip");
    send(id, 0);
    auto first = service_.finalize(id);

    // The stored answer must not depend on the blob
    std::filesystem::remove(service_.chunks().blob_path(id));
    auto second = service_.finalize(id);
    EXPECT_EQ(second.final_hash, first.final_hash);
    EXPECT_EQ(second.preview_entries, first.preview_entries);
    EXPECT_EQ(status(id), SessionStatus::COMPLETED);
}

TEST_F(FinalizerTest, IncompleteSessionStaysUploading) {
    auto id = begin(test::pattern_bytes(12 * MiB));
    send(id, 0);
    send(id, 2);

    EXPECT_EQ(finalize_error(id), errc::incomplete);
    EXPECT_EQ(status(id), SessionStatus::UPLOADING);

    send(id, 1);
    EXPECT_EQ(service_.finalize(id).final_hash, sha256_hex(content_.data(), content_.size()));
}

TEST_F(FinalizerTest, UnknownSessionIsNotFound) {
    EXPECT_EQ(finalize_error("missing"), errc::not_found);
}

TEST_F(FinalizerTest, ShortBlobFailsTheSession) {
    auto id = begin(test::pattern_bytes(7 * MiB));
    send(id, 0);
    send(id, 1);
    std::filesystem::resize_file(service_.chunks().blob_path(id), 6 * MiB);

    EXPECT_EQ(finalize_error(id), errc::integrity_failure);
    EXPECT_EQ(status(id), SessionStatus::FAILED);
    EXPECT_EQ(finalize_error(id), errc::invalid_state);
}

TEST_F(FinalizerTest, FailedSessionRestartsOnHandshake) {
    auto content = test::pattern_bytes(7 * MiB);
    auto id = begin(content);
    send(id, 0);
    send(id, 1);
    std::filesystem::resize_file(service_.chunks().blob_path(id), MiB);
    ASSERT_EQ(finalize_error(id), errc::integrity_failure);

    auto again = service_.handshake(HandshakeRequest{"fp-" + std::to_string(content.size()), content.size(), 2, "file.bin"});
    EXPECT_NE(again.session_id, id);
    EXPECT_TRUE(again.uploaded_chunks.empty());
    EXPECT_EQ(status(again.session_id), SessionStatus::UPLOADING);
}

TEST_F(FinalizerTest, ProcessingSessionIsBusy) {
    auto id = begin(test::pattern_bytes(MiB));
    send(id, 0);
    ASSERT_TRUE(service_.store().compare_and_set_status(id, SessionStatus::UPLOADING, SessionStatus::PROCESSING));

    EXPECT_EQ(finalize_error(id), errc::busy);
    EXPECT_TRUE(is_retryable(make_error_code(errc::busy)));
}

TEST_F(FinalizerTest, ConcurrentFinalizeAgreesOnOneResult) {
    auto id = begin(test::pattern_bytes(12 * MiB));
    for (uint32_t i = 0; i < 3; ++i) send(id, i);

    std::vector<std::string> hashes(4);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < hashes.size(); ++t) {
        threads.emplace_back([this, &id, &hashes, t]() {
            try {
                hashes[t] = service_.finalize(id).final_hash;
            } catch (const UploadError& e) {
                // Losers may see the winner still processing
                EXPECT_EQ(e.code(), make_error_code(errc::busy));
            }
        });
    }
    for (auto& th : threads) th.join();

    std::string expected = sha256_hex(content_.data(), content_.size());
    size_t answered = 0;
    for (const auto& h : hashes) {
        if (h.empty()) continue;
        EXPECT_EQ(h, expected);
        ++answered;
    }
    EXPECT_GE(answered, 1u);
    EXPECT_EQ(status(id), SessionStatus::COMPLETED);
}

TEST_F(FinalizerTest, ZipPreviewListsFirstEntries) {
    auto id = begin(make_zip({"one", "two", "three", "four", "five", "six", "seven"}), "photos.zip");
    send(id, 0);

    auto result = service_.finalize(id);
    EXPECT_EQ(result.preview_entries, (std::vector<std::string>{"one", "two", "three", "four", "five"}));
}

TEST_F(FinalizerTest, StoredPreviewKeepsOddNamesExactly) {
    auto id = begin(test::pattern_bytes(1024));
    send(id, 0);

    const std::vector<std::string> preview{"dir/", "a\nb", "c", ""};
    const std::string hash = sha256_hex(content_.data(), content_.size());
    ASSERT_TRUE(service_.store().compare_and_set_status(id, SessionStatus::UPLOADING, SessionStatus::PROCESSING));
    ASSERT_TRUE(service_.store().compare_and_set_status(id, SessionStatus::PROCESSING, SessionStatus::COMPLETED,
                                                        &hash, &preview));

    EXPECT_EQ(service_.registry().get(id).preview_entries, preview);
    auto first = service_.finalize(id);
    auto second = service_.finalize(id);
    EXPECT_EQ(first.preview_entries, preview);
    EXPECT_EQ(second.preview_entries, preview);
    EXPECT_EQ(second.final_hash, hash);
}

TEST_F(FinalizerTest, ArchiveNamesSurviveRepeatedFinalize) {
    auto id = begin(make_zip({"dir/", "a\nb", "c"}), "odd.zip");
    send(id, 0);

    auto first = service_.finalize(id);
    auto second = service_.finalize(id);
    EXPECT_EQ(first.preview_entries, (std::vector<std::string>{"dir/", "a\nb", "c"}));
    EXPECT_EQ(second.preview_entries, first.preview_entries);
}

TEST_F(FinalizerTest, NonArchiveHasNoPreview) {
    auto id = begin(test::pattern_bytes(4096), "notes.zip");
    send(id, 0);
    EXPECT_TRUE(service_.finalize(id).preview_entries.empty());
    EXPECT_EQ(status(id), SessionStatus::COMPLETED);
}

} // namespace
} // namespace shuttle
