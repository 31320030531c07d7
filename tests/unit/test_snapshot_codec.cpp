/**
 * @file test_snapshot_codec.cpp
 * @brief Unit tests for the TOML queue snapshot codec.
 */

#include "store/snapshot_codec.hpp"

#include <gtest/gtest.h>

using namespace render_batch;

namespace {

Job full_job() {
    Job job;
    job.id = "shot-010";
    job.payload = Blob{0x00, 0x7f, 0x80, 0xff, 'a'};
    job.max_attempts = 4;
    job.created_at = from_epoch_us(1'700'000'000'000'001);
    job.timeout = Duration{2'500'000};
    job.timeout_retryable = false;

    (void)apply_mutation(job, JobMutation::start(from_epoch_us(1'700'000'000'100'000)));
    (void)apply_mutation(job, JobMutation::fail(FailureClass::Timeout, "deadline \"exceeded\"\nline 2",
                                                from_epoch_us(1'700'000'000'200'000)));
    (void)apply_mutation(job, JobMutation::retry(from_epoch_us(1'700'000'001'200'000),
                                                 from_epoch_us(1'700'000'000'200'000)));
    (void)apply_mutation(job, JobMutation::start(from_epoch_us(1'700'000'001'300'000)));
    (void)apply_mutation(job, JobMutation::complete(Blob{1, 2, 3},
                                                    from_epoch_us(1'700'000'001'400'000)));
    return job;
}

}  // namespace

TEST(SnapshotCodecTest, HexRoundTrip) {
    Blob blob{0x00, 0x01, 0xab, 0xff};
    auto hex = SnapshotCodec::hex_encode(blob);
    EXPECT_EQ(hex, "0001abff");

    Blob decoded;
    ASSERT_TRUE(SnapshotCodec::hex_decode(hex, decoded));
    EXPECT_EQ(decoded, blob);
    ASSERT_TRUE(SnapshotCodec::hex_decode("0001ABFF", decoded));
    EXPECT_EQ(decoded, blob);
}

TEST(SnapshotCodecTest, HexRejectsMalformed) {
    Blob out;
    EXPECT_FALSE(SnapshotCodec::hex_decode("abc", out));
    EXPECT_FALSE(SnapshotCodec::hex_decode("zz", out));
}

TEST(SnapshotCodecTest, EmptyQueue) {
    auto text = SnapshotCodec::encode({});
    auto decoded = SnapshotCodec::decode(text);
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    EXPECT_TRUE(decoded->empty());
}

TEST(SnapshotCodecTest, PreservesEveryField) {
    Job pending;
    pending.id = "shot-020";
    pending.payload = to_blob("frames=1-240");
    pending.max_attempts = 1;
    pending.created_at = from_epoch_us(1'700'000'000'000'002);

    std::vector<Job> jobs{full_job(), pending};
    auto decoded = SnapshotCodec::decode(SnapshotCodec::encode(jobs));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().message;
    ASSERT_EQ(decoded->size(), 2u);
    EXPECT_EQ((*decoded)[0], jobs[0]);
    EXPECT_EQ((*decoded)[1], jobs[1]);
}

TEST(SnapshotCodecTest, KeepsInsertionOrder) {
    std::vector<Job> jobs;
    for (const char* id : {"c", "a", "b"}) {
        Job job;
        job.id = id;
        job.created_at = from_epoch_us(1);
        jobs.push_back(job);
    }
    auto decoded = SnapshotCodec::decode(SnapshotCodec::encode(jobs));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ((*decoded)[0].id, "c");
    EXPECT_EQ((*decoded)[1].id, "a");
    EXPECT_EQ((*decoded)[2].id, "b");
}

TEST(SnapshotCodecTest, RejectsGarbage) {
    auto decoded = SnapshotCodec::decode("this is [[ not toml");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}

TEST(SnapshotCodecTest, RejectsMissingSchemaVersion) {
    auto decoded = SnapshotCodec::decode("jobs = []\n");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}

TEST(SnapshotCodecTest, RejectsSchemaMismatch) {
    auto decoded = SnapshotCodec::decode("schema_version = 2\n");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}

TEST(SnapshotCodecTest, RejectsUnknownState) {
    auto decoded = SnapshotCodec::decode(R"(
schema_version = 1
[[jobs]]
id = "x"
payload = ""
state = "paused"
attempt_count = 0
max_attempts = 1
created_at_us = 0
eligible_at_us = 0
)");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}

TEST(SnapshotCodecTest, RejectsAttemptCountAboveMax) {
    auto decoded = SnapshotCodec::decode(R"(
schema_version = 1
[[jobs]]
id = "x"
payload = ""
state = "failed"
attempt_count = 3
max_attempts = 2
created_at_us = 0
eligible_at_us = 0
)");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}

TEST(SnapshotCodecTest, RejectsDuplicateIds) {
    auto decoded = SnapshotCodec::decode(R"(
schema_version = 1
[[jobs]]
id = "x"
payload = ""
state = "pending"
attempt_count = 0
max_attempts = 1
created_at_us = 0
eligible_at_us = 0
[[jobs]]
id = "x"
payload = ""
state = "pending"
attempt_count = 0
max_attempts = 1
created_at_us = 0
eligible_at_us = 0
)");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}

TEST(SnapshotCodecTest, RejectsMissingRequiredField) {
    auto decoded = SnapshotCodec::decode(R"(
schema_version = 1
[[jobs]]
id = "x"
state = "pending"
)");
    ASSERT_FALSE(decoded.has_value());
    EXPECT_TRUE(decoded.error().is(ErrorCode::CorruptState));
}
