#include <gtest/gtest.h>
#include "manager/session_resolver.h"
#include "test_embeddings.h"

using namespace sid;
using sid_test::axis;
using sid_test::related_voice;
using sid_test::stranger;
using sid_test::tilt;

namespace {

std::vector<EnrolledSpeaker> alice_and_bob() {
    return {EnrolledSpeaker("alice-id", "Alice", axis(0), 1),
            EnrolledSpeaker("bob-id", "Bob", tilt(0, 1, 0.6f), 2)};
}

} // namespace

TEST(SessionResolverTest, AppendSegmentRecordsHistory) {
    SessionResolver session;
    auto res = session.append_segment(axis(0));
    EXPECT_EQ(res.speaker_id, 0);
    EXPECT_EQ(res.label, "Speaker 1");

    res = session.append_segment(axis(5), true);
    EXPECT_TRUE(res.environmental);
    EXPECT_EQ(res.speaker_id, kUnassignedSpeakerId);
    EXPECT_TRUE(res.label.empty());

    ASSERT_EQ(session.history().size(), 2u);
    EXPECT_TRUE(session.history()[0].contributed);
    EXPECT_TRUE(session.history()[1].environmental);
    EXPECT_EQ(session.history()[1].speaker_id, kUnassignedSpeakerId);
    EXPECT_EQ(session.engine().speaker_count(), 1);
}

TEST(SessionResolverTest, ResolveDoesNotRecord) {
    SessionResolver session;
    session.resolve(axis(0));
    EXPECT_TRUE(session.history().empty());
    EXPECT_EQ(session.engine().speaker_count(), 1);
}

TEST(SessionResolverTest, ProcessPhrasesInheritsSpeaker) {
    SessionResolver session;
    std::vector<Phrase> phrases = {
        {{}, false},
        {axis(0), false},
        {{}, false},
        {axis(3), true},
        {tilt(0, 1, 0.6f), false},
        {{}, false},
    };

    auto results = session.process_phrases(phrases);
    ASSERT_EQ(results.size(), 6u);

    EXPECT_EQ(results[0].speaker_id, 0);
    EXPECT_EQ(results[0].decision.reason, DecisionReason::Inherited);
    EXPECT_EQ(results[1].decision.reason, DecisionReason::NewSpeaker);
    EXPECT_EQ(results[2].speaker_id, 0);
    EXPECT_EQ(results[2].decision.reason, DecisionReason::Inherited);
    EXPECT_TRUE(results[3].environmental);
    EXPECT_EQ(results[4].speaker_id, 1);
    EXPECT_EQ(results[5].speaker_id, 1);
    EXPECT_EQ(results[5].decision.reason, DecisionReason::Inherited);
    EXPECT_EQ(results[5].label, "Speaker 2");

    EXPECT_EQ(session.history().size(), 6u);
    EXPECT_FALSE(session.history()[5].contributed);
}

TEST(SessionResolverTest, NoConfidentMatchGoesToUnknownCluster) {
    SessionResolver session;
    session.engine().import_enrolled_speakers(
        {EnrolledSpeaker("a", "Alice", axis(0)), EnrolledSpeaker("b", "Bob", axis(1))});

    auto res = session.append_segment(tilt(1, 6, 0.6f));
    EXPECT_EQ(res.decision.reason, DecisionReason::NoConfidentMatch);
    ASSERT_TRUE(res.unknown.has_value());
    EXPECT_EQ(res.unknown->reason, DecisionReason::UnknownNewCluster);
    EXPECT_EQ(res.speaker_id, kUnknownSpeakerBase);
    EXPECT_EQ(res.label, "Unknown 1");
    EXPECT_EQ(res.closest_enrolled, "Bob");
    EXPECT_TRUE(res.contributed);

    res = session.append_segment(tilt(1, 6, 0.6f));
    EXPECT_EQ(res.unknown->reason, DecisionReason::UnknownClusterMatch);

    auto unknown = session.unknown().all_unknown_speakers();
    ASSERT_EQ(unknown.size(), 1u);
    EXPECT_EQ(unknown[0].closest_enrolled->name, "Bob");
    EXPECT_EQ(unknown[0].closest_enrolled->occurrences, 2);
}

TEST(SessionResolverTest, AmbiguousMatchDisplaysRunnerUp) {
    SessionResolver session;
    session.engine().import_enrolled_speakers(alice_and_bob());

    auto res = session.append_segment(sid_test::normalized({1.7f, 0.8f, 0, 0, 0, 0, 0, 0}));
    EXPECT_EQ(res.decision.reason, DecisionReason::AmbiguousMatch);
    EXPECT_EQ(res.label, "Alice");
    EXPECT_EQ(session.display_label(res), "Alice (Bob?)");

    res = session.append_segment(axis(0));
    EXPECT_EQ(session.display_label(res), "Alice");
}

TEST(SessionResolverTest, EnrollmentMidSessionThenRecluster) {
    EngineConfig cfg;
    cfg.num_speakers = 3;
    SessionResolver session(cfg);

    auto alice = sid_test::related_voice(0);
    auto bob = sid_test::related_voice(1);
    for (unsigned i = 0; i < 3; ++i) session.append_segment(sid_test::noisy(alice, 0.05f, i));
    session.append_segment(sid_test::noisy(bob, 0.05f, 10));
    session.append_segment({}, true);
    session.append_segment(sid_test::noisy(alice, 0.05f, 3));
    ASSERT_EQ(session.speaker_label(session.history()[0].speaker_id), "Speaker 1");

    session.engine().import_enrolled_speakers({EnrolledSpeaker("alice-id", "Alice", alice)});

    auto outcome = session.recluster_from_index(0);
    ASSERT_EQ(outcome.changes.size(), 4u);
    EXPECT_EQ(outcome.changes.back().index, 5u);
    EXPECT_EQ(outcome.changes.back().new_label, "Alice");
    EXPECT_EQ(session.history()[0].speaker_id, 0);

    session.apply(std::move(outcome));
    EXPECT_EQ(session.speaker_label(session.history()[0].speaker_id), "Alice");
    EXPECT_EQ(session.speaker_label(session.history()[3].speaker_id), "Speaker 2");
    EXPECT_TRUE(session.history()[4].environmental);
    EXPECT_EQ(session.history()[4].speaker_id, kUnassignedSpeakerId);

    // The live alice stream now lands on the enrolled record
    auto res = session.append_segment(sid_test::noisy(alice, 0.05f, 4));
    EXPECT_EQ(res.label, "Alice");
    EXPECT_EQ(res.decision.reason, DecisionReason::ConfidentMatch);
}

TEST(SessionResolverTest, ResetClearsSession) {
    SessionResolver session;
    session.engine().import_enrolled_speakers(
        {EnrolledSpeaker("a", "Alice", axis(0)), EnrolledSpeaker("b", "Bob", axis(1))});
    session.append_segment(tilt(1, 6, 0.6f));
    ASSERT_EQ(session.unknown().cluster_count(), 1);

    session.reset(true);
    EXPECT_TRUE(session.history().empty());
    EXPECT_EQ(session.unknown().cluster_count(), 0);
    EXPECT_EQ(session.engine().enrolled_count(), 2);

    session.reset(false);
    EXPECT_EQ(session.engine().speaker_count(), 0);
}

TEST(SessionResolverTest, UnrelatedVoiceAtCapacityGoesToUnknownCluster) {
    EngineConfig cfg;
    cfg.num_speakers = 2;
    SessionResolver session(cfg);

    ASSERT_EQ(session.append_segment(related_voice(0, 0.6f, 8)).speaker_id, 0);
    ASSERT_EQ(session.append_segment(related_voice(1, 0.6f, 8)).speaker_id, 1);

    auto outsider = stranger(2, 0.40f, 0.6f, 8);
    auto res = session.append_segment(outsider);
    EXPECT_EQ(res.decision.reason, DecisionReason::NoConfidentMatch);
    EXPECT_FALSE(res.decision.forced_assignment);
    EXPECT_NEAR(res.decision.similarity, 0.40f, 1e-4f);
    ASSERT_TRUE(res.unknown.has_value());
    EXPECT_EQ(res.unknown->reason, DecisionReason::UnknownNewCluster);
    EXPECT_EQ(res.speaker_id, kUnknownSpeakerBase);

    res = session.append_segment(sid_test::noisy(outsider, 0.05f, 7));
    EXPECT_EQ(res.decision.reason, DecisionReason::NoConfidentMatch);
    ASSERT_TRUE(res.unknown.has_value());
    EXPECT_EQ(res.unknown->reason, DecisionReason::UnknownClusterMatch);
    EXPECT_EQ(res.speaker_id, kUnknownSpeakerBase);
    EXPECT_EQ(session.unknown().cluster_info(kUnknownSpeakerBase)->segment_count, 2);

    // Neither primary speaker absorbed the outsider
    EXPECT_EQ(session.engine().speaker_count(), 2);
    EXPECT_EQ(session.engine().find_speaker(0)->sample_count(), 1);
    EXPECT_EQ(session.engine().find_speaker(1)->sample_count(), 1);
}

TEST(SessionResolverTest, BelowMinimumWithFreeSlotGoesToUnknownCluster) {
    EngineConfig cfg;
    cfg.num_speakers = 3;
    SessionResolver session(cfg);
    session.append_segment(related_voice(0, 0.6f, 8));
    session.append_segment(related_voice(1, 0.6f, 8));

    auto res = session.append_segment(stranger(2, 0.40f, 0.6f, 8));
    EXPECT_EQ(res.decision.reason, DecisionReason::NoConfidentMatch);
    EXPECT_EQ(res.speaker_id, kUnknownSpeakerBase);
    EXPECT_EQ(session.engine().speaker_count(), 2);
}

TEST(SessionResolverTest, RemovedSegmentIsNotUndoneAgainByReplay) {
    SessionResolver session;
    auto a = sid_test::random_voice(31);
    std::vector<std::vector<float>> samples;
    for (unsigned i = 0; i < 3; ++i) {
        samples.push_back(sid_test::noisy(a, 0.05f, 300 + i));
        ASSERT_EQ(session.append_segment(samples.back()).speaker_id, 0);
    }
    ASSERT_EQ(session.engine().find_speaker(0)->sample_count(), 3);

    ASSERT_TRUE(session.remove_from_centroid(0, samples[2]));
    EXPECT_EQ(session.engine().find_speaker(0)->sample_count(), 2);
    EXPECT_FALSE(session.history()[2].contributed);

    auto outcome = session.recluster_from_index(2);
    EXPECT_TRUE(outcome.changes.empty());
    session.apply(std::move(outcome));
    EXPECT_EQ(session.engine().find_speaker(0)->sample_count(), 3);
    EXPECT_TRUE(session.history()[2].contributed);

    // A second undo of the same segment is refused
    ASSERT_TRUE(session.undo_segment(2));
    EXPECT_FALSE(session.undo_segment(2));
    EXPECT_EQ(session.engine().find_speaker(0)->sample_count(), 2);
    EXPECT_FALSE(session.undo_segment(99));
}

TEST(SessionResolverTest, RemovingUnknownSegmentDropsClosestEnrolled) {
    SessionResolver session;
    session.engine().import_enrolled_speakers(
        {EnrolledSpeaker("a", "Alice", axis(0)), EnrolledSpeaker("b", "Bob", axis(1))});

    auto first = tilt(1, 6, 0.6f);
    auto second = sid_test::noisy(first, 0.05f, 3);
    session.append_segment(first);
    ASSERT_EQ(session.append_segment(second).speaker_id, kUnknownSpeakerBase);
    auto info = session.unknown().cluster_info(kUnknownSpeakerBase);
    ASSERT_TRUE(info->closest_enrolled.has_value());
    ASSERT_EQ(info->closest_enrolled->occurrences, 2);

    ASSERT_TRUE(session.remove_from_centroid(kUnknownSpeakerBase, second));
    info = session.unknown().cluster_info(kUnknownSpeakerBase);
    EXPECT_EQ(info->segment_count, 1);
    ASSERT_TRUE(info->closest_enrolled.has_value());
    EXPECT_EQ(info->closest_enrolled->name, "Bob");
    EXPECT_EQ(info->closest_enrolled->occurrences, 1);
    EXPECT_FALSE(session.history()[1].contributed);
}
