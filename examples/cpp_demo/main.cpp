#include <speakerid/speakerid_api.h>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <random>
#include <string>
#include <vector>

// Stand-in for an embedding model: a direction shared by every voice on the
// channel plus one random direction per voice, so two voices score about 0.6
static std::vector<float> make_voice(unsigned seed, int dim) {
    std::mt19937 shared_rng(7);
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(dim);
    double norm = 0.0;
    for (auto& x : v) {
        x = std::sqrt(0.6f) * dist(shared_rng) + std::sqrt(0.4f) * dist(rng);
        norm += static_cast<double>(x) * x;
    }
    for (auto& x : v) x = static_cast<float>(x / std::sqrt(norm));
    return v;
}

static std::vector<float> utterance(const std::vector<float>& voice, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 0.05f / std::sqrt(static_cast<float>(voice.size())));
    std::vector<float> v(voice);
    for (auto& x : v) x += dist(rng);
    return v;
}

static void print_decision(int index, const SidDecision& d) {
    std::cout << "  #" << index << " -> " << d.display_label
              << " (" << sid_reason_name(d.reason) << ", sim=" << d.similarity << ")" << std::endl;
}

int main(int argc, char* argv[]) {
    std::cout << "=== SpeakerID C++ Demo ===" << std::endl;

    const int dim = argc > 1 ? std::atoi(argv[1]) : 192;
    if (dim <= 0) {
        std::cerr << "usage: speakerid_demo [dim]" << std::endl;
        return 1;
    }

    // 1. Create a session for one channel
    std::cout << "\n[1] Creating session..." << std::endl;
    SidConfig config;
    sid_default_config(&config);
    config.num_speakers = 3;

    SidSession* session = nullptr;
    int ret = sid_session_create(&config, &session);
    if (ret != SID_OK) {
        std::cerr << "Create failed: " << sid_get_last_error() << std::endl;
        return 1;
    }

    auto alice = make_voice(1, dim);
    auto bob = make_voice(2, dim);

    // 2. Live phrases before anyone is enrolled
    std::cout << "\n[2] Processing phrases..." << std::endl;
    const std::vector<const std::vector<float>*> script = {&alice, &alice, &bob, &alice, &bob};
    for (size_t i = 0; i < script.size(); ++i) {
        auto e = utterance(*script[i], static_cast<unsigned>(100 + i));
        SidDecision d;
        ret = sid_assign(session, e.data(), dim, &d);
        if (ret != SID_OK) {
            std::cerr << "Assign failed: " << sid_get_last_error() << std::endl;
            sid_session_destroy(session);
            return 1;
        }
        print_decision(static_cast<int>(i), d);
    }
    sid_add_environmental(session);

    // 3. Alice enrolls mid-session
    std::cout << "\n[3] Enrolling Alice..." << std::endl;
    ret = sid_enroll_speaker(session, "alice", "Alice", alice.data(), dim, 1);
    if (ret != SID_OK) {
        std::cerr << "Enroll failed: " << sid_get_last_error() << std::endl;
    }

    // 4. Re-decide the session so far
    std::cout << "\n[4] Re-clustering from the first phrase..." << std::endl;
    std::vector<SidSpeakerChange> changes(16);
    int count = 0;
    ret = sid_recluster_from_index(session, 0, changes.data(),
                                   static_cast<int>(changes.size()), &count);
    if (ret != SID_OK) {
        std::cerr << "Recluster failed: " << sid_get_last_error() << std::endl;
    } else {
        for (int i = 0; i < count; ++i) {
            std::cout << "  #" << changes[i].index << ": " << changes[i].old_speaker_id
                      << " -> " << changes[i].new_label << std::endl;
        }
    }

    // 5. Export the enrolled set for the caller's store
    std::cout << "\n[5] Exporting enrolled speakers..." << std::endl;
    SidEnrolledSpeaker enrolled[4];
    std::vector<float> centroids(4 * static_cast<size_t>(dim));
    ret = sid_export_enrolled(session, enrolled, 4, centroids.data(),
                              static_cast<int>(centroids.size()), &count);
    if (ret == SID_OK) {
        for (int i = 0; i < count; ++i) {
            std::cout << "  " << enrolled[i].id << ": " << enrolled[i].name
                      << " (" << enrolled[i].dimension << " dims)" << std::endl;
        }
    }

    std::cout << "\nLive speakers: " << sid_get_speaker_count(session) << std::endl;
    sid_session_destroy(session);
    std::cout << "\nDemo completed." << std::endl;
    return 0;
}
