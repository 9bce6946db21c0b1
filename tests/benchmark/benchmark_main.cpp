#include <speakerid/speakerid_api.h>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

// Helper: synthetic unit embedding for one voice
static std::vector<float> generate_voice(unsigned seed, int dim) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, 1.0f);
    std::vector<float> v(dim);
    double norm = 0.0;
    for (auto& x : v) {
        x = dist(rng);
        norm += static_cast<double>(x) * x;
    }
    for (auto& x : v) x = static_cast<float>(x / std::sqrt(norm));
    return v;
}

// Another utterance of the same voice
static std::vector<float> perturb(const std::vector<float>& base, float level, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> dist(0.0f, level / std::sqrt(static_cast<float>(base.size())));
    std::vector<float> v(base);
    double norm = 0.0;
    for (auto& x : v) {
        x += dist(rng);
        norm += static_cast<double>(x) * x;
    }
    for (auto& x : v) x = static_cast<float>(x / std::sqrt(norm));
    return v;
}

struct BenchmarkResult {
    std::string name;
    double p50_ms;
    double p95_ms;
    double mean_ms;
    bool passed;
    double target_ms;
};

static BenchmarkResult summarize(const std::string& name, std::vector<double> timings,
                                 double target_ms) {
    BenchmarkResult r;
    r.name = name;
    r.target_ms = target_ms;
    if (timings.empty()) {
        r.mean_ms = r.p50_ms = r.p95_ms = 0.0;
        r.passed = false;
        std::cout << "  No successful samples: FAIL" << std::endl;
        return r;
    }

    std::sort(timings.begin(), timings.end());
    double mean = 0;
    for (double t : timings) mean += t;
    mean /= timings.size();

    r.mean_ms = mean;
    r.p50_ms = timings[timings.size() / 2];
    r.p95_ms = timings[static_cast<size_t>(timings.size() * 0.95)];
    r.passed = r.p95_ms <= r.target_ms;

    std::cout << "  P95: " << r.p95_ms << " ms (target: <= " << r.target_ms << " ms) "
              << (r.passed ? "PASS" : "FAIL") << std::endl;
    return r;
}

static void print_report(const std::vector<BenchmarkResult>& results,
                         const std::string& extra_info,
                         const std::string& filename) {
    std::ofstream report(filename);
    report << "=== SpeakerID Benchmark Report ===\n\n";

    for (const auto& r : results) {
        report << r.name << ":\n";
        report << "  Mean: " << r.mean_ms << " ms\n";
        report << "  P50:  " << r.p50_ms << " ms\n";
        report << "  P95:  " << r.p95_ms << " ms\n";
        report << "  Target: " << r.target_ms << " ms\n";
        report << "  Result: " << (r.passed ? "PASS" : "FAIL") << "\n\n";
    }

    if (!extra_info.empty()) {
        report << extra_info;
    }

    report.close();
    std::cout << "\nBenchmark report saved to: " << filename << std::endl;
}

int main(int argc, char* argv[]) {
    const int dim = argc > 1 ? std::atoi(argv[1]) : 192;
    const int segments = argc > 2 ? std::atoi(argv[2]) : 2000;
    if (dim <= 0 || segments <= 0) {
        std::cerr << "usage: speakerid_benchmark [dim] [segments]" << std::endl;
        return 1;
    }
    std::vector<BenchmarkResult> results;
    std::string extra_info;

    std::cout << "=== SpeakerID Benchmark ===" << std::endl;
    sid_set_log_level(SID_LOG_LEVEL_WARN);

    SidConfig config;
    sid_default_config(&config);
    config.num_speakers = 10;
    // Unrelated random voices: keep every segment on a primary speaker
    config.closed_set = 1;

    SidSession* session = nullptr;
    if (sid_session_create(&config, &session) != SID_OK) {
        std::cerr << "Create failed: " << sid_get_last_error() << std::endl;
        return 1;
    }

    std::vector<std::vector<float>> voices;
    for (int v = 0; v < 10; ++v) {
        voices.push_back(generate_voice(1000 + v, dim));
    }

    // =============================================
    // Benchmark 1: per-segment assignment, 10 speakers
    // =============================================
    {
        std::cout << "\n[Benchmark 1] Assigning " << segments << " segments..." << std::endl;
        std::vector<double> timings;
        timings.reserve(segments);
        std::mt19937 rng(7);

        for (int i = 0; i < segments; ++i) {
            const auto& voice = voices[rng() % voices.size()];
            auto e = perturb(voice, 0.3f, static_cast<unsigned>(i));
            SidDecision d;

            auto start = std::chrono::high_resolution_clock::now();
            int ret = sid_assign(session, e.data(), dim, &d);
            auto end = std::chrono::high_resolution_clock::now();

            if (ret == SID_OK) {
                timings.push_back(std::chrono::duration<double, std::milli>(end - start).count());
            }
        }

        results.push_back(summarize("Assign (" + std::to_string(dim) + "-dim, 10 speakers)",
                                    timings, 1.0));
        std::cout << "  Speakers: " << sid_get_speaker_count(session) << std::endl;
    }

    // =============================================
    // Benchmark 2: mid-session enrollment + full replay
    // =============================================
    {
        std::cout << "\n[Benchmark 2] Enrolling 3 voices and replaying the session..." << std::endl;
        SidEnrolledSpeaker enrolled[3];
        for (int i = 0; i < 3; ++i) {
            std::memset(&enrolled[i], 0, sizeof(enrolled[i]));
            std::snprintf(enrolled[i].id, sizeof(enrolled[i].id), "voice-%d", i);
            std::snprintf(enrolled[i].name, sizeof(enrolled[i].name), "Voice %d", i);
            enrolled[i].centroid = voices[i].data();
            enrolled[i].dimension = dim;
        }
        sid_import_enrolled(session, enrolled, 3, nullptr);

        std::vector<SidSpeakerChange> changes(segments);
        int count = 0;

        auto start = std::chrono::high_resolution_clock::now();
        int ret = sid_recluster_from_index(session, 0, changes.data(),
                                           static_cast<int>(changes.size()), &count);
        auto end = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration<double, std::milli>(end - start).count();

        BenchmarkResult r;
        r.name = "Replay (" + std::to_string(segments) + " segments)";
        r.mean_ms = ms;
        r.p50_ms = ms;
        r.p95_ms = ms;
        r.target_ms = 1000.0;
        r.passed = ret == SID_OK && ms <= r.target_ms;
        results.push_back(r);

        std::cout << "  Replay time: " << ms << " ms, " << count << " segments relabeled "
                  << (r.passed ? "PASS" : "FAIL") << std::endl;

        std::ostringstream oss;
        oss << "Replay after enrollment:\n";
        oss << "  Segments relabeled: " << count << "\n";
        oss << "  Live speakers:      " << sid_get_speaker_count(session) << "\n\n";
        extra_info += oss.str();
    }

    sid_session_destroy(session);

    print_report(results, extra_info, "benchmark_report.txt");
    return 0;
}
