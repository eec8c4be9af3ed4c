// Membership and decoding microbenchmark
// Measures key scanning against full JSON decoding and keyed decoding

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "reqbind/core/decoder.hpp"
#include "reqbind/core/key_scanner.hpp"
#include "reqbind/core/schema.hpp"
#include "reqbind/core/source.hpp"

using namespace reqbind;

struct latency_stats {
    void add(int64_t ns) {
        samples.push_back(ns);
        sum_ns += ns;
    }

    void sort() { std::sort(samples.begin(), samples.end()); }

    [[nodiscard]] double percentile(double p) const {
        if (samples.empty()) return 0.0;
        if (samples.size() == 1) return static_cast<double>(samples.front()) / 1e3;

        double rank = (p / 100.0) * static_cast<double>(samples.size() - 1);
        size_t lower = static_cast<size_t>(std::floor(rank));
        size_t upper = static_cast<size_t>(std::ceil(rank));
        double weight = rank - static_cast<double>(lower);
        double interpolated = static_cast<double>(samples[lower]) +
                            (static_cast<double>(samples[upper]) - static_cast<double>(samples[lower])) * weight;
        return interpolated / 1e3;
    }

    std::vector<int64_t> samples;
    int64_t sum_ns = 0;
};

struct address {
    std::string street;
    std::string city;
    int zip = 0;

    static void describe(schema<address>& s) {
        s.field(&address::street, "street");
        s.field(&address::city, "city");
        s.field(&address::zip, "zip");
    }
};

struct user {
    int64_t id = 0;
    std::string name;
    std::vector<std::string> tags;
    std::optional<double> score;
    address home;

    static void describe(schema<user>& s) {
        s.field(&user::id, "id");
        s.field(&user::name, "name");
        s.field(&user::tags, "tags");
        s.field(&user::score, "score");
        s.embed(&user::home);
    }
};

std::string make_payload(size_t padding_items) {
    std::string out = R"({"id": 42, "name": "Ada", "tags": ["a", "b", "c"], "score": 9.5,)";
    out += R"( "street": "Main", "city": "Springfield", "zip": 12345, "padding": [)";
    for (size_t i = 0; i < padding_items; ++i) {
        if (i) out += ",";
        out += R"({"k": "value)" + std::to_string(i) + R"(", "n": [1, 2, 3]})";
    }
    out += "]}";
    return out;
}

template <typename Fn> latency_stats measure(size_t iterations, Fn&& fn) {
    latency_stats stats;
    for (size_t i = 0; i < 1000; ++i) {
        fn();
    }
    for (size_t i = 0; i < iterations; ++i) {
        auto start = std::chrono::steady_clock::now();
        fn();
        auto end = std::chrono::steady_clock::now();
        stats.add(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    }
    stats.sort();
    return stats;
}

void print_stats(const char* label, const latency_stats& stats, size_t bytes) {
    double duration_s = static_cast<double>(stats.sum_ns) / 1e9;
    double ops_per_sec = static_cast<double>(stats.samples.size()) / duration_s;
    std::cout << "  " << label << ":\n";
    std::cout << "    Throughput: " << std::fixed << std::setprecision(2) << ops_per_sec / 1e3 << " K ops/s";
    if (bytes) {
        std::cout << " (" << ops_per_sec * static_cast<double>(bytes) / (1024.0 * 1024.0) << " MB/s)";
    }
    std::cout << "\n";
    std::cout << "    p50:        " << std::fixed << std::setprecision(3) << stats.percentile(50.0) << " us\n";
    std::cout << "    p99:        " << std::fixed << std::setprecision(3) << stats.percentile(99.0) << " us\n";
}

void bench_json(size_t iterations, size_t padding_items) {
    auto payload = make_payload(padding_items);
    bool failed = false;

    auto scan = measure(iterations, [&] {
        auto keys = json::scan_keys(payload);
        failed |= !keys || !keys->has("padding");
    });

    auto full = measure(iterations, [&] {
        user out;
        failed |= !decode_json(payload, out).has_value();
    });

    std::cout << "\n=== JSON body, " << payload.size() << " bytes ===\n";
    print_stats("membership", scan, payload.size());
    print_stats("decode", full, payload.size());
    if (failed) {
        std::cerr << "benchmark payload was rejected\n";
    }
}

void bench_form(size_t iterations) {
    auto parsed = form::from_query("id=42&name=Ada&tags=a&tags=b&tags=c&score=9.5&street=Main&city=Springfield&zip=12345");
    if (!parsed) {
        std::cerr << parsed.error().message << "\n";
        return;
    }
    const form src = std::move(*parsed);
    bool failed = false;

    auto keys = measure(iterations, [&] { failed |= membership(src).size() != 7; });
    auto full = measure(iterations, [&] {
        user out;
        failed |= !decode_form(src, out).has_value();
    });

    std::cout << "\n=== Keyed source, " << src.size() << " keys ===\n";
    print_stats("membership", keys, 0);
    print_stats("decode", full, 0);
    if (failed) {
        std::cerr << "benchmark form was rejected\n";
    }
}

int main() {
    std::cout << "REQBIND Membership/Decode Microbenchmark\n";
    std::cout << "========================================\n";

    constexpr size_t iterations = 100000;

    bench_json(iterations, 0);
    bench_json(iterations, 64);
    bench_json(iterations / 10, 4096);
    bench_form(iterations);

    std::cout << "\nAll benchmarks completed\n";
    return 0;
}
