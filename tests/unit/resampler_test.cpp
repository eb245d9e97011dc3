// Copyright (c) 2025 VAM Voice Relay
#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <vector>
#include "audio/resampler.hpp"

using audio::resample_linear;

static void test_identity() {
    std::mt19937 rng(7);
    std::uniform_int_distribution<int> dist(-32768, 32767);
    for (int rate : {8000, 16000, 44100, 48000}) {
        std::vector<int16_t> x(333);
        for (auto& s : x) s = static_cast<int16_t>(dist(rng));
        assert(resample_linear(x, rate, rate) == x);
    }
    assert(resample_linear({}, 16000, 16000).empty());
}

static void test_length_44100_to_16000() {
    for (size_t n : {0u, 1u, 2u, 441u, 882u, 1000u, 4410u, 44100u}) {
        std::vector<int16_t> x(n, 100);
        auto y = resample_linear(x, 44100, 16000);
        const double expected = std::floor(static_cast<double>(n) * 16000.0 / 44100.0);
        assert(std::fabs(static_cast<double>(y.size()) - expected) <= 1.0);
    }
    // Whole 10 ms chunk: exact
    assert(resample_linear(std::vector<int16_t>(441), 44100, 16000).size() == 160);
}

static void test_interpolation_truncates_toward_zero() {
    // ratio 1.5: output 1 sits halfway between input 1 and 2
    auto up = resample_linear({0, 3, 0, 0}, 3, 2);
    assert(up.size() == 2);
    assert(up[0] == 0);
    assert(up[1] == 1);   // 1.5 -> 1

    auto down = resample_linear({0, -3, 0, 0}, 3, 2);
    assert(down[1] == -1);   // -1.5 -> -1

    auto mid = resample_linear({0, 10, 20, 30}, 3, 2);
    assert(mid[1] == 15);
}

static void test_upsample_clamps_last_index() {
    auto y = resample_linear({0, 10}, 1, 2);
    assert(y.size() == 4);
    assert(y[0] == 0);
    assert(y[1] == 5);
    assert(y[2] == 10);
    assert(y[3] == 10);   // past the end: both taps are the last sample
}

static void test_chunks_resample_independently() {
    // Two halves resampled separately restart their phase at 0
    std::vector<int16_t> a{0, 100, 200, 300, 400};
    std::vector<int16_t> b{500, 600, 700, 800, 900};
    auto ya = resample_linear(a, 3, 2);
    auto yb = resample_linear(b, 3, 2);
    assert(ya.size() == 3 && yb.size() == 3);
    assert(ya[0] == 0);
    assert(yb[0] == 500);
}

static void test_rejects_non_positive_rates() {
    bool threw = false;
    try { resample_linear({1, 2}, 0, 16000); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
    threw = false;
    try { resample_linear({1, 2}, 44100, -1); } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);
}

static void test_pcm16_bytes() {
    const uint8_t bytes[] = {0x01, 0x00, 0xFF, 0xFF, 0x00, 0x80, 0x7F};   // odd tail
    auto s = audio::pcm16_from_bytes(bytes, sizeof(bytes));
    assert(s.size() == 3);
    assert(s[0] == 1);
    assert(s[1] == -1);
    assert(s[2] == -32768);
    auto back = audio::pcm16_to_bytes(s);
    assert(back.size() == 6);
    for (size_t i = 0; i < back.size(); ++i) assert(back[i] == bytes[i]);
}

int main() {
    test_identity();
    test_length_44100_to_16000();
    test_interpolation_truncates_toward_zero();
    test_upsample_clamps_last_index();
    test_chunks_resample_independently();
    test_rejects_non_positive_rates();
    test_pcm16_bytes();
    std::cout << "resampler_test: PASS\n";
    return 0;
}
