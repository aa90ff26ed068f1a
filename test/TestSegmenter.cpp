/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

/*
  Pianoscribe

  Transcription of piano recordings into two-staff notation.
    
  This program is free software; you can redistribute it and/or
  modify it under the terms of the GNU General Public License as
  published by the Free Software Foundation; either version 2 of the
  License, or (at your option) any later version.  See the file
  COPYING included with this distribution for more information.
*/

#include "Segmenter.h"
#include "OnsetDetector.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <vector>

using namespace std;

BOOST_AUTO_TEST_SUITE(TestSegmenter)

static const int rate = 44100;

static AudioBuffer
toneWithSilence(double lead, double tone, double tail)
{
    int a = int(lead * rate), b = int(tone * rate), c = int(tail * rate);
    vector<float> s(a + b + c, 0.f);
    double f = 261.6256;
    for (int i = 0; i < b; ++i) {
        s[a + i] = 0.5f * float(sin(2.0 * M_PI * f * i / rate));
    }
    return AudioBuffer(s, rate);
}

BOOST_AUTO_TEST_CASE(run_and_minimum_lengths)
{
    TranscriptionParameters params;
    BOOST_CHECK_EQUAL(Segmenter(rate, params, 120.0).getSilenceRunFrames(), 11);
    BOOST_CHECK_EQUAL(Segmenter(rate, params, 300.0).getSilenceRunFrames(), 4);
    BOOST_CHECK_EQUAL(Segmenter(rate, params, 20.0).getSilenceRunFrames(), 20);
    BOOST_CHECK_EQUAL(Segmenter(rate, params, 120.0).getMinimumFrames(), 5);
    BOOST_CHECK_EQUAL(Segmenter(rate, params, 300.0).getMinimumFrames(), 2);
}

BOOST_AUTO_TEST_CASE(noise_floor)
{
    TranscriptionParameters params;
    Segmenter segmenter(rate, params, 120.0);
    vector<double> levels;
    for (int i = 0; i < 10; ++i) levels.push_back(9 - i);
    BOOST_CHECK_CLOSE(segmenter.getNoiseFloor(levels), 1.8, 1e-9);
    BOOST_CHECK_EQUAL(segmenter.getNoiseFloor(vector<double>()), 0.0);

    // With no quiet frames the floor is held at half the median
    BOOST_CHECK_CLOSE(segmenter.getNoiseFloor(vector<double>(20, 1.0)), 0.5, 1e-9);
    levels = vector<double>(20, 0.0);
    levels[19] = 1.0;
    BOOST_CHECK_EQUAL(segmenter.getNoiseFloor(levels), 0.0);
}

BOOST_AUTO_TEST_CASE(frame_levels)
{
    TranscriptionParameters params;
    Segmenter segmenter(rate, params, 120.0);
    vector<float> dc(rate, 0.5f);
    vector<double> levels = segmenter.getFrameLevels(dc);
    BOOST_CHECK_EQUAL(int(levels.size()), 1 + rate / params.hopSize);
    BOOST_CHECK_CLOSE(levels[10], 0.5, 1e-6);
    BOOST_CHECK_CLOSE(levels[0], 0.5 / sqrt(2.0), 1e-6);
}

BOOST_AUTO_TEST_CASE(fallback_boundaries)
{
    TranscriptionParameters params;
    Segmenter segmenter(rate, params, 120.0);
    vector<double> flat(200, 0.0);
    vector<double> b = segmenter.findBoundaries(flat, 1.7);
    BOOST_CHECK_EQUAL(int(b.size()), 5);
    BOOST_CHECK_EQUAL(b[0], 0.0);
    BOOST_CHECK_EQUAL(b[1], 0.5);
    BOOST_CHECK_EQUAL(b[3], 1.5);
    BOOST_CHECK_EQUAL(b[4], 1.7);
}

BOOST_AUTO_TEST_CASE(silence_has_no_segments)
{
    TranscriptionParameters params;
    Segmenter segmenter(rate, params, 120.0);
    AudioBuffer silence(vector<float>(rate * 2, 0.f), rate);
    OnsetDetector detector(rate, params);
    vector<double> strength = detector.getStrength(silence.samples);
    BOOST_CHECK(detector.pickOnsets(strength).empty());
    vector<double> b = segmenter.findBoundaries(strength, silence.getDuration());
    BOOST_CHECK_EQUAL(int(b.size()), 5);
    BOOST_CHECK(segmenter.segment(silence, b).empty());
    BOOST_CHECK_EQUAL(segmenter.getRejectedCount(), 4);
}

BOOST_AUTO_TEST_CASE(tone_is_trimmed_at_silence)
{
    TranscriptionParameters params;
    Segmenter segmenter(rate, params, 120.0);
    AudioBuffer buffer = toneWithSilence(0.5, 1.0, 0.5);

    OnsetDetector detector(rate, params);
    vector<double> strength = detector.getStrength(buffer.samples);
    vector<double> b = segmenter.findBoundaries(strength, buffer.getDuration());

    BOOST_CHECK(b.size() >= 2);
    BOOST_CHECK_EQUAL(b.back(), buffer.getDuration());
    BOOST_CHECK(b[0] > 0.4 && b[0] < 0.55);

    vector<OnsetSegment> segments = segmenter.segment(buffer, b);
    BOOST_CHECK(!segments.empty());
    if (!segments.empty()) {
        BOOST_CHECK(segments[0].start > 0.4 && segments[0].start < 0.55);
    }
    double frame = double(params.hopSize) / rate;
    for (int i = 0; i < int(segments.size()); ++i) {
        BOOST_CHECK(segments[i].end > segments[i].start);
        BOOST_CHECK(segments[i].getDuration() >= frame);
        BOOST_CHECK(segments[i].end < 1.6);
    }
    if (!segments.empty()) {
        BOOST_CHECK(segments.back().end > 1.4);
    }
}

BOOST_AUTO_TEST_CASE(held_tone_is_kept)
{
    TranscriptionParameters params;
    Segmenter segmenter(rate, params, 120.0);
    AudioBuffer buffer = toneWithSilence(0.0, 4.0, 0.0);

    vector<double> b;
    b.push_back(0.0);
    b.push_back(buffer.getDuration());
    vector<OnsetSegment> segments = segmenter.segment(buffer, b);
    BOOST_CHECK_EQUAL(int(segments.size()), 1);
    BOOST_CHECK_EQUAL(segmenter.getRejectedCount(), 0);
    if (!segments.empty()) {
        BOOST_CHECK_EQUAL(segments[0].start, 0.0);
        BOOST_CHECK(segments[0].end > 3.9);
    }

    // The half-second grid keeps every span of the tone as well
    b = segmenter.findBoundaries(vector<double>(400, 0.0), buffer.getDuration());
    BOOST_CHECK_EQUAL(int(b.size()), 9);
    segments = segmenter.segment(buffer, b);
    BOOST_CHECK_EQUAL(int(segments.size()), 8);
    BOOST_CHECK_EQUAL(segmenter.getRejectedCount(), 0);
}

BOOST_AUTO_TEST_CASE(guard_keeps_one_frame)
{
    TranscriptionParameters params;
    params.noiseFloorMultiplier = 1.0;
    Segmenter segmenter(rate, params, 300.0);

    // Loud click then silence: trimming lands on the first frame
    vector<float> s(rate, 0.f);
    for (int i = 0; i < 64; ++i) s[i] = 1.f;
    AudioBuffer buffer(s, rate);
    vector<double> b;
    b.push_back(0.0);
    b.push_back(buffer.getDuration());
    vector<OnsetSegment> segments = segmenter.segment(buffer, b);
    for (int i = 0; i < int(segments.size()); ++i) {
        BOOST_CHECK(segments[i].end >= segments[i].start + double(params.hopSize) / rate);
    }
}

BOOST_AUTO_TEST_CASE(peak_pick_and_backtrack)
{
    double x[] = { 0, 0, 0.2, 1.0, 0.4, 0, 0, 0, 0.1, 0.9, 0.2, 0 };
    vector<double> curve(x, x + 12);
    vector<int> peaks = OnsetDetector::peakPick(curve, 2, 1, 3, 4, 0.07, 2);
    BOOST_CHECK_EQUAL(int(peaks.size()), 2);
    BOOST_CHECK_EQUAL(peaks[0], 3);
    BOOST_CHECK_EQUAL(peaks[1], 9);
    vector<int> back = OnsetDetector::backtrack(peaks, curve);
    BOOST_CHECK_EQUAL(back[0], 1);
    BOOST_CHECK_EQUAL(back[1], 7);
}

BOOST_AUTO_TEST_SUITE_END()
