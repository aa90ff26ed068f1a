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

#include "TempoEstimator.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <limits>
#include <vector>

using namespace std;

BOOST_AUTO_TEST_SUITE(TestTempo)

static const int rate = 44100;

BOOST_AUTO_TEST_CASE(clamp_in_range)
{
    BOOST_CHECK_EQUAL(clampTempo(20.0), 20.0);
    BOOST_CHECK_EQUAL(clampTempo(97.5), 97.5);
    BOOST_CHECK_EQUAL(clampTempo(300.0), 300.0);
}

BOOST_AUTO_TEST_CASE(clamp_out_of_range)
{
    double bad[] = { -120.0, 0.0, 19.99, 300.01, 1000.0, 1e9 };
    for (int i = 0; i < 6; ++i) {
        BOOST_CHECK_EQUAL(clampTempo(bad[i]), 120.0);
    }
    BOOST_CHECK_EQUAL(clampTempo(numeric_limits<double>::quiet_NaN()), 120.0);
    BOOST_CHECK_EQUAL(clampTempo(numeric_limits<double>::infinity()), 120.0);
}

BOOST_AUTO_TEST_CASE(durations)
{
    BOOST_CHECK_EQUAL(sixteenthDuration(120.0), 0.125);
    BOOST_CHECK_EQUAL(quarterDuration(120.0), 0.5);
    BOOST_CHECK_EQUAL(quarterDuration(60.0), 1.0);
}

BOOST_AUTO_TEST_CASE(silent_envelope)
{
    TranscriptionParameters params;
    TempoEstimator estimator(rate, params);
    vector<double> flat(500, 0.0);
    BOOST_CHECK_EQUAL(estimator.track(flat), 0.0);
    BOOST_CHECK_EQUAL(estimator.estimate(flat), 120.0);
    BOOST_CHECK_EQUAL(estimator.estimate(vector<double>()), 120.0);
}

BOOST_AUTO_TEST_CASE(tempo_override)
{
    TranscriptionParameters params;
    params.tempoOverride = 90.0;
    TempoEstimator estimator(rate, params);
    vector<double> flat(500, 0.0);
    BOOST_CHECK_EQUAL(estimator.estimate(flat), 90.0);

    params.tempoOverride = 450.0;
    TempoEstimator wild(rate, params);
    BOOST_CHECK_EQUAL(wild.estimate(flat), 120.0);
}

BOOST_AUTO_TEST_CASE(click_train)
{
    TranscriptionParameters params;
    TempoEstimator estimator(rate, params);

    double framesPerBeat = 60.0 * rate / (params.hopSize * 100.0);
    vector<double> env(1500, 0.0);
    for (int k = 0; k * framesPerBeat < env.size(); ++k) {
        env[int(round(k * framesPerBeat))] = 5.0;
    }

    double bpm = estimator.track(env);
    BOOST_CHECK_CLOSE(bpm, 100.0, 3.0);
    BOOST_CHECK_CLOSE(estimator.estimate(env), 100.0, 3.0);
}

BOOST_AUTO_TEST_SUITE_END()
