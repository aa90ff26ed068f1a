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

#include "RestCombiner.h"
#include "TranscriptionErrors.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>

#include <vector>

using namespace std;

BOOST_AUTO_TEST_SUITE(TestRestCombiner)

static ScoreElement
note(int pitch, int steps)
{
    return ScoreElement::makeSounding(vector<int>(1, pitch), steps);
}

static Measure
sixteenthRestsAround(int notePos, int noteSteps)
{
    Measure m(1);
    int pos = 0;
    while (pos < stepsPerMeasure) {
        if (pos == notePos) {
            m.elements.push_back(note(60, noteSteps));
            pos += noteSteps;
        } else {
            m.elements.push_back(ScoreElement::makeRest(1));
            ++pos;
        }
    }
    return m;
}

BOOST_AUTO_TEST_CASE(mask)
{
    Measure m = sixteenthRestsAround(4, 4);
    RestCombiner::RestMask mask = RestCombiner::getMask(m);
    BOOST_CHECK_EQUAL(mask.size(), 16);
    for (int i = 0; i < 16; ++i) {
        BOOST_CHECK(bool(mask[i]) == (i >= 4 && i < 8));
    }
}

BOOST_AUTO_TEST_CASE(empty_measure_becomes_whole_rest)
{
    Measure m(3);
    for (int i = 0; i < 16; ++i) m.elements.push_back(ScoreElement::makeRest(1));
    Measure c = RestCombiner::combine(m, "treble");
    BOOST_CHECK_EQUAL(c.number, 3);
    BOOST_CHECK(c.isWholeRest());
}

BOOST_AUTO_TEST_CASE(note_at_start)
{
    Measure c = RestCombiner::combine(sixteenthRestsAround(0, 4), "treble");
    BOOST_CHECK_EQUAL(c.elements.size(), 3);
    BOOST_CHECK(c.elements[0] == note(60, 4));
    BOOST_CHECK(c.elements[1] == ScoreElement::makeRest(4));
    BOOST_CHECK(c.elements[2] == ScoreElement::makeRest(8));
    BOOST_CHECK_EQUAL(c.getQuarterLength(), 4.0);
}

BOOST_AUTO_TEST_CASE(note_in_second_beat)
{
    Measure c = RestCombiner::combine(sixteenthRestsAround(4, 4), "bass");
    BOOST_CHECK_EQUAL(c.elements.size(), 3);
    BOOST_CHECK(c.elements[0] == ScoreElement::makeRest(4));
    BOOST_CHECK(c.elements[1] == note(60, 4));
    BOOST_CHECK(c.elements[2] == ScoreElement::makeRest(8));
}

BOOST_AUTO_TEST_CASE(unaligned_note)
{
    Measure c = RestCombiner::combine(sixteenthRestsAround(3, 2), "treble");
    // rests at 0-2, note 3-4, rests at 5-15
    int expected[] = { 2, 1, 2, 1, 2, 8 };
    BOOST_CHECK_EQUAL(c.elements.size(), 6);
    for (int i = 0; i < int(c.elements.size()) && i < 6; ++i) {
        BOOST_CHECK_EQUAL(c.elements[i].steps, expected[i]);
    }
    BOOST_CHECK(!c.elements[2].isRest());
    BOOST_CHECK_EQUAL(c.getTotalSteps(), 16);
}

BOOST_AUTO_TEST_CASE(notes_kept_verbatim)
{
    Measure m(2);
    ScoreElement tied = note(65, 2);
    tied.tieStop = true;
    m.elements.push_back(tied);
    m.elements.push_back(ScoreElement::makeRest(2));
    m.elements.push_back(ScoreElement::makeRest(4));
    vector<int> chord;
    chord.push_back(60);
    chord.push_back(64);
    ScoreElement c = ScoreElement::makeSounding(chord, 4);
    c.tieStart = true;
    m.elements.push_back(ScoreElement::makeRest(4));
    m.elements.push_back(c);

    Measure out = RestCombiner::combine(m, "treble");
    BOOST_CHECK(out.elements.front() == tied);
    BOOST_CHECK(out.elements.back() == c);
    BOOST_CHECK_EQUAL(out.getTotalSteps(), 16);
}

BOOST_AUTO_TEST_CASE(idempotent)
{
    for (int pos = 0; pos < 16; ++pos) {
        for (int len = 1; pos + len <= 16; len *= 2) {
            Measure once = RestCombiner::combine(sixteenthRestsAround(pos, len), "treble");
            Measure twice = RestCombiner::combine(once, "treble");
            BOOST_CHECK_EQUAL(once.getQuarterLength(), 4.0);
            BOOST_CHECK_EQUAL(once.elements.size(), twice.elements.size());
            for (int i = 0; i < int(once.elements.size()) &&
                     i < int(twice.elements.size()); ++i) {
                BOOST_CHECK(once.elements[i] == twice.elements[i]);
            }
        }
    }
}

BOOST_AUTO_TEST_CASE(partial_measure_unchanged)
{
    Measure m(1);
    m.elements.push_back(note(60, 4));
    m.elements.push_back(ScoreElement::makeRest(1));
    m.elements.push_back(ScoreElement::makeRest(1));
    Measure c = RestCombiner::combine(m, "treble");
    BOOST_CHECK_EQUAL(c.elements.size(), 3);
}

BOOST_AUTO_TEST_CASE(malformed_measure_throws)
{
    Measure m(7);
    m.elements.push_back(note(60, 0));
    m.elements.push_back(ScoreElement::makeRest(16));
    BOOST_CHECK_THROW(RestCombiner::combine(m, "treble"), AnalysisError);
}

BOOST_AUTO_TEST_CASE(whole_score)
{
    ScoreModel score;
    score.treble.measures.push_back(sixteenthRestsAround(0, 4));
    score.treble.measures.push_back(sixteenthRestsAround(8, 8));
    score.bass.measures.push_back(sixteenthRestsAround(12, 4));
    score.bass.measures.push_back(sixteenthRestsAround(0, 16));
    combineRestsInScore(score);
    BOOST_CHECK_EQUAL(score.treble.measures[0].elements.size(), 3);
    BOOST_CHECK_EQUAL(score.treble.measures[1].elements.size(), 2);
    BOOST_CHECK_EQUAL(score.bass.measures[0].elements.size(), 3);
    BOOST_CHECK_EQUAL(score.bass.measures[1].elements.size(), 1);
}

BOOST_AUTO_TEST_SUITE_END()
