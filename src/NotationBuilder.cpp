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

#include "NotationBuilder.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>

using std::vector;
using std::string;
using std::cerr;
using std::endl;

static const int vocabulary[] = { 16, 8, 4, 2, 1 };
static const int vocabularySize = 5;

StaffWriter::StaffWriter() :
    m_open(1),
    m_accumulated(0),
    m_state(Accumulating),
    m_splits(0)
{
}

void
StaffWriter::push(const ScoreElement &element)
{
    m_open.elements.push_back(element);
    m_accumulated += element.steps;
    if (m_accumulated == stepsPerMeasure) {
        closeMeasure();
    }
}

void
StaffWriter::closeMeasure()
{
    m_measures.push_back(m_open);
    m_open = Measure(int(m_measures.size()) + 1);
    m_accumulated = 0;
}

vector<int>
StaffWriter::decomposeRest(int position, int steps)
{
    vector<int> pieces;
    int pos = position % stepsPerMeasure;
    while (steps > 0) {
        for (int i = 0; i < vocabularySize; ++i) {
            int v = vocabulary[i];
            if (v <= steps && pos % v == 0) {
                pieces.push_back(v);
                steps -= v;
                pos = (pos + v) % stepsPerMeasure;
                break;
            }
        }
    }
    return pieces;
}

void
StaffWriter::appendRest(int steps)
{
    vector<int> pieces = decomposeRest(m_accumulated, steps);
    for (int i = 0; i < int(pieces.size()); ++i) {
        m_state = Accumulating;
        push(ScoreElement::makeRest(pieces[i]));
    }
}

void
StaffWriter::append(const ScoreElement &element)
{
    if (element.steps <= 0) return;

    if (element.isRest()) {
        appendRest(element.steps);
        return;
    }

    if (m_accumulated + element.steps <= stepsPerMeasure) {
        m_state = Accumulating;
        push(element);
        return;
    }

    m_state = OverflowSplit;
    ++m_splits;

    int remainder = stepsPerMeasure - m_accumulated;
    int overflow = element.steps - remainder;

    ScoreElement a(element);
    a.steps = remainder;
    a.tieStart = true;

#ifdef DEBUG_NOTATION_BUILDER
    cerr << "StaffWriter::append: splitting " << element.steps
         << " steps at measure " << m_open.number << " into "
         << remainder << " + " << overflow << endl;
#endif

    push(a);        // closes the measure

    // Whole bars of overflow are tied at both ends
    while (overflow > stepsPerMeasure) {
        ScoreElement bar(element);
        bar.steps = stepsPerMeasure;
        bar.tieStart = true;
        bar.tieStop = true;
        push(bar);
        overflow -= stepsPerMeasure;
    }

    ScoreElement b(element);
    b.steps = overflow;
    b.tieStop = true;
    push(b);        // baseline of the new one
}

void
StaffWriter::finish(bool pad)
{
    if (m_open.elements.empty()) return;
    if (pad && m_accumulated > 0) {
        appendRest(stepsPerMeasure - m_accumulated);
    }
    if (!m_open.elements.empty()) {
        closeMeasure();
    }
}

NotationBuilder::NotationBuilder(const TranscriptionParameters &params) :
    m_params(params)
{
}

NotationBuilder::~NotationBuilder()
{
}

int
NotationBuilder::snapDuration(int steps)
{
    int best = vocabulary[vocabularySize - 1];
    for (int i = vocabularySize - 1; i >= 0; --i) {
        if (abs(vocabulary[i] - steps) < abs(best - steps)) {
            best = vocabulary[i];
        }
    }
    return best;
}

ScoreModel
NotationBuilder::build(const vector<QuantizedNote> &notes,
                       double tempo,
                       string title,
                       string composer) const
{
    ScoreModel score;
    score.title = title;
    score.composer = composer;
    score.tempo = tempo;

    vector<ChordGroup> groups = Quantizer::groupChords(notes);

    if (groups.empty()) {
        Measure m(1);
        m.elements.push_back(ScoreElement::makeRest(stepsPerMeasure));
        score.treble.measures.push_back(m);
        score.bass.measures.push_back(m);
        if (m_params.verbose) {
            cerr << "NotationBuilder::build: no notes, writing a rest measure"
                 << endl;
        }
        return score;
    }

    StaffWriter treble, bass;
    int cursor = 0;
    int delayed = 0;

    for (int i = 0; i < int(groups.size()); ++i) {

        const ChordGroup &g = groups[i];

        int start = g.startStep;
        if (start < cursor) {
            // Overlaps the previous group: play it once that ends
            start = cursor;
            ++delayed;
        }

        int gap = start - cursor;
        if (gap >= m_params.minimumRestSteps) {
            treble.appendRest(gap);
            bass.appendRest(gap);
            cursor = start;
        }

        int steps = snapDuration(g.getSteps());

        vector<int> high, low;
        for (int j = 0; j < int(g.notes.size()); ++j) {
            if (g.notes[j].pitch >= m_params.staffSplitPitch) {
                high.push_back(g.notes[j].pitch);
            } else {
                low.push_back(g.notes[j].pitch);
            }
        }

        if (!high.empty()) treble.append(ScoreElement::makeSounding(high, steps));
        else treble.appendRest(steps);

        if (!low.empty()) bass.append(ScoreElement::makeSounding(low, steps));
        else bass.appendRest(steps);

        cursor += steps;
    }

    treble.finish(m_params.padFinalMeasure);
    bass.finish(m_params.padFinalMeasure);

    score.treble.measures = treble.getMeasures();
    score.bass.measures = bass.getMeasures();

    if (m_params.verbose) {
        cerr << "NotationBuilder::build: " << groups.size() << " chord groups ("
             << delayed << " delayed), " << score.treble.measures.size()
             << " measures, " << treble.getSplitCount() + bass.getSplitCount()
             << " tie splits" << endl;
    }

    return score;
}
