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

#include "Quantizer.h"
#include "TempoEstimator.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>

using std::vector;
using std::cerr;
using std::endl;

int
ChordGroup::getSteps() const
{
    int steps = 0;
    for (int i = 0; i < int(notes.size()); ++i) {
        steps = std::max(steps, notes[i].getSteps());
    }
    return steps;
}

Quantizer::Quantizer(const TranscriptionParameters &params, double tempo) :
    m_params(params),
    m_tempo(clampTempo(tempo))
{
}

Quantizer::~Quantizer()
{
}

double
Quantizer::getStepDuration() const
{
    return quarterDuration(m_tempo) / m_params.stepsPerQuarter;
}

int
Quantizer::toTicks(double seconds) const
{
    return int(round(seconds / quarterDuration(m_tempo) *
                     m_params.ticksPerQuarter));
}

QuantizedNote
Quantizer::quantize(const NoteEvent &note) const
{
    int perStep = getTicksPerStep();

    QuantizedNote q;
    q.pitch = note.pitch;
    q.velocity = note.velocity;

    q.startStep = int(round(double(toTicks(note.start)) / perStep));
    q.endStep = int(round(double(toTicks(note.end)) / perStep));
    if (q.startStep < 0) q.startStep = 0;
    if (q.endStep <= q.startStep) {
        q.endStep = q.startStep + 1;
    }

    q.startTick = q.startStep * perStep;
    q.endTick = q.endStep * perStep;
    q.start = q.startStep * getStepDuration();
    q.end = q.endStep * getStepDuration();

    return q;
}

vector<QuantizedNote>
Quantizer::quantize(const vector<NoteEvent> &notes) const
{
    vector<QuantizedNote> out;
    int forced = 0;
    for (int i = 0; i < int(notes.size()); ++i) {
        QuantizedNote q = quantize(notes[i]);
        if (int(round(double(toTicks(notes[i].end)) / getTicksPerStep())) <= q.startStep) {
            ++forced;
        }
        out.push_back(q);
    }
    if (m_params.verbose) {
        cerr << "Quantizer::quantize: " << out.size() << " notes at "
             << m_tempo << " BPM, " << forced
             << " extended to the minimum duration" << endl;
    }
    return out;
}

vector<ChordGroup>
Quantizer::groupChords(const vector<QuantizedNote> &notes)
{
    std::map<int, ChordGroup> byStart;
    for (int i = 0; i < int(notes.size()); ++i) {
        ChordGroup &g = byStart[notes[i].startStep];
        g.startStep = notes[i].startStep;
        g.notes.push_back(notes[i]);
    }

    vector<ChordGroup> groups;
    for (std::map<int, ChordGroup>::iterator i = byStart.begin();
         i != byStart.end(); ++i) {
        ChordGroup g = i->second;
        struct ByPitch {
            bool operator()(const QuantizedNote &a, const QuantizedNote &b) const {
                return a.pitch < b.pitch;
            }
        };
        std::stable_sort(g.notes.begin(), g.notes.end(), ByPitch());
        groups.push_back(g);
    }
    return groups;
}
