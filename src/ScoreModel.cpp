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

#include "ScoreModel.h"

#include <algorithm>
#include <cstdlib>
#include <sstream>

using std::string;
using std::vector;

static const struct {
    const char *step;
    int alter;
} spelling[12] = {
    { "C", 0 }, { "C", 1 }, { "D", 0 }, { "E", -1 },
    { "E", 0 }, { "F", 0 }, { "F", 1 }, { "G", 0 },
    { "G", 1 }, { "A", 0 }, { "B", -1 }, { "B", 0 },
};

struct DurationClass {
    int steps;
    const char *name;
};

static const DurationClass durationClasses[] = {
    { 1, "16th" }, { 2, "eighth" }, { 4, "quarter" }, { 8, "half" }, { 16, "whole" },
};
static const int durationClassCount = 5;

ScoreElement
ScoreElement::makeRest(int steps)
{
    ScoreElement e;
    e.kind = Rest;
    e.steps = steps;
    return e;
}

ScoreElement
ScoreElement::makeSounding(vector<int> pitches, int steps)
{
    std::sort(pitches.begin(), pitches.end());
    pitches.erase(std::unique(pitches.begin(), pitches.end()), pitches.end());
    ScoreElement e;
    e.kind = (pitches.size() > 1 ? Chord : Note);
    e.pitches = pitches;
    e.steps = steps;
    return e;
}

static int
classIndexFor(int steps, bool &dotted)
{
    dotted = false;
    for (int i = 0; i < durationClassCount; ++i) {
        if (durationClasses[i].steps == steps) return i;
    }
    for (int i = 0; i < durationClassCount; ++i) {
        if (durationClasses[i].steps * 3 == steps * 2) {
            dotted = true;
            return i;
        }
    }
    int best = 0;
    for (int i = 1; i < durationClassCount; ++i) {
        if (abs(durationClasses[i].steps - steps) <
            abs(durationClasses[best].steps - steps)) {
            best = i;
        }
    }
    return best;
}

string
ScoreElement::getTypeName() const
{
    bool dotted;
    return durationClasses[classIndexFor(steps, dotted)].name;
}

bool
ScoreElement::isDotted() const
{
    bool dotted;
    (void)classIndexFor(steps, dotted);
    return dotted;
}

int
Measure::getTotalSteps() const
{
    int total = 0;
    for (int i = 0; i < int(elements.size()); ++i) {
        total += elements[i].steps;
    }
    return total;
}

Part
Part::makeTreble()
{
    Part p;
    p.id = "P1";
    p.name = "Piano (treble)";
    p.clefSign = "G";
    p.clefLine = 2;
    return p;
}

Part
Part::makeBass()
{
    Part p;
    p.id = "P2";
    p.name = "Piano (bass)";
    p.clefSign = "F";
    p.clefLine = 4;
    return p;
}

ScoreModel::ScoreModel() :
    tempo(120.0),
    treble(Part::makeTreble()),
    bass(Part::makeBass())
{
}

void
spellPitch(int pitch, string &step, int &alter, int &octave)
{
    int pc = ((pitch % 12) + 12) % 12;
    step = spelling[pc].step;
    alter = spelling[pc].alter;
    octave = pitch / 12 - 1;
}

string
getPitchName(int pitch)
{
    string step;
    int alter, octave;
    spellPitch(pitch, step, alter, octave);
    std::ostringstream os;
    os << step;
    if (alter > 0) os << "#";
    if (alter < 0) os << "-";
    os << octave;
    return os.str();
}
