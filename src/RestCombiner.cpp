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

#include <map>
#include <sstream>

using std::vector;
using std::string;
using std::pair;

RestCombiner::RestMask
RestCombiner::getMask(const Measure &measure)
{
    RestMask mask(stepsPerMeasure, false);
    int pos = 0;
    for (int i = 0; i < int(measure.elements.size()); ++i) {
        const ScoreElement &e = measure.elements[i];
        if (!e.isRest()) {
            for (int j = pos; j < pos + e.steps && j < stepsPerMeasure; ++j) {
                mask[j] = true;
            }
        }
        pos += e.steps;
    }
    return mask;
}

void
RestCombiner::fold(const RestMask &mask, int start, int length,
                   vector<pair<int, int> > &spans)
{
    bool empty = true;
    for (int i = start; i < start + length; ++i) {
        if (mask[i]) {
            empty = false;
            break;
        }
    }
    if (empty) {
        spans.push_back(pair<int, int>(start, length));
        return;
    }
    if (length == 1) return;
    fold(mask, start, length / 2, spans);
    fold(mask, start + length / 2, length / 2, spans);
}

vector<pair<int, int> >
RestCombiner::foldMask(const RestMask &mask)
{
    vector<pair<int, int> > spans;
    fold(mask, 0, stepsPerMeasure, spans);
    return spans;
}

Measure
RestCombiner::combine(const Measure &measure, string staff)
{
    if (!measure.isFull()) return measure;

    // position -> element, notes from the input measure and rests from
    // the folded mask
    std::map<int, ScoreElement> placed;

    int pos = 0;
    for (int i = 0; i < int(measure.elements.size()); ++i) {
        const ScoreElement &e = measure.elements[i];
        if (e.steps <= 0) {
            std::ostringstream os;
            os << "RestCombiner::combine: " << staff << " staff, measure "
               << measure.number << ": element " << i << " has length "
               << e.getQuarterLength();
            throw AnalysisError(os.str());
        }
        if (!e.isRest()) placed[pos] = e;
        pos += e.steps;
    }

    vector<pair<int, int> > spans = foldMask(getMask(measure));
    for (int i = 0; i < int(spans.size()); ++i) {
        placed[spans[i].first] = ScoreElement::makeRest(spans[i].second);
    }

    Measure out(measure.number);
    int expected = 0;
    for (std::map<int, ScoreElement>::const_iterator i = placed.begin();
         i != placed.end(); ++i) {
        if (i->first != expected) {
            std::ostringstream os;
            os << "RestCombiner::combine: " << staff << " staff, measure "
               << measure.number << ": element at step " << i->first
               << " where step " << expected << " was expected";
            throw AnalysisError(os.str());
        }
        out.elements.push_back(i->second);
        expected += i->second.steps;
    }

    if (out.getTotalSteps() != stepsPerMeasure) {
        std::ostringstream os;
        os << "RestCombiner::combine: " << staff << " staff, measure "
           << measure.number << ": combined duration "
           << out.getQuarterLength() << " is not a full bar";
        throw AnalysisError(os.str());
    }

    return out;
}

void
combineRestsInScore(ScoreModel &score)
{
    for (int i = 0; i < int(score.treble.measures.size()); ++i) {
        score.treble.measures[i] =
            RestCombiner::combine(score.treble.measures[i], "treble");
    }
    for (int i = 0; i < int(score.bass.measures.size()); ++i) {
        score.bass.measures[i] =
            RestCombiner::combine(score.bass.measures[i], "bass");
    }
}
