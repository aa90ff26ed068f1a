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

#ifndef PIANOSCRIBE_NOTATION_BUILDER_H
#define PIANOSCRIBE_NOTATION_BUILDER_H

#include "Quantizer.h"
#include "ScoreModel.h"
#include "TranscriptionParameters.h"

#include <string>
#include <vector>

/**
 * Lays elements out into the measures of one staff. The writer is
 * always in one of two states, reflecting what the most recent
 * append did:
 *
 *  Accumulating - the element fitted in the open measure; the
 *  measure is closed when it reaches exactly one bar.
 *
 *  OverflowSplit - the element would have run past the barline, so
 *  it was split into a fragment filling the rest of the measure,
 *  marked as a tie start, and a fragment carrying the overflow into
 *  a new measure, marked as a tie stop. An overflow longer than a
 *  bar also fills whole measures between the two, each tied at both
 *  ends. What is left over becomes the new measure's accumulated
 *  length.
 *
 * Rests are never tied; they are written as barline-aligned pieces
 * instead.
 */
class StaffWriter
{
public:
    enum State { Accumulating, OverflowSplit };

    StaffWriter();

    void append(const ScoreElement &element);

    /**
     * Append a rest of the given length as the fewest symbols that
     * each start on a multiple of their own length within the bar.
     */
    void appendRest(int steps);

    /**
     * Close the open measure, if it has anything in it, first
     * padding it with rests to a full bar if pad is set.
     */
    void finish(bool pad);

    const std::vector<Measure> &getMeasures() const { return m_measures; }

    /// Steps so far in the open measure, in [0, 16)
    int getAccumulated() const { return m_accumulated; }

    State getState() const { return m_state; }

    int getSplitCount() const { return m_splits; }

    /**
     * Return the lengths of the aligned rest symbols covering steps
     * sixteenths from the given position within a bar.
     */
    static std::vector<int> decomposeRest(int position, int steps);

private:
    std::vector<Measure> m_measures;
    Measure m_open;
    int m_accumulated;
    State m_state;
    int m_splits;

    void push(const ScoreElement &element);
    void closeMeasure();
};

/**
 * Build two-staff notation from quantized notes. Notes sharing a
 * start form one chord group; pitches at or above the split go to
 * the treble staff and the rest to the bass, and a staff with no
 * notes in a group gets a rest of the group's length so both staves
 * advance together. Silence before and between groups becomes
 * rests on both staves.
 */
class NotationBuilder
{
public:
    NotationBuilder(const TranscriptionParameters &params);
    ~NotationBuilder();

    ScoreModel build(const std::vector<QuantizedNote> &notes,
                     double tempo,
                     std::string title,
                     std::string composer) const;

    /**
     * Return the nearest of 1, 2, 4, 8 and 16 steps, the shorter
     * where two are equally near.
     */
    static int snapDuration(int steps);

private:
    TranscriptionParameters m_params;
};

#endif
