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

#ifndef PIANOSCRIBE_QUANTIZER_H
#define PIANOSCRIBE_QUANTIZER_H

#include "NoteEvent.h"
#include "TranscriptionParameters.h"

#include <vector>

/**
 * A note snapped to the sixteenth-note grid. Steps count grid
 * sixteenths from the start of the recording; ticks are at the
 * configured resolution per quarter note, and start and end are the
 * quantized times in seconds. endStep > startStep always.
 */
struct QuantizedNote
{
    QuantizedNote() :
        pitch(0), velocity(0), startStep(0), endStep(0),
        startTick(0), endTick(0), start(0.0), end(0.0) { }

    int pitch;
    int velocity;
    int startStep;
    int endStep;
    int startTick;
    int endTick;
    double start;
    double end;

    int getSteps() const { return endStep - startStep; }

    NoteEvent toNoteEvent() const {
        return NoteEvent(pitch, velocity, start, end);
    }
};

/**
 * Notes sharing a quantized start, in ascending pitch order.
 */
struct ChordGroup
{
    ChordGroup() : startStep(0) { }
    int startStep;
    std::vector<QuantizedNote> notes;

    /// Longest member duration in steps
    int getSteps() const;
};

class Quantizer
{
public:
    Quantizer(const TranscriptionParameters &params, double tempo);
    ~Quantizer();

    QuantizedNote quantize(const NoteEvent &note) const;

    std::vector<QuantizedNote> quantize(const std::vector<NoteEvent> &notes) const;

    /**
     * Group notes by quantized start. Groups are returned in
     * ascending order of start.
     */
    static std::vector<ChordGroup> groupChords(const std::vector<QuantizedNote> &notes);

    int getTicksPerStep() const {
        return m_params.ticksPerQuarter / m_params.stepsPerQuarter;
    }

    double getStepDuration() const;

private:
    TranscriptionParameters m_params;
    double m_tempo;

    int toTicks(double seconds) const;
};

#endif
