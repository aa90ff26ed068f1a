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

#ifndef PIANOSCRIBE_MIDI_EXPORT_H
#define PIANOSCRIBE_MIDI_EXPORT_H

#include "NoteEvent.h"
#include "Quantizer.h"

#include <string>
#include <vector>

/**
 * The simplified event export: quantized notes as a single-track
 * Standard MIDI File (format 0) on channel 1 with a piano program,
 * for resynthesis.
 */
class MidiExport
{
public:
    MidiExport(double tempo, int ticksPerQuarter);
    ~MidiExport();

    void addNotes(const std::vector<QuantizedNote> &notes);

    /**
     * Return the exported notes as (pitch, velocity, start, end),
     * times in seconds, in order of start then pitch.
     */
    std::vector<NoteEvent> toEventList() const;

    std::vector<unsigned char> toBytes() const;

    /**
     * Write the file. Throws OutputError on failure.
     */
    void writeFile(std::string path) const;

    static void writeVariableLength(std::vector<unsigned char> &buf,
                                    unsigned int value);

    static const int noteOn = 0x90;
    static const int noteOff = 0x80;

private:
    double m_tempo;
    int m_ticksPerQuarter;
    std::vector<QuantizedNote> m_notes;
};

#endif
