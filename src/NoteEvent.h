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

#ifndef PIANOSCRIBE_NOTE_EVENT_H
#define PIANOSCRIBE_NOTE_EVENT_H

/**
 * A detected note. Times are in seconds from the start of the
 * recording. Once made, events are not modified; the Quantizer
 * produces new ones.
 */
struct NoteEvent
{
    NoteEvent() : pitch(0), velocity(0), start(0.0), end(0.0) { }
    NoteEvent(int p, int v, double s, double e) :
        pitch(p), velocity(v), start(s), end(e) { }

    int pitch;          // MIDI pitch, 0-127
    int velocity;       // MIDI velocity, 0-127
    double start;
    double end;

    bool operator<(const NoteEvent &other) const {
        if (start != other.start) return start < other.start;
        return pitch < other.pitch;
    }
};

#endif
