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

#include "MidiExport.h"
#include "TranscriptionErrors.h"

#include <algorithm>
#include <cmath>
#include <fstream>

using std::vector;
using std::string;

static const int pianoProgram = 0;
static const char *trackName = "Piano";

namespace {

struct MidiEvent {
    int tick;
    int status;
    int pitch;
    int velocity;

    bool operator<(const MidiEvent &e) const {
        if (tick != e.tick) return tick < e.tick;
        // note-offs first, so a repeated pitch sounds again
        if (status != e.status) return status == MidiExport::noteOff;
        return pitch < e.pitch;
    }
};

void
writeBigEndian(vector<unsigned char> &buf, unsigned int value, int bytes)
{
    for (int i = bytes - 1; i >= 0; --i) {
        buf.push_back((value >> (8 * i)) & 0xff);
    }
}

}

const int MidiExport::noteOn;
const int MidiExport::noteOff;

MidiExport::MidiExport(double tempo, int ticksPerQuarter) :
    m_tempo(tempo),
    m_ticksPerQuarter(ticksPerQuarter)
{
}

MidiExport::~MidiExport()
{
}

void
MidiExport::addNotes(const vector<QuantizedNote> &notes)
{
    m_notes.insert(m_notes.end(), notes.begin(), notes.end());
}

vector<NoteEvent>
MidiExport::toEventList() const
{
    vector<NoteEvent> events;
    for (int i = 0; i < int(m_notes.size()); ++i) {
        events.push_back(m_notes[i].toNoteEvent());
    }
    std::stable_sort(events.begin(), events.end());
    return events;
}

void
MidiExport::writeVariableLength(vector<unsigned char> &buf, unsigned int value)
{
    unsigned char tmp[5];
    int n = 0;
    do {
        tmp[n++] = value & 0x7f;
        value >>= 7;
    } while (value > 0);
    for (int i = n - 1; i >= 0; --i) {
        buf.push_back(i > 0 ? (tmp[i] | 0x80) : tmp[i]);
    }
}

vector<unsigned char>
MidiExport::toBytes() const
{
    vector<unsigned char> track;

    // Track name
    string name(trackName);
    track.push_back(0x00);
    track.push_back(0xff);
    track.push_back(0x03);
    writeVariableLength(track, name.size());
    track.insert(track.end(), name.begin(), name.end());

    // Tempo, microseconds per quarter
    unsigned int usec = (unsigned int)(round(60000000.0 / m_tempo));
    track.push_back(0x00);
    track.push_back(0xff);
    track.push_back(0x51);
    track.push_back(0x03);
    writeBigEndian(track, usec, 3);

    // 4/4
    track.push_back(0x00);
    track.push_back(0xff);
    track.push_back(0x58);
    track.push_back(0x04);
    track.push_back(0x04);
    track.push_back(0x02);
    track.push_back(0x18);
    track.push_back(0x08);

    track.push_back(0x00);
    track.push_back(0xc0);
    track.push_back(pianoProgram);

    vector<MidiEvent> events;
    for (int i = 0; i < int(m_notes.size()); ++i) {
        const QuantizedNote &n = m_notes[i];
        int pitch = std::max(0, std::min(127, n.pitch));
        int velocity = std::max(1, std::min(127, n.velocity));
        MidiEvent on = { n.startTick, noteOn, pitch, velocity };
        MidiEvent off = { n.endTick, noteOff, pitch, 0 };
        events.push_back(on);
        events.push_back(off);
    }
    std::stable_sort(events.begin(), events.end());

    int tick = 0;
    for (int i = 0; i < int(events.size()); ++i) {
        const MidiEvent &e = events[i];
        writeVariableLength(track, e.tick - tick);
        tick = e.tick;
        track.push_back(e.status);
        track.push_back(e.pitch);
        track.push_back(e.velocity);
    }

    track.push_back(0x00);
    track.push_back(0xff);
    track.push_back(0x2f);
    track.push_back(0x00);

    vector<unsigned char> out;
    const char *mthd = "MThd";
    out.insert(out.end(), mthd, mthd + 4);
    writeBigEndian(out, 6, 4);
    writeBigEndian(out, 0, 2);      // format 0
    writeBigEndian(out, 1, 2);      // one track
    writeBigEndian(out, m_ticksPerQuarter, 2);

    const char *mtrk = "MTrk";
    out.insert(out.end(), mtrk, mtrk + 4);
    writeBigEndian(out, track.size(), 4);
    out.insert(out.end(), track.begin(), track.end());

    return out;
}

void
MidiExport::writeFile(string path) const
{
    vector<unsigned char> bytes = toBytes();
    std::ofstream file(path.c_str(), std::ios::binary);
    if (!file) {
        throw OutputError("MidiExport::writeFile: failed to open \"" +
                          path + "\" for writing");
    }
    file.write(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    file.close();
    if (!file) {
        throw OutputError("MidiExport::writeFile: failed to write \"" +
                          path + "\"");
    }
}
