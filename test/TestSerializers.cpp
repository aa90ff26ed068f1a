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

#include "MusicXmlWriter.h"
#include "MidiExport.h"
#include "TranscriptionErrors.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

using namespace std;

BOOST_AUTO_TEST_SUITE(TestSerializers)

static int
countOf(const string &text, const string &sub)
{
    int n = 0;
    string::size_type pos = 0;
    while ((pos = text.find(sub, pos)) != string::npos) {
        ++n;
        pos += sub.size();
    }
    return n;
}

static ScoreModel
makeScore()
{
    ScoreModel score;
    score.title = "Fish & Chips <live>";
    score.composer = "Anon";
    score.tempo = 96.6;
    score.treble = Part::makeTreble();
    score.bass = Part::makeBass();

    Measure m1(1), m2(2);

    m1.elements.push_back(ScoreElement::makeRest(4));
    ScoreElement held = ScoreElement::makeSounding(vector<int>(1, 61), 12);
    held.tieStart = true;
    m1.elements.push_back(held);

    ScoreElement tail = ScoreElement::makeSounding(vector<int>(1, 61), 4);
    tail.tieStop = true;
    m2.elements.push_back(tail);
    vector<int> chord;
    chord.push_back(64);
    chord.push_back(60);
    m2.elements.push_back(ScoreElement::makeSounding(chord, 12));

    score.treble.measures.push_back(m1);
    score.treble.measures.push_back(m2);

    Measure r1(1), r2(2);
    r1.elements.push_back(ScoreElement::makeRest(16));
    r2.elements.push_back(ScoreElement::makeRest(16));
    score.bass.measures.push_back(r1);
    score.bass.measures.push_back(r2);

    return score;
}

BOOST_AUTO_TEST_CASE(escape)
{
    BOOST_CHECK_EQUAL(MusicXmlWriter::escape("plain"), "plain");
    BOOST_CHECK_EQUAL(MusicXmlWriter::escape("a\"b'c"), "a&quot;b&apos;c");
    BOOST_CHECK_EQUAL(MusicXmlWriter::escape("<&>"), "&lt;&amp;&gt;");
}

BOOST_AUTO_TEST_CASE(document_header)
{
    MusicXmlWriter writer;
    string xml = writer.toString(makeScore());

    BOOST_CHECK_EQUAL(xml.find("<?xml"), 0u);
    BOOST_CHECK(xml.find("<score-partwise version=\"3.1\">") != string::npos);
    BOOST_CHECK(xml.find("<work-title>Fish &amp; Chips &lt;live&gt;</work-title>")
                != string::npos);
    BOOST_CHECK(xml.find("<creator type=\"composer\">Anon</creator>") != string::npos);
    BOOST_CHECK(xml.find("<score-part id=\"P1\">") != string::npos);
    BOOST_CHECK(xml.find("<score-part id=\"P2\">") != string::npos);
    BOOST_CHECK_EQUAL(countOf(xml, "<divisions>4</divisions>"), 2);
    BOOST_CHECK_EQUAL(countOf(xml, "<per-minute>97</per-minute>"), 2);
    BOOST_CHECK(xml.find("<sign>G</sign>") < xml.find("<sign>F</sign>"));
}

BOOST_AUTO_TEST_CASE(notes_and_rests)
{
    MusicXmlWriter writer;
    string xml = writer.toString(makeScore());

    BOOST_CHECK_EQUAL(countOf(xml, "<chord/>"), 1);
    BOOST_CHECK_EQUAL(countOf(xml, "<rest measure=\"yes\"/>"), 2);
    BOOST_CHECK_EQUAL(countOf(xml, "<rest/>"), 1);
    BOOST_CHECK_EQUAL(countOf(xml, "<alter>1</alter>"), 2);
    BOOST_CHECK_EQUAL(countOf(xml, "<tie type=\"start\"/>"), 1);
    BOOST_CHECK_EQUAL(countOf(xml, "<tie type=\"stop\"/>"), 1);
    BOOST_CHECK_EQUAL(countOf(xml, "<tied type=\"start\"/>"), 1);
    BOOST_CHECK_EQUAL(countOf(xml, "<tied type=\"stop\"/>"), 1);
    BOOST_CHECK(xml.find("<type>half</type>\n        <dot/>") != string::npos);

    // Chord members are written lowest first, the second marked
    string::size_type c = xml.find("<chord/>");
    string::size_type e = xml.rfind("<step>C</step>", c);
    BOOST_CHECK(e != string::npos);
    BOOST_CHECK(xml.find("<step>E</step>", c) != string::npos);
}

BOOST_AUTO_TEST_CASE(unwritable_document)
{
    MusicXmlWriter writer;
    BOOST_CHECK_THROW(writer.writeFile(makeScore(), "/nonexistent/dir/score.musicxml"),
                      OutputError);
    MidiExport exporter(120.0, 480);
    BOOST_CHECK_THROW(exporter.writeFile("/nonexistent/dir/score.mid"),
                      OutputError);
}

BOOST_AUTO_TEST_CASE(variable_length)
{
    vector<unsigned char> buf;
    MidiExport::writeVariableLength(buf, 0);
    MidiExport::writeVariableLength(buf, 127);
    MidiExport::writeVariableLength(buf, 128);
    MidiExport::writeVariableLength(buf, 480);
    MidiExport::writeVariableLength(buf, 0x0fffffff);
    unsigned char expected[] = { 0x00, 0x7f, 0x81, 0x00, 0x83, 0x60,
                                 0xff, 0xff, 0xff, 0x7f };
    BOOST_CHECK_EQUAL_COLLECTIONS(buf.begin(), buf.end(),
                                  expected, expected + 10);
}

static QuantizedNote
makeNote(int pitch, int velocity, int startTick, int endTick)
{
    QuantizedNote n;
    n.pitch = pitch;
    n.velocity = velocity;
    n.startTick = startTick;
    n.endTick = endTick;
    n.startStep = startTick / 120;
    n.endStep = endTick / 120;
    n.start = startTick / 960.0;
    n.end = endTick / 960.0;
    return n;
}

BOOST_AUTO_TEST_CASE(midi_bytes)
{
    vector<QuantizedNote> notes;
    notes.push_back(makeNote(60, 100, 480, 960));
    notes.push_back(makeNote(60, 80, 0, 480));

    MidiExport exporter(120.0, 480);
    exporter.addNotes(notes);
    vector<unsigned char> b = exporter.toBytes();

    BOOST_CHECK_EQUAL(int(b.size()), 71);
    BOOST_CHECK_EQUAL(string(b.begin(), b.begin() + 4), "MThd");
    BOOST_CHECK_EQUAL(int(b[9]), 0);        // format 0
    BOOST_CHECK_EQUAL(int(b[11]), 1);       // one track
    BOOST_CHECK_EQUAL(int(b[12]) * 256 + b[13], 480);
    BOOST_CHECK_EQUAL(string(b.begin() + 14, b.begin() + 18), "MTrk");
    BOOST_CHECK_EQUAL(int(b[21]), 49);

    // track name, tempo of 500000 usec per quarter
    BOOST_CHECK_EQUAL(string(b.begin() + 26, b.begin() + 31), "Piano");
    BOOST_CHECK_EQUAL(int(b[35]), 0x07);
    BOOST_CHECK_EQUAL(int(b[36]), 0xa1);
    BOOST_CHECK_EQUAL(int(b[37]), 0x20);

    unsigned char events[] = {
        0x00, 0x90, 60, 80,
        0x83, 0x60, 0x80, 60, 0,
        0x00, 0x90, 60, 100,    // repeated pitch: the note-off comes first
        0x83, 0x60, 0x80, 60, 0,
        0x00, 0xff, 0x2f, 0x00
    };
    BOOST_CHECK_EQUAL_COLLECTIONS(b.begin() + 49, b.end(),
                                  events, events + 22);
}

BOOST_AUTO_TEST_CASE(event_list)
{
    vector<QuantizedNote> notes;
    notes.push_back(makeNote(67, 90, 480, 960));
    notes.push_back(makeNote(64, 90, 0, 240));
    notes.push_back(makeNote(60, 90, 0, 480));

    MidiExport exporter(120.0, 480);
    exporter.addNotes(notes);
    vector<NoteEvent> events = exporter.toEventList();
    BOOST_CHECK_EQUAL(int(events.size()), 3);
    BOOST_CHECK_EQUAL(events[0].pitch, 60);
    BOOST_CHECK_EQUAL(events[1].pitch, 64);
    BOOST_CHECK_EQUAL(events[2].pitch, 67);
    BOOST_CHECK_CLOSE(events[2].start, 0.5, 1e-9);
    BOOST_CHECK_CLOSE(events[1].end, 0.25, 1e-9);
}

BOOST_AUTO_TEST_SUITE_END()
