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
#include "TranscriptionErrors.h"

#include <cmath>
#include <fstream>
#include <sstream>

using std::string;
using std::ostream;
using std::endl;

MusicXmlWriter::MusicXmlWriter()
{
}

MusicXmlWriter::~MusicXmlWriter()
{
}

string
MusicXmlWriter::escape(string text)
{
    string out;
    for (int i = 0; i < int(text.size()); ++i) {
        switch (text[i]) {
        case '&': out += "&amp;"; break;
        case '<': out += "&lt;"; break;
        case '>': out += "&gt;"; break;
        case '"': out += "&quot;"; break;
        case '\'': out += "&apos;"; break;
        default: out += text[i]; break;
        }
    }
    return out;
}

void
MusicXmlWriter::write(const ScoreModel &score, ostream &out) const
{
    out << "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"no\"?>" << endl;
    out << "<!DOCTYPE score-partwise PUBLIC \"-//Recordare//DTD MusicXML 3.1 Partwise//EN\" \"http://www.musicxml.org/dtds/partwise.dtd\">" << endl;
    out << "<score-partwise version=\"3.1\">" << endl;

    out << "  <work>" << endl;
    out << "    <work-title>" << escape(score.title) << "</work-title>" << endl;
    out << "  </work>" << endl;

    out << "  <identification>" << endl;
    out << "    <creator type=\"composer\">" << escape(score.composer)
        << "</creator>" << endl;
    out << "    <encoding>" << endl;
    out << "      <software>Pianoscribe</software>" << endl;
    out << "    </encoding>" << endl;
    out << "  </identification>" << endl;

    out << "  <part-list>" << endl;
    const Part *parts[] = { &score.treble, &score.bass };
    for (int i = 0; i < 2; ++i) {
        out << "    <score-part id=\"" << parts[i]->id << "\">" << endl;
        out << "      <part-name>" << escape(parts[i]->name) << "</part-name>" << endl;
        out << "    </score-part>" << endl;
    }
    out << "  </part-list>" << endl;

    for (int i = 0; i < 2; ++i) {
        writePart(*parts[i], score.tempo, out);
    }

    out << "</score-partwise>" << endl;
}

void
MusicXmlWriter::writePart(const Part &part, double tempo, ostream &out) const
{
    out << "  <part id=\"" << part.id << "\">" << endl;

    for (int m = 0; m < int(part.measures.size()); ++m) {

        const Measure &measure = part.measures[m];
        out << "    <measure number=\"" << measure.number << "\">" << endl;

        if (m == 0) {
            out << "      <attributes>" << endl;
            out << "        <divisions>" << notationStepsPerQuarter
                << "</divisions>" << endl;
            out << "        <key>" << endl;
            out << "          <fifths>0</fifths>" << endl;
            out << "        </key>" << endl;
            out << "        <time>" << endl;
            out << "          <beats>4</beats>" << endl;
            out << "          <beat-type>4</beat-type>" << endl;
            out << "        </time>" << endl;
            out << "        <clef>" << endl;
            out << "          <sign>" << part.clefSign << "</sign>" << endl;
            out << "          <line>" << part.clefLine << "</line>" << endl;
            out << "        </clef>" << endl;
            out << "      </attributes>" << endl;
            out << "      <direction placement=\"above\">" << endl;
            out << "        <direction-type>" << endl;
            out << "          <metronome>" << endl;
            out << "            <beat-unit>quarter</beat-unit>" << endl;
            out << "            <per-minute>" << int(round(tempo))
                << "</per-minute>" << endl;
            out << "          </metronome>" << endl;
            out << "        </direction-type>" << endl;
            out << "        <sound tempo=\"" << tempo << "\"/>" << endl;
            out << "      </direction>" << endl;
        }

        bool wholeRest = measure.isWholeRest();
        for (int i = 0; i < int(measure.elements.size()); ++i) {
            writeElement(measure.elements[i], wholeRest, out);
        }

        out << "    </measure>" << endl;
    }

    out << "  </part>" << endl;
}

void
MusicXmlWriter::writeElement(const ScoreElement &e, bool wholeRest,
                             ostream &out) const
{
    int count = (e.isRest() ? 1 : int(e.pitches.size()));

    for (int i = 0; i < count; ++i) {

        out << "      <note>" << endl;

        if (i > 0) {
            out << "        <chord/>" << endl;
        }

        if (e.isRest()) {
            if (wholeRest) out << "        <rest measure=\"yes\"/>" << endl;
            else out << "        <rest/>" << endl;
        } else {
            string step;
            int alter, octave;
            spellPitch(e.pitches[i], step, alter, octave);
            out << "        <pitch>" << endl;
            out << "          <step>" << step << "</step>" << endl;
            if (alter != 0) {
                out << "          <alter>" << alter << "</alter>" << endl;
            }
            out << "          <octave>" << octave << "</octave>" << endl;
            out << "        </pitch>" << endl;
        }

        out << "        <duration>" << e.steps << "</duration>" << endl;

        if (e.tieStop) out << "        <tie type=\"stop\"/>" << endl;
        if (e.tieStart) out << "        <tie type=\"start\"/>" << endl;

        out << "        <voice>1</voice>" << endl;
        out << "        <type>" << e.getTypeName() << "</type>" << endl;
        if (e.isDotted()) out << "        <dot/>" << endl;

        if (e.tieStart || e.tieStop) {
            out << "        <notations>" << endl;
            if (e.tieStop) out << "          <tied type=\"stop\"/>" << endl;
            if (e.tieStart) out << "          <tied type=\"start\"/>" << endl;
            out << "        </notations>" << endl;
        }

        out << "      </note>" << endl;
    }
}

string
MusicXmlWriter::toString(const ScoreModel &score) const
{
    std::ostringstream os;
    write(score, os);
    return os.str();
}

void
MusicXmlWriter::writeFile(const ScoreModel &score, string path) const
{
    std::ofstream file(path.c_str());
    if (!file) {
        throw OutputError("MusicXmlWriter::writeFile: failed to open \"" +
                          path + "\" for writing");
    }
    write(score, file);
    file.close();
    if (!file) {
        throw OutputError("MusicXmlWriter::writeFile: failed to write \"" +
                          path + "\"");
    }
}
