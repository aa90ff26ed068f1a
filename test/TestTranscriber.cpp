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

#include "Transcriber.h"
#include "Renderer.h"
#include "Synthesizer.h"
#include "ExternalTool.h"
#include "TranscriptionErrors.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>

#include <cmath>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace std;

BOOST_AUTO_TEST_SUITE(TestTranscriber)

static const int rate = 44100;

static AudioBuffer
chordWithSilence(vector<int> pitches, double lead, double length, double tail)
{
    int a = int(lead * rate), b = int(length * rate), c = int(tail * rate);
    int fade = rate / 20;
    vector<float> s(a + b + c, 0.f);
    for (int p = 0; p < int(pitches.size()); ++p) {
        double f = 440.0 * pow(2.0, (pitches[p] - 69) / 12.0);
        for (int i = 0; i < b; ++i) {
            // fade out so the release has no click of its own
            float gain = (i > b - fade) ? float(b - i) / fade : 1.f;
            s[a + i] += gain * 0.4f * float(sin(2.0 * M_PI * f * i / rate));
        }
    }
    return AudioBuffer(s, rate);
}

static TranscriptionParameters
plainParameters()
{
    TranscriptionParameters params;
    params.preprocess = false;
    params.tempoOverride = 120.0;
    return params;
}

static bool
allFull(const Part &part)
{
    for (int i = 0; i < int(part.measures.size()); ++i) {
        if (!part.measures[i].isFull()) return false;
    }
    return true;
}

static int
countSounding(const Part &part)
{
    int n = 0;
    for (int i = 0; i < int(part.measures.size()); ++i) {
        const vector<ScoreElement> &ee = part.measures[i].elements;
        for (int j = 0; j < int(ee.size()); ++j) {
            if (!ee[j].isRest()) ++n;
        }
    }
    return n;
}

class FailingRenderer : public Renderer
{
public:
    FailingRenderer(int &calls) : m_calls(calls) { }
    virtual void render(string, string) {
        ++m_calls;
        throw RenderError("FailingRenderer: no renderer here");
    }
private:
    int &m_calls;
};

class RecordingSynthesizer : public Synthesizer
{
public:
    RecordingSynthesizer(string &exported) : m_exported(exported) { }
    virtual void synthesize(string exportPath, string, string) {
        m_exported = exportPath;
    }
private:
    string &m_exported;
};

static void
writeSilentWave(string path, int frames)
{
    string s = "RIFF";
    unsigned int dataBytes = frames * 2;
    unsigned int fields[] = { 36 + dataBytes };
    s.append((const char *)fields, 4);
    s += "WAVEfmt ";
    unsigned char fmt[] = { 16, 0, 0, 0, 1, 0, 1, 0,
                            0x44, 0xac, 0, 0, 0x88, 0x58, 1, 0,
                            2, 0, 16, 0 };
    s.append((const char *)fmt, sizeof(fmt));
    s += "data";
    fields[0] = dataBytes;
    s.append((const char *)fields, 4);
    s.append(dataBytes, '\0');

    ofstream out(path.c_str(), ios::binary);
    out.write(s.data(), s.size());
}

static string
readText(string path)
{
    ifstream in(path.c_str());
    return string((istreambuf_iterator<char>(in)), istreambuf_iterator<char>());
}

BOOST_AUTO_TEST_CASE(empty_buffer)
{
    Transcriber transcriber(plainParameters());
    Transcription t = transcriber.transcribe(AudioBuffer(), "Nothing", "Nobody");
    BOOST_CHECK_EQUAL(t.tempo, 120.0);
    BOOST_CHECK_EQUAL(t.score.title, "Nothing");
    BOOST_CHECK_EQUAL(t.score.composer, "Nobody");
    BOOST_CHECK_EQUAL(int(t.score.treble.measures.size()), 1);
    BOOST_CHECK_EQUAL(int(t.score.bass.measures.size()), 1);
    BOOST_CHECK(t.score.treble.measures[0].isWholeRest());
    BOOST_CHECK(t.score.bass.measures[0].isWholeRest());
}

BOOST_AUTO_TEST_CASE(empty_buffer_tempo_is_clamped)
{
    TranscriptionParameters params = plainParameters();
    params.tempoOverride = 1000.0;
    Transcriber transcriber(params);
    BOOST_CHECK_EQUAL(transcriber.transcribe(AudioBuffer()).tempo, 120.0);
}

BOOST_AUTO_TEST_CASE(single_tone)
{
    Transcriber transcriber(plainParameters());
    Transcription t = transcriber.transcribe
        (chordWithSilence(vector<int>(1, 60), 0.5, 3.0, 0.5));

    BOOST_CHECK_EQUAL(t.tempo, 120.0);
    BOOST_CHECK(!t.notes.empty());
    for (int i = 0; i < int(t.notes.size()); ++i) {
        BOOST_CHECK_EQUAL(t.notes[i].pitch, 60);
    }
    BOOST_CHECK_EQUAL(t.notes.size(), t.quantized.size());

    BOOST_CHECK(countSounding(t.score.treble) > 0);
    BOOST_CHECK_EQUAL(countSounding(t.score.bass), 0);
    BOOST_CHECK(allFull(t.score.treble));
    BOOST_CHECK(allFull(t.score.bass));
    BOOST_CHECK_EQUAL(t.score.treble.measures.size(),
                      t.score.bass.measures.size());

    // Half a second of silence at 120 BPM is one beat
    const Measure &first = t.score.treble.measures[0];
    BOOST_CHECK(first.elements[0].isRest());
}

BOOST_AUTO_TEST_CASE(chord_on_treble)
{
    vector<int> pitches;
    pitches.push_back(60);
    pitches.push_back(64);

    Transcriber transcriber(plainParameters());
    Transcription t = transcriber.transcribe
        (chordWithSilence(pitches, 0.5, 1.0, 0.5));

    bool found = false;
    const vector<Measure> &mm = t.score.treble.measures;
    for (int i = 0; i < int(mm.size()); ++i) {
        for (int j = 0; j < int(mm[i].elements.size()); ++j) {
            const ScoreElement &e = mm[i].elements[j];
            if (e.kind == ScoreElement::Chord) {
                BOOST_CHECK_EQUAL(int(e.pitches.size()), 2);
                BOOST_CHECK_EQUAL(e.pitches[0], 60);
                BOOST_CHECK_EQUAL(e.pitches[1], 64);
                found = true;
            }
        }
    }
    BOOST_CHECK(found);
    BOOST_CHECK_EQUAL(countSounding(t.score.bass), 0);
    BOOST_CHECK(allFull(t.score.bass));
}

BOOST_AUTO_TEST_CASE(single_tone_without_silence)
{
    Transcriber transcriber(plainParameters());
    Transcription t = transcriber.transcribe
        (chordWithSilence(vector<int>(1, 60), 0.0, 4.0, 0.0));

    BOOST_CHECK(!t.segments.empty());
    BOOST_CHECK_EQUAL(t.notes.size(), t.segments.size());
    for (int i = 0; i < int(t.notes.size()); ++i) {
        BOOST_CHECK_EQUAL(t.notes[i].pitch, 60);
    }
    BOOST_CHECK(countSounding(t.score.treble) > 0);
    BOOST_CHECK_EQUAL(countSounding(t.score.bass), 0);
    BOOST_CHECK(allFull(t.score.treble));
}

BOOST_AUTO_TEST_CASE(chord_without_silence)
{
    vector<int> pitches;
    pitches.push_back(60);
    pitches.push_back(64);

    Transcriber transcriber(plainParameters());
    Transcription t = transcriber.transcribe
        (chordWithSilence(pitches, 0.0, 1.0, 0.0));

    BOOST_CHECK(!t.segments.empty());
    for (int i = 0; i < int(t.notes.size()); ++i) {
        BOOST_CHECK(t.notes[i].pitch == 60 || t.notes[i].pitch == 64);
    }

    bool found = false;
    const vector<Measure> &mm = t.score.treble.measures;
    for (int i = 0; i < int(mm.size()); ++i) {
        for (int j = 0; j < int(mm[i].elements.size()); ++j) {
            const ScoreElement &e = mm[i].elements[j];
            if (e.kind == ScoreElement::Chord && e.pitches.size() == 2) {
                BOOST_CHECK_EQUAL(e.pitches[0], 60);
                BOOST_CHECK_EQUAL(e.pitches[1], 64);
                found = true;
            }
        }
    }
    BOOST_CHECK(found);
    BOOST_CHECK_EQUAL(countSounding(t.score.bass), 0);
}

BOOST_AUTO_TEST_CASE(single_tone_preprocessed)
{
    TranscriptionParameters params;
    params.tempoOverride = 120.0;
    BOOST_CHECK(params.preprocess);

    Transcriber transcriber(params);
    Transcription t = transcriber.transcribe
        (chordWithSilence(vector<int>(1, 60), 0.0, 4.0, 0.0));

    BOOST_CHECK(!t.segments.empty());
    bool found = false;
    for (int i = 0; i < int(t.notes.size()); ++i) {
        if (t.notes[i].pitch == 60) found = true;
    }
    BOOST_CHECK(found);
    BOOST_CHECK(allFull(t.score.treble));
    BOOST_CHECK(allFull(t.score.bass));
}

BOOST_AUTO_TEST_CASE(check_measures)
{
    ScoreModel score;
    score.treble = Part::makeTreble();
    score.bass = Part::makeBass();

    Measure full(1);
    full.elements.push_back(ScoreElement::makeRest(16));
    Measure partial(2);
    partial.elements.push_back(ScoreElement::makeRest(4));

    score.treble.measures.push_back(full);
    score.bass.measures.push_back(full);
    BOOST_CHECK_NO_THROW(Transcriber::checkMeasures(score, false));

    score.treble.measures.push_back(partial);
    score.bass.measures.push_back(full);
    BOOST_CHECK_THROW(Transcriber::checkMeasures(score, false), AnalysisError);
    BOOST_CHECK_NO_THROW(Transcriber::checkMeasures(score, true));

    score.treble.measures.push_back(full);
    BOOST_CHECK_THROW(Transcriber::checkMeasures(score, true), AnalysisError);
}

BOOST_AUTO_TEST_CASE(export_path)
{
    TranscriptionOutputs outputs;
    outputs.documentPath = "/tmp/out/score.musicxml";
    BOOST_CHECK_EQUAL(Transcriber::getExportPath(outputs), "/tmp/out/score.mid");
    outputs.documentPath = "/tmp/out.d/score";
    BOOST_CHECK_EQUAL(Transcriber::getExportPath(outputs), "/tmp/out.d/score.mid");
    outputs.exportPath = "/elsewhere/x.mid";
    BOOST_CHECK_EQUAL(Transcriber::getExportPath(outputs), "/elsewhere/x.mid");
}

BOOST_AUTO_TEST_CASE(invalid_requests)
{
    TranscriptionParameters params;
    params.fftSize = 1000;
    BOOST_CHECK(!params.validate().empty());

    TranscriptionOutputs outputs;
    outputs.documentPath = "/tmp/never-written.musicxml";
    Transcriber bad(params);
    BOOST_CHECK_THROW(bad.transcribeFile("/nonexistent.wav", outputs),
                      invalid_argument);

    Transcriber good(plainParameters());
    BOOST_CHECK_THROW(good.transcribeFile("/nonexistent.wav", TranscriptionOutputs()),
                      invalid_argument);
    BOOST_CHECK_THROW(good.transcribeFile("/nonexistent/pianoscribe.wav", outputs),
                      DecodeError);
}

BOOST_AUTO_TEST_CASE(written_outputs)
{
    TempArea area("", TempArea::makeRequestId() + "-outputs");
    TempFile input(area.makePath("input", "wav"));
    TempFile document(area.makePath("score", "musicxml"));
    TempFile exported(area.makePath("score", "mid"));

    writeSilentWave(input.getPath(), rate);

    TranscriptionOutputs outputs;
    outputs.documentPath = document.getPath();
    outputs.title = "Silence";

    Transcriber transcriber(plainParameters());
    BOOST_CHECK_EQUAL(transcriber.transcribeFile(input.getPath(), outputs),
                      Transcriber::Success);
    BOOST_CHECK(transcriber.getDegradations().empty());

    string xml = readText(document.getPath());
    BOOST_CHECK(xml.find("<work-title>Silence</work-title>") != string::npos);
    BOOST_CHECK(xml.find("<rest measure=\"yes\"/>") != string::npos);

    string midi = readText(exported.getPath());
    BOOST_CHECK(midi.compare(0, 4, "MThd") == 0);

    const Transcription &t = transcriber.getLastTranscription();
    BOOST_CHECK(t.notes.empty());
    BOOST_CHECK(t.score.treble.measures[0].isWholeRest());
}

BOOST_AUTO_TEST_CASE(degraded_outputs)
{
    TempArea area("", TempArea::makeRequestId() + "-degraded");
    TempFile input(area.makePath("input", "wav"));
    TempFile document(area.makePath("score", "musicxml"));
    TempFile exported(area.makePath("score", "mid"));
    TempFile rendered(area.makePath("score", "png"));
    TempFile audio(area.makePath("score", "wav"));

    writeSilentWave(input.getPath(), rate / 2);

    TranscriptionOutputs outputs;
    outputs.documentPath = document.getPath();
    outputs.renderPath = rendered.getPath();
    outputs.audioPath = audio.getPath();

    int renderCalls = 0;
    string synthesized;

    Transcriber transcriber(plainParameters());
    transcriber.setRenderer(new FailingRenderer(renderCalls));
    transcriber.setSynthesizer(new RecordingSynthesizer(synthesized));

    // No sample bank: audio is skipped, and the render fails
    BOOST_CHECK_EQUAL(transcriber.transcribeFile(input.getPath(), outputs),
                      Transcriber::DegradedSuccess);
    BOOST_CHECK_EQUAL(renderCalls, 1);
    BOOST_CHECK_EQUAL(int(transcriber.getDegradations().size()), 2);
    BOOST_CHECK_EQUAL(synthesized, "");
    BOOST_CHECK(readText(document.getPath()).find("<score-partwise") != string::npos);

    outputs.renderPath = "";
    outputs.sampleBankPath = "/any/bank.sf2";
    BOOST_CHECK_EQUAL(transcriber.transcribeFile(input.getPath(), outputs),
                      Transcriber::Success);
    BOOST_CHECK_EQUAL(synthesized, exported.getPath());
    BOOST_CHECK(transcriber.getDegradations().empty());
}

BOOST_AUTO_TEST_SUITE_END()
