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

#include "ExternalTool.h"
#include "Renderer.h"
#include "Synthesizer.h"
#include "TranscriptionErrors.h"
#include "TranscriptionParameters.h"

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MAIN

#include <boost/test/unit_test.hpp>

#include <fstream>
#include <string>
#include <vector>

#include <sys/stat.h>

using namespace std;

BOOST_AUTO_TEST_SUITE(TestExternalTool)

static bool
exists(string path)
{
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

static vector<string>
command(string a, string b = "")
{
    vector<string> argv;
    argv.push_back(a);
    if (b != "") argv.push_back(b);
    return argv;
}

BOOST_AUTO_TEST_CASE(exit_status)
{
    BOOST_CHECK_EQUAL(runTool(command("true"), true), 0);
    BOOST_CHECK_EQUAL(runTool(command("false"), true), 1);
    BOOST_CHECK_EQUAL(runTool(command("pianoscribe-no-such-program"), true), 127);
    BOOST_CHECK_EQUAL(runTool(vector<string>(), true), -1);
}

BOOST_AUTO_TEST_CASE(temp_area)
{
    string path;
    {
        TempArea area("", TempArea::makeRequestId() + "-area");
        path = area.getPath();
        BOOST_CHECK(path.find("/pianoscribe-") != string::npos);
        BOOST_CHECK(exists(path));
        BOOST_CHECK_EQUAL(area.makePath("x", "wav"), path + "/x.wav");
        {
            TempFile file(area.makePath("x", "wav"));
            ofstream out(file.getPath().c_str());
            out << "data";
            out.close();
            BOOST_CHECK(exists(file.getPath()));
        }
        BOOST_CHECK(!exists(path + "/x.wav"));
    }
    BOOST_CHECK(!exists(path));
}

BOOST_AUTO_TEST_CASE(renderer_failures)
{
    TempArea area("", TempArea::makeRequestId() + "-render");
    string out = area.makePath("page", "png");

    MuseScoreRenderer missing("pianoscribe-no-such-renderer");
    BOOST_CHECK_THROW(missing.render("/any/score.musicxml", out), RenderError);

    MuseScoreRenderer failing("false");
    BOOST_CHECK_THROW(failing.render("/any/score.musicxml", out), RenderError);

    // Exits cleanly without writing anything
    MuseScoreRenderer silent("true");
    BOOST_CHECK_THROW(silent.render("/any/score.musicxml", out), RenderError);
}

BOOST_AUTO_TEST_CASE(synthesizer_failures)
{
    TempArea area("", TempArea::makeRequestId() + "-synth");
    string out = area.makePath("audio", "wav");

    FluidSynthSynthesizer synth("true");
    BOOST_CHECK_THROW(synth.synthesize("/any/score.mid", "/no/such/bank.sf2", out),
                      SynthesisError);

    TempFile bank(area.makePath("bank", "sf2"));
    {
        ofstream b(bank.getPath().c_str());
        b << "not really a bank";
    }
    BOOST_CHECK_THROW(synth.synthesize("/any/score.mid", bank.getPath(), out),
                      SynthesisError);

    FluidSynthSynthesizer missing("pianoscribe-no-such-synth");
    BOOST_CHECK_THROW(missing.synthesize("/any/score.mid", bank.getPath(), out),
                      SynthesisError);
}

BOOST_AUTO_TEST_CASE(parameter_validation)
{
    TranscriptionParameters params;
    BOOST_CHECK(params.validate().empty());

    TranscriptionParameters p(params);
    p.fftSize = 1000;
    BOOST_CHECK(!p.validate().empty());

    p = params;
    p.persistence = 0.f;
    BOOST_CHECK(!p.validate().empty());

    p = params;
    p.harmonicSupportRatio = 1.f;
    BOOST_CHECK(!p.validate().empty());

    p = params;
    p.bandHigh = 30000.f;
    BOOST_CHECK(!p.validate().empty());

    p = params;
    p.stepsPerQuarter = 8;
    BOOST_CHECK(!p.validate().empty());

    p = params;
    p.noiseReduction = 1.5f;
    p.maxHarmonic = 1;
    BOOST_CHECK_EQUAL(int(p.validate().size()), 2);
}

BOOST_AUTO_TEST_SUITE_END()
