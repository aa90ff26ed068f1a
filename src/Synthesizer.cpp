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

#include "Synthesizer.h"
#include "ExternalTool.h"
#include "TranscriptionErrors.h"

#include <sstream>
#include <vector>

#include <sys/stat.h>

using std::string;
using std::vector;

FluidSynthSynthesizer::FluidSynthSynthesizer(string program) :
    m_program(program)
{
}

FluidSynthSynthesizer::~FluidSynthSynthesizer()
{
}

void
FluidSynthSynthesizer::synthesize(string exportPath,
                                  string sampleBankPath,
                                  string outputPath)
{
    struct stat st;
    if (stat(sampleBankPath.c_str(), &st) != 0) {
        throw SynthesisError("FluidSynthSynthesizer::synthesize: sample bank \"" +
                             sampleBankPath + "\" not found");
    }

    std::ostringstream g;
    g << gain;

    vector<string> argv;
    argv.push_back(m_program);
    argv.push_back("-ni");
    argv.push_back("-g");
    argv.push_back(g.str());
    argv.push_back("-F");
    argv.push_back(outputPath);
    argv.push_back(sampleBankPath);
    argv.push_back(exportPath);

    int status = runTool(argv, true);

    if (status != 0) {
        std::ostringstream os;
        os << "FluidSynthSynthesizer::synthesize: \"" << m_program << "\" ";
        if (status == 127) os << "not found";
        else if (status < 0) os << "could not be run";
        else os << "exited with status " << status;
        throw SynthesisError(os.str());
    }

    if (stat(outputPath.c_str(), &st) != 0 || st.st_size == 0) {
        throw SynthesisError("FluidSynthSynthesizer::synthesize: no output written to \"" +
                             outputPath + "\"");
    }
}
