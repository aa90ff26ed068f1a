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

#include "Renderer.h"
#include "ExternalTool.h"
#include "TranscriptionErrors.h"

#include <sstream>
#include <vector>

#include <sys/stat.h>

using std::string;
using std::vector;

MuseScoreRenderer::MuseScoreRenderer(string program) :
    m_program(program)
{
}

MuseScoreRenderer::~MuseScoreRenderer()
{
}

void
MuseScoreRenderer::render(string documentPath, string outputPath)
{
    vector<string> argv;
    argv.push_back(m_program);
    argv.push_back("-o");
    argv.push_back(outputPath);
    argv.push_back(documentPath);

    int status = runTool(argv, true);

    if (status != 0) {
        std::ostringstream os;
        os << "MuseScoreRenderer::render: \"" << m_program << "\" ";
        if (status == 127) os << "not found";
        else if (status < 0) os << "could not be run";
        else os << "exited with status " << status;
        throw RenderError(os.str());
    }

    struct stat st;
    if (stat(outputPath.c_str(), &st) != 0 || st.st_size == 0) {
        throw RenderError("MuseScoreRenderer::render: no output written to \"" +
                          outputPath + "\"");
    }
}
