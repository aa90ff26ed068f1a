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

#ifndef PIANOSCRIBE_RENDERER_H
#define PIANOSCRIBE_RENDERER_H

#include <string>

/**
 * Turns a notation document into a page image. Implementations throw
 * RenderError if the output could not be produced; the document
 * itself remains valid either way.
 */
class Renderer
{
public:
    virtual ~Renderer() { }

    virtual void render(std::string documentPath, std::string outputPath) = 0;
};

/**
 * Renders through MuseScore's command line converter, run as
 * "mscore -o <output> <document>". The output format follows the
 * output file extension.
 */
class MuseScoreRenderer : public Renderer
{
public:
    MuseScoreRenderer(std::string program = "mscore");
    virtual ~MuseScoreRenderer();

    virtual void render(std::string documentPath, std::string outputPath);

private:
    std::string m_program;
};

#endif
