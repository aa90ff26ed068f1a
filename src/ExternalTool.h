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

#ifndef PIANOSCRIBE_EXTERNAL_TOOL_H
#define PIANOSCRIBE_EXTERNAL_TOOL_H

#include <string>
#include <vector>

/**
 * Run an external program, found on PATH, and wait for it. Blocks
 * with no timeout. Returns the exit status, or -1 if the program
 * could not be started or did not exit normally. An exit status of
 * 127 means the program was not found.
 *
 * If quiet is set, the program's stdout and stderr are discarded.
 */
int runTool(const std::vector<std::string> &argv, bool quiet);

/**
 * A per-request directory beneath a temporary root, named
 * pianoscribe-<requestId>. Concurrent requests must use distinct
 * ids. The directory is removed on destruction if it is empty.
 */
class TempArea
{
public:
    TempArea(std::string root, std::string requestId);
    ~TempArea();

    std::string getPath() const { return m_path; }

    /**
     * Return a path within the area for a file with the given stem
     * and extension. Nothing is created.
     */
    std::string makePath(std::string stem, std::string extension) const;

    /**
     * Return a request id unique to this process and moment, for
     * callers that have none of their own.
     */
    static std::string makeRequestId();

private:
    std::string m_path;
    bool m_created;

    TempArea(const TempArea &); // not provided
    TempArea &operator=(const TempArea &); // not provided
};

/**
 * A transient file that is deleted when this object goes out of
 * scope, whether or not anything was ever written to it.
 */
class TempFile
{
public:
    TempFile(std::string path) : m_path(path) { }
    ~TempFile();

    std::string getPath() const { return m_path; }

private:
    std::string m_path;

    TempFile(const TempFile &); // not provided
    TempFile &operator=(const TempFile &); // not provided
};

#endif
