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

#include <iostream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <cstdlib>
#include <ctime>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string;
using std::vector;
using std::cerr;
using std::endl;

int
runTool(const vector<string> &argv, bool quiet)
{
    if (argv.empty()) return -1;

    vector<char *> args;
    for (int i = 0; i < int(argv.size()); ++i) {
        args.push_back(const_cast<char *>(argv[i].c_str()));
    }
    args.push_back(0);

    pid_t pid = fork();

    if (pid < 0) {
        cerr << "runTool: fork failed for \"" << argv[0] << "\": "
             << strerror(errno) << endl;
        return -1;
    }

    if (pid == 0) {
        if (quiet) {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, 1);
                dup2(devnull, 2);
                close(devnull);
            }
        }
        execvp(args[0], args.data());
        _exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            cerr << "runTool: wait failed for \"" << argv[0] << "\": "
                 << strerror(errno) << endl;
            return -1;
        }
    }

    if (!WIFEXITED(status)) {
        cerr << "runTool: \"" << argv[0] << "\" terminated abnormally" << endl;
        return -1;
    }

    return WEXITSTATUS(status);
}

TempArea::TempArea(string root, string requestId) :
    m_created(false)
{
    if (root == "") {
        const char *env = getenv("TMPDIR");
        root = (env && *env) ? env : "/tmp";
    }
    if (requestId == "") {
        requestId = makeRequestId();
    }
    m_path = root + "/pianoscribe-" + requestId;

    if (mkdir(m_path.c_str(), 0700) == 0) {
        m_created = true;
    } else if (errno != EEXIST) {
        cerr << "TempArea::TempArea: unable to create \"" << m_path
             << "\": " << strerror(errno) << endl;
    }
}

TempArea::~TempArea()
{
    if (m_created) {
        // Succeeds only if every transient file has been removed
        rmdir(m_path.c_str());
    }
}

string
TempArea::makePath(string stem, string extension) const
{
    return m_path + "/" + stem + "." + extension;
}

string
TempArea::makeRequestId()
{
    std::ostringstream os;
    os << getpid() << "-" << time(0);
    return os.str();
}

TempFile::~TempFile()
{
    if (unlink(m_path.c_str()) != 0 && errno != ENOENT) {
        cerr << "TempFile::~TempFile: could not remove \"" << m_path
             << "\": " << strerror(errno) << endl;
    }
}
