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

#include "Decoder.h"
#include "ExternalTool.h"
#include "TranscriptionErrors.h"

#include "constant-q-cpp/src/dsp/Resampler.h"

#include <bqvec/VectorOps.h>

#include <sndfile.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include <sys/stat.h>

using std::string;
using std::vector;
using std::cerr;
using std::endl;
using std::runtime_error;

using namespace breakfastquay;

static const int readBlockFrames = 4096;

Decoder::Decoder(const TranscriptionParameters &params,
                 const TempArea *tempArea) :
    m_params(params),
    m_tempArea(tempArea)
{
}

Decoder::~Decoder()
{
}

static long
getFileSize(string path)
{
    struct stat st;
    if (stat(path.c_str(), &st) != 0) return -1;
    return long(st.st_size);
}

static vector<char>
readWholeFile(string path)
{
    std::ifstream in(path.c_str(), std::ios::binary);
    if (!in) {
        throw runtime_error("unable to open \"" + path + "\" for reading");
    }
    return vector<char>((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
}

AudioBuffer
Decoder::decode(string path) const
{
    long size = getFileSize(path);
    if (size < 0) {
        throw DecodeError("Audio file not found: " + path);
    }
    if (size == 0) {
        throw EmptyInputError("Audio file is empty: " + path);
    }

    if (m_params.verbose) {
        cerr << "Decoder::decode: \"" << path << "\" is " << size
             << " bytes" << endl;
    }

    return decodeWith(getStrategies(), path);
}

vector<Decoder::NamedStrategy>
Decoder::getStrategies() const
{
    vector<NamedStrategy> strategies;

    NamedStrategy s;

    s.name = "native";
    s.strategy = [](const string &p) { return readNative(p); };
    strategies.push_back(s);

    s.name = "resampled";
    s.strategy = [this](const string &p) { return readResampled(p); };
    strategies.push_back(s);

    s.name = "wave header";
    s.strategy = [](const string &p) { return readRawWave(p); };
    strategies.push_back(s);

    if (m_tempArea) {
        s.name = "transcoded";
        s.strategy = [this](const string &p) { return readTranscoded(p); };
        strategies.push_back(s);
    }

    s.name = "container scan";
    s.strategy = [](const string &p) { return readContainerScan(p); };
    strategies.push_back(s);

    return strategies;
}

AudioBuffer
Decoder::decodeWith(const vector<NamedStrategy> &strategies, string path)
{
    string lastError = "no decode strategies available";

    for (int i = 0; i < int(strategies.size()); ++i) {

        const NamedStrategy &s = strategies[i];
        Decoded decoded;

        try {
            decoded = s.strategy(path);
        } catch (const std::exception &e) {
            lastError = e.what();
            cerr << "Decoder::decode: method " << i + 1 << " (" << s.name
                 << ") failed: " << e.what() << endl;
            continue;
        }

        if (decoded.channels < 1 || decoded.sampleRate <= 0) {
            lastError = "method " + s.name + " returned no usable format";
            cerr << "Decoder::decode: " << lastError << endl;
            continue;
        }

        if (decoded.data.empty()) {
            throw EmptyInputError("Audio file has no frames: " + path);
        }

        cerr << "Decoder::decode: loaded \"" << path << "\" with method "
             << i + 1 << " (" << s.name << "), " << decoded.channels
             << " channel(s) at " << decoded.sampleRate << " Hz" << endl;

        return finalise(decoded);
    }

    throw DecodeError("Failed to load audio file \"" + path +
                      "\" with all methods. Last error: " + lastError);
}

AudioBuffer
Decoder::finalise(const Decoded &decoded)
{
    int channels = decoded.channels;
    int frames = int(decoded.data.size()) / channels;

    AudioBuffer out;
    out.sampleRate = decoded.sampleRate;
    out.samples.resize(frames);

    if (channels == 1) {
        v_copy(out.samples.data(), decoded.data.data(), frames);
    } else {
        for (int i = 0; i < frames; ++i) {
            float sum = 0.f;
            for (int c = 0; c < channels; ++c) {
                sum += decoded.data[i * channels + c];
            }
            out.samples[i] = sum / channels;
        }
    }

    float peak = 0.f;
    for (int i = 0; i < frames; ++i) {
        peak = std::max(peak, fabsf(out.samples[i]));
    }
    if (peak > 1.f) {
        v_scale(out.samples.data(), 1.f / peak, frames);
    }

    return out;
}

static Decoder::Decoded
readFromSndfile(SNDFILE *sf, const SF_INFO &info)
{
    Decoder::Decoded d;
    d.channels = info.channels;
    d.sampleRate = info.samplerate;

    vector<float> block(readBlockFrames * info.channels);
    while (true) {
        sf_count_t got = sf_readf_float(sf, block.data(), readBlockFrames);
        if (got <= 0) break;
        d.data.insert(d.data.end(), block.begin(),
                      block.begin() + got * info.channels);
    }

    return d;
}

Decoder::Decoded
Decoder::readNative(string path)
{
    SF_INFO info;
    memset(&info, 0, sizeof(info));

    SNDFILE *sf = sf_open(path.c_str(), SFM_READ, &info);
    if (!sf) {
        throw runtime_error(string("libsndfile: ") + sf_strerror(0));
    }

    Decoded d = readFromSndfile(sf, info);
    sf_close(sf);
    return d;
}

Decoder::Decoded
Decoder::readResampled(string path) const
{
    Decoded native = readNative(path);
    if (native.sampleRate == m_params.targetSampleRate) {
        return native;
    }

    AudioBuffer mono = finalise(native);
    AudioBuffer resampled = resampleBuffer(mono, m_params.targetSampleRate);

    Decoded d;
    d.channels = 1;
    d.sampleRate = resampled.sampleRate;
    d.data = resampled.samples;
    return d;
}

AudioBuffer
resampleBuffer(const AudioBuffer &in, int targetRate)
{
    if (in.sampleRate == targetRate || in.empty()) {
        return in;
    }

    Resampler resampler(in.sampleRate, targetRate);

    int n = int(in.samples.size());
    int expected = int(round(double(n) * targetRate / in.sampleRate));
    int latency = resampler.getLatency();

    // Enough trailing zeros to push the latency out of the filter
    int flush = int(ceil(double(latency + 1) * in.sampleRate / targetRate)) + 1;

    vector<double> input(n + flush, 0.0);
    for (int i = 0; i < n; ++i) input[i] = in.samples[i];

    vector<double> output = resampler.process(input.data(), int(input.size()));

    AudioBuffer out;
    out.sampleRate = targetRate;
    out.samples.resize(expected, 0.f);
    for (int i = 0; i < expected; ++i) {
        int ix = i + latency;
        if (ix >= int(output.size())) break;
        out.samples[i] = float(output[ix]);
    }
    return out;
}

static unsigned int
readLE(const vector<char> &data, size_t offset, int bytes)
{
    unsigned int v = 0;
    for (int i = bytes - 1; i >= 0; --i) {
        v = (v << 8) | (unsigned char)data[offset + i];
    }
    return v;
}

Decoder::Decoded
Decoder::readRawWave(string path)
{
    vector<char> data = readWholeFile(path);

    if (data.size() < 12 ||
        memcmp(&data[0], "RIFF", 4) != 0 ||
        memcmp(&data[8], "WAVE", 4) != 0) {
        throw runtime_error("not a RIFF/WAVE file");
    }

    int format = 0, channels = 0, rate = 0, bits = 0;
    size_t dataStart = 0, dataSize = 0;
    bool haveFormat = false, haveData = false;

    size_t pos = 12;
    while (pos + 8 <= data.size()) {
        string id(&data[pos], 4);
        size_t size = readLE(data, pos + 4, 4);
        size_t body = pos + 8;
        if (id == "fmt ") {
            if (body + 16 > data.size()) break;
            format = readLE(data, body, 2);
            channels = readLE(data, body + 2, 2);
            rate = readLE(data, body + 4, 4);
            bits = readLE(data, body + 14, 2);
            if (format == 0xfffe && size >= 40 && body + 26 <= data.size()) {
                // WAVE_FORMAT_EXTENSIBLE: subformat GUID starts with the code
                format = readLE(data, body + 24, 2);
            }
            haveFormat = true;
        } else if (id == "data") {
            dataStart = body;
            // Streaming writers leave 0 or 0xffffffff here
            if (size == 0 || size > data.size() - body) {
                size = data.size() - body;
            }
            dataSize = size;
            haveData = true;
            break;
        }
        pos = body + size + (size & 1);
    }

    if (!haveFormat || !haveData) {
        throw runtime_error("WAVE file lacks a fmt or data chunk");
    }
    if (channels < 1 || rate <= 0) {
        throw runtime_error("WAVE file has an invalid channel count or rate");
    }

    int bytesPerSample = bits / 8;
    bool isFloat = (format == 3);
    if (!(format == 1 && (bits == 8 || bits == 16 || bits == 24 || bits == 32)) &&
        !(isFloat && (bits == 32 || bits == 64))) {
        throw runtime_error("unsupported WAVE sample format");
    }

    size_t count = dataSize / bytesPerSample;
    count -= count % channels;

    Decoded d;
    d.channels = channels;
    d.sampleRate = rate;
    d.data.resize(count);

    for (size_t i = 0; i < count; ++i) {
        size_t off = dataStart + i * bytesPerSample;
        float v = 0.f;
        if (isFloat && bits == 32) {
            unsigned int u = readLE(data, off, 4);
            memcpy(&v, &u, 4);
        } else if (isFloat) {
            unsigned long long u = readLE(data, off, 4) |
                ((unsigned long long)readLE(data, off + 4, 4) << 32);
            double dv;
            memcpy(&dv, &u, 8);
            v = float(dv);
        } else if (bits == 8) {
            v = ((unsigned char)data[off] - 128) / 128.f;
        } else {
            unsigned int u = readLE(data, off, bytesPerSample);
            int shift = 32 - bits;
            int s = int(u << shift) >> shift;
            v = float(s / pow(2.0, bits - 1));
        }
        d.data[i] = v;
    }

    return d;
}

string
Decoder::detectFormat(string path)
{
    std::ifstream in(path.c_str(), std::ios::binary);
    char header[12];
    memset(header, 0, sizeof(header));
    if (!in.read(header, sizeof(header))) {
        return "";
    }

    const unsigned char *u = (const unsigned char *)header;

    if (!memcmp(header, "RIFF", 4)) return "wav";
    if (!memcmp(header, "ID3", 3) || (u[0] == 0xff && u[1] == 0xfb)) return "mp3";
    if (!memcmp(header + 4, "ftypM4A", 7)) return "m4a";
    if (!memcmp(header, "fLaC", 4)) return "flac";
    if (!memcmp(header, "OggS", 4)) return "ogg";
    if (!memcmp(header, "caff", 4)) return "caf";

    return "";
}

Decoder::Decoded
Decoder::readTranscoded(string path) const
{
    if (!m_tempArea) {
        throw runtime_error("no temporary area for transcoding");
    }

    TempFile converted(m_tempArea->makePath("transcoded", "wav"));

    std::ostringstream rate;
    rate << m_params.targetSampleRate;

    string hint = detectFormat(path);

    vector<string> cmd;
    cmd.push_back("ffmpeg");
    cmd.push_back("-y");
    cmd.push_back("-vn");
    if (hint != "") {
        cmd.push_back("-f");
        cmd.push_back(hint);
    }
    cmd.push_back("-i");
    cmd.push_back(path);
    cmd.push_back("-f");
    cmd.push_back("wav");
    cmd.push_back("-acodec");
    cmd.push_back("pcm_s16le");
    cmd.push_back("-ar");
    cmd.push_back(rate.str());
    cmd.push_back("-ac");
    cmd.push_back("1");
    cmd.push_back("-loglevel");
    cmd.push_back("warning");
    cmd.push_back(converted.getPath());

    int rc = runTool(cmd, true);

    if (rc != 0 && hint != "") {
        cerr << "Decoder::readTranscoded: ffmpeg with format hint \"" << hint
             << "\" failed with code " << rc
             << ", retrying with format detection" << endl;
        cmd.erase(cmd.begin() + 3, cmd.begin() + 5);
        rc = runTool(cmd, true);
    }

    if (rc == 127) {
        throw runtime_error("ffmpeg not found");
    }
    if (rc != 0) {
        std::ostringstream os;
        os << "ffmpeg conversion failed with code " << rc;
        throw runtime_error(os.str());
    }
    if (getFileSize(converted.getPath()) <= 0) {
        throw runtime_error("ffmpeg created empty or no output file: " +
                            converted.getPath());
    }

    try {
        return readNative(converted.getPath());
    } catch (const std::exception &e) {
        cerr << "Decoder::readTranscoded: error loading converted file: "
             << e.what() << endl;
        return readRawWave(converted.getPath());
    }
}

namespace {

struct MemoryFile {
    const vector<char> *data;
    sf_count_t offset;
    sf_count_t position;
};

sf_count_t
memoryLength(void *user)
{
    MemoryFile *m = static_cast<MemoryFile *>(user);
    return sf_count_t(m->data->size()) - m->offset;
}

sf_count_t
memorySeek(sf_count_t offset, int whence, void *user)
{
    MemoryFile *m = static_cast<MemoryFile *>(user);
    sf_count_t length = memoryLength(user);
    sf_count_t target = offset;
    if (whence == SEEK_CUR) target = m->position + offset;
    else if (whence == SEEK_END) target = length + offset;
    if (target < 0) target = 0;
    if (target > length) target = length;
    m->position = target;
    return target;
}

sf_count_t
memoryRead(void *ptr, sf_count_t count, void *user)
{
    MemoryFile *m = static_cast<MemoryFile *>(user);
    sf_count_t available = memoryLength(user) - m->position;
    if (count > available) count = available;
    if (count <= 0) return 0;
    memcpy(ptr, &(*m->data)[m->offset + m->position], size_t(count));
    m->position += count;
    return count;
}

sf_count_t
memoryWrite(const void *, sf_count_t, void *)
{
    return 0;
}

sf_count_t
memoryTell(void *user)
{
    return static_cast<MemoryFile *>(user)->position;
}

}

Decoder::Decoded
Decoder::readContainerScan(string path)
{
    static const char *const signatures[] = {
        "RIFF", "fLaC", "OggS", "FORM", "caff"
    };
    static const int nsignatures = 5;
    static const size_t scanLimit = 65536;

    vector<char> data = readWholeFile(path);

    size_t limit = std::min(scanLimit, data.size() > 4 ? data.size() - 4 : 0);

    for (size_t off = 1; off < limit; ++off) {
        for (int s = 0; s < nsignatures; ++s) {
            if (memcmp(&data[off], signatures[s], 4) != 0) continue;

            MemoryFile mem;
            mem.data = &data;
            mem.offset = off;
            mem.position = 0;

            SF_VIRTUAL_IO io;
            io.get_filelen = memoryLength;
            io.seek = memorySeek;
            io.read = memoryRead;
            io.write = memoryWrite;
            io.tell = memoryTell;

            SF_INFO info;
            memset(&info, 0, sizeof(info));

            SNDFILE *sf = sf_open_virtual(&io, SFM_READ, &info, &mem);
            if (!sf) continue;

            cerr << "Decoder::readContainerScan: found \"" << signatures[s]
                 << "\" container at byte offset " << off << endl;

            Decoded d = readFromSndfile(sf, info);
            sf_close(sf);
            return d;
        }
    }

    throw runtime_error("no decodable container signature found");
}
