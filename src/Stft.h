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

#ifndef PIANOSCRIBE_STFT_H
#define PIANOSCRIBE_STFT_H

#include <vector>

class FFTReal;

/// Columns are frames, rows within a column are frequency bins
typedef std::vector<std::vector<double> > Grid;

/**
 * Short-time Fourier transform with a periodic Hann window and
 * centred frames: frame i is centred on sample i * hop, with zeros
 * beyond either end of the signal. A signal of n samples has
 * 1 + n / hop frames of fftSize / 2 + 1 bins.
 */
class Stft
{
public:
    Stft(int fftSize, int hopSize);
    ~Stft();

    int getFftSize() const { return m_fftSize; }
    int getHopSize() const { return m_hopSize; }
    int getBinCount() const { return m_fftSize / 2 + 1; }
    int getFrameCount(int length) const { return 1 + length / m_hopSize; }

    void forward(const std::vector<float> &signal,
                 Grid &magnitudes, Grid &phases) const;

    Grid magnitudes(const std::vector<float> &signal) const;

    /**
     * Resynthesise by weighted overlap-add, trimming or padding to
     * the given length.
     */
    std::vector<float> inverse(const Grid &magnitudes, const Grid &phases,
                               int length) const;

private:
    int m_fftSize;
    int m_hopSize;
    FFTReal *m_fft;
    std::vector<double> m_window;
    double m_inverseScale;

    Stft(const Stft &); // not provided
    Stft &operator=(const Stft &); // not provided
};

#endif
