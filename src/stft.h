#pragma once

#include <complex>
#include <cstddef>
#include <vector>

// Short-time Fourier transform of a mono signal.
// Frames are Hann-windowed (periodic), zero-padded to a power-of-two FFT size,
// and laid out row-major as frames x bins (bins = nfft/2 + 1).
struct Spectrogram {
  int frames = 0;
  int bins = 0;
  int nperseg = 0;
  int hop = 0;
  int nfft = 0;
  size_t signal_length = 0;  // samples covered by the frames (after end padding)
  std::vector<std::complex<float>> data;

  std::complex<float>& at(int frame, int bin) { return data[size_t(frame) * size_t(bins) + size_t(bin)]; }
  const std::complex<float>& at(int frame, int bin) const {
    return data[size_t(frame) * size_t(bins) + size_t(bin)];
  }
};

// In-place iterative radix-2 FFT; a.size() must be a power of two.
void fft_inplace(std::vector<std::complex<double>>& a, bool inverse);

int next_pow2(int n);

// No boundary extension. The tail is zero-padded to a whole number of hops;
// signals shorter than nperseg are zero-padded to one frame.
Spectrogram stft(const std::vector<float>& signal, int nperseg, int noverlap);

// Weighted overlap-add inverse of stft(). Returns sg.signal_length samples.
std::vector<float> istft(const Spectrogram& sg);

// Log-mel filterbank (25ms Hamming window, 10ms hop, 512-point FFT) with
// per-utterance mean normalisation. Row-major frames x n_mels.
std::vector<float> log_mel_fbank(const float* samples, size_t count, int sample_rate, int n_mels, int& frames_out);
