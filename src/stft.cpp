#include "stft.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

constexpr double kPi = 3.14159265358979323846;

std::vector<float> periodic_hann(int n) {
  std::vector<float> w(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) w[size_t(i)] = float(0.5 - 0.5 * std::cos(2.0 * kPi * i / n));
  return w;
}

std::vector<float> hamming(int n) {
  std::vector<float> w(static_cast<size_t>(n));
  if (n == 1) {
    w[0] = 1.0f;
    return w;
  }
  for (int i = 0; i < n; ++i) w[size_t(i)] = float(0.54 - 0.46 * std::cos(2.0 * kPi * i / (n - 1)));
  return w;
}

float hz_to_mel(float hz) { return 2595.0f * std::log10(1.0f + hz / 700.0f); }
float mel_to_hz(float mel) { return 700.0f * (std::pow(10.0f, mel / 2595.0f) - 1.0f); }

// Triangular filters over the nfft/2+1 power bins. Row-major n_mels x bins.
std::vector<float> mel_filterbank(int n_mels, int nfft, int sample_rate) {
  const int bins = nfft / 2 + 1;
  std::vector<float> fb(size_t(n_mels) * size_t(bins), 0.0f);
  const float mel_lo = hz_to_mel(20.0f);
  const float mel_hi = hz_to_mel(float(sample_rate) / 2.0f);
  std::vector<float> centers(size_t(n_mels) + 2);
  for (int i = 0; i < n_mels + 2; ++i) {
    const float mel = mel_lo + (mel_hi - mel_lo) * float(i) / float(n_mels + 1);
    centers[size_t(i)] = mel_to_hz(mel) * float(nfft) / float(sample_rate);
  }
  for (int m = 0; m < n_mels; ++m) {
    const float left = centers[size_t(m)];
    const float mid = centers[size_t(m) + 1];
    const float right = centers[size_t(m) + 2];
    for (int k = 0; k < bins; ++k) {
      const float fk = float(k);
      float v = 0.0f;
      if (fk > left && fk <= mid && mid > left) v = (fk - left) / (mid - left);
      else if (fk > mid && fk < right && right > mid) v = (right - fk) / (right - mid);
      fb[size_t(m) * size_t(bins) + size_t(k)] = v;
    }
  }
  return fb;
}

}  // namespace

int next_pow2(int n) {
  int p = 1;
  while (p < n) p <<= 1;
  return p;
}

void fft_inplace(std::vector<std::complex<double>>& a, bool inverse) {
  const size_t n = a.size();
  if (n == 0 || (n & (n - 1)) != 0) throw std::runtime_error("fft size must be a power of two");

  for (size_t i = 1, j = 0; i < n; ++i) {
    size_t bit = n >> 1;
    for (; j & bit; bit >>= 1) j ^= bit;
    j ^= bit;
    if (i < j) std::swap(a[i], a[j]);
  }

  for (size_t len = 2; len <= n; len <<= 1) {
    const double ang = 2.0 * kPi / double(len) * (inverse ? 1.0 : -1.0);
    const std::complex<double> wlen(std::cos(ang), std::sin(ang));
    for (size_t i = 0; i < n; i += len) {
      std::complex<double> w(1.0, 0.0);
      for (size_t k = 0; k < len / 2; ++k) {
        const auto u = a[i + k];
        const auto v = a[i + k + len / 2] * w;
        a[i + k] = u + v;
        a[i + k + len / 2] = u - v;
        w *= wlen;
      }
    }
  }

  if (inverse) {
    for (auto& x : a) x /= double(n);
  }
}

Spectrogram stft(const std::vector<float>& signal, int nperseg, int noverlap) {
  if (nperseg <= 0) throw std::runtime_error("stft: nperseg must be positive");
  noverlap = std::max(0, std::min(noverlap, nperseg - 1));

  Spectrogram sg;
  sg.nperseg = nperseg;
  sg.hop = nperseg - noverlap;
  sg.nfft = next_pow2(nperseg);
  sg.bins = sg.nfft / 2 + 1;

  const size_t n = signal.size();
  if (n <= size_t(nperseg)) {
    sg.frames = 1;
  } else {
    const size_t rest = n - size_t(nperseg);
    sg.frames = 1 + int((rest + size_t(sg.hop) - 1) / size_t(sg.hop));
  }
  sg.signal_length = size_t(sg.frames - 1) * size_t(sg.hop) + size_t(nperseg);
  sg.data.resize(size_t(sg.frames) * size_t(sg.bins));

  const auto window = periodic_hann(nperseg);
  std::vector<std::complex<double>> buf(size_t(sg.nfft));
  for (int f = 0; f < sg.frames; ++f) {
    const size_t off = size_t(f) * size_t(sg.hop);
    std::fill(buf.begin(), buf.end(), std::complex<double>(0.0, 0.0));
    for (int i = 0; i < nperseg; ++i) {
      const size_t idx = off + size_t(i);
      const float x = idx < n ? signal[idx] : 0.0f;
      buf[size_t(i)] = double(x) * double(window[size_t(i)]);
    }
    fft_inplace(buf, /*inverse=*/false);
    for (int k = 0; k < sg.bins; ++k) {
      sg.at(f, k) = std::complex<float>(float(buf[size_t(k)].real()), float(buf[size_t(k)].imag()));
    }
  }
  return sg;
}

std::vector<float> istft(const Spectrogram& sg) {
  if (sg.frames <= 0 || sg.nfft <= 0) return {};

  const auto window = periodic_hann(sg.nperseg);
  std::vector<double> out(sg.signal_length, 0.0);
  std::vector<double> norm(sg.signal_length, 0.0);
  std::vector<std::complex<double>> buf(size_t(sg.nfft));

  for (int f = 0; f < sg.frames; ++f) {
    for (int k = 0; k < sg.bins; ++k) {
      const auto& c = sg.at(f, k);
      buf[size_t(k)] = std::complex<double>(c.real(), c.imag());
    }
    for (int k = 1; k < sg.nfft / 2; ++k) {
      buf[size_t(sg.nfft - k)] = std::conj(buf[size_t(k)]);
    }
    fft_inplace(buf, /*inverse=*/true);

    const size_t off = size_t(f) * size_t(sg.hop);
    for (int i = 0; i < sg.nperseg; ++i) {
      const double w = window[size_t(i)];
      out[off + size_t(i)] += buf[size_t(i)].real() * w;
      norm[off + size_t(i)] += w * w;
    }
  }

  std::vector<float> result(sg.signal_length, 0.0f);
  for (size_t i = 0; i < result.size(); ++i) {
    if (norm[i] > 1e-10) result[i] = float(out[i] / norm[i]);
  }
  return result;
}

std::vector<float> log_mel_fbank(const float* samples, size_t count, int sample_rate, int n_mels, int& frames_out) {
  frames_out = 0;
  const int win = sample_rate * 25 / 1000;
  const int hop = sample_rate * 10 / 1000;
  if (win <= 0 || hop <= 0 || count < size_t(win)) return {};

  const int nfft = next_pow2(win);
  const int bins = nfft / 2 + 1;
  const int frames = 1 + int((count - size_t(win)) / size_t(hop));
  const auto window = hamming(win);
  const auto fb = mel_filterbank(n_mels, nfft, sample_rate);

  std::vector<float> feats(size_t(frames) * size_t(n_mels));
  std::vector<std::complex<double>> buf(static_cast<size_t>(nfft));
  std::vector<double> power(static_cast<size_t>(bins));
  for (int f = 0; f < frames; ++f) {
    const size_t off = size_t(f) * size_t(hop);
    double mean = 0.0;
    for (int i = 0; i < win; ++i) mean += samples[off + size_t(i)];
    mean /= double(win);
    std::fill(buf.begin(), buf.end(), std::complex<double>(0.0, 0.0));
    for (int i = 0; i < win; ++i) {
      buf[size_t(i)] = (double(samples[off + size_t(i)]) - mean) * double(window[size_t(i)]);
    }
    fft_inplace(buf, /*inverse=*/false);
    for (int k = 0; k < bins; ++k) power[size_t(k)] = std::norm(buf[size_t(k)]);
    for (int m = 0; m < n_mels; ++m) {
      double e = 0.0;
      const float* row = fb.data() + size_t(m) * size_t(bins);
      for (int k = 0; k < bins; ++k) e += double(row[k]) * power[size_t(k)];
      feats[size_t(f) * size_t(n_mels) + size_t(m)] = float(std::log(std::max(e, 1e-10)));
    }
  }

  for (int m = 0; m < n_mels; ++m) {
    double mean = 0.0;
    for (int f = 0; f < frames; ++f) mean += feats[size_t(f) * size_t(n_mels) + size_t(m)];
    mean /= double(frames);
    for (int f = 0; f < frames; ++f) feats[size_t(f) * size_t(n_mels) + size_t(m)] -= float(mean);
  }

  frames_out = frames;
  return feats;
}
