#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "audio/audio_backend.hpp"

namespace agent_notifier::audio {
namespace {

constexpr std::uint16_t kWavFormatPcm = 1;
constexpr std::uint16_t kBitsPerSample = 16;
constexpr std::uint16_t kMaxChannels = 8;

std::uint16_t read_u16(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
  return static_cast<std::uint16_t>(bytes[offset] | (bytes[offset + 1] << 8U));
}

std::uint32_t read_u32(const std::vector<std::uint8_t>& bytes, std::size_t offset) {
  return static_cast<std::uint32_t>(bytes[offset]) | (static_cast<std::uint32_t>(bytes[offset + 1]) << 8U) |
         (static_cast<std::uint32_t>(bytes[offset + 2]) << 16U) | (static_cast<std::uint32_t>(bytes[offset + 3]) << 24U);
}

bool tag_equals(const std::vector<std::uint8_t>& bytes, std::size_t offset, const char* tag) {
  for (std::size_t i = 0; i < 4; ++i) {
    if (bytes[offset + i] != static_cast<std::uint8_t>(tag[i])) {
      return false;
    }
  }
  return true;
}

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t value) {
  out.push_back(static_cast<std::uint8_t>(value & 0xFFU));
  out.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
}

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
  for (unsigned shift = 0; shift < 32; shift += 8) {
    out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
  }
}

void put_tag(std::vector<std::uint8_t>& out, const char* tag) {
  for (std::size_t i = 0; i < 4; ++i) {
    out.push_back(static_cast<std::uint8_t>(tag[i]));
  }
}

}  // namespace

Samples decode_wav(const std::vector<std::uint8_t>& bytes) {
  if (bytes.size() < 12 || !tag_equals(bytes, 0, "RIFF") || !tag_equals(bytes, 8, "WAVE")) {
    throw std::invalid_argument("not a RIFF/WAVE file");
  }

  Samples samples;
  bool have_format = false;
  std::size_t offset = 12;
  while (offset + 8 <= bytes.size()) {
    const std::uint32_t chunk_size = read_u32(bytes, offset + 4);
    const std::size_t body = offset + 8;
    if (chunk_size > bytes.size() - body) {
      throw std::invalid_argument("truncated WAV chunk");
    }

    if (tag_equals(bytes, offset, "fmt ")) {
      if (chunk_size < 16) {
        throw std::invalid_argument("WAV fmt chunk too short");
      }
      const auto format = read_u16(bytes, body);
      samples.channels = read_u16(bytes, body + 2);
      samples.sample_rate = read_u32(bytes, body + 4);
      const auto bits = read_u16(bytes, body + 14);
      if (format != kWavFormatPcm || bits != kBitsPerSample) {
        throw std::invalid_argument("unsupported WAV encoding; expected 16-bit PCM");
      }
      if (samples.channels == 0 || samples.channels > kMaxChannels || samples.sample_rate == 0) {
        throw std::invalid_argument("invalid WAV channel count or sample rate");
      }
      have_format = true;
    } else if (tag_equals(bytes, offset, "data")) {
      if (!have_format) {
        throw std::invalid_argument("WAV data chunk before fmt chunk");
      }
      const std::size_t count = chunk_size / sizeof(std::int16_t);
      samples.pcm.resize(count);
      for (std::size_t i = 0; i < count; ++i) {
        samples.pcm[i] = static_cast<std::int16_t>(read_u16(bytes, body + (i * 2)));
      }
      samples.pcm.resize(samples.frames() * samples.channels);
      return samples;
    }

    // Chunks are word aligned.
    offset = body + chunk_size + (chunk_size & 1U);
  }

  throw std::invalid_argument("WAV file has no data chunk");
}

std::vector<std::uint8_t> encode_wav(const Samples& samples) {
  const auto data_size = static_cast<std::uint32_t>(samples.pcm.size() * sizeof(std::int16_t));
  const auto block_align = static_cast<std::uint16_t>(samples.channels * sizeof(std::int16_t));

  std::vector<std::uint8_t> out;
  out.reserve(44 + data_size);
  put_tag(out, "RIFF");
  put_u32(out, 36 + data_size);
  put_tag(out, "WAVE");
  put_tag(out, "fmt ");
  put_u32(out, 16);
  put_u16(out, kWavFormatPcm);
  put_u16(out, samples.channels);
  put_u32(out, samples.sample_rate);
  put_u32(out, samples.sample_rate * block_align);
  put_u16(out, block_align);
  put_u16(out, kBitsPerSample);
  put_tag(out, "data");
  put_u32(out, data_size);
  for (const auto sample : samples.pcm) {
    put_u16(out, static_cast<std::uint16_t>(sample));
  }
  return out;
}

std::vector<std::uint8_t> make_ping_wav() {
  constexpr std::uint32_t kRate = 44100;
  constexpr double kDurationS = 0.35;
  constexpr double kPi = 3.14159265358979323846;

  Samples ping{.sample_rate = kRate, .channels = 1, .pcm = {}};
  const auto frames = static_cast<std::size_t>(kRate * kDurationS);
  ping.pcm.reserve(frames);
  for (std::size_t i = 0; i < frames; ++i) {
    const double t = static_cast<double>(i) / kRate;
    const double envelope = std::exp(-9.0 * t) * std::min(1.0, t * 400.0);
    const double tone = (0.6 * std::sin(2.0 * kPi * 1318.5 * t)) + (0.4 * std::sin(2.0 * kPi * 1975.5 * t));
    ping.pcm.push_back(static_cast<std::int16_t>(std::lround(envelope * tone * 0.5 * 32767.0)));
  }
  return encode_wav(ping);
}

}  // namespace agent_notifier::audio
